#include <gtest/gtest.h>

#include <limits>
#include <unordered_set>

#include "saltuid/UIDOptions.h"
#include "saltuid/core/Handle.h"
#include "saltuid/core/UIDGenerator.h"

using namespace saltuid;
using namespace saltuid::core;

namespace
{
struct Player
{
};
} // namespace

TEST(HandleTest, DefaultHandleIsInvalid)
{
	Handle<Player> handle;

	ASSERT_FALSE(handle.valid());
	ASSERT_EQ(handle.id(), kInvalidUID);
	ASSERT_FALSE(handle.isSaltedBy(handle.salt()));
}

TEST(HandleTest, ZeroIsAValidIdentifier)
{
	Handle<Player> handle(0);

	ASSERT_TRUE(handle.valid());
	ASSERT_EQ(handle.salt(), 0u);
	ASSERT_TRUE(handle.isSaltedBy(0));
}

TEST(HandleTest, SaltFollowsLayout)
{
	UIDOptions options;
	options.maxSalts = 10;
	const auto layout = options.layout();
	Handle<Player> handle(13);

	ASSERT_EQ(handle.salt(layout), 3u);
	ASSERT_TRUE(handle.isSaltedBy(3, layout));
	ASSERT_FALSE(handle.isSaltedBy(4, layout));
	ASSERT_EQ(handle.salt(), 13u);
}

TEST(HandleTest, ComparisonAndHashing)
{
	Handle<Player> a(10003);
	Handle<Player> b(10003);
	Handle<Player> c(20003);

	ASSERT_EQ(a, b);
	ASSERT_NE(a, c);
	ASSERT_LT(a, c);

	std::unordered_set<Handle<Player>> handles{a, b, c};
	ASSERT_EQ(handles.size(), 2u);
}

TEST(HandleTest, UnvalidatedMaxSaltMintsInvalidIdentifier)
{
	UIDGenerator generator(std::numeric_limits<Salt>::max());
	Handle<Player> handle(generator.next());

	ASSERT_EQ(handle.id(), kInvalidUID);
	ASSERT_FALSE(handle.valid());
}
