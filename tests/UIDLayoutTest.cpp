#include <gtest/gtest.h>

#include <stdexcept>

#include "saltuid/UIDOptions.h"
#include "saltuid/core/UIDLayout.h"

using namespace saltuid;
using namespace saltuid::core;

TEST(UIDLayoutTest, DefaultCapacityUses64BitCeiling)
{
	const UIDLayout layout;

	ASSERT_EQ(layout.maxSalts, 10000u);
	ASSERT_EQ(layout.maxEntityPerGenerator, 1844674407370954u);
	ASSERT_EQ(kMaxEntityPerGenerator, kMaxSafeValue / kMaxSalts - 1);
}

TEST(UIDLayoutTest, DoubleCeilingMatchesDoubleCapacity)
{
	const auto layout = UIDLayout::fromCeiling(kMaxSalts, kMaxSafeDoubleInteger);

	ASSERT_EQ(kMaxSafeDoubleInteger, 9007199254740991u);
	ASSERT_EQ(layout.maxEntityPerGenerator, 900719925473u);
}

TEST(UIDLayoutTest, HighestIdentifierStaysBelowCeiling)
{
	const UIDLayout layout;
	const UID highest = layout.compose(layout.maxSalts - 1, layout.maxEntityPerGenerator - 1);

	ASSERT_LE(highest, kMaxSafeValue);
	ASSERT_EQ(layout.saltOf(highest), layout.maxSalts - 1);
	ASSERT_EQ(layout.sequenceOf(highest), layout.maxEntityPerGenerator - 1);
}

TEST(UIDLayoutTest, ComposeAndDecompose)
{
	UIDOptions options;
	options.maxSalts = 10;
	const auto layout = options.layout();

	ASSERT_EQ(layout.compose(3, 0), 3u);
	ASSERT_EQ(layout.compose(3, 2), 23u);
	ASSERT_EQ(layout.saltOf(23), 3u);
	ASSERT_EQ(layout.sequenceOf(23), 2u);
}

TEST(UIDLayoutTest, IsSaltedBy)
{
	UIDOptions options;
	options.maxSalts = 10;
	const auto layout = options.layout();

	ASSERT_TRUE(isSaltedBy(13, 3, layout));
	ASSERT_FALSE(isSaltedBy(13, 4, layout));

	ASSERT_TRUE(isSaltedBy(20003, 3));
	ASSERT_FALSE(isSaltedBy(20003, 4));
	ASSERT_TRUE(isSaltedBy(0, 0));
}

TEST(UIDLayoutTest, ValidSaltRange)
{
	const UIDLayout layout;

	ASSERT_TRUE(layout.isValidSalt(0));
	ASSERT_TRUE(layout.isValidSalt(9999));
	ASSERT_FALSE(layout.isValidSalt(10000));
}

TEST(UIDLayoutTest, RejectsUnusableLayouts)
{
	ASSERT_THROW(UIDLayout::fromCeiling(0, kMaxSafeValue), std::invalid_argument);
	ASSERT_THROW(UIDLayout::fromCeiling(1, kMaxSafeValue), std::invalid_argument);
	ASSERT_THROW(UIDLayout::fromCeiling(10, 19), std::invalid_argument);

	const auto smallest = UIDLayout::fromCeiling(10, 20);
	ASSERT_EQ(smallest.maxEntityPerGenerator, 1u);
}
