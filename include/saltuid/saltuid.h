#pragma once

#include "saltuid/UIDOptions.h"
#include "saltuid/core/Handle.h"
#include "saltuid/core/Identifiable.h"
#include "saltuid/core/InvalidSaltError.h"
#include "saltuid/core/SaltRegistry.h"
#include "saltuid/core/UIDGenerator.h"
#include "saltuid/core/UIDLayout.h"
