#pragma once

/**
 * @defgroup letterbox Letterbox
 */

/**
 * @defgroup letterbox-utils Utilities
 * @ingroup letterbox
 */

#include "utils/base-include.hpp"

#include "utils/error-codes.hpp"

#include "utils/cli-utils.hpp"
#include "utils/uuid.hpp"
