#pragma once

/**
 * @defgroup async Async
 * @ingroup letterbox
 */

#include "async/extended-futures.hpp"
#include "portable/asio/asio-execution-context.hpp"
