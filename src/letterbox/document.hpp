#pragma once

/**
 * @defgroup document Replicated Documents
 * @ingroup letterbox
 */

#include "document/replicated-document.hpp"
#include "document/memory-document.hpp"
#include "document/document-link.hpp"
