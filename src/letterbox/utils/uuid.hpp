#pragma once

#include <string>

namespace letterbox {

/**
 * @ingroup letterbox-utils
 * @brief A random (version 4) uuid, in its canonical textual form. Thread safe.
 */
std::string make_uuid();

} // namespace letterbox
