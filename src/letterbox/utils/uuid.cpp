#include "uuid.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace letterbox {

std::string make_uuid() {
  // random_generator is not thread safe, and is expensive to construct
  thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

} // namespace letterbox
