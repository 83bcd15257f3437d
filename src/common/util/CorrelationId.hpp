#pragma once

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <string>

namespace Pancake {

// Every column and deletion read of one segment snapshot must carry the same
// correlation id, otherwise the server may answer from different versions of
// the segment. Generate a fresh id per segment read; reusing one across
// segments or long time spans can yield errors or inconsistent data.
inline std::string NewCorrelationId() {
  thread_local boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

} // namespace Pancake
