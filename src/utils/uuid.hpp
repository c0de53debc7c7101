#pragma once

#include <string>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace pyexec::utils {

// Random (v4) UUID text. The generator is per thread, it is not safe to share.
inline std::string GenerateUuid() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

}  // namespace pyexec::utils
