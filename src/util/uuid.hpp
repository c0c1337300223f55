#pragma once

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <string>

namespace util {

using uuid_t = boost::uuids::uuid;

// random_generator is not thread safe, hence one per thread
inline uuid_t make_uuid() {
    thread_local boost::uuids::random_generator generator;
    return generator();
}

// throws std::runtime_error if text is not a valid uuid
inline uuid_t parse_uuid(std::string const &text) {
    return boost::uuids::string_generator{}(text);
}

inline std::string to_string(uuid_t const &id) {
    return boost::uuids::to_string(id);
}

} // namespace util
