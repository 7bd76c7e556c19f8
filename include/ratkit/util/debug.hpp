#pragma once

#include <ostream>

#include <ratkit/core/bigint.hpp>
#include <ratkit/core/rational.hpp>
#include <ratkit/io/format.hpp>

namespace ratkit::util {

inline std::ostream& dump(std::ostream& os, const ratkit::core::bigint& value) {
    return os << "bigint(" << ratkit::io::to_string(value) << ')';
}

inline std::ostream& dump(std::ostream& os, const ratkit::core::rational& value) {
    return os << "rational(" << ratkit::io::to_string(value) << ')';
}

} // namespace ratkit::util
