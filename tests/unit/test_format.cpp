// tests/unit/test_format.cpp — Text rendering and debug dumps.

#include <ratkit/ratkit.hpp>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

using ratkit::core::bigint;
using ratkit::core::rational;

bool expect_text(const std::string& actual, const std::string& expected) {
    if (actual == expected) {
        return true;
    }
    std::cerr << "format mismatch: \"" << actual << "\" != \"" << expected << "\"\n";
    return false;
}

bool test_bigint_bases() {
    if (!expect_text(ratkit::io::to_string(bigint(255), 16), "ff")) return false;
    if (!expect_text(ratkit::io::to_string(bigint(-10), 2), "-1010")) return false;
    if (!expect_text(ratkit::io::to_string(bigint(0), 7), "0")) return false;
    if (!expect_text(ratkit::io::to_string(bigint(35), 36), "z")) return false;
    try {
        (void)ratkit::io::to_string(bigint(1), 1);
        std::cerr << "base 1 accepted\n";
        return false;
    } catch (const std::invalid_argument&) {
    }
    return true;
}

bool test_rational_text() {
    if (!expect_text(ratkit::io::to_string(ratkit::core::from_int(-3, 2)), "-3/2")) return false;
    if (!expect_text(ratkit::io::to_string(ratkit::core::from_int(10, 5)), "10/5")) return false;
    if (!expect_text(ratkit::io::to_string(ratkit::core::from_int(7, 1)), "7")) return false;
    if (!expect_text(ratkit::io::to_string(ratkit::core::from_int(0, -4)), "0")) return false;
    if (!expect_text(ratkit::io::to_string(ratkit::core::from_int(-255, 16), 16), "-ff/10")) {
        return false;
    }
    std::ostringstream stream;
    stream << ratkit::core::add(ratkit::core::from_int(1, 2), ratkit::core::from_int(1, 3));
    return expect_text(stream.str(), "5/6");
}

bool test_dump() {
    std::ostringstream stream;
    ratkit::util::dump(stream, ratkit::core::from_int(-1, 3)) << ' ';
    ratkit::util::dump(stream, bigint(12));
    return expect_text(stream.str(), "rational(-1/3) bigint(12)");
}

} // namespace

int main() {
    if (!test_bigint_bases()) return 1;
    if (!test_rational_text()) return 1;
    if (!test_dump()) return 1;
    std::cout << "format tests passed\n";
    return 0;
}
