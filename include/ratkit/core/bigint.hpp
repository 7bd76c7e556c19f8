// include/ratkit/core/bigint.hpp — BigInt collaborator and the integer helpers rationals build on.

#pragma once

#include <optional>

#include <boost/multiprecision/cpp_int.hpp>

namespace ratkit::core {

    // Arbitrary-precision signed integer. Division truncates toward zero and
    // throws std::overflow_error on a zero divisor.
    using bigint = boost::multiprecision::cpp_int;

    inline bool is_negative(const bigint &value) noexcept {
        return value.sign() < 0;
    }

    // Remainder of lhs / rhs, or nullopt when rhs is zero.
    inline std::optional<bigint> checked_mod(const bigint &lhs, const bigint &rhs) {
        if (rhs.is_zero()) {
            return std::nullopt;
        }
        return bigint(lhs % rhs);
    }

    // Euclid's algorithm. gcd(0, x) and gcd(x, 0) return x unchanged; a failed
    // modulo step yields zero.
    bigint gcd(bigint lhs, bigint rhs);

    // (lhs * rhs) / gcd(lhs, rhs). At least one operand must be nonzero.
    bigint lcm(const bigint &lhs, const bigint &rhs);

} // namespace ratkit::core
