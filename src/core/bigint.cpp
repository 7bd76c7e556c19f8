// src/core/bigint.cpp — gcd and lcm over the BigInt collaborator.

#include <ratkit/core/bigint.hpp>

#include <utility>

namespace ratkit::core {

    bigint gcd(bigint lhs, bigint rhs) {
        if (lhs.is_zero()) {
            return rhs;
        }
        if (rhs.is_zero()) {
            return lhs;
        }
        while (!rhs.is_zero()) {
            std::optional<bigint> remainder = checked_mod(lhs, rhs);
            if (!remainder) {
                return bigint(0);
            }
            lhs = std::move(rhs);
            rhs = std::move(*remainder);
        }
        return lhs;
    }

    bigint lcm(const bigint &lhs, const bigint &rhs) {
        const bigint divisor = core::gcd(lhs, rhs);
        return bigint((lhs * rhs) / divisor);
    }

} // namespace ratkit::core
