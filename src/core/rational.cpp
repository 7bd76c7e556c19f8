// src/core/rational.cpp — Reduction, arithmetic and ordering for rational values.

#include <ratkit/core/rational.hpp>

#include <cstdint>
#include <stdexcept>
#include <utility>

namespace ratkit::core {

    namespace {

        sign_t flipped(sign_t sign) noexcept {
            return sign == sign_t::positive ? sign_t::negative : sign_t::positive;
        }

        // Zero magnitudes order as positive regardless of the stored sign.
        sign_t ordering_sign(const rational &value) noexcept {
            return value.is_zero() ? sign_t::positive : value.sign();
        }

        // Sign-aware numerator sum over a shared denominator. For mixed signs the
        // negative operand's numerator is subtracted from the positive one's, so
        // the result may be negative.
        bigint add_numerators(const rational &lhs, const rational &rhs) {
            if (same_sign(lhs, rhs)) {
                return bigint(lhs.numerator() + rhs.numerator());
            }
            if (is_positive(lhs)) {
                return bigint(lhs.numerator() - rhs.numerator());
            }
            return bigint(rhs.numerator() - lhs.numerator());
        }

        sign_t add_sign(const rational &lhs, const rational &rhs, const bigint &raw_numerator) {
            if (same_sign(lhs, rhs)) {
                return lhs.sign();
            }
            return is_negative(raw_numerator) ? sign_t::negative : sign_t::positive;
        }

    } // namespace

    rational rational::from_int(std::int64_t numerator, std::int64_t denominator) {
        return from_bigint(bigint(numerator), bigint(denominator));
    }

    rational rational::from_bigint(const bigint &numerator, const bigint &denominator) {
        if (denominator.is_zero()) {
            throw std::domain_error("rational denominator cannot be zero");
        }
        sign_t sign = sign_t::negative;
        if (numerator >= 0 && denominator >= 0) {
            sign = sign_t::positive;
        } else if (numerator < 0 && denominator < 0) {
            sign = sign_t::positive;
        }
        return rational(bigint(boost::multiprecision::abs(numerator)),
                        bigint(boost::multiprecision::abs(denominator)), sign);
    }

    rational rational::from_magnitudes(bigint numerator, bigint denominator, sign_t sign) {
        if (core::is_negative(numerator)) {
            throw std::domain_error("rational numerator magnitude must be non-negative");
        }
        if (denominator.sign() <= 0) {
            throw std::domain_error("rational denominator must be positive");
        }
        return rational(std::move(numerator), std::move(denominator), sign);
    }

    rational &rational::operator+=(const rational &other) {
        *this = add(*this, other);
        return *this;
    }

    rational &rational::operator-=(const rational &other) {
        *this = sub(*this, other);
        return *this;
    }

    rational &rational::operator*=(const rational &other) {
        *this = mul(*this, other);
        return *this;
    }

    rational &rational::operator/=(const rational &other) {
        *this = div(*this, other);
        return *this;
    }

    rational negate(const rational &value) {
        return rational(value.numerator_, value.denominator_, flipped(value.sign_));
    }

    rational abs(const rational &value) {
        return rational(value.numerator_, value.denominator_, sign_t::positive);
    }

    rational reciprocal(const rational &value) {
        if (value.is_zero()) {
            throw std::domain_error("rational reciprocal of zero");
        }
        return rational(value.denominator_, value.numerator_, value.sign_);
    }

    rational reduce(const rational &value) {
        const bigint divisor = core::gcd(value.numerator_, value.denominator_);
        bigint numerator = value.numerator_ / divisor;
        bigint denominator = value.denominator_ / divisor;
        const sign_t sign = numerator.is_zero() ? sign_t::positive : value.sign_;
        return rational(std::move(numerator), std::move(denominator), sign);
    }

    bool is_reduced(const rational &value) {
        return core::gcd(value.numerator(), value.denominator()) == 1;
    }

    std::pair<rational, rational> normalize(const rational &lhs, const rational &rhs) {
        const bigint common = core::lcm(lhs.denominator_, rhs.denominator_);
        bigint left = lhs.numerator_ * (common / lhs.denominator_);
        bigint right = rhs.numerator_ * (common / rhs.denominator_);
        return {rational(std::move(left), common, lhs.sign_),
                rational(std::move(right), common, rhs.sign_)};
    }

    rational add(const rational &lhs, const rational &rhs) {
        auto [left, right] = normalize(lhs, rhs);
        const bigint raw_numerator = add_numerators(left, right);
        const sign_t sign = add_sign(left, right, raw_numerator);
        rational sum(bigint(boost::multiprecision::abs(raw_numerator)),
                     std::move(left.denominator_), sign);
        return reduce(sum);
    }

    rational sub(const rational &lhs, const rational &rhs) {
        return add(lhs, negate(rhs));
    }

    rational mul(const rational &lhs, const rational &rhs) {
        const sign_t sign = same_sign(lhs, rhs) ? sign_t::positive : sign_t::negative;
        rational product(lhs.numerator_ * rhs.numerator_, lhs.denominator_ * rhs.denominator_,
                         sign);
        return reduce(product);
    }

    rational div(const rational &lhs, const rational &rhs) {
        if (rhs.is_zero()) {
            throw std::domain_error("rational division by zero");
        }
        return mul(lhs, reciprocal(rhs));
    }

    rational pow(const rational &base, std::int64_t exponent) {
        rational factor = exponent < 0 ? reciprocal(base) : base;
        std::uint64_t remaining = exponent < 0 ? std::uint64_t(0) - static_cast<std::uint64_t>(exponent)
                                               : static_cast<std::uint64_t>(exponent);
        rational result = rational::one();
        while (remaining != 0) {
            if ((remaining & 1u) != 0) {
                result = mul(result, factor);
            }
            remaining >>= 1;
            if (remaining != 0) {
                factor = mul(factor, factor);
            }
        }
        return result;
    }

    bigint integer_part(const rational &value) {
        bigint quotient = value.numerator() / value.denominator();
        if (value.is_negative()) {
            quotient = -quotient;
        }
        return quotient;
    }

    rational fractional_part(const rational &value) {
        return sub(value, rational(integer_part(value)));
    }

    bool gt(const rational &lhs, const rational &rhs) {
        const sign_t lhs_sign = ordering_sign(lhs);
        const sign_t rhs_sign = ordering_sign(rhs);
        if (lhs_sign != rhs_sign) {
            return lhs_sign == sign_t::positive;
        }
        const auto [left, right] = normalize(lhs, rhs);
        if (lhs_sign == sign_t::positive) {
            return left.numerator() > right.numerator();
        }
        return right.numerator() > left.numerator();
    }

    bool gte(const rational &lhs, const rational &rhs) {
        return gt(lhs, rhs) || same_representation(reduce(lhs), reduce(rhs));
    }

    bool lt(const rational &lhs, const rational &rhs) {
        return gt(rhs, lhs);
    }

    bool lte(const rational &lhs, const rational &rhs) {
        return gte(rhs, lhs);
    }

    bool same_representation(const rational &lhs, const rational &rhs) noexcept {
        return lhs.sign() == rhs.sign() && lhs.numerator() == rhs.numerator() &&
               lhs.denominator() == rhs.denominator();
    }

    rational operator+(const rational &lhs, const rational &rhs) {
        return add(lhs, rhs);
    }

    rational operator-(const rational &lhs, const rational &rhs) {
        return sub(lhs, rhs);
    }

    rational operator*(const rational &lhs, const rational &rhs) {
        return mul(lhs, rhs);
    }

    rational operator/(const rational &lhs, const rational &rhs) {
        return div(lhs, rhs);
    }

    rational operator-(const rational &value) {
        return negate(value);
    }

    bool operator==(const rational &lhs, const rational &rhs) {
        return same_representation(reduce(lhs), reduce(rhs));
    }

    std::strong_ordering operator<=>(const rational &lhs, const rational &rhs) {
        if (gt(lhs, rhs)) {
            return std::strong_ordering::greater;
        }
        if (gt(rhs, lhs)) {
            return std::strong_ordering::less;
        }
        return std::strong_ordering::equal;
    }

} // namespace ratkit::core

std::size_t std::hash<ratkit::core::rational>::operator()(
    const ratkit::core::rational &value) const {
    const ratkit::core::rational reduced = ratkit::core::reduce(value);
    std::size_t seed = std::hash<ratkit::core::bigint>{}(reduced.numerator());
    const std::size_t denominator_hash = std::hash<ratkit::core::bigint>{}(reduced.denominator());
    seed ^= denominator_hash + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    return reduced.is_negative() ? ~seed : seed;
}
