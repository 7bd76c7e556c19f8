// include/ratkit/core/rational.hpp — Signed exact fractions over bigint magnitudes.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <type_traits>
#include <utility>

#include <ratkit/core/bigint.hpp>

namespace ratkit::core {

    enum class sign_t : std::uint8_t { positive, negative };

    // An exact fraction. The numerator is >= 0, the denominator is > 0 and the
    // sign lives only in sign(). Constructors keep the operands as given; the
    // arithmetic functions below return values in lowest terms.
    class rational {
      public:
        rational() = default;

        explicit rational(bigint value)
            : numerator_(value.sign() < 0 ? bigint(-value) : value),
              sign_(value.sign() < 0 ? sign_t::negative : sign_t::positive) {
        }

        template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
        explicit rational(Int value) : rational(bigint(value)) {
        }

        static rational zero() {
            return {};
        }
        static rational one() {
            return rational(bigint(1));
        }

        // Sign is positive iff both operands are >= 0 or both are < 0. Throws
        // std::domain_error on a zero denominator.
        static rational from_int(std::int64_t numerator, std::int64_t denominator);
        static rational from_bigint(const bigint &numerator, const bigint &denominator);

        // Builds a value from already separated magnitudes. Throws
        // std::domain_error when numerator < 0 or denominator <= 0.
        static rational from_magnitudes(bigint numerator, bigint denominator, sign_t sign);

        const bigint &numerator() const noexcept {
            return numerator_;
        }
        const bigint &denominator() const noexcept {
            return denominator_;
        }
        sign_t sign() const noexcept {
            return sign_;
        }

        bool is_zero() const noexcept {
            return numerator_.is_zero();
        }
        bool is_positive() const noexcept {
            return sign_ == sign_t::positive;
        }
        bool is_negative() const noexcept {
            return sign_ == sign_t::negative;
        }

        rational &operator+=(const rational &other);
        rational &operator-=(const rational &other);
        rational &operator*=(const rational &other);
        rational &operator/=(const rational &other);

      private:
        rational(bigint numerator, bigint denominator, sign_t sign) noexcept
            : numerator_(std::move(numerator)), denominator_(std::move(denominator)), sign_(sign) {
        }

        friend rational negate(const rational &value);
        friend rational abs(const rational &value);
        friend rational reciprocal(const rational &value);
        friend rational reduce(const rational &value);
        friend std::pair<rational, rational> normalize(const rational &lhs, const rational &rhs);
        friend rational add(const rational &lhs, const rational &rhs);
        friend rational mul(const rational &lhs, const rational &rhs);

        bigint numerator_{0};
        bigint denominator_{1};
        sign_t sign_ = sign_t::positive;
    };

    inline rational from_int(std::int64_t numerator, std::int64_t denominator) {
        return rational::from_int(numerator, denominator);
    }
    inline rational from_bigint(const bigint &numerator, const bigint &denominator) {
        return rational::from_bigint(numerator, denominator);
    }

    inline bool is_positive(const rational &value) noexcept {
        return value.is_positive();
    }
    inline bool same_sign(const rational &lhs, const rational &rhs) noexcept {
        return lhs.sign() == rhs.sign();
    }

    // Same magnitudes, opposite sign field.
    rational negate(const rational &value);
    rational abs(const rational &value);
    // Swaps numerator and denominator and keeps the sign field. Throws
    // std::domain_error for a zero value.
    rational reciprocal(const rational &value);

    // Divides both magnitudes by their gcd. A zero numerator reduces to a
    // positive 0/1.
    rational reduce(const rational &value);
    bool is_reduced(const rational &value);

    // Rescales both operands to lcm(lhs.denominator(), rhs.denominator()).
    std::pair<rational, rational> normalize(const rational &lhs, const rational &rhs);

    rational add(const rational &lhs, const rational &rhs);
    rational sub(const rational &lhs, const rational &rhs);
    rational mul(const rational &lhs, const rational &rhs);
    // Throws std::domain_error when rhs is zero.
    rational div(const rational &lhs, const rational &rhs);
    // Repeated squaring; negative exponents raise the reciprocal. pow(x, 0) is one.
    rational pow(const rational &base, std::int64_t exponent);

    // Quotient truncated toward zero, with the sign applied.
    bigint integer_part(const rational &value);
    rational fractional_part(const rational &value);

    bool gt(const rational &lhs, const rational &rhs);
    bool gte(const rational &lhs, const rational &rhs);
    bool lt(const rational &lhs, const rational &rhs);
    bool lte(const rational &lhs, const rational &rhs);

    // Field-by-field comparison without reduction.
    bool same_representation(const rational &lhs, const rational &rhs) noexcept;

    rational operator+(const rational &lhs, const rational &rhs);
    rational operator-(const rational &lhs, const rational &rhs);
    rational operator*(const rational &lhs, const rational &rhs);
    rational operator/(const rational &lhs, const rational &rhs);
    rational operator-(const rational &value);

    // Value equality: the reduced forms match field by field.
    bool operator==(const rational &lhs, const rational &rhs);
    std::strong_ordering operator<=>(const rational &lhs, const rational &rhs);

} // namespace ratkit::core

namespace std {

    template <> struct hash<ratkit::core::rational> {
        std::size_t operator()(const ratkit::core::rational &value) const;
    };

} // namespace std
