// tests/unit/test_rational_basic.cpp — Construction, sign rules and worked arithmetic cases.

#include <ratkit/ratkit.hpp>

#include <iostream>
#include <stdexcept>
#include <string_view>

namespace {

using ratkit::core::bigint;
using ratkit::core::rational;
using ratkit::core::sign_t;

bool check_fields(const rational& value,
                  int numerator,
                  int denominator,
                  sign_t sign,
                  std::string_view label) {
    if (value.numerator() == numerator && value.denominator() == denominator &&
        value.sign() == sign) {
        return true;
    }
    std::cerr << label << " mismatch: got ";
    ratkit::util::dump(std::cerr, value) << " expected "
                                         << (sign == sign_t::negative ? "-" : "") << numerator
                                         << '/' << denominator << "\n";
    return false;
}

bool test_from_int_signs() {
    if (!check_fields(ratkit::core::from_int(-3, 2), 3, 2, sign_t::negative, "from_int(-3, 2)")) {
        return false;
    }
    if (!check_fields(ratkit::core::from_int(3, -2), 3, 2, sign_t::negative, "from_int(3, -2)")) {
        return false;
    }
    if (!check_fields(ratkit::core::from_int(-3, -2), 3, 2, sign_t::positive, "from_int(-3, -2)")) {
        return false;
    }
    if (!check_fields(ratkit::core::from_int(0, 7), 0, 7, sign_t::positive, "from_int(0, 7)")) {
        return false;
    }
    // A zero numerator is ">= 0", so a negative denominator makes the signs differ.
    if (!check_fields(ratkit::core::from_int(0, -7), 0, 7, sign_t::negative, "from_int(0, -7)")) {
        return false;
    }
    return true;
}

bool test_from_bigint_matches_from_int() {
    const int samples[][2] = {{5, 5}, {-4, 6}, {4, -6}, {-4, -6}, {0, 3}, {0, -3}, {12, 1}};
    for (const auto& sample : samples) {
        const rational small = ratkit::core::from_int(sample[0], sample[1]);
        const rational big =
            ratkit::core::from_bigint(bigint(sample[0]), bigint(sample[1]));
        if (!ratkit::core::same_representation(small, big)) {
            std::cerr << "from_bigint disagrees with from_int for " << sample[0] << '/'
                      << sample[1] << "\n";
            return false;
        }
    }
    return true;
}

bool test_constructors_do_not_reduce() {
    const rational value = ratkit::core::from_int(5, 5);
    if (!check_fields(value, 5, 5, sign_t::positive, "unreduced from_int(5, 5)")) {
        return false;
    }
    if (ratkit::core::is_reduced(value)) {
        std::cerr << "5/5 reported as reduced\n";
        return false;
    }
    return check_fields(ratkit::core::reduce(value), 1, 1, sign_t::positive, "reduce(5/5)");
}

bool test_zero_denominator_rejected() {
    try {
        (void)ratkit::core::from_int(1, 0);
        std::cerr << "from_int accepted a zero denominator\n";
        return false;
    } catch (const std::domain_error&) {
    }
    try {
        (void)ratkit::core::from_bigint(bigint(0), bigint(0));
        std::cerr << "from_bigint accepted a zero denominator\n";
        return false;
    } catch (const std::domain_error&) {
    }
    try {
        (void)rational::from_magnitudes(bigint(-1), bigint(2), sign_t::positive);
        std::cerr << "from_magnitudes accepted a negative numerator\n";
        return false;
    } catch (const std::domain_error&) {
    }
    return true;
}

bool test_sign_helpers() {
    const rational positive = ratkit::core::from_int(1, 2);
    const rational negative = ratkit::core::from_int(-1, 2);
    if (!ratkit::core::is_positive(positive) || ratkit::core::is_positive(negative)) {
        std::cerr << "is_positive\n";
        return false;
    }
    if (ratkit::core::same_sign(positive, negative) ||
        !ratkit::core::same_sign(negative, ratkit::core::from_int(-7, 3))) {
        std::cerr << "same_sign\n";
        return false;
    }
    const rational flipped = ratkit::core::negate(positive);
    if (!check_fields(flipped, 1, 2, sign_t::negative, "negate(1/2)")) {
        return false;
    }
    if (!check_fields(ratkit::core::negate(flipped), 1, 2, sign_t::positive, "negate twice")) {
        return false;
    }
    return check_fields(ratkit::core::abs(negative), 1, 2, sign_t::positive, "abs(-1/2)");
}

bool test_worked_examples() {
    using ratkit::core::from_int;
    if (!check_fields(ratkit::core::add(from_int(1, 2), from_int(1, 3)), 5, 6, sign_t::positive,
                      "1/2 + 1/3")) {
        return false;
    }
    if (!ratkit::core::gt(from_int(1, 2), from_int(1, 3))) {
        std::cerr << "1/2 > 1/3\n";
        return false;
    }
    if (!check_fields(ratkit::core::mul(from_int(2, 3), from_int(3, 4)), 1, 2, sign_t::positive,
                      "2/3 * 3/4")) {
        return false;
    }
    if (!check_fields(ratkit::core::div(from_int(1, 2), from_int(1, 4)), 2, 1, sign_t::positive,
                      "(1/2) / (1/4)")) {
        return false;
    }
    if (!check_fields(ratkit::core::sub(from_int(1, 3), from_int(1, 2)), 1, 6, sign_t::negative,
                      "1/3 - 1/2")) {
        return false;
    }
    if (!check_fields(ratkit::core::add(from_int(-1, 2), from_int(1, 3)), 1, 6, sign_t::negative,
                      "-1/2 + 1/3")) {
        return false;
    }
    if (!check_fields(ratkit::core::add(from_int(-1, 4), from_int(3, 4)), 1, 2, sign_t::positive,
                      "-1/4 + 3/4")) {
        return false;
    }
    if (!check_fields(ratkit::core::add(from_int(-1, 4), from_int(-3, 4)), 1, 1, sign_t::negative,
                      "-1/4 + -3/4")) {
        return false;
    }
    if (!check_fields(ratkit::core::div(from_int(3, 4), from_int(-3, 8)), 2, 1, sign_t::negative,
                      "(3/4) / (-3/8)")) {
        return false;
    }
    if (!check_fields(ratkit::core::mul(from_int(-2, 3), from_int(-9, 4)), 3, 2, sign_t::positive,
                      "-2/3 * -9/4")) {
        return false;
    }
    return true;
}

bool test_normalize() {
    const auto [left, right] =
        ratkit::core::normalize(ratkit::core::from_int(1, 4), ratkit::core::from_int(-5, 6));
    if (!check_fields(left, 3, 12, sign_t::positive, "normalize left")) {
        return false;
    }
    return check_fields(right, 10, 12, sign_t::negative, "normalize right");
}

bool test_zero_results_are_positive() {
    const rational half = ratkit::core::from_int(1, 2);
    const rational zero = ratkit::core::add(ratkit::core::negate(half), half);
    if (!check_fields(zero, 0, 1, sign_t::positive, "-1/2 + 1/2")) {
        return false;
    }
    const rational product = ratkit::core::mul(ratkit::core::from_int(0, 5), ratkit::core::from_int(-2, 3));
    if (!check_fields(product, 0, 1, sign_t::positive, "0 * -2/3")) {
        return false;
    }
    if (!check_fields(ratkit::core::reduce(ratkit::core::from_int(0, -9)), 0, 1, sign_t::positive,
                      "reduce(0/-9)")) {
        return false;
    }
    return true;
}

bool test_division_by_zero() {
    try {
        (void)ratkit::core::div(ratkit::core::from_int(1, 2), ratkit::core::from_int(0, 3));
        std::cerr << "division by zero did not throw\n";
        return false;
    } catch (const std::domain_error&) {
    }
    try {
        (void)ratkit::core::reciprocal(rational::zero());
        std::cerr << "reciprocal of zero did not throw\n";
        return false;
    } catch (const std::domain_error&) {
    }
    return true;
}

bool test_from_magnitudes() {
    const rational value = rational::from_magnitudes(bigint(6), bigint(4), sign_t::negative);
    if (!check_fields(value, 6, 4, sign_t::negative, "from_magnitudes(6, 4, negative)")) {
        return false;
    }
    if (!check_fields(rational::from_magnitudes(bigint(0), bigint(3), sign_t::positive), 0, 3,
                      sign_t::positive, "from_magnitudes(0, 3, positive)")) {
        return false;
    }
    const bigint bad_denominators[] = {bigint(0), bigint(-5)};
    for (const auto& denominator : bad_denominators) {
        try {
            (void)rational::from_magnitudes(bigint(1), denominator, sign_t::positive);
            std::cerr << "from_magnitudes accepted denominator " << denominator << "\n";
            return false;
        } catch (const std::domain_error&) {
        }
    }
    return true;
}

bool test_reciprocal_keeps_sign() {
    return check_fields(ratkit::core::reciprocal(ratkit::core::from_int(-4, 6)), 6, 4,
                        sign_t::negative, "reciprocal(-4/6)");
}

} // namespace

int main() {
    if (!test_from_int_signs()) return 1;
    if (!test_from_bigint_matches_from_int()) return 1;
    if (!test_constructors_do_not_reduce()) return 1;
    if (!test_zero_denominator_rejected()) return 1;
    if (!test_sign_helpers()) return 1;
    if (!test_worked_examples()) return 1;
    if (!test_normalize()) return 1;
    if (!test_zero_results_are_positive()) return 1;
    if (!test_division_by_zero()) return 1;
    if (!test_reciprocal_keeps_sign()) return 1;
    if (!test_from_magnitudes()) return 1;
    std::cout << "rational_basic tests passed\n";
    return 0;
}
