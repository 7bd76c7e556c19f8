// examples/example_basic.cpp — Walks through construction, arithmetic and ordering of rationals.

#include <iostream>
#include <stdexcept>

#include <ratkit/ratkit.hpp>

int main() {
    using ratkit::core::from_int;
    using ratkit::core::rational;

    const rational half = from_int(1, 2);
    const rational third = from_int(1, 3);
    std::cout << half << " + " << third << " = " << ratkit::core::add(half, third) << '\n';
    std::cout << half << " - " << third << " = " << ratkit::core::sub(half, third) << '\n';
    std::cout << from_int(2, 3) << " * " << from_int(3, 4) << " = "
              << ratkit::core::mul(from_int(2, 3), from_int(3, 4)) << '\n';
    std::cout << half << " / " << from_int(1, 4) << " = "
              << ratkit::core::div(half, from_int(1, 4)) << '\n';

    const rational unreduced = from_int(-10, 4);
    std::cout << "stored " << unreduced << ", reduced " << ratkit::core::reduce(unreduced) << '\n';
    std::cout << "integer part " << ratkit::core::integer_part(unreduced) << ", fraction "
              << ratkit::core::fractional_part(unreduced) << '\n';

    rational harmonic;
    for (int k = 1; k <= 20; ++k) {
        harmonic += from_int(1, k);
    }
    std::cout << "H(20) = " << harmonic << '\n';
    std::cout << "H(20) > 3 is " << std::boolalpha << ratkit::core::gt(harmonic, rational(3)) << '\n';
    std::cout << "(3/2)^10 = " << ratkit::core::pow(from_int(3, 2), 10) << '\n';

    try {
        (void)ratkit::core::div(half, rational::zero());
    } catch (const std::domain_error &err) {
        std::cout << "division rejected: " << err.what() << '\n';
    }
    return 0;
}
