/**
 * @file reduction_example.cpp
 * @brief Montgomery and Barrett multiplication example
 */

#include "modred/modred.h"
#include <iostream>

int main() {
    std::cout << "=== modred Reduction Example ===" << std::endl;
    std::cout << "Library version: " << modred_version() << std::endl;

    mpz_class n("18446744069414584321");
    mpz_class a("1234567890123456789");
    mpz_class b("9876543210987654321");

    modred::math::MontgomeryEngine mont(n);
    modred::math::BarrettEngine barrett(n);

    modred::math::MontgomeryValue am = mont.to_montgomery(a);
    modred::math::MontgomeryValue bm = mont.to_montgomery(b);
    mpz_class via_montgomery = mont.from_montgomery(mont.multiply(am, bm));
    mpz_class via_barrett = barrett.multiply(a, b);

    std::cout << "N          = " << n << std::endl;
    std::cout << "N'         = " << mont.n_prime() << std::endl;
    std::cout << "mu         = " << barrett.mu() << std::endl;
    std::cout << "Montgomery = " << via_montgomery << std::endl;
    std::cout << "Barrett    = " << via_barrett << std::endl;
    std::cout << "Naive      = " << mpz_class((a * b) % n) << std::endl;

    return via_montgomery == via_barrett ? 0 : 1;
}
