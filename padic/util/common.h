#pragma once

#include <cstdint>
#include <string>
#include <stdexcept>
#include "util/defines.h"

namespace padic
{
    namespace util
    {
        inline void get_msb_index_generic(unsigned long *result, std::uint64_t value)
        {
#ifdef _DEBUG
            if (result == nullptr)
            {
                throw std::invalid_argument("result");
            }
#endif
            static const unsigned long deBruijnTable64[64] = {
                63,  0, 58,  1, 59, 47, 53,  2,
                60, 39, 48, 27, 54, 33, 42,  3,
                61, 51, 37, 40, 49, 18, 28, 20,
                55, 30, 34, 11, 43, 14, 22,  4,
                62, 57, 46, 52, 38, 26, 32, 41,
                50, 36, 17, 19, 29, 10, 13, 21,
                56, 45, 25, 31, 35, 16,  9, 12,
                44, 24, 15,  8, 23,  7,  6,  5
            };

            value |= value >> 1;
            value |= value >> 2;
            value |= value >> 4;
            value |= value >> 8;
            value |= value >> 16;
            value |= value >> 32;

            *result = deBruijnTable64[((value - (value >> 1)) * 0x07EDD5E59A4E28C2) >> 58];
        }

        inline int get_significant_bit_count(std::uint64_t value)
        {
            if (value == 0)
            {
                return 0;
            }

            unsigned long result;
            PADIC_MSB_INDEX_UINT64(&result, value);
            return static_cast<int>(result + 1);
        }

        /**
        Returns true if value is a prime number. Trial division; intended for the primes of p-adic rings,
        which are small compared to the working moduli built on them.
        */
        bool is_prime(std::uint64_t value);

        /**
        Returns base^exponent, or throws std::invalid_argument if the result does not fit in 62 bits.
        */
        std::uint64_t exponentiate_uint64_checked(std::uint64_t base, int exponent);

        /**
        Writes a dense polynomial with reduced coefficients in decreasing degree order, e.g. "3*x^2 + x + 4".
        Zero coefficients are skipped; the zero polynomial prints as "0".

        @param[in] coeffs Coefficients, lowest degree first.
        @param[in] coeff_count Number of coefficients.
        @param[in] var_name Name of the variable.
        */
        std::string poly_to_dec_string(const std::uint64_t *coeffs, int coeff_count, const std::string &var_name);
    }
}
