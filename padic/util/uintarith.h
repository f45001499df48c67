#pragma once

#include <stdexcept>
#include <cstdint>
#include "util/common.h"
#include "util/defines.h"

namespace padic
{
    namespace util
    {
        inline unsigned char add_uint64(std::uint64_t operand1, std::uint64_t operand2, unsigned char carry, std::uint64_t *result)
        {
#ifdef _DEBUG
            if (result == nullptr)
            {
                throw std::invalid_argument("result cannot be null");
            }
#endif
            operand1 += operand2;
            *result = operand1 + carry;
            return (operand1 < operand2) || (~operand1 < carry);
        }

        inline unsigned char sub_uint64(std::uint64_t operand1, std::uint64_t operand2, unsigned char borrow, std::uint64_t *result)
        {
#ifdef _DEBUG
            if (result == nullptr)
            {
                throw std::invalid_argument("result cannot be null");
            }
#endif
            std::uint64_t diff = operand1 - operand2;
            *result = diff - (borrow != 0);
            return (diff > operand1) || (diff < borrow);
        }

        inline void multiply_uint64_generic(std::uint64_t operand1, std::uint64_t operand2, std::uint64_t *result128)
        {
#ifdef _DEBUG
            if (result128 == nullptr)
            {
                throw std::invalid_argument("result128 cannot be null");
            }
#endif
            std::uint64_t operand1_coeff_right = operand1 & 0x00000000FFFFFFFF;
            std::uint64_t operand2_coeff_right = operand2 & 0x00000000FFFFFFFF;
            operand1 >>= 32;
            operand2 >>= 32;

            std::uint64_t middle1 = operand1 * operand2_coeff_right;
            std::uint64_t middle;
            std::uint64_t left = operand1 * operand2 + (static_cast<std::uint64_t>(add_uint64(middle1, operand2 * operand1_coeff_right, 0, &middle)) << 32);
            std::uint64_t right = operand1_coeff_right * operand2_coeff_right;
            std::uint64_t temp_sum = (right >> 32) + (middle & 0x00000000FFFFFFFF);

            result128[1] = left + (middle >> 32) + (temp_sum >> 32);
            result128[0] = (temp_sum << 32) | (right & 0x00000000FFFFFFFF);
        }

        inline void multiply_uint64(std::uint64_t operand1, std::uint64_t operand2, std::uint64_t *result128)
        {
            PADIC_MULTIPLY_UINT64(operand1, operand2, result128);
        }

        inline void multiply_uint64_hw64_generic(std::uint64_t operand1, std::uint64_t operand2, std::uint64_t *hw64)
        {
            std::uint64_t result128[2];
            multiply_uint64_generic(operand1, operand2, result128);
            *hw64 = result128[1];
        }

        inline void multiply_uint64_hw64(std::uint64_t operand1, std::uint64_t operand2, std::uint64_t *hw64)
        {
            PADIC_MULTIPLY_UINT64_HW64(operand1, operand2, hw64);
        }

        // Leaves the remainder in numerator[0]; denominator must be below 2^63
        inline void divide_uint128_uint64_inplace_generic(std::uint64_t *numerator, std::uint64_t denominator, std::uint64_t *quotient)
        {
#ifdef _DEBUG
            if (numerator == nullptr || quotient == nullptr)
            {
                throw std::invalid_argument("numerator and quotient cannot be null");
            }
            if (denominator == 0 || denominator >> 63 != 0)
            {
                throw std::invalid_argument("denominator");
            }
#endif
            std::uint64_t remainder = 0;
            quotient[0] = 0;
            quotient[1] = 0;
            for (int i = 127; i >= 0; i--)
            {
                remainder = (remainder << 1) | ((numerator[i / 64] >> (i % 64)) & 1);
                if (remainder >= denominator)
                {
                    remainder -= denominator;
                    quotient[i / 64] |= std::uint64_t(1) << (i % 64);
                }
            }
            numerator[0] = remainder;
            numerator[1] = 0;
        }

        inline void divide_uint128_uint64_inplace(std::uint64_t *numerator, std::uint64_t denominator, std::uint64_t *quotient)
        {
            PADIC_DIVIDE_UINT128_UINT64(numerator, denominator, quotient);
        }
    }
}
