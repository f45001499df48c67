#pragma once

#include <cstdint>
#include "smallmodulus.h"

namespace padic
{
    namespace util
    {
        inline std::uint64_t small_modulo_uint64(std::uint64_t value, const SmallModulus &smallmodulus)
        {
            return value % smallmodulus.value();
        }

        void negate_uint_smallmod(const std::uint64_t *operand, const SmallModulus &smallmodulus, std::uint64_t *result);

        void add_uint_uint_smallmod(const std::uint64_t *operand1, const std::uint64_t *operand2, const SmallModulus &smallmodulus, std::uint64_t *result);

        void sub_uint_uint_smallmod(const std::uint64_t *operand1, const std::uint64_t *operand2, const SmallModulus &smallmodulus, std::uint64_t *result);

        void barrett_reduce_128(const std::uint64_t *input, const SmallModulus &smallmodulus, std::uint64_t *result);

        void multiply_uint64_smallmod(const std::uint64_t *operand1, const std::uint64_t *operand2, const SmallModulus &smallmodulus, std::uint64_t *result);

        void exponentiate_uint_smallmod(const std::uint64_t *operand, std::uint64_t exponent, const SmallModulus &smallmodulus, std::uint64_t *result);

        // Inverts operand modulo smallmodulus; returns false if operand is not a unit.
        bool try_invert_uint_smallmod(const std::uint64_t *operand, const SmallModulus &smallmodulus, std::uint64_t *result);
    }
}
