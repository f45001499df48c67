#include "util/uintarithsmallmod.h"
#include "util/uintarith.h"
#include "util/common.h"
#include <stdexcept>
#include <utility>

using namespace std;

namespace padic
{
    namespace util
    {
        void negate_uint_smallmod(const uint64_t *operand, const SmallModulus &smallmodulus, uint64_t *result)
        {
#ifdef _DEBUG
            if (operand == nullptr)
            {
                throw invalid_argument("operand");
            }
            if (smallmodulus.is_zero())
            {
                throw invalid_argument("modulus");
            }
            if (*operand >= smallmodulus.value())
            {
                throw out_of_range("operand");
            }
#endif
            int64_t non_zero = static_cast<int64_t>(*operand != 0);
            *result = (smallmodulus.value() - *operand) & static_cast<uint64_t>(-non_zero);
        }

        void add_uint_uint_smallmod(const uint64_t *operand1, const uint64_t *operand2, const SmallModulus &smallmodulus, uint64_t *result)
        {
#ifdef _DEBUG
            if (operand1 == nullptr)
            {
                throw invalid_argument("operand1");
            }
            if (operand2 == nullptr)
            {
                throw invalid_argument("operand2");
            }
            if (smallmodulus.is_zero())
            {
                throw invalid_argument("modulus");
            }
            if (*operand1 >= smallmodulus.value())
            {
                throw out_of_range("operand1");
            }
            if (*operand2 >= smallmodulus.value())
            {
                throw out_of_range("operand2");
            }
#endif
            bool carry = add_uint64(*operand1, *operand2, 0, result) != 0;
            *result -= smallmodulus.value() & static_cast<uint64_t>(-static_cast<int64_t>(carry || (*result >= smallmodulus.value())));
        }

        void sub_uint_uint_smallmod(const uint64_t *operand1, const uint64_t *operand2, const SmallModulus &smallmodulus, uint64_t *result)
        {
#ifdef _DEBUG
            if (operand1 == nullptr)
            {
                throw invalid_argument("operand1");
            }
            if (operand2 == nullptr)
            {
                throw invalid_argument("operand2");
            }
            if (smallmodulus.is_zero())
            {
                throw invalid_argument("modulus");
            }
            if (*operand1 >= smallmodulus.value())
            {
                throw out_of_range("operand1");
            }
            if (*operand2 >= smallmodulus.value())
            {
                throw out_of_range("operand2");
            }
#endif
            int64_t borrow = sub_uint64(*operand1, *operand2, 0, result);
            *result += smallmodulus.value() & static_cast<uint64_t>(-borrow);
        }

        void barrett_reduce_128(const uint64_t *input, const SmallModulus &smallmodulus, uint64_t *result)
        {
            // Reduces input using base 2^64 Barrett reduction
            // input allocation size must be 128 bits

            uint64_t tmp1, tmp2[2], tmp3, carry;
            const uint64_t *const_ratio = smallmodulus.const_ratio().data();

            // Multiply input and const_ratio
            // Round 1
            multiply_uint64_hw64(input[0], const_ratio[0], &carry);

            multiply_uint64(input[0], const_ratio[1], tmp2);
            tmp3 = tmp2[1] + add_uint64(tmp2[0], carry, 0, &tmp1);

            // Round 2
            multiply_uint64(input[1], const_ratio[0], tmp2);
            carry = tmp2[1] + add_uint64(tmp1, tmp2[0], 0, &tmp1);

            // This is all we care about
            tmp1 = input[1] * const_ratio[1] + tmp3 + carry;

            // Barrett subtraction
            *result = input[0] - tmp1 * smallmodulus.value();

            // One more subtraction is enough
            *result -= smallmodulus.value() & static_cast<uint64_t>(-static_cast<int64_t>(*result >= smallmodulus.value()));
        }

        void multiply_uint64_smallmod(const uint64_t *operand1, const uint64_t *operand2, const SmallModulus &smallmodulus, uint64_t *result)
        {
#ifdef _DEBUG
            if (operand1 == nullptr)
            {
                throw invalid_argument("operand1");
            }
            if (operand2 == nullptr)
            {
                throw invalid_argument("operand2");
            }
            if (smallmodulus.is_zero())
            {
                throw invalid_argument("modulus");
            }
            if (result == nullptr)
            {
                throw invalid_argument("result");
            }
#endif
            uint64_t z[2];
            multiply_uint64(*operand1, *operand2, z);
            barrett_reduce_128(z, smallmodulus, result);
        }

        void exponentiate_uint_smallmod(const uint64_t *operand, uint64_t exponent, const SmallModulus &smallmodulus, uint64_t *result)
        {
#ifdef _DEBUG
            if (operand == nullptr)
            {
                throw invalid_argument("operand");
            }
            if (smallmodulus.is_zero())
            {
                throw invalid_argument("modulus");
            }
            if (*operand >= smallmodulus.value())
            {
                throw out_of_range("operand");
            }
#endif
            // Fast cases
            if (exponent == 0)
            {
                // Result is supposed to be only one digit
                *result = smallmodulus.value() == 1 ? 0 : 1;
                return;
            }

            if (exponent == 1)
            {
                *result = *operand;
                return;
            }

            // Perform binary exponentiation.
            uint64_t power = *operand;
            uint64_t product = 0;
            uint64_t intermediate = smallmodulus.value() == 1 ? 0 : 1;

            // Initially: power = operand and intermediate = 1, product is irrelevant.
            while (true)
            {
                if (exponent & 1)
                {
                    multiply_uint64_smallmod(&power, &intermediate, smallmodulus, &product);
                    swap(product, intermediate);
                }
                exponent >>= 1;
                if (exponent == 0)
                {
                    break;
                }
                multiply_uint64_smallmod(&power, &power, smallmodulus, &product);
                swap(product, power);
            }
            *result = intermediate;
        }

        bool try_invert_uint_smallmod(const uint64_t *operand, const SmallModulus &smallmodulus, uint64_t *result)
        {
#ifdef _DEBUG
            if (operand == nullptr)
            {
                throw invalid_argument("operand");
            }
            if (smallmodulus.is_zero())
            {
                throw invalid_argument("modulus");
            }
#endif
            // Extended Euclidean algorithm on signed 64-bit values; the modulus is at most 62 bits.
            int64_t modulus = static_cast<int64_t>(smallmodulus.value());
            int64_t a = static_cast<int64_t>(*operand % smallmodulus.value());
            int64_t b = modulus;
            int64_t x0 = 1;
            int64_t x1 = 0;
            while (b != 0)
            {
                int64_t quotient = a / b;
                int64_t temp = a - quotient * b;
                a = b;
                b = temp;
                temp = x0 - quotient * x1;
                x0 = x1;
                x1 = temp;
            }
            if (a != 1)
            {
                return false;
            }
            if (x0 < 0)
            {
                x0 += modulus;
            }
            *result = static_cast<uint64_t>(x0) % smallmodulus.value();
            return true;
        }
    }
}
