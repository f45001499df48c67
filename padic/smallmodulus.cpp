#include "smallmodulus.h"
#include "util/common.h"
#include "util/uintarith.h"
#include <stdexcept>

using namespace padic::util;
using namespace std;

namespace padic
{
    SmallModulus::SmallModulus(uint64_t value)
    {
        set_value(value);
    }

    string SmallModulus::to_string() const
    {
        return std::to_string(value_);
    }

    void SmallModulus::set_value(uint64_t value)
    {
        if (value == 0)
        {
            // Zero settings
            value_ = 0;
            const_ratio_ = { { 0, 0, 0 } };
            bit_count_ = 0;
        }
        else if (value >> 62 != 0)
        {
            throw invalid_argument("value can be at most 62 bits, and cannot be 2^62");
        }
        else
        {
            // All normal, compute const_ratio and set everything
            value_ = value;
            bit_count_ = get_significant_bit_count(value_);

            // Compute Barrett ratios for 64-bit words (barrett_reduce_128): 2^128 = quotient * value + remainder
            uint64_t numerator[2] = { ~static_cast<uint64_t>(0), ~static_cast<uint64_t>(0) };
            uint64_t quotient[2];
            divide_uint128_uint64_inplace(numerator, value_, quotient);
            uint64_t remainder = numerator[0] + 1;
            if (remainder == value_)
            {
                quotient[1] += add_uint64(quotient[0], 1, 0, quotient);
                remainder = 0;
            }
            const_ratio_[0] = quotient[0];
            const_ratio_[1] = quotient[1];

            // We need the remainder for barrett_reduce_256
            const_ratio_[2] = remainder;
        }
    }
}
