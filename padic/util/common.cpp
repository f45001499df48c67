#include "util/common.h"
#include <sstream>

using namespace std;

namespace padic
{
    namespace util
    {
        bool is_prime(uint64_t value)
        {
            if (value < 2)
            {
                return false;
            }
            if (value < 4)
            {
                return true;
            }
            if (value % 2 == 0 || value % 3 == 0)
            {
                return false;
            }
            for (uint64_t i = 5; i <= value / i; i += 6)
            {
                if (value % i == 0 || value % (i + 2) == 0)
                {
                    return false;
                }
            }
            return true;
        }

        uint64_t exponentiate_uint64_checked(uint64_t base, int exponent)
        {
            if (exponent < 0)
            {
                throw invalid_argument("exponent cannot be negative");
            }
            const uint64_t limit = 1ULL << 62;
            uint64_t result = 1;
            for (int i = 0; i < exponent; i++)
            {
                if (base != 0 && result > (limit - 1) / base)
                {
                    throw invalid_argument("result does not fit in 62 bits");
                }
                result *= base;
            }
            return result;
        }

        string poly_to_dec_string(const uint64_t *coeffs, int coeff_count, const string &var_name)
        {
            ostringstream result;
            bool empty = true;
            for (int i = coeff_count - 1; i >= 0; i--)
            {
                uint64_t coeff = coeffs[i];
                if (coeff == 0)
                {
                    continue;
                }
                if (!empty)
                {
                    result << " + ";
                }
                empty = false;
                if (coeff != 1 || i == 0)
                {
                    result << coeff;
                    if (i > 0)
                    {
                        result << "*";
                    }
                }
                if (i > 0)
                {
                    result << var_name;
                    if (i > 1)
                    {
                        result << "^" << i;
                    }
                }
            }
            if (empty)
            {
                return "0";
            }
            return result.str();
        }
    }
}
