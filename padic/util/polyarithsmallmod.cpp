#include "util/polyarithsmallmod.h"
#include "util/uintarithsmallmod.h"
#include <algorithm>
#include <stdexcept>

using namespace std;

namespace padic
{
    namespace util
    {
        void add_poly_poly_coeff_smallmod(const uint64_t *operand1, const uint64_t *operand2, int coeff_count, const SmallModulus &modulus, uint64_t *result)
        {
#ifdef _DEBUG
            if (operand1 == nullptr && coeff_count > 0)
            {
                throw invalid_argument("operand1");
            }
            if (operand2 == nullptr && coeff_count > 0)
            {
                throw invalid_argument("operand2");
            }
            if (result == nullptr && coeff_count > 0)
            {
                throw invalid_argument("result");
            }
#endif
            for (int i = 0; i < coeff_count; i++)
            {
                add_uint_uint_smallmod(operand1 + i, operand2 + i, modulus, result + i);
            }
        }

        void sub_poly_poly_coeff_smallmod(const uint64_t *operand1, const uint64_t *operand2, int coeff_count, const SmallModulus &modulus, uint64_t *result)
        {
#ifdef _DEBUG
            if (operand1 == nullptr && coeff_count > 0)
            {
                throw invalid_argument("operand1");
            }
            if (operand2 == nullptr && coeff_count > 0)
            {
                throw invalid_argument("operand2");
            }
            if (result == nullptr && coeff_count > 0)
            {
                throw invalid_argument("result");
            }
#endif
            for (int i = 0; i < coeff_count; i++)
            {
                sub_uint_uint_smallmod(operand1 + i, operand2 + i, modulus, result + i);
            }
        }

        void negate_poly_coeff_smallmod(const uint64_t *poly, int coeff_count, const SmallModulus &modulus, uint64_t *result)
        {
            for (int i = 0; i < coeff_count; i++)
            {
                negate_uint_smallmod(poly + i, modulus, result + i);
            }
        }

        void multiply_poly_scalar_coeff_smallmod(const uint64_t *poly, int coeff_count, const uint64_t *scalar, const SmallModulus &modulus, uint64_t *result)
        {
            uint64_t reduced_scalar = small_modulo_uint64(*scalar, modulus);
            for (int i = 0; i < coeff_count; i++)
            {
                multiply_uint64_smallmod(poly + i, &reduced_scalar, modulus, result + i);
            }
        }

        void multiply_poly_poly_coeff_smallmod(const uint64_t *operand1, int operand1_coeff_count, const uint64_t *operand2, int operand2_coeff_count,
            const SmallModulus &modulus, int result_coeff_count, uint64_t *result)
        {
#ifdef _DEBUG
            if (operand1 == nullptr && operand1_coeff_count > 0)
            {
                throw invalid_argument("operand1");
            }
            if (operand2 == nullptr && operand2_coeff_count > 0)
            {
                throw invalid_argument("operand2");
            }
            if (result == nullptr && result_coeff_count > 0)
            {
                throw invalid_argument("result");
            }
            if (result != nullptr && (operand1 == result || operand2 == result))
            {
                throw invalid_argument("result cannot point to the same value as operand1 or operand2");
            }
#endif
            fill(result, result + result_coeff_count, 0);
            uint64_t product;
            for (int operand1_index = 0; operand1_index < operand1_coeff_count; operand1_index++)
            {
                if (operand1[operand1_index] == 0)
                {
                    // If coefficient is 0, then move on to next coefficient.
                    continue;
                }
                // Lastly, do more expensive add if other cases don't handle it.
                for (int operand2_index = 0; operand2_index < operand2_coeff_count; operand2_index++)
                {
                    int product_coeff_index = operand1_index + operand2_index;
                    if (product_coeff_index >= result_coeff_count)
                    {
                        break;
                    }
                    if (operand2[operand2_index] == 0)
                    {
                        continue;
                    }
                    multiply_uint64_smallmod(operand1 + operand1_index, operand2 + operand2_index, modulus, &product);
                    add_uint_uint_smallmod(result + product_coeff_index, &product, modulus, result + product_coeff_index);
                }
            }
        }

        void modulo_poly_monic_inplace(uint64_t *value, int value_coeff_count, const uint64_t *poly_modulus, int poly_modulus_coeff_count,
            const SmallModulus &modulus)
        {
            int degree = poly_modulus_coeff_count - 1;
            if (degree < 0 || poly_modulus[degree] != 1)
            {
                throw invalid_argument("poly_modulus must be monic");
            }
            uint64_t product;
            for (int i = value_coeff_count - 1; i >= degree; i--)
            {
                uint64_t leading = value[i];
                if (leading == 0)
                {
                    continue;
                }
                // value -= leading * x^(i - degree) * poly_modulus
                for (int j = 0; j < degree; j++)
                {
                    if (poly_modulus[j] == 0)
                    {
                        continue;
                    }
                    multiply_uint64_smallmod(&leading, poly_modulus + j, modulus, &product);
                    sub_uint_uint_smallmod(value + i - degree + j, &product, modulus, value + i - degree + j);
                }
                value[i] = 0;
            }
        }

        void nonfft_multiply_poly_poly_polymod_coeff_smallmod(const uint64_t *operand1, const uint64_t *operand2, const uint64_t *poly_modulus,
            int poly_modulus_coeff_count, const SmallModulus &modulus, uint64_t *result)
        {
            int degree = poly_modulus_coeff_count - 1;
            if (degree <= 0)
            {
                throw invalid_argument("poly_modulus must have positive degree");
            }
            int product_coeff_count = degree + degree - 1;
            vector<uint64_t> intermediate(product_coeff_count);
            multiply_poly_poly_coeff_smallmod(operand1, degree, operand2, degree, modulus, product_coeff_count, intermediate.data());
            modulo_poly_monic_inplace(intermediate.data(), product_coeff_count, poly_modulus, poly_modulus_coeff_count, modulus);
            copy(intermediate.begin(), intermediate.begin() + degree, result);
        }

        void exponentiate_poly_polymod_coeff_smallmod(const uint64_t *operand, uint64_t exponent, const uint64_t *poly_modulus,
            int poly_modulus_coeff_count, const SmallModulus &modulus, uint64_t *result)
        {
            int degree = poly_modulus_coeff_count - 1;
            if (degree <= 0)
            {
                throw invalid_argument("poly_modulus must have positive degree");
            }

            // Initially: power = operand and intermediate = 1.
            vector<uint64_t> power(operand, operand + degree);
            vector<uint64_t> intermediate(degree, 0);
            intermediate[0] = modulus.value() == 1 ? 0 : 1;
            while (exponent != 0)
            {
                if (exponent & 1)
                {
                    nonfft_multiply_poly_poly_polymod_coeff_smallmod(power.data(), intermediate.data(), poly_modulus,
                        poly_modulus_coeff_count, modulus, intermediate.data());
                }
                exponent >>= 1;
                if (exponent == 0)
                {
                    break;
                }
                nonfft_multiply_poly_poly_polymod_coeff_smallmod(power.data(), power.data(), poly_modulus,
                    poly_modulus_coeff_count, modulus, power.data());
            }
            copy(intermediate.begin(), intermediate.end(), result);
        }

        void trim_poly(vector<uint64_t> &poly)
        {
            while (!poly.empty() && poly.back() == 0)
            {
                poly.pop_back();
            }
        }

        void divide_poly_poly_coeff_primemod(const vector<uint64_t> &numerator, const vector<uint64_t> &denominator,
            const SmallModulus &prime, vector<uint64_t> &quotient, vector<uint64_t> &remainder)
        {
            vector<uint64_t> divisor(denominator);
            trim_poly(divisor);
            if (divisor.empty())
            {
                throw invalid_argument("denominator cannot be zero");
            }
            uint64_t leading_inverse;
            if (!try_invert_uint_smallmod(&divisor.back(), prime, &leading_inverse))
            {
                throw invalid_argument("leading coefficient of denominator is not invertible");
            }

            remainder = numerator;
            trim_poly(remainder);
            int divisor_degree = poly_degree(divisor);
            int quotient_coeff_count = max(poly_degree(remainder) - divisor_degree + 1, 0);
            quotient.assign(quotient_coeff_count, 0);

            uint64_t product;
            while (poly_degree(remainder) >= divisor_degree)
            {
                int shift = poly_degree(remainder) - divisor_degree;
                uint64_t factor;
                multiply_uint64_smallmod(&remainder.back(), &leading_inverse, prime, &factor);
                quotient[shift] = factor;
                for (int j = 0; j <= divisor_degree; j++)
                {
                    multiply_uint64_smallmod(&factor, &divisor[j], prime, &product);
                    sub_uint_uint_smallmod(&remainder[shift + j], &product, prime, &remainder[shift + j]);
                }
                trim_poly(remainder);
            }
        }

        vector<uint64_t> gcd_poly_poly_coeff_primemod(vector<uint64_t> operand1, vector<uint64_t> operand2, const SmallModulus &prime)
        {
            trim_poly(operand1);
            trim_poly(operand2);
            vector<uint64_t> quotient;
            vector<uint64_t> remainder;
            while (!operand2.empty())
            {
                divide_poly_poly_coeff_primemod(operand1, operand2, prime, quotient, remainder);
                operand1.swap(operand2);
                operand2.swap(remainder);
            }
            if (operand1.empty())
            {
                return operand1;
            }

            // Normalize to a monic polynomial
            uint64_t leading_inverse;
            if (!try_invert_uint_smallmod(&operand1.back(), prime, &leading_inverse))
            {
                throw invalid_argument("prime is not a prime modulus");
            }
            multiply_poly_scalar_coeff_smallmod(operand1.data(), static_cast<int>(operand1.size()), &leading_inverse, prime, operand1.data());
            return operand1;
        }

        bool is_irreducible_poly_coeff_primemod(vector<uint64_t> poly, const SmallModulus &prime)
        {
            trim_poly(poly);
            int degree = poly_degree(poly);
            if (degree <= 0)
            {
                throw invalid_argument("poly must have positive degree");
            }
            if (degree == 1)
            {
                return true;
            }

            uint64_t leading_inverse;
            if (!try_invert_uint_smallmod(&poly.back(), prime, &leading_inverse))
            {
                throw invalid_argument("prime is not a prime modulus");
            }
            multiply_poly_scalar_coeff_smallmod(poly.data(), degree + 1, &leading_inverse, prime, poly.data());
            int coeff_count = degree + 1;

            // x as a residue modulo poly
            vector<uint64_t> x(degree, 0);
            x[1] = 1;

            // Frobenius powers x^(p^k) mod poly for k = 0..degree
            vector<vector<uint64_t> > frobenius_powers(degree + 1);
            frobenius_powers[0] = x;
            for (int k = 1; k <= degree; k++)
            {
                frobenius_powers[k].resize(degree);
                exponentiate_poly_polymod_coeff_smallmod(frobenius_powers[k - 1].data(), prime.value(), poly.data(), coeff_count, prime,
                    frobenius_powers[k].data());
            }
            if (frobenius_powers[degree] != x)
            {
                return false;
            }

            // gcd(x^(p^(n/q)) - x, poly) must be trivial for every prime q dividing n
            int remaining = degree;
            for (int q = 2; q <= remaining; q++)
            {
                if (remaining % q != 0)
                {
                    continue;
                }
                while (remaining % q == 0)
                {
                    remaining /= q;
                }
                vector<uint64_t> difference(degree);
                sub_poly_poly_coeff_smallmod(frobenius_powers[degree / q].data(), x.data(), degree, prime, difference.data());
                vector<uint64_t> divisor = gcd_poly_poly_coeff_primemod(poly, difference, prime);
                if (poly_degree(divisor) != 0)
                {
                    return false;
                }
            }
            return true;
        }
    }
}
