#pragma once

#include <cstdint>
#include <vector>
#include "smallmodulus.h"

namespace padic
{
    namespace util
    {
        /*
        Dense polynomials are stored lowest degree first, one std::uint64_t per coefficient, every
        coefficient reduced modulo the SmallModulus passed along.
        */

        void add_poly_poly_coeff_smallmod(const std::uint64_t *operand1, const std::uint64_t *operand2, int coeff_count, const SmallModulus &modulus, std::uint64_t *result);

        void sub_poly_poly_coeff_smallmod(const std::uint64_t *operand1, const std::uint64_t *operand2, int coeff_count, const SmallModulus &modulus, std::uint64_t *result);

        void negate_poly_coeff_smallmod(const std::uint64_t *poly, int coeff_count, const SmallModulus &modulus, std::uint64_t *result);

        void multiply_poly_scalar_coeff_smallmod(const std::uint64_t *poly, int coeff_count, const std::uint64_t *scalar, const SmallModulus &modulus, std::uint64_t *result);

        void multiply_poly_poly_coeff_smallmod(const std::uint64_t *operand1, int operand1_coeff_count, const std::uint64_t *operand2, int operand2_coeff_count,
            const SmallModulus &modulus, int result_coeff_count, std::uint64_t *result);

        /**
        Reduces value modulo a monic polynomial in place. On return the first (modulus_coeff_count - 1)
        coefficients of value hold the remainder and the rest are zero.

        @param[in,out] value The polynomial to reduce
        @param[in] value_coeff_count Number of coefficients of value
        @param[in] poly_modulus A monic polynomial (its top coefficient must be 1)
        @param[in] poly_modulus_coeff_count Number of coefficients of poly_modulus (degree + 1)
        @param[in] modulus The coefficient modulus
        @throws std::invalid_argument if poly_modulus is not monic
        */
        void modulo_poly_monic_inplace(std::uint64_t *value, int value_coeff_count, const std::uint64_t *poly_modulus, int poly_modulus_coeff_count,
            const SmallModulus &modulus);

        /**
        Multiplies two residues modulo a monic polynomial f of degree d. Operands and result have d coefficients.
        The result may alias an operand.
        */
        void nonfft_multiply_poly_poly_polymod_coeff_smallmod(const std::uint64_t *operand1, const std::uint64_t *operand2, const std::uint64_t *poly_modulus,
            int poly_modulus_coeff_count, const SmallModulus &modulus, std::uint64_t *result);

        /**
        Raises a residue modulo a monic polynomial f of degree d to the given power. Operand and result have d coefficients.
        */
        void exponentiate_poly_polymod_coeff_smallmod(const std::uint64_t *operand, std::uint64_t exponent, const std::uint64_t *poly_modulus,
            int poly_modulus_coeff_count, const SmallModulus &modulus, std::uint64_t *result);

        /*
        Variable-degree polynomials over a prime field F_p. The modulus must be prime for these, so that
        every non-zero leading coefficient is invertible.
        */

        // Drops leading zero coefficients; the zero polynomial becomes empty.
        void trim_poly(std::vector<std::uint64_t> &poly);

        // Degree of a trimmed polynomial, -1 for the zero polynomial.
        inline int poly_degree(const std::vector<std::uint64_t> &poly)
        {
            return static_cast<int>(poly.size()) - 1;
        }

        void divide_poly_poly_coeff_primemod(const std::vector<std::uint64_t> &numerator, const std::vector<std::uint64_t> &denominator,
            const SmallModulus &prime, std::vector<std::uint64_t> &quotient, std::vector<std::uint64_t> &remainder);

        // Monic greatest common divisor.
        std::vector<std::uint64_t> gcd_poly_poly_coeff_primemod(std::vector<std::uint64_t> operand1, std::vector<std::uint64_t> operand2,
            const SmallModulus &prime);

        /**
        Returns whether a polynomial of positive degree is irreducible over F_p (Rabin's test). The polynomial is made
        monic first.

        @param[in] poly The polynomial, lowest degree first, coefficients reduced modulo prime
        @param[in] prime The prime p
        @throws std::invalid_argument if poly is constant
        */
        bool is_irreducible_poly_coeff_primemod(std::vector<std::uint64_t> poly, const SmallModulus &prime);
    }
}
