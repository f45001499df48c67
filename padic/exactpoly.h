#pragma once

#include <climits>
#include <cstdint>
#include <string>
#include <vector>
#include <gmpxx.h>
#include "smallmodulus.h"

namespace padic
{
    /**
    Valuation returned for zero.
    */
    const int infinite_valuation = INT_MAX;

    /**
    Returns the p-adic valuation of a rational number, or infinite_valuation if it is zero.
    */
    int p_adic_valuation(const mpq_class &value, std::uint64_t prime);

    /**
    Reduces a p-integral rational number modulo a SmallModulus p^N.

    @param[in] value The rational number
    @param[in] modulus The modulus p^N
    @throws std::invalid_argument if the denominator of value is not invertible modulo modulus
    */
    std::uint64_t reduce_rational(const mpq_class &value, const SmallModulus &modulus);

    /**
    Represents a univariate polynomial with exact rational coefficients. This is the form in which the
    defining polynomial of an extension is given, before its coefficients are reduced into the working
    precision of a p-adic base ring.

    Coefficients are stored lowest degree first and never carry leading zeros.

    @par Thread Safety
    ExactPolynomial is immutable after construction.
    */
    class ExactPolynomial
    {
    public:
        /**
        Creates the zero polynomial.
        */
        ExactPolynomial() = default;

        /**
        Creates a polynomial from its coefficients, lowest degree first.

        @param[in] coeffs The coefficients
        */
        explicit ExactPolynomial(std::vector<mpq_class> coeffs);

        /**
        Creates a polynomial from integer coefficients, lowest degree first.

        @param[in] coeffs The coefficients
        */
        explicit ExactPolynomial(const std::vector<long> &coeffs);

        /**
        Parses a polynomial written as a sum of terms, e.g. "x^5 + 75*x^3 - 15*x^2 + 125*x - 5". Coefficients
        may be integers or fractions ("1/3*x^2"), the '*' between coefficient and variable is optional, and all
        terms must use the same variable name.

        @param[in] text The polynomial
        @throws std::invalid_argument if text cannot be parsed or has an exponent above PADIC_POLY_DEGREE_MAX
        */
        explicit ExactPolynomial(const std::string &text);

        /**
        Returns the degree, or -1 for the zero polynomial.
        */
        inline int degree() const
        {
            return static_cast<int>(coeffs_.size()) - 1;
        }

        inline bool is_zero() const
        {
            return coeffs_.empty();
        }

        inline const std::vector<mpq_class> &coeffs() const
        {
            return coeffs_;
        }

        /**
        Returns the coefficient of x^index; zero beyond the degree.

        @throws std::out_of_range if index is negative
        */
        mpq_class coeff(int index) const;

        /**
        @throws std::logic_error if the polynomial is zero
        */
        const mpq_class &leading_coefficient() const;

        bool is_monic() const;

        /**
        Returns whether every coefficient is an integer.
        */
        bool is_integral() const;

        /**
        Returns whether every coefficient has non-negative p-adic valuation.
        */
        bool is_p_integral(std::uint64_t prime) const;

        /**
        Returns the polynomial divided by its leading coefficient.

        @throws std::logic_error if the polynomial is zero
        */
        ExactPolynomial monic() const;

        /**
        Reduces every coefficient modulo p^N, lowest degree first.

        @throws std::invalid_argument if a coefficient is not p-integral
        */
        std::vector<std::uint64_t> reduce(const SmallModulus &modulus) const;

        inline bool operator ==(const ExactPolynomial &other) const
        {
            return coeffs_ == other.coeffs_;
        }

        inline bool operator !=(const ExactPolynomial &other) const
        {
            return !operator ==(other);
        }

        /**
        Writes the polynomial in decreasing degree order, e.g. "x^5 + 75*x^3 - 15*x^2 + 125*x - 5".

        @param[in] var_name Name of the variable
        */
        std::string to_string(const std::string &var_name = "x") const;

    private:
        void trim();

        std::vector<mpq_class> coeffs_;
    };
}
