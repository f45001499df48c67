#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "exactpoly.h"
#include "padicbase.h"

namespace padic
{
    class PAdicPolynomial;

    /**
    The ring of univariate polynomials over a p-adic base ring. Its elements, PAdicPolynomial objects,
    carry their coefficients reduced modulo the working modulus p^N of the base ring.
    */
    class PolynomialRing : public std::enable_shared_from_this<PolynomialRing>
    {
    public:
        /**
        @param[in] base_ring The coefficient ring
        @param[in] variable_name Name of the polynomial variable
        @throws std::invalid_argument if base_ring is null or variable_name is empty
        */
        PolynomialRing(std::shared_ptr<const PAdicBaseRing> base_ring, std::string variable_name = "x");

        inline std::shared_ptr<const PAdicBaseRing> base_ring() const
        {
            return base_ring_;
        }

        inline const std::string &variable_name() const
        {
            return variable_name_;
        }

        /**
        Creates a polynomial in this ring; coefficients are reduced modulo p^N and leading zeros dropped.

        @param[in] coeffs The coefficients, lowest degree first
        */
        PAdicPolynomial element(std::vector<std::uint64_t> coeffs) const;

        /**
        Reduces an exact polynomial into this ring.

        @throws std::invalid_argument if a coefficient of poly is not p-integral
        */
        PAdicPolynomial reduce(const ExactPolynomial &poly) const;

        bool operator ==(const PolynomialRing &other) const;

        inline bool operator !=(const PolynomialRing &other) const
        {
            return !operator ==(other);
        }

        /**
        Returns e.g. "Univariate Polynomial Ring in x over 5-adic Ring with capped relative precision 5".
        */
        std::string to_string() const;

    private:
        std::shared_ptr<const PAdicBaseRing> base_ring_;

        std::string variable_name_;
    };

    /**
    Represents a polynomial over a p-adic base ring, known modulo p^N. The working defining polynomial of
    an extension is a PAdicPolynomial.
    */
    class PAdicPolynomial
    {
    public:
        PAdicPolynomial(std::shared_ptr<const PolynomialRing> parent, std::vector<std::uint64_t> coeffs);

        inline std::shared_ptr<const PolynomialRing> parent() const
        {
            return parent_;
        }

        inline std::shared_ptr<const PAdicBaseRing> base_ring() const
        {
            return parent_->base_ring();
        }

        /**
        Returns the degree, or -1 for the zero polynomial.
        */
        inline int degree() const
        {
            return static_cast<int>(coeffs_.size()) - 1;
        }

        inline int coeff_count() const
        {
            return static_cast<int>(coeffs_.size());
        }

        inline const std::vector<std::uint64_t> &coeffs() const
        {
            return coeffs_;
        }

        /**
        Returns the coefficient of x^index; zero beyond the degree.

        @throws std::out_of_range if index is negative
        */
        std::uint64_t coeff(int index) const;

        inline bool is_monic() const
        {
            return !coeffs_.empty() && coeffs_.back() == 1;
        }

        bool operator ==(const PAdicPolynomial &other) const;

        inline bool operator !=(const PAdicPolynomial &other) const
        {
            return !operator ==(other);
        }

        /**
        Writes the coefficients as residues modulo p^N, e.g. "x^2 + 3120".
        */
        std::string to_string() const;

    private:
        std::shared_ptr<const PolynomialRing> parent_;

        std::vector<std::uint64_t> coeffs_;
    };
}
