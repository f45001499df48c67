#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "exactpoly.h"
#include "padicbase.h"
#include "padicring.h"
#include "polyring.h"
#include "printmode.h"

namespace padic
{
    class Coercion;
    class ExtensionElement;
    class ExtensionFunctor;
    class NumberField;

    /**
    The shape of a defining polynomial.
    */
    enum class ExtensionKind
    {
        unramified,
        eisenstein,
        general
    };

    std::string extension_kind_name(ExtensionKind kind);

    /**
    The arithmetic backend used for elements of an extension. It decides how elements of a ring coerce into
    its fraction field and takes no part in equality.
    */
    enum class ExtensionBackend
    {
        generic,
        specialized
    };

    std::string extension_backend_name(ExtensionBackend backend);

    /**
    The names of an extension: the generator, the generator of the residue field, and the names used when
    printing the unramified and the ramified part of an element.
    */
    struct ExtensionNames
    {
        std::string variable;

        std::string residue;

        std::string unramified;

        std::string ramified;

        inline bool operator ==(const ExtensionNames &other) const
        {
            return variable == other.variable && residue == other.residue && unramified == other.unramified
                && ramified == other.ramified;
        }

        inline bool operator !=(const ExtensionNames &other) const
        {
            return !operator ==(other);
        }
    };

    /**
    Represents the extension of a p-adic base ring obtained by adjoining a root of a polynomial f, i.e. the
    ring R[x]/(f) where R is Z_p or Q_p capped at precision N. An ExtensionRing stores two copies of f: the
    exact defining polynomial with rational coefficients, and the working polynomial whose coefficients are
    reduced modulo p^N. Both are monic and have the same degree.

    ExtensionRing is an abstract class; the concrete classes UnramifiedExtension, EisensteinExtension and
    GeneralExtension carry what depends on the shape of f. All extensions are created by ExtensionFactory,
    which validates f and returns the same object for equal constructions. An extension never validates its
    arguments itself.

    Two extensions are equal when they have equal ground rings, equal exact defining polynomials, equal
    precision caps and print modes that compare equal (see PrintMode::equals_mode). The backend and the
    working polynomial do not take part.

    @par Thread Safety
    ExtensionRing is immutable; every member function is const and can be called from several threads.
    */
    class ExtensionRing : public PAdicRing
    {
    public:
        /**
        Creates an extension. Use ExtensionFactory::create instead.

        @param[in] given_poly The working defining polynomial; its coefficient ring becomes the ground ring
        @param[in] exact_modulus The exact defining polynomial
        @param[in] precision_cap Maximum precision of elements
        @param[in] print_mode Print options; the names are folded into it
        @param[in] names The names of the extension
        @param[in] backend The arithmetic backend of elements
        */
        ExtensionRing(PAdicPolynomial given_poly, ExactPolynomial exact_modulus, int precision_cap,
            const PrintMode &print_mode, const ExtensionNames &names, ExtensionBackend backend);

        bool equals(const PAdicRing &other) const override;

        /**
        Decides whether elements of source coerce into this ring. The ground ring always coerces. Another
        extension coerces only when this ring is its fraction field: with the generic backend the coercion
        needs no map, otherwise a CoercionMap is chosen by the precision type of source. Every other case,
        including a precision type without a map, yields Coercion::none().

        @param[in] source The ring to coerce from; must be managed by a std::shared_ptr
        */
        Coercion coerce_map_from(const PAdicRing &source) const;

        /**
        Converts an element of another extension into this ring along the coercion from its parent.

        @throws std::logic_error if there is no coercion from the parent of element
        */
        ExtensionElement convert(const ExtensionElement &element) const;

        /**
        Returns the degree of the defining polynomial, the rank of this ring over its ground ring.
        */
        inline int degree() const
        {
            return given_poly_.degree();
        }

        /**
        Returns the working defining polynomial, with coefficients in the ground ring.
        */
        inline const PAdicPolynomial &defining_polynomial() const
        {
            return given_poly_;
        }

        /**
        Returns the exact defining polynomial.
        */
        inline const ExactPolynomial &exact_defining_polynomial() const
        {
            return exact_modulus_;
        }

        inline const PAdicPolynomial &modulus() const
        {
            return defining_polynomial();
        }

        inline const ExactPolynomial &exact_modulus() const
        {
            return exact_defining_polynomial();
        }

        /**
        Returns the ring this extension is built over.
        */
        inline std::shared_ptr<const PAdicBaseRing> ground_ring() const
        {
            return ground_ring_;
        }

        /**
        Walks down the tower of ground rings and returns the first base ring. Towers are one level deep
        since ExtensionFactory rejects relative extensions.
        */
        std::shared_ptr<const PAdicBaseRing> ground_ring_of_tower() const;

        /**
        Returns the polynomial ring the working defining polynomial belongs to.
        */
        inline std::shared_ptr<const PolynomialRing> polynomial_ring() const
        {
            return given_poly_.parent();
        }

        /**
        Returns the number field Q[x]/(f) with the exact defining polynomial and the variable name. The
        result is a field even when this is a ring.
        */
        std::shared_ptr<const NumberField> exact_field() const;

        /**
        Returns a functor and a base ring such that applying the functor to the base ring gives back a ring
        equal to this one.
        */
        std::pair<ExtensionFunctor, std::shared_ptr<const PAdicBaseRing> > construction() const;

        /**
        Returns the fraction field of this ring. A field asked without overrides returns itself.

        @param[in] overrides Print options to change in the result
        */
        std::shared_ptr<const ExtensionRing> fraction_field(const PrintModeOverrides &overrides = PrintModeOverrides()) const;

        /**
        Returns the ring of integers of this ring. A ring asked without overrides returns itself.

        @param[in] overrides Print options to change in the result
        @throws std::logic_error if a ring has to be built and the exact defining polynomial has non-integral
        coefficients
        */
        std::shared_ptr<const ExtensionRing> integer_ring(const PrintModeOverrides &overrides = PrintModeOverrides()) const;

        /**
        Returns a random element: the sum of degree() random elements of the ground ring times the powers
        gen()^0, ..., gen()^(degree() - 1).
        */
        ExtensionElement random_element() const;

        /**
        Returns the generator, the image of x in R[x]/(f).
        */
        ExtensionElement gen() const;

        ExtensionElement one() const;

        ExtensionElement zero() const;

        /**
        Returns the image of a polynomial in the generator; coefficients are residues modulo p^N, lowest
        degree first, and may be more than degree().
        */
        ExtensionElement element(std::vector<std::uint64_t> coeffs) const;

        /**
        Returns the image of a residue of the ground ring.
        */
        ExtensionElement from_ground(std::uint64_t value) const;

        virtual ExtensionKind kind() const = 0;

        /**
        Returns e, the ramification index over the ground ring.

        @throws std::logic_error for a general extension
        */
        virtual int ramification_index() const = 0;

        /**
        Returns f, the degree of the residue field extension.

        @throws std::logic_error for a general extension
        */
        virtual int inertia_degree() const = 0;

        /**
        @throws std::logic_error for a general extension
        */
        virtual ExtensionElement uniformizer() const = 0;

        bool is_field() const override
        {
            return ground_ring_->is_field();
        }

        PrecisionType precision_type() const override
        {
            return ground_ring_->precision_type();
        }

        bool is_base_ring() const override
        {
            return false;
        }

        std::shared_ptr<const PAdicRing> base_ring() const override
        {
            return ground_ring_;
        }

        std::string to_string() const override;

        inline ExtensionBackend backend() const
        {
            return backend_;
        }

        inline const ExtensionNames &names() const
        {
            return names_;
        }

        inline const SmallModulus &coeff_modulus() const
        {
            return ground_ring_->modulus();
        }

        void add(const ExtensionElement &operand1, const ExtensionElement &operand2, ExtensionElement &result) const;

        void sub(const ExtensionElement &operand1, const ExtensionElement &operand2, ExtensionElement &result) const;

        void negate(const ExtensionElement &operand, ExtensionElement &result) const;

        void multiply(const ExtensionElement &operand1, const ExtensionElement &operand2, ExtensionElement &result) const;

        void multiply_scalar(const ExtensionElement &operand, std::uint64_t scalar, ExtensionElement &result) const;

        void exponentiate(const ExtensionElement &base, std::uint64_t exponent, ExtensionElement &result) const;

    protected:
        std::shared_ptr<const ExtensionRing> shared_extension() const;

    private:
        std::shared_ptr<const ExtensionRing> change(bool field, const PrintModeOverrides &overrides) const;

        void check_operand(const ExtensionElement &operand) const;

        PAdicPolynomial given_poly_;

        ExactPolynomial exact_modulus_;

        std::shared_ptr<const PAdicBaseRing> ground_ring_;

        ExtensionNames names_;

        ExtensionBackend backend_;
    };

    /**
    Represents an element of an ExtensionRing: a polynomial of degree less than d in the generator, with
    coefficients known modulo p^k where k is the precision of the element. The precision never exceeds the
    precision cap N of the ground ring, and the coefficients are always reduced modulo p^k.

    Arithmetic reduces modulo the working defining polynomial; the precision of a result is the smallest
    precision of its operands.
    */
    class ExtensionElement
    {
    public:
        /**
        Creates an empty element with no ring.
        */
        ExtensionElement() : precision_(0)
        {
        }

        /**
        Creates the zero element of ring at full precision.

        @param[in] ring The extension ring
        @throws std::invalid_argument if ring is null
        */
        explicit ExtensionElement(std::shared_ptr<const ExtensionRing> ring);

        /**
        Creates an element from coefficients in the generator. If there are more coefficients than the degree
        of ring, the polynomial is reduced modulo the working defining polynomial.

        @param[in] ring The extension ring
        @param[in] coeffs The coefficients, lowest degree first; reduced modulo p^precision
        @param[in] precision The precision of the element, between 0 and the precision cap of the ground ring
        @throws std::invalid_argument if ring is null or precision is out of range
        */
        ExtensionElement(std::shared_ptr<const ExtensionRing> ring, std::vector<std::uint64_t> coeffs, int precision);

        ExtensionElement(const ExtensionElement &copy) = default;

        ExtensionElement &operator =(const ExtensionElement &assign) = default;

        ExtensionElement(ExtensionElement &&source) = default;

        ExtensionElement &operator =(ExtensionElement &&assign) = default;

        /**
        @throws std::out_of_range if coeff_index is not less than the degree of the ring
        */
        const std::uint64_t *pointer(int coeff_index = 0) const;

        /**
        Returns the coefficient of the generator to the power index.

        @throws std::out_of_range if index is negative or not less than the degree of the ring
        */
        std::uint64_t coeff(int index) const;

        inline const std::vector<std::uint64_t> &coeffs() const
        {
            return coeffs_;
        }

        inline int coeff_count() const
        {
            return static_cast<int>(coeffs_.size());
        }

        /**
        Returns the absolute precision k: the coefficients are known modulo p^k.
        */
        inline int precision() const
        {
            return precision_;
        }

        inline std::shared_ptr<const ExtensionRing> ring() const
        {
            return ring_;
        }

        inline bool is_empty() const
        {
            return !ring_;
        }

        bool is_zero() const;

        /**
        Returns a copy known only modulo p^precision.

        @throws std::invalid_argument if precision is negative or larger than the current precision
        */
        ExtensionElement with_precision(int precision) const;

        bool operator ==(const ExtensionElement &operand2) const;

        inline bool operator !=(const ExtensionElement &operand2) const
        {
            return !operator ==(operand2);
        }

        ExtensionElement operator +(const ExtensionElement &operand2) const;

        ExtensionElement &operator +=(const ExtensionElement &operand2);

        ExtensionElement operator -(const ExtensionElement &operand2) const;

        ExtensionElement &operator -=(const ExtensionElement &operand2);

        ExtensionElement operator -() const;

        ExtensionElement operator *(const ExtensionElement &operand2) const;

        ExtensionElement &operator *=(const ExtensionElement &operand2);

        /**
        Multiplies by a residue of the ground ring.
        */
        ExtensionElement operator *(std::uint64_t scalar) const;

        ExtensionElement &operator *=(std::uint64_t scalar);

        ExtensionElement operator ^(std::uint64_t exponent) const;

        /**
        Writes the element in its generator followed by its precision, e.g. "3*w^2 + w + 4 + O(5^5)".
        */
        std::string to_string() const;

    private:
        const ExtensionRing &checked_ring() const;

        void reduce_to_precision();

        std::shared_ptr<const ExtensionRing> ring_;

        std::vector<std::uint64_t> coeffs_;

        int precision_;

        friend class ExtensionRing;
    };
}
