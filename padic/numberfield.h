#pragma once

#include <memory>
#include <string>
#include "exactpoly.h"

namespace padic
{
    class NumberField;

    /**
    The field of rational numbers, the exact field behind every p-adic base ring.
    */
    class RationalField : public std::enable_shared_from_this<RationalField>
    {
    public:
        static std::shared_ptr<const RationalField> acquire_field();

        /**
        Returns the number field obtained by adjoining to Q a root of poly, named name.

        @param[in] poly The defining polynomial
        @param[in] name Name of the generator
        @throws std::invalid_argument if poly has degree less than 1 or name is empty
        */
        std::shared_ptr<const NumberField> extension(const ExactPolynomial &poly, const std::string &name) const;

        std::string to_string() const
        {
            return "Rational Field";
        }
    };

    /**
    Represents Q[x]/(f) for an exact rational polynomial f. Number fields appear here as the exact
    counterparts of p-adic extensions.
    */
    class NumberField
    {
    public:
        NumberField(std::shared_ptr<const RationalField> base_field, ExactPolynomial defining_polynomial, std::string variable_name);

        inline const ExactPolynomial &defining_polynomial() const
        {
            return defining_polynomial_;
        }

        inline const std::string &variable_name() const
        {
            return variable_name_;
        }

        inline int degree() const
        {
            return defining_polynomial_.degree();
        }

        inline std::shared_ptr<const RationalField> base_field() const
        {
            return base_field_;
        }

        inline bool operator ==(const NumberField &other) const
        {
            return defining_polynomial_ == other.defining_polynomial_ && variable_name_ == other.variable_name_;
        }

        inline bool operator !=(const NumberField &other) const
        {
            return !operator ==(other);
        }

        /**
        Returns e.g. "Number Field in w with defining polynomial x^2 - 5".
        */
        std::string to_string() const;

    private:
        std::shared_ptr<const RationalField> base_field_;

        ExactPolynomial defining_polynomial_;

        std::string variable_name_;
    };
}
