#include "numberfield.h"
#include <stdexcept>

using namespace std;

namespace padic
{
    shared_ptr<const RationalField> RationalField::acquire_field()
    {
        static const shared_ptr<const RationalField> rationals = make_shared<RationalField>();
        return rationals;
    }

    shared_ptr<const NumberField> RationalField::extension(const ExactPolynomial &poly, const string &name) const
    {
        if (poly.degree() < 1)
        {
            throw invalid_argument("defining polynomial must have degree at least 1");
        }
        if (name.empty())
        {
            throw invalid_argument("name cannot be empty");
        }
        return make_shared<NumberField>(shared_from_this(), poly, name);
    }

    NumberField::NumberField(shared_ptr<const RationalField> base_field, ExactPolynomial defining_polynomial, string variable_name) :
        base_field_(move(base_field)), defining_polynomial_(move(defining_polynomial)), variable_name_(move(variable_name))
    {
        if (!base_field_)
        {
            throw invalid_argument("base_field cannot be null");
        }
    }

    string NumberField::to_string() const
    {
        return "Number Field in " + variable_name_ + " with defining polynomial " + defining_polynomial_.to_string("x");
    }
}
