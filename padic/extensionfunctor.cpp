#include "extensionfunctor.h"
#include "extensionfactory.h"
#include "extensionparams.h"
#include <sstream>
#include <stdexcept>

using namespace std;

namespace padic
{
    const int ExtensionFunctor::rank;

    ExtensionFunctor::ExtensionFunctor(vector<ExactPolynomial> polys, vector<string> names, int precision_cap,
        PrintMode print_mode, ExtensionBackend backend) :
        polys_(move(polys)), names_(move(names)), precision_cap_(precision_cap), print_mode_(move(print_mode)),
        backend_(backend)
    {
        if (polys_.empty())
        {
            throw invalid_argument("polys cannot be empty");
        }
        if (polys_.size() != names_.size())
        {
            throw invalid_argument("polys and names must have the same length");
        }
    }

    shared_ptr<const ExtensionRing> ExtensionFunctor::operator ()(const shared_ptr<const PAdicBaseRing> &base) const
    {
        if (polys_.size() != 1)
        {
            throw logic_error("extensions by more than one polynomial are not supported");
        }

        ExtensionNames names;
        names.variable = names_[0];
        names.unramified = print_mode_.unram_name();
        names.ramified = print_mode_.ram_name();

        ExtensionParameters parms;
        parms.set_defining_polynomial(polys_[0]);
        parms.set_names(names);
        parms.set_precision_cap(precision_cap_);
        parms.set_print_mode(print_mode_);
        parms.set_backend(backend_);
        return ExtensionFactory::create(base, parms);
    }

    bool ExtensionFunctor::operator ==(const ExtensionFunctor &other) const
    {
        return polys_ == other.polys_ && names_ == other.names_ && precision_cap_ == other.precision_cap_
            && print_mode_.equals_mode(other.print_mode_);
    }

    boost::optional<ExtensionFunctor> ExtensionFunctor::merge(const ExtensionFunctor &other) const
    {
        if (*this == other)
        {
            return *this;
        }
        return boost::none;
    }

    string ExtensionFunctor::to_string() const
    {
        ostringstream result;
        result << "AlgebraicExtensionFunctor(";
        for (size_t i = 0; i < polys_.size(); i++)
        {
            if (i > 0)
            {
                result << ", ";
            }
            result << polys_[i].to_string() << ", " << names_[i];
        }
        result << ", prec=" << precision_cap_ << ")";
        return result.str();
    }
}
