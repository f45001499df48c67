#include "extensionparams.h"
#include <stdexcept>

using namespace std;

namespace padic
{
    ExtensionParameters::ExtensionParameters() : precision_cap_(0)
    {
    }

    void ExtensionParameters::set_defining_polynomial(const ExactPolynomial &poly)
    {
        defining_polynomial_ = poly;
    }

    void ExtensionParameters::set_names(const ExtensionNames &names)
    {
        names_ = names;
    }

    void ExtensionParameters::set_variable_name(const string &name)
    {
        names_.variable = name;
    }

    void ExtensionParameters::set_precision_cap(int precision_cap)
    {
        if (precision_cap < 0)
        {
            throw invalid_argument("precision_cap cannot be negative");
        }
        precision_cap_ = precision_cap;
    }

    void ExtensionParameters::set_print_mode(const PrintMode &print_mode)
    {
        print_mode_ = print_mode;
    }

    void ExtensionParameters::set_backend(ExtensionBackend backend)
    {
        backend_ = backend;
    }

    void ExtensionParameters::set_kind(ExtensionKind kind)
    {
        kind_ = kind;
    }
}
