#include "extensions.h"
#include <stdexcept>

using namespace std;

namespace padic
{
    ExtensionElement UnramifiedExtension::uniformizer() const
    {
        return from_ground(prime());
    }

    ExtensionElement EisensteinExtension::uniformizer() const
    {
        return gen();
    }

    int GeneralExtension::ramification_index() const
    {
        throw logic_error("ramification index of a general extension is not known");
    }

    int GeneralExtension::inertia_degree() const
    {
        throw logic_error("inertia degree of a general extension is not known");
    }

    ExtensionElement GeneralExtension::uniformizer() const
    {
        throw logic_error("uniformizer of a general extension is not known");
    }
}
