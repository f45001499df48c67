#include "coercion.h"
#include <algorithm>
#include <stdexcept>

using namespace std;

namespace padic
{
    CoercionMap::CoercionMap(shared_ptr<const ExtensionRing> domain, shared_ptr<const ExtensionRing> codomain) :
        domain_(move(domain)), codomain_(move(codomain))
    {
        if (!domain_ || !codomain_)
        {
            throw invalid_argument("domain and codomain cannot be null");
        }
    }

    void CoercionMap::check_element(const ExtensionElement &element) const
    {
        if (element.is_empty())
        {
            throw invalid_argument("element is empty");
        }
        if (element.ring() != domain_ && !element.ring()->equals(*domain_))
        {
            throw invalid_argument("element is not in the domain " + domain_->to_string());
        }
    }

    ExtensionElement CappedAbsoluteFractionFieldCoercion::apply(const ExtensionElement &element) const
    {
        check_element(element);
        int precision = min(element.precision(), codomain()->ground_ring()->precision_cap());
        return ExtensionElement(codomain(), element.coeffs(), precision);
    }

    ExtensionElement CappedRelativeFractionFieldCoercion::apply(const ExtensionElement &element) const
    {
        check_element(element);
        return ExtensionElement(codomain(), element.coeffs(), element.precision());
    }

    ExtensionElement FloatingPointFractionFieldCoercion::apply(const ExtensionElement &element) const
    {
        check_element(element);
        return ExtensionElement(codomain(), element.coeffs(), codomain()->ground_ring()->precision_cap());
    }

    shared_ptr<const CoercionMap> make_fraction_field_coercion(shared_ptr<const ExtensionRing> domain,
        shared_ptr<const ExtensionRing> codomain)
    {
        if (!domain)
        {
            throw invalid_argument("domain cannot be null");
        }
        switch (domain->precision_type())
        {
        case PrecisionType::capped_abs:
            return make_shared<CappedAbsoluteFractionFieldCoercion>(domain, codomain);

        case PrecisionType::capped_rel:
            return make_shared<CappedRelativeFractionFieldCoercion>(domain, codomain);

        case PrecisionType::floating_point:
            return make_shared<FloatingPointFractionFieldCoercion>(domain, codomain);

        default:
            return nullptr;
        }
    }

    Coercion Coercion::mapped(shared_ptr<const CoercionMap> map)
    {
        if (!map)
        {
            throw invalid_argument("map cannot be null");
        }
        return Coercion(Kind::mapped, move(map));
    }

    string coercion_kind_name(Coercion::Kind kind)
    {
        switch (kind)
        {
        case Coercion::Kind::none:
            return "none";
        case Coercion::Kind::identity:
            return "identity";
        case Coercion::Kind::base:
            return "base";
        case Coercion::Kind::generic:
            return "generic";
        case Coercion::Kind::mapped:
            return "mapped";
        }
        throw invalid_argument("kind");
    }
}
