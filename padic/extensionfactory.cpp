#include "extensionfactory.h"
#include "extensions.h"
#include "polyring.h"
#include "util/logging.h"
#include "util/polyarithsmallmod.h"
#include "util/uniquecache.h"
#include <sstream>
#include <stdexcept>

using namespace std;
using namespace padic::util;

namespace padic
{
    namespace
    {
        UniqueCache<ExtensionRing> &extension_cache()
        {
            static UniqueCache<ExtensionRing> cache;
            return cache;
        }

        void write_name(ostringstream &key, const string &name)
        {
            key << name.size() << ':' << name << ';';
        }
    }

    bool ExtensionFactory::is_eisenstein(const ExactPolynomial &poly, uint64_t prime)
    {
        int degree = poly.degree();
        if (degree < 1 || p_adic_valuation(poly.leading_coefficient(), prime) != 0)
        {
            return false;
        }
        for (int i = 1; i < degree; i++)
        {
            if (p_adic_valuation(poly.coeff(i), prime) < 1)
            {
                return false;
            }
        }
        return p_adic_valuation(poly.coeff(0), prime) == 1;
    }

    bool ExtensionFactory::is_unramified(const ExactPolynomial &poly, uint64_t prime)
    {
        if (!poly.is_monic())
        {
            throw invalid_argument("poly must be monic");
        }
        return is_irreducible_poly_coeff_primemod(poly.reduce(SmallModulus(prime)), SmallModulus(prime));
    }

    ExtensionKind ExtensionFactory::detect_kind(const ExactPolynomial &poly, uint64_t prime)
    {
        if (poly.degree() < 1)
        {
            throw invalid_argument("poly must have degree at least 1");
        }
        if (!poly.is_monic())
        {
            throw invalid_argument("poly must be monic");
        }
        if (is_eisenstein(poly, prime))
        {
            return ExtensionKind::eisenstein;
        }
        if (is_unramified(poly, prime))
        {
            return ExtensionKind::unramified;
        }
        return ExtensionKind::general;
    }

    shared_ptr<const ExtensionRing> ExtensionFactory::create(const shared_ptr<const PAdicRing> &base,
        const ExtensionParameters &parms)
    {
        if (!base)
        {
            throw invalid_argument("base cannot be null");
        }
        if (!base->is_base_ring())
        {
            throw invalid_argument("relative extensions are not supported: " + base->to_string());
        }
        auto ground = static_pointer_cast<const PAdicBaseRing>(base);
        uint64_t prime = ground->prime();

        if (parms.names().variable.empty())
        {
            throw invalid_argument("variable name must be set");
        }
        const ExactPolynomial &given = parms.defining_polynomial();
        if (given.degree() < 1)
        {
            throw invalid_argument("defining polynomial must have degree at least 1");
        }
        if (p_adic_valuation(given.leading_coefficient(), prime) != 0)
        {
            throw invalid_argument("leading coefficient of " + given.to_string() + " must be a "
                + std::to_string(prime) + "-adic unit");
        }
        ExactPolynomial exact_modulus = given.monic();
        if (!exact_modulus.is_p_integral(prime))
        {
            throw invalid_argument("coefficients of " + exact_modulus.to_string() + " must be "
                + std::to_string(prime) + "-adic integers");
        }

        ExtensionKind kind = detect_kind(exact_modulus, prime);
        PADIC_REPORT(PADIC_LOG_DETAILED, exact_modulus.to_string() << " is " << extension_kind_name(kind)
            << " over " << ground->to_string());
        if (parms.kind())
        {
            if (*parms.kind() != ExtensionKind::general && *parms.kind() != kind)
            {
                throw invalid_argument(exact_modulus.to_string() + " is not " + extension_kind_name(*parms.kind()));
            }
            kind = *parms.kind();
        }

        int max_precision_cap = ground->precision_cap();
        if (kind == ExtensionKind::eisenstein)
        {
            max_precision_cap *= exact_modulus.degree();
        }
        int precision_cap = parms.precision_cap() == 0 ? max_precision_cap : parms.precision_cap();
        if (precision_cap > max_precision_cap)
        {
            throw invalid_argument("precision cap " + std::to_string(precision_cap) + " exceeds "
                + std::to_string(max_precision_cap));
        }

        ExtensionBackend backend = parms.backend() ? *parms.backend()
            : (kind == ExtensionKind::unramified ? ExtensionBackend::specialized : ExtensionBackend::generic);

        ExtensionNames names = parms.names();
        if (names.residue.empty())
        {
            names.residue = names.variable + "0";
        }
        if (names.unramified.empty() && kind == ExtensionKind::unramified)
        {
            names.unramified = names.variable;
        }
        if (names.ramified.empty())
        {
            names.ramified = kind == ExtensionKind::unramified ? std::to_string(prime) : names.variable;
        }
        PrintMode print_mode = parms.print_mode().with_names(names.variable, names.unramified, names.ramified);

        ostringstream key;
        key << ground->key() << '|' << exact_modulus.to_string() << '|';
        write_name(key, names.variable);
        write_name(key, names.residue);
        write_name(key, names.unramified);
        write_name(key, names.ramified);
        key << '|' << precision_cap << '|' << print_mode.mode_key() << '|' << static_cast<int>(backend) << '|'
            << static_cast<int>(kind);

        bool created;
        auto extension = extension_cache().acquire(key.str(), [&]() -> shared_ptr<const ExtensionRing> {
            auto poly_ring = make_shared<PolynomialRing>(ground, "x");
            PAdicPolynomial given_poly = poly_ring->reduce(exact_modulus);
            switch (kind)
            {
            case ExtensionKind::unramified:
                return make_shared<UnramifiedExtension>(given_poly, exact_modulus, precision_cap, print_mode, names, backend);
            case ExtensionKind::eisenstein:
                return make_shared<EisensteinExtension>(given_poly, exact_modulus, precision_cap, print_mode, names, backend);
            default:
                return make_shared<GeneralExtension>(given_poly, exact_modulus, precision_cap, print_mode, names, backend);
            }
        }, created);

        if (created)
        {
            PADIC_REPORT(PADIC_LOG_INFO, "created " << extension->to_string() << " ("
                << extension_backend_name(backend) << " backend)");
        }
        else
        {
            PADIC_REPORT(PADIC_LOG_DEBUG, "reusing " << extension->to_string());
        }
        return extension;
    }

    size_t ExtensionFactory::cache_size()
    {
        return extension_cache().size();
    }
}
