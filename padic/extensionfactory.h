#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include "exactpoly.h"
#include "extensionparams.h"
#include "extensionring.h"
#include "padicring.h"

namespace padic
{
    /**
    Creates extensions of p-adic base rings. The factory checks the defining polynomial, detects its shape,
    fills in the defaults of ExtensionParameters and returns an UnramifiedExtension, EisensteinExtension or
    GeneralExtension. Equal constructions return the same object as long as it is alive.

    The defining polynomial f is accepted when
    - the base ring is Z_p or Q_p (relative extensions are not supported),
    - f has degree at least 1 and its leading coefficient is a p-adic unit,
    - every coefficient of f divided by its leading coefficient is p-integral.

    The monic f is Eisenstein if all its lower coefficients are divisible by p and its constant coefficient
    is not divisible by p^2; otherwise it is unramified if it is irreducible modulo p; otherwise general.

    The precision cap of an Eisenstein extension counts powers of the uniformizer, so it defaults to the cap
    of the base ring times the degree. Other extensions default to the cap of the base ring. A larger cap
    than the default is rejected.

    @par Thread Safety
    create is thread-safe.
    */
    class ExtensionFactory
    {
    public:
        ExtensionFactory() = delete;

        /**
        Creates the extension of base described by parms.

        @param[in] base The base ring
        @param[in] parms The settings of the extension
        @throws std::invalid_argument if base is null or not a base ring, if parms has no variable name, if
        the defining polynomial is not accepted, if the requested shape does not match, or if the precision
        cap is too large
        */
        static std::shared_ptr<const ExtensionRing> create(const std::shared_ptr<const PAdicRing> &base,
            const ExtensionParameters &parms);

        /**
        Returns the shape of a monic p-integral polynomial.

        @throws std::invalid_argument if poly is not monic or has degree less than 1
        */
        static ExtensionKind detect_kind(const ExactPolynomial &poly, std::uint64_t prime);

        static bool is_eisenstein(const ExactPolynomial &poly, std::uint64_t prime);

        /**
        Returns whether a monic p-integral polynomial is irreducible modulo p.
        */
        static bool is_unramified(const ExactPolynomial &poly, std::uint64_t prime);

        /**
        Returns the number of extensions created by the factory that are still alive.
        */
        static std::size_t cache_size();
    };
}
