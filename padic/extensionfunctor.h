#pragma once

#include <memory>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include "exactpoly.h"
#include "extensionring.h"
#include "padicbase.h"
#include "printmode.h"

namespace padic
{
    /**
    Describes how an extension is built from its base ring: adjoin a root of each polynomial, with the given
    names, precision cap, print mode and backend. Applying the functor to the base ring of an extension
    rebuilds an equal extension, which lets two rings built along different paths be compared and combined.

    The polynomials are kept as a list so that towers with several generators can be described; applying a
    functor with more than one polynomial is not supported yet.
    */
    class ExtensionFunctor
    {
    public:
        /**
        The rank of extension functors among construction functors.
        */
        static const int rank = 3;

        /**
        @param[in] polys The exact defining polynomials, one per generator
        @param[in] names The generator names, one per polynomial
        @param[in] precision_cap The precision cap of the result
        @param[in] print_mode The print mode of the result, with the names folded in
        @param[in] backend The backend of the result
        @throws std::invalid_argument if polys is empty or polys and names differ in length
        */
        ExtensionFunctor(std::vector<ExactPolynomial> polys, std::vector<std::string> names, int precision_cap,
            PrintMode print_mode, ExtensionBackend backend);

        /**
        Builds the extension of base described by this functor.

        @param[in] base The base ring
        @throws std::logic_error if the functor has more than one polynomial
        @throws std::invalid_argument if ExtensionFactory rejects the construction
        */
        std::shared_ptr<const ExtensionRing> operator ()(const std::shared_ptr<const PAdicBaseRing> &base) const;

        inline const std::vector<ExactPolynomial> &polys() const
        {
            return polys_;
        }

        inline const std::vector<std::string> &names() const
        {
            return names_;
        }

        inline int precision_cap() const
        {
            return precision_cap_;
        }

        inline const PrintMode &print_mode() const
        {
            return print_mode_;
        }

        inline ExtensionBackend backend() const
        {
            return backend_;
        }

        /**
        Two functors are equal when they have the same polynomials, names, precision cap and print mode.
        */
        bool operator ==(const ExtensionFunctor &other) const;

        inline bool operator !=(const ExtensionFunctor &other) const
        {
            return !operator ==(other);
        }

        /**
        Returns the functor that applies both this one and other, if there is one: equal functors merge into
        themselves and any other pair does not merge.
        */
        boost::optional<ExtensionFunctor> merge(const ExtensionFunctor &other) const;

        /**
        Returns e.g. "AlgebraicExtensionFunctor(x^2 - 5, w, prec=40)".
        */
        std::string to_string() const;

    private:
        std::vector<ExactPolynomial> polys_;

        std::vector<std::string> names_;

        int precision_cap_;

        PrintMode print_mode_;

        ExtensionBackend backend_;
    };
}
