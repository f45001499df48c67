#pragma once

#include <string>
#include <boost/optional.hpp>
#include "exactpoly.h"
#include "extensionring.h"
#include "printmode.h"

namespace padic
{
    /**
    Represents the user-customizable settings of an extension: the defining polynomial, the names, the
    precision cap, the print mode, and optionally the backend and the expected shape of the polynomial. Once
    populated, an ExtensionParameters is passed to ExtensionFactory::create together with a base ring, which
    validates the settings and returns the extension.

    Settings that are left unset get defaults from the factory: the precision cap from the base ring, the
    backend and the names from the detected shape.

    @par Thread Safety
    In general, reading from ExtensionParameters is thread-safe, while mutating is not.
    */
    class ExtensionParameters
    {
    public:
        /**
        Creates empty parameters. At a minimum, the user needs to specify the defining polynomial and the
        variable name.
        */
        ExtensionParameters();

        ExtensionParameters(const ExtensionParameters &copy) = default;

        ExtensionParameters &operator =(const ExtensionParameters &assign) = default;

        ExtensionParameters(ExtensionParameters &&source) = default;

        ExtensionParameters &operator =(ExtensionParameters &&assign) = default;

        /**
        Sets the exact defining polynomial. Its leading coefficient needs to be a p-adic unit; the factory
        divides it out.

        @param[in] poly The defining polynomial
        */
        void set_defining_polynomial(const ExactPolynomial &poly);

        /**
        Sets the exact defining polynomial from its string form, e.g. "x^2 + x + 2".

        @param[in] poly The defining polynomial
        @throws std::invalid_argument if poly cannot be parsed
        */
        inline void set_defining_polynomial(const std::string &poly)
        {
            // Needed to enable char[] arguments
            set_defining_polynomial(ExactPolynomial(poly));
        }

        /**
        Sets all names of the extension. Empty names other than the variable are filled in by the factory.
        */
        void set_names(const ExtensionNames &names);

        /**
        Sets the name of the generator.
        */
        void set_variable_name(const std::string &name);

        /**
        Sets the precision cap of the extension; 0 selects the largest cap the base ring allows.

        @param[in] precision_cap The new precision cap
        @throws std::invalid_argument if precision_cap is negative
        */
        void set_precision_cap(int precision_cap);

        void set_print_mode(const PrintMode &print_mode);

        void set_backend(ExtensionBackend backend);

        /**
        Requests a shape. The factory rejects a polynomial that does not have it; requesting
        ExtensionKind::general accepts any polynomial.
        */
        void set_kind(ExtensionKind kind);

        inline const ExactPolynomial &defining_polynomial() const
        {
            return defining_polynomial_;
        }

        inline const ExtensionNames &names() const
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

        inline const boost::optional<ExtensionBackend> &backend() const
        {
            return backend_;
        }

        inline const boost::optional<ExtensionKind> &kind() const
        {
            return kind_;
        }

    private:
        ExactPolynomial defining_polynomial_;

        ExtensionNames names_;

        int precision_cap_;

        PrintMode print_mode_;

        boost::optional<ExtensionBackend> backend_;

        boost::optional<ExtensionKind> kind_;
    };
}
