#pragma once

#include "extensionring.h"

namespace padic
{
    /**
    An extension defined by a polynomial that stays irreducible modulo p. The residue field grows by the
    full degree and p remains a uniformizer: e = 1, f = degree().
    */
    class UnramifiedExtension : public ExtensionRing
    {
    public:
        using ExtensionRing::ExtensionRing;

        ExtensionKind kind() const override
        {
            return ExtensionKind::unramified;
        }

        int ramification_index() const override
        {
            return 1;
        }

        int inertia_degree() const override
        {
            return degree();
        }

        /**
        Returns p.
        */
        ExtensionElement uniformizer() const override;
    };

    /**
    An extension defined by an Eisenstein polynomial. It is totally ramified, e = degree() and f = 1, and the
    generator is a uniformizer. The precision cap counts powers of the generator.
    */
    class EisensteinExtension : public ExtensionRing
    {
    public:
        using ExtensionRing::ExtensionRing;

        ExtensionKind kind() const override
        {
            return ExtensionKind::eisenstein;
        }

        int ramification_index() const override
        {
            return degree();
        }

        int inertia_degree() const override
        {
            return 1;
        }

        /**
        Returns the generator.
        */
        ExtensionElement uniformizer() const override;
    };

    /**
    An extension defined by a polynomial that is neither Eisenstein nor irreducible modulo p. Its
    ramification is not computed.
    */
    class GeneralExtension : public ExtensionRing
    {
    public:
        using ExtensionRing::ExtensionRing;

        ExtensionKind kind() const override
        {
            return ExtensionKind::general;
        }

        int ramification_index() const override;

        int inertia_degree() const override;

        ExtensionElement uniformizer() const override;
    };
}
