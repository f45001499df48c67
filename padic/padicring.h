#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "printmode.h"

namespace padic
{
    /**
    How elements of a p-adic ring track their precision.
    */
    enum class PrecisionType
    {
        capped_rel,
        capped_abs,
        fixed_mod,
        floating_point
    };

    /**
    Returns "capped relative", "capped absolute", "fixed modulus" or "floating point".
    */
    std::string precision_type_name(PrecisionType type);

    /**
    Common base of all p-adic rings and fields: base rings (Z_p, Q_p) as well as their extensions. It holds
    the data every p-adic ring has (the prime, the precision cap, the print mode and the variable name) and
    the list of rings that coerce into this one.

    Rings are immutable once constructed and are always managed by std::shared_ptr; they are created by
    factories (PAdicBaseRing::acquire_ring, ExtensionFactory) that keep one object per construction.

    @par Thread Safety
    All member functions are const and PAdicRing objects can be shared between threads.
    */
    class PAdicRing : public std::enable_shared_from_this<PAdicRing>
    {
    public:
        virtual ~PAdicRing() = default;

        inline std::uint64_t prime() const
        {
            return prime_;
        }

        inline int precision_cap() const
        {
            return precision_cap_;
        }

        inline const PrintMode &print_mode() const
        {
            return print_mode_;
        }

        inline const std::string &variable_name() const
        {
            return variable_name_;
        }

        virtual bool is_field() const = 0;

        virtual PrecisionType precision_type() const = 0;

        /**
        Returns true for Z_p and Q_p, false for extensions.
        */
        virtual bool is_base_ring() const = 0;

        /**
        Returns the ring this ring is built over; base rings return themselves.
        */
        virtual std::shared_ptr<const PAdicRing> base_ring() const = 0;

        virtual std::string to_string() const = 0;

        /**
        Returns whether two rings are the same mathematical object with the same precision cap and print mode.
        */
        virtual bool equals(const PAdicRing &other) const = 0;

        inline bool operator ==(const PAdicRing &other) const
        {
            return equals(other);
        }

        inline bool operator !=(const PAdicRing &other) const
        {
            return !equals(other);
        }

        /**
        Returns whether source was registered as coercing into this ring when this ring was constructed.
        */
        bool in_coercion_list(const PAdicRing &source) const;

    protected:
        /**
        Registers the prime, the precision cap, the print mode and the variable name of a new ring.
        */
        PAdicRing(std::uint64_t prime, int precision_cap, PrintMode print_mode, std::string variable_name);

        /**
        Declares that elements of source coerce into this ring.
        */
        void register_coercion(std::shared_ptr<const PAdicRing> source);

    private:
        PAdicRing(const PAdicRing &copy) = delete;

        PAdicRing &operator =(const PAdicRing &assign) = delete;

        std::uint64_t prime_;

        int precision_cap_;

        PrintMode print_mode_;

        std::string variable_name_;

        std::vector<std::shared_ptr<const PAdicRing> > coerce_list_;
    };
}
