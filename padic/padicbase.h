#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include "padicring.h"
#include "smallmodulus.h"

namespace padic
{
    class RationalField;

    /**
    Represents the p-adic integers Z_p or the p-adic numbers Q_p with precision capped at N digits. Elements
    are handled as residues modulo p^N, the working modulus.

    Base rings are obtained through acquire_ring and acquire_field, which return the same object for equal
    arguments. The working modulus p^N must fit in 62 bits.

    @par Thread Safety
    PAdicBaseRing is immutable and can be shared freely between threads.
    */
    class PAdicBaseRing : public PAdicRing
    {
    public:
        /**
        Returns Z_p with the given precision cap.

        @param[in] prime The prime p
        @param[in] precision_cap Number of p-adic digits N tracked for elements
        @param[in] type How elements track precision
        @param[in] print_mode Print options; the variable and ramified names default to the decimal value of p
        @throws std::invalid_argument if prime is not a prime, precision_cap is not positive, or p^N does not
        fit in 62 bits
        */
        static std::shared_ptr<const PAdicBaseRing> acquire_ring(
            std::uint64_t prime,
            int precision_cap = 20,
            PrecisionType type = PrecisionType::capped_rel,
            const PrintMode &print_mode = PrintMode());

        /**
        Returns Q_p with the given precision cap.

        @throws std::invalid_argument as acquire_ring, or if type is capped_abs or fixed_mod
        */
        static std::shared_ptr<const PAdicBaseRing> acquire_field(
            std::uint64_t prime,
            int precision_cap = 20,
            PrecisionType type = PrecisionType::capped_rel,
            const PrintMode &print_mode = PrintMode());

        /**
        Use acquire_ring and acquire_field instead.
        */
        PAdicBaseRing(std::uint64_t prime, int precision_cap, PrecisionType type, bool field, const PrintMode &print_mode);

        /**
        Returns the working modulus p^N.
        */
        inline const SmallModulus &modulus() const
        {
            return modulus_;
        }

        bool is_field() const override
        {
            return field_;
        }

        PrecisionType precision_type() const override
        {
            return type_;
        }

        bool is_base_ring() const override
        {
            return true;
        }

        std::shared_ptr<const PAdicRing> base_ring() const override;

        std::string to_string() const override;

        bool equals(const PAdicRing &other) const override;

        /**
        Returns a uniformly random residue modulo p^N.
        */
        std::uint64_t random_element() const;

        /**
        Returns Q_p with the same prime, precision cap and print mode. Capped absolute and fixed modulus rings
        have capped relative fraction fields.
        */
        std::shared_ptr<const PAdicBaseRing> fraction_field() const;

        /**
        Returns Z_p with the same prime, precision cap, precision type and print mode.
        */
        std::shared_ptr<const PAdicBaseRing> integer_ring() const;

        /**
        Returns the field of rational numbers, the exact counterpart of Z_p and Q_p.
        */
        std::shared_ptr<const RationalField> exact_field() const;

        /**
        Returns a string that identifies this ring among base rings; equal rings give equal keys.
        */
        std::string key() const;

    private:
        static std::shared_ptr<const PAdicBaseRing> acquire(std::uint64_t prime, int precision_cap, PrecisionType type,
            bool field, const PrintMode &print_mode);

        PrecisionType type_;

        bool field_;

        SmallModulus modulus_;
    };
}
