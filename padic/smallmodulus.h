#pragma once

#include <cstdint>
#include <array>
#include <string>

namespace padic
{
    /**
    Represents the working modulus p^N of a p-adic ring capped at precision N. Elements of such a ring
    are stored as residues modulo p^N, and every coefficient of a working polynomial or of an extension
    element is reduced modulo the SmallModulus of its base ring.

    @par Barrett reduction
    The class stores the value of a pre-computation required by Barrett reduction: the constant ratio
    floor(2^128 / m), together with the remainder 2^128 mod m, where m is the modulus. For Barrett
    reduction to work correctly, the value of the modulus is restricted to be at most 62 bits wide and
    cannot be exactly 2^62. The constructor that takes no parameters sets the value, the Barrett ratio,
    and the bit count to zero.

    @par Thread Safety
    In general, reading from SmallModulus is thread-safe as long as no other thread is concurrently
    mutating it.
    */
    class SmallModulus
    {
    public:
        /**
        Creates a SmallModulus instance with given value represented by std::uint64_t.

        @param[in] value The integer modulus
        @throws std::invalid_argument if value is exactly 2^62, or at least 63 bits long
        */
        SmallModulus(std::uint64_t value = 0);

        SmallModulus(const SmallModulus &copy) = default;

        SmallModulus(SmallModulus &&source) = default;

        SmallModulus &operator =(const SmallModulus &assign) = default;

        SmallModulus &operator =(SmallModulus &&assign) = default;

        /**
        Sets the value of the SmallModulus to a given one represented by std::uint64_t.

        @param[in] value The integer modulus
        @throws std::invalid_argument if value is exactly 2^62, or at least 63 bits long
        */
        inline SmallModulus &operator =(std::uint64_t value)
        {
            set_value(value);
            return *this;
        }

        /**
        Returns the significant bit count of the value of the current SmallModulus.
        */
        inline int bit_count() const
        {
            return bit_count_;
        }

        /**
        Returns a constant pointer to the value of the current SmallModulus.
        */
        inline const std::uint64_t *pointer() const
        {
            return &value_;
        }

        /**
        Returns the value of the current SmallModulus.
        */
        inline std::uint64_t value() const
        {
            return value_;
        }

        /**
        Returns the Barrett ratio computed for the value of the current SmallModulus.
        */
        inline const std::array<std::uint64_t, 3> &const_ratio() const
        {
            return const_ratio_;
        }

        inline bool is_zero() const
        {
            return value_ == 0;
        }

        inline bool operator ==(const SmallModulus &compare) const
        {
            return value_ == compare.value_;
        }

        inline bool operator ==(std::uint64_t compare) const
        {
            return value_ == compare;
        }

        inline bool operator !=(const SmallModulus &compare) const
        {
            return !(value_ == compare.value_);
        }

        inline bool operator !=(std::uint64_t compare) const
        {
            return !(value_ == compare);
        }

        /**
        Returns the value of the current SmallModulus as a decimal string.
        */
        std::string to_string() const;

    private:
        void set_value(std::uint64_t value);

        std::uint64_t value_;

        std::array<std::uint64_t, 3> const_ratio_;

        int bit_count_;
    };
}
