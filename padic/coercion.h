#pragma once

#include <memory>
#include <string>
#include <utility>
#include "extensionring.h"

namespace padic
{
    /**
    Maps elements of an extension ring into its fraction field. Each precision type of the source ring has
    its own map, since the way precision carries over depends on how the source tracks it.
    */
    class CoercionMap
    {
    public:
        /**
        @param[in] domain The ring to map from
        @param[in] codomain The fraction field of domain
        @throws std::invalid_argument if domain or codomain is null
        */
        CoercionMap(std::shared_ptr<const ExtensionRing> domain, std::shared_ptr<const ExtensionRing> codomain);

        virtual ~CoercionMap() = default;

        /**
        Maps an element of the domain into the codomain.

        @throws std::invalid_argument if element does not belong to the domain
        */
        virtual ExtensionElement apply(const ExtensionElement &element) const = 0;

        virtual std::string name() const = 0;

        inline std::shared_ptr<const ExtensionRing> domain() const
        {
            return domain_;
        }

        inline std::shared_ptr<const ExtensionRing> codomain() const
        {
            return codomain_;
        }

    protected:
        void check_element(const ExtensionElement &element) const;

    private:
        std::shared_ptr<const ExtensionRing> domain_;

        std::shared_ptr<const ExtensionRing> codomain_;
    };

    /**
    From a capped absolute ring: the absolute precision is kept, capped by the codomain.
    */
    class CappedAbsoluteFractionFieldCoercion : public CoercionMap
    {
    public:
        using CoercionMap::CoercionMap;

        ExtensionElement apply(const ExtensionElement &element) const override;

        std::string name() const override
        {
            return "capped absolute to fraction field";
        }
    };

    /**
    From a capped relative ring: elements are copied with their precision.
    */
    class CappedRelativeFractionFieldCoercion : public CoercionMap
    {
    public:
        using CoercionMap::CoercionMap;

        ExtensionElement apply(const ExtensionElement &element) const override;

        std::string name() const override
        {
            return "capped relative to fraction field";
        }
    };

    /**
    From a floating point ring: elements carry no precision, so the image is at full precision.
    */
    class FloatingPointFractionFieldCoercion : public CoercionMap
    {
    public:
        using CoercionMap::CoercionMap;

        ExtensionElement apply(const ExtensionElement &element) const override;

        std::string name() const override
        {
            return "floating point to fraction field";
        }
    };

    /**
    Returns the map from domain into its fraction field codomain for the precision type of domain, or null
    if there is no map for that precision type (fixed modulus).
    */
    std::shared_ptr<const CoercionMap> make_fraction_field_coercion(std::shared_ptr<const ExtensionRing> domain,
        std::shared_ptr<const ExtensionRing> codomain);

    /**
    The outcome of ExtensionRing::coerce_map_from. It says whether elements of a source ring coerce and how:

    - none: they do not
    - identity: the source is the ring itself
    - base: the source is the ground ring
    - generic: the generic backend accepts the elements as they are, no map is needed
    - mapped: map() converts the elements
    */
    class Coercion
    {
    public:
        enum class Kind
        {
            none,
            identity,
            base,
            generic,
            mapped
        };

        static Coercion none()
        {
            return Coercion(Kind::none, nullptr);
        }

        static Coercion identity()
        {
            return Coercion(Kind::identity, nullptr);
        }

        static Coercion base()
        {
            return Coercion(Kind::base, nullptr);
        }

        static Coercion generic()
        {
            return Coercion(Kind::generic, nullptr);
        }

        /**
        @throws std::invalid_argument if map is null
        */
        static Coercion mapped(std::shared_ptr<const CoercionMap> map);

        inline Kind kind() const
        {
            return kind_;
        }

        inline bool exists() const
        {
            return kind_ != Kind::none;
        }

        explicit operator bool() const
        {
            return exists();
        }

        /**
        Returns the map for Kind::mapped and null otherwise.
        */
        inline std::shared_ptr<const CoercionMap> map() const
        {
            return map_;
        }

    private:
        Coercion(Kind kind, std::shared_ptr<const CoercionMap> map) : kind_(kind), map_(std::move(map))
        {
        }

        Kind kind_;

        std::shared_ptr<const CoercionMap> map_;
    };

    std::string coercion_kind_name(Coercion::Kind kind);
}
