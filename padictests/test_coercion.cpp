#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <vector>
#include "padic.h"

using namespace padic;
using namespace std;

namespace
{
    // x^3 + x + 1 is irreducible modulo 7
    shared_ptr<const ExtensionRing> cubic_over_z7(PrecisionType type,
        ExtensionBackend backend = ExtensionBackend::specialized)
    {
        ExtensionParameters parms;
        parms.set_defining_polynomial("x^3 + x + 1");
        parms.set_variable_name("t");
        parms.set_backend(backend);
        return ExtensionFactory::create(PAdicBaseRing::acquire_ring(7, 3, type), parms);
    }
}

BOOST_AUTO_TEST_SUITE(CoercionTests)

BOOST_AUTO_TEST_CASE(CappedAbsoluteRingIntoFractionField)
{
    auto ring = cubic_over_z7(PrecisionType::capped_abs);
    auto field = ring->fraction_field();
    BOOST_CHECK(ring->kind() == ExtensionKind::unramified);
    BOOST_CHECK(field->precision_type() == PrecisionType::capped_rel);

    Coercion coercion = field->coerce_map_from(*ring);
    BOOST_REQUIRE(coercion.kind() == Coercion::Kind::mapped);
    BOOST_CHECK(coercion.exists());
    BOOST_CHECK(static_cast<bool>(coercion));
    BOOST_REQUIRE(coercion.map());
    BOOST_CHECK(dynamic_pointer_cast<const CappedAbsoluteFractionFieldCoercion>(coercion.map()) != nullptr);
    BOOST_CHECK_EQUAL("capped absolute to fraction field", coercion.map()->name());
    BOOST_CHECK(coercion.map()->domain() == ring);
    BOOST_CHECK(coercion.map()->codomain() == field);

    ExtensionElement t = ring->gen().with_precision(2);
    ExtensionElement image = field->convert(t);
    BOOST_CHECK(image.ring() == field);
    BOOST_CHECK_EQUAL(2, image.precision());
    BOOST_CHECK(image.coeffs() == vector<uint64_t>({ 0, 1, 0 }));
    BOOST_CHECK(image == coercion.map()->apply(t));
}

BOOST_AUTO_TEST_CASE(CappedRelativeRingIntoFractionField)
{
    auto ring = cubic_over_z7(PrecisionType::capped_rel);
    auto field = ring->fraction_field();
    Coercion coercion = field->coerce_map_from(*ring);
    BOOST_REQUIRE(coercion.kind() == Coercion::Kind::mapped);
    BOOST_CHECK_EQUAL("capped relative to fraction field", coercion.map()->name());

    ExtensionElement value = ring->element(vector<uint64_t>{ 8, 0, 3 }).with_precision(1);
    ExtensionElement image = field->convert(value);
    BOOST_CHECK_EQUAL(1, image.precision());
    BOOST_CHECK(image.coeffs() == vector<uint64_t>({ 1, 0, 3 }));
}

BOOST_AUTO_TEST_CASE(FloatingPointRingIntoFractionField)
{
    auto ring = cubic_over_z7(PrecisionType::floating_point);
    auto field = ring->fraction_field();
    BOOST_CHECK(field->precision_type() == PrecisionType::floating_point);
    Coercion coercion = field->coerce_map_from(*ring);
    BOOST_REQUIRE(coercion.kind() == Coercion::Kind::mapped);
    BOOST_CHECK(dynamic_pointer_cast<const FloatingPointFractionFieldCoercion>(coercion.map()) != nullptr);

    ExtensionElement image = field->convert(ring->gen().with_precision(1));
    BOOST_CHECK_EQUAL(3, image.precision());
    BOOST_CHECK(image == field->gen());
}

BOOST_AUTO_TEST_CASE(FixedModulusHasNoMap)
{
    auto ring = cubic_over_z7(PrecisionType::fixed_mod);
    auto field = ring->fraction_field();
    Coercion coercion = field->coerce_map_from(*ring);
    BOOST_CHECK(coercion.kind() == Coercion::Kind::none);
    BOOST_CHECK(!coercion.exists());
    BOOST_CHECK(!coercion);
    BOOST_CHECK(!coercion.map());
    BOOST_CHECK_THROW(field->convert(ring->gen()), logic_error);
    BOOST_CHECK(!make_fraction_field_coercion(ring, field));
}

BOOST_AUTO_TEST_CASE(GenericBackendNeedsNoMap)
{
    auto ring = cubic_over_z7(PrecisionType::fixed_mod, ExtensionBackend::generic);
    auto field = ring->fraction_field();
    BOOST_CHECK(field->backend() == ExtensionBackend::generic);
    Coercion coercion = field->coerce_map_from(*ring);
    BOOST_CHECK(coercion.kind() == Coercion::Kind::generic);
    BOOST_CHECK(!coercion.map());

    ExtensionElement image = field->convert(ring->gen().with_precision(2));
    BOOST_CHECK(image.ring() == field);
    BOOST_CHECK_EQUAL(2, image.precision());
    BOOST_CHECK(image.coeffs() == vector<uint64_t>({ 0, 1, 0 }));
}

BOOST_AUTO_TEST_CASE(IdentityAndGroundCoercions)
{
    auto ring = cubic_over_z7(PrecisionType::capped_abs);
    auto field = ring->fraction_field();

    BOOST_CHECK(ring->coerce_map_from(*ring).kind() == Coercion::Kind::identity);
    BOOST_CHECK(ring->coerce_map_from(*ring->ground_ring()).kind() == Coercion::Kind::base);
    BOOST_CHECK(field->coerce_map_from(*field->ground_ring()).kind() == Coercion::Kind::base);
    BOOST_CHECK(field->coerce_map_from(*ring->ground_ring()).kind() == Coercion::Kind::none);
    BOOST_CHECK(field->convert(field->gen()) == field->gen());
}

BOOST_AUTO_TEST_CASE(NoCoercionBetweenUnrelatedRings)
{
    auto ring = cubic_over_z7(PrecisionType::capped_abs);
    auto field = ring->fraction_field();

    // Only the fraction field receives elements; the ring does not receive them back
    BOOST_CHECK(ring->coerce_map_from(*field).kind() == Coercion::Kind::none);
    BOOST_CHECK_THROW(ring->convert(field->gen()), logic_error);

    ExtensionParameters parms;
    parms.set_defining_polynomial("x^2 + 1");
    parms.set_variable_name("i");
    auto other = ExtensionFactory::create(PAdicBaseRing::acquire_ring(7, 3, PrecisionType::capped_abs), parms);
    BOOST_CHECK(field->coerce_map_from(*other).kind() == Coercion::Kind::none);
    BOOST_CHECK(field->coerce_map_from(*other->fraction_field()).kind() == Coercion::Kind::none);
}

BOOST_AUTO_TEST_CASE(CoercionMapsCheckTheirDomain)
{
    auto ring = cubic_over_z7(PrecisionType::capped_abs);
    auto field = ring->fraction_field();
    auto map = make_fraction_field_coercion(ring, field);
    BOOST_REQUIRE(map);
    BOOST_CHECK_THROW(map->apply(field->gen()), invalid_argument);
    BOOST_CHECK_THROW(map->apply(ExtensionElement()), invalid_argument);
    BOOST_CHECK_THROW(make_fraction_field_coercion(nullptr, field), invalid_argument);
    BOOST_CHECK_THROW(CappedRelativeFractionFieldCoercion(ring, nullptr), invalid_argument);
    BOOST_CHECK_THROW(Coercion::mapped(nullptr), invalid_argument);

    BOOST_CHECK_EQUAL("none", coercion_kind_name(Coercion::Kind::none));
    BOOST_CHECK_EQUAL("mapped", coercion_kind_name(Coercion::Kind::mapped));
}

BOOST_AUTO_TEST_SUITE_END()
