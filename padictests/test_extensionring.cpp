#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "padic.h"

using namespace padic;
using namespace std;

namespace
{
    const char *eisenstein_poly = "x^5 + 75*x^3 - 15*x^2 + 125*x - 5";

    shared_ptr<const ExtensionRing> make_extension(shared_ptr<const PAdicRing> base, const string &poly,
        const string &name, const PrintMode &print_mode = PrintMode())
    {
        ExtensionParameters parms;
        parms.set_defining_polynomial(poly);
        parms.set_variable_name(name);
        parms.set_print_mode(print_mode);
        return ExtensionFactory::create(base, parms);
    }
}

BOOST_AUTO_TEST_SUITE(ExtensionRingTests)

BOOST_AUTO_TEST_CASE(EisensteinExtensionOfZ5)
{
    auto zp = PAdicBaseRing::acquire_ring(5, 5);
    auto ring = make_extension(zp, eisenstein_poly, "w");

    BOOST_CHECK_EQUAL(5, ring->degree());
    BOOST_CHECK(ring->ground_ring() == zp);
    BOOST_CHECK(*ring->ground_ring() == *zp);
    BOOST_CHECK(ring->exact_modulus() == ExactPolynomial(vector<long>{ -5, 125, -15, 75, 0, 1 }));
    BOOST_CHECK_EQUAL(eisenstein_poly, ring->exact_defining_polynomial().to_string());
    BOOST_CHECK_EQUAL(ring->exact_modulus().degree(), ring->modulus().degree());

    BOOST_CHECK(ring->kind() == ExtensionKind::eisenstein);
    BOOST_CHECK_EQUAL(5, ring->ramification_index());
    BOOST_CHECK_EQUAL(1, ring->inertia_degree());
    BOOST_CHECK_EQUAL(25, ring->precision_cap());
    BOOST_CHECK(ring->backend() == ExtensionBackend::generic);
    BOOST_CHECK(!ring->is_field());
    BOOST_CHECK(!ring->is_base_ring());
    BOOST_CHECK(ring->base_ring() == zp);
    BOOST_CHECK(ring->precision_type() == PrecisionType::capped_rel);
    BOOST_CHECK_EQUAL("w", ring->variable_name());
    BOOST_CHECK_EQUAL("w0", ring->names().residue);
    BOOST_CHECK_EQUAL("w", ring->print_mode().ram_name());
    BOOST_CHECK_EQUAL("5-adic Eisenstein Extension Ring in w defined by x^5 + 75*x^3 - 15*x^2 + 125*x - 5"
        " with capped relative precision 25 over 5-adic Ring", ring->to_string());
}

BOOST_AUTO_TEST_CASE(WorkingDefiningPolynomial)
{
    auto zp = PAdicBaseRing::acquire_ring(5, 5);
    auto ring = make_extension(zp, eisenstein_poly, "w");

    const PAdicPolynomial &modulus = ring->modulus();
    BOOST_CHECK(modulus == ring->defining_polynomial());
    BOOST_CHECK(modulus.coeffs() == vector<uint64_t>({ 3120, 125, 3110, 75, 0, 1 }));
    BOOST_CHECK_EQUAL("x^5 + 75*x^3 + 3110*x^2 + 125*x + 3120", modulus.to_string());
    BOOST_CHECK(modulus.parent() == ring->polynomial_ring());
    BOOST_CHECK(ring->polynomial_ring()->base_ring() == zp);
    BOOST_CHECK_EQUAL("Univariate Polynomial Ring in x over 5-adic Ring with capped relative precision 5",
        ring->polynomial_ring()->to_string());
    BOOST_CHECK_EQUAL(3125ULL, ring->coeff_modulus().value());
}

BOOST_AUTO_TEST_CASE(DegreeMatchesDefiningPolynomial)
{
    auto zp = PAdicBaseRing::acquire_ring(3, 6);
    vector<string> polys{ "x - 3", "x^2 + 1", "x^2 - 3", "x^3 + 2*x + 1", "x^4 + 3*x^2 + 3" };
    for (const auto &poly : polys)
    {
        BOOST_TEST_CHECKPOINT("defining polynomial " << poly);
        auto ring = make_extension(zp, poly, "t");
        BOOST_CHECK_EQUAL(ExactPolynomial(poly).degree(), ring->degree());
        BOOST_CHECK_EQUAL(ring->exact_defining_polynomial().degree(), ring->defining_polynomial().degree());
    }
}

BOOST_AUTO_TEST_CASE(ExtensionEquality)
{
    auto zp = PAdicBaseRing::acquire_ring(5, 5);
    auto ring = make_extension(zp, eisenstein_poly, "w");
    auto same = make_extension(zp, eisenstein_poly, "w");
    BOOST_CHECK(ring == same);
    BOOST_CHECK(*ring == *ring);
    BOOST_CHECK(*ring == *same && *same == *ring);

    // Print mode is part of the identity
    PrintModeOverrides overrides;
    overrides.style = PrintStyle::terse;
    auto terse = make_extension(zp, eisenstein_poly, "w", PrintMode(overrides));
    BOOST_CHECK(*terse != *ring);
    BOOST_CHECK(*ring != *terse);

    // A different variable name changes the print mode too
    auto renamed = make_extension(zp, eisenstein_poly, "v");
    BOOST_CHECK(*renamed != *ring);

    // Precision cap
    ExtensionParameters parms;
    parms.set_defining_polynomial(eisenstein_poly);
    parms.set_variable_name("w");
    parms.set_precision_cap(10);
    auto capped = ExtensionFactory::create(zp, parms);
    BOOST_CHECK(*capped != *ring);

    // Ground ring
    auto other_ground = make_extension(PAdicBaseRing::acquire_ring(5, 6), eisenstein_poly, "w");
    BOOST_CHECK(*other_ground != *ring);

    // Exact modulus, even when the working moduli agree
    auto other_poly = make_extension(zp, "x^5 + 3200*x^3 - 15*x^2 + 125*x - 5", "w");
    BOOST_CHECK(other_poly->modulus().coeffs() == ring->modulus().coeffs());
    BOOST_CHECK(*other_poly != *ring);

    // The backend does not take part in equality
    parms.set_precision_cap(0);
    parms.set_backend(ExtensionBackend::specialized);
    auto specialized = ExtensionFactory::create(zp, parms);
    BOOST_CHECK(specialized != ring);
    BOOST_CHECK(*specialized == *ring);

    // Base rings are never equal to extensions
    BOOST_CHECK(*ring != *zp);
    BOOST_CHECK(*zp != *ring);
}

BOOST_AUTO_TEST_CASE(FractionFieldIsIdempotent)
{
    auto zp = PAdicBaseRing::acquire_ring(5, 5);
    auto ring = make_extension(zp, eisenstein_poly, "w");
    auto field = ring->fraction_field();
    BOOST_CHECK(field->is_field());
    BOOST_CHECK(field != ring);
    BOOST_CHECK(*field != *ring);
    BOOST_CHECK(field->fraction_field() == field);
    BOOST_CHECK(*field->fraction_field()->fraction_field() == *field);
    BOOST_CHECK(field->ground_ring() == zp->fraction_field());
    BOOST_CHECK(field->exact_modulus() == ring->exact_modulus());
    BOOST_CHECK_EQUAL(ring->precision_cap(), field->precision_cap());
    BOOST_CHECK(ring->fraction_field() == field);
    BOOST_CHECK_EQUAL("5-adic Eisenstein Extension Field in w defined by x^5 + 75*x^3 - 15*x^2 + 125*x - 5"
        " with capped relative precision 25 over 5-adic Field", field->to_string());
}

BOOST_AUTO_TEST_CASE(IntegerRingIsIdentityOnRings)
{
    auto zp = PAdicBaseRing::acquire_ring(5, 5);
    auto ring = make_extension(zp, eisenstein_poly, "w");
    BOOST_CHECK(ring->integer_ring() == ring);

    auto field = ring->fraction_field();
    BOOST_CHECK(field->integer_ring() == ring);
    BOOST_CHECK(*field->integer_ring() == *ring);
}

BOOST_AUTO_TEST_CASE(IntegerRingRequiresIntegralPolynomial)
{
    // 1/3 is 2 modulo 5, which is not a square, so x^2 - 1/3 is unramified over Q_5
    auto qp = PAdicBaseRing::acquire_field(5, 5);
    auto field = make_extension(qp, "x^2 - 1/3", "a");
    BOOST_CHECK(field->kind() == ExtensionKind::unramified);
    BOOST_CHECK(field->fraction_field() == field);
    BOOST_CHECK_THROW(field->integer_ring(), logic_error);
}

BOOST_AUTO_TEST_CASE(PrintModeOverridesMakeNewRings)
{
    auto zp = PAdicBaseRing::acquire_ring(5, 5);
    auto ring = make_extension(zp, eisenstein_poly, "w");

    PrintModeOverrides overrides;
    overrides.style = PrintStyle::terse;
    auto terse_field = ring->fraction_field(overrides);
    BOOST_CHECK(terse_field->is_field());
    BOOST_CHECK(terse_field->print_mode().style() == PrintStyle::terse);
    BOOST_CHECK(*terse_field != *ring->fraction_field());

    auto terse_ring = ring->integer_ring(overrides);
    BOOST_CHECK(!terse_ring->is_field());
    BOOST_CHECK(*terse_ring != *ring);
    BOOST_CHECK(terse_ring->fraction_field() == terse_field);

    overrides = PrintModeOverrides();
    overrides.var_name = "pi";
    auto renamed = ring->integer_ring(overrides);
    BOOST_CHECK_EQUAL("pi", renamed->variable_name());
    BOOST_CHECK_EQUAL("pi", renamed->print_mode().var_name());
    BOOST_CHECK_EQUAL("pi", renamed->print_mode().ram_name());
    BOOST_CHECK_EQUAL("pi", renamed->names().ramified);
    BOOST_CHECK_EQUAL("pi0", renamed->names().residue);

    overrides.ram_name = "u";
    auto explicit_ram = ring->integer_ring(overrides);
    BOOST_CHECK_EQUAL("pi", explicit_ram->variable_name());
    BOOST_CHECK_EQUAL("u", explicit_ram->print_mode().ram_name());
}

BOOST_AUTO_TEST_CASE(RenamedUnramifiedKeepsPrimeAsRamifiedName)
{
    auto zp = PAdicBaseRing::acquire_ring(5, 3);
    auto ring = make_extension(zp, "x^2 + x + 2", "a");
    PrintModeOverrides overrides;
    overrides.var_name = "b";
    auto renamed = ring->fraction_field(overrides);
    BOOST_CHECK_EQUAL("b", renamed->variable_name());
    BOOST_CHECK_EQUAL("b", renamed->print_mode().unram_name());
    BOOST_CHECK_EQUAL("5", renamed->print_mode().ram_name());
}

BOOST_AUTO_TEST_CASE(GroundRingOfTower)
{
    auto zp = PAdicBaseRing::acquire_ring(5, 5);
    auto ring = make_extension(zp, eisenstein_poly, "w");
    auto bottom = ring->ground_ring_of_tower();
    BOOST_CHECK(bottom == zp);
    BOOST_CHECK(bottom->is_base_ring());
    BOOST_CHECK(ring->fraction_field()->ground_ring_of_tower() == zp->fraction_field());
}

BOOST_AUTO_TEST_CASE(ExactFieldIsNumberField)
{
    auto zp = PAdicBaseRing::acquire_ring(5, 5);
    auto ring = make_extension(zp, eisenstein_poly, "w");
    auto exact = ring->exact_field();
    BOOST_CHECK_EQUAL(5, exact->degree());
    BOOST_CHECK_EQUAL("w", exact->variable_name());
    BOOST_CHECK(exact->defining_polynomial() == ring->exact_modulus());
    BOOST_CHECK_EQUAL("Number Field in w with defining polynomial x^5 + 75*x^3 - 15*x^2 + 125*x - 5", exact->to_string());
    BOOST_CHECK(*ring->fraction_field()->exact_field() == *exact);
}

BOOST_AUTO_TEST_CASE(ConstructionRebuildsExtension)
{
    auto zp = PAdicBaseRing::acquire_ring(5, 5);
    auto ring = make_extension(zp, eisenstein_poly, "w");
    auto construction = ring->construction();
    BOOST_CHECK(construction.second == zp);

    const ExtensionFunctor &functor = construction.first;
    BOOST_REQUIRE_EQUAL(1U, functor.polys().size());
    BOOST_CHECK(functor.polys()[0] == ring->exact_modulus());
    BOOST_CHECK_EQUAL("w", functor.names()[0]);
    BOOST_CHECK_EQUAL(25, functor.precision_cap());
    BOOST_CHECK(functor.backend() == ring->backend());
    BOOST_CHECK(functor.print_mode().equals_mode(ring->print_mode()));

    auto rebuilt = functor(construction.second);
    BOOST_CHECK(*rebuilt == *ring);
    BOOST_CHECK(rebuilt == ring);

    auto unramified = make_extension(zp, "x^2 + x + 2", "a");
    auto unramified_construction = unramified->construction();
    BOOST_CHECK(*unramified_construction.first(unramified_construction.second) == *unramified);

    auto field = ring->fraction_field();
    auto field_construction = field->construction();
    BOOST_CHECK(*field_construction.first(field_construction.second) == *field);
}

BOOST_AUTO_TEST_CASE(RandomElementIsCombinationOfPowers)
{
    auto zp = PAdicBaseRing::acquire_ring(5, 5);
    auto ring = make_extension(zp, eisenstein_poly, "w");
    for (int i = 0; i < 20; i++)
    {
        ExtensionElement element = ring->random_element();
        BOOST_CHECK(element.ring() == ring);
        BOOST_REQUIRE_EQUAL(ring->degree(), element.coeff_count());
        BOOST_CHECK_EQUAL(zp->precision_cap(), element.precision());
        for (int j = 0; j < element.coeff_count(); j++)
        {
            BOOST_CHECK(element.coeff(j) < 3125);
        }

        // Rebuild the element from its coefficients in powers of the generator
        ExtensionElement sum = ring->zero();
        ExtensionElement power = ring->one();
        for (int j = 0; j < ring->degree(); j++)
        {
            sum += power * element.coeff(j);
            power *= ring->gen();
        }
        BOOST_CHECK(sum == element);
    }
}

BOOST_AUTO_TEST_CASE(ShapesOfExtensions)
{
    auto zp = PAdicBaseRing::acquire_ring(5, 3);

    auto unramified = make_extension(zp, "x^2 + x + 2", "a");
    BOOST_CHECK(unramified->kind() == ExtensionKind::unramified);
    BOOST_CHECK(unramified->backend() == ExtensionBackend::specialized);
    BOOST_CHECK_EQUAL(1, unramified->ramification_index());
    BOOST_CHECK_EQUAL(2, unramified->inertia_degree());
    BOOST_CHECK_EQUAL(3, unramified->precision_cap());
    BOOST_CHECK(unramified->uniformizer() == unramified->from_ground(5));
    BOOST_CHECK_EQUAL("a", unramified->print_mode().unram_name());
    BOOST_CHECK_EQUAL("5", unramified->print_mode().ram_name());

    auto eisenstein = make_extension(zp, "x^2 - 5", "pi");
    BOOST_CHECK(eisenstein->uniformizer() == eisenstein->gen());
    BOOST_CHECK_EQUAL(6, eisenstein->precision_cap());

    // x^2 + 1 = (x - 2)(x + 2) modulo 5
    auto general = make_extension(zp, "x^2 + 1", "i");
    BOOST_CHECK(general->kind() == ExtensionKind::general);
    BOOST_CHECK_EQUAL("5-adic General Extension Ring in i defined by x^2 + 1 with capped relative precision 3"
        " over 5-adic Ring", general->to_string());
    BOOST_CHECK_THROW(general->ramification_index(), logic_error);
    BOOST_CHECK_THROW(general->inertia_degree(), logic_error);
    BOOST_CHECK_THROW(general->uniformizer(), logic_error);
}

BOOST_AUTO_TEST_CASE(NamesAndKindNames)
{
    BOOST_CHECK_EQUAL("unramified", extension_kind_name(ExtensionKind::unramified));
    BOOST_CHECK_EQUAL("eisenstein", extension_kind_name(ExtensionKind::eisenstein));
    BOOST_CHECK_EQUAL("general", extension_kind_name(ExtensionKind::general));
    BOOST_CHECK_EQUAL("generic", extension_backend_name(ExtensionBackend::generic));
    BOOST_CHECK_EQUAL("specialized", extension_backend_name(ExtensionBackend::specialized));
    BOOST_CHECK_EQUAL("capped absolute", precision_type_name(PrecisionType::capped_abs));
    BOOST_CHECK_EQUAL("fixed modulus", precision_type_name(PrecisionType::fixed_mod));
}

BOOST_AUTO_TEST_SUITE_END()
