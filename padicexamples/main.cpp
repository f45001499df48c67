#include <iostream>
#include <string>
#include <vector>
#include <boost/lexical_cast.hpp>
#include "padic.h"

using namespace std;
using namespace padic;

void print_example_banner(string title);
void example_eisenstein();
void example_unramified();
void example_fraction_field();
void example_construction();

int main(int argc, char *argv[])
{
    for (int i = 1; i < argc; i++)
    {
        string arg(argv[i]);
        const string verbose = "--verbose=";
        if (arg.compare(0, verbose.size(), verbose) == 0)
        {
            try
            {
                util::set_max_log_level(boost::lexical_cast<int>(arg.substr(verbose.size())));
            }
            catch (const boost::bad_lexical_cast &)
            {
                cerr << "invalid verbosity level: " << arg << endl;
                return 1;
            }
        }
        else
        {
            cerr << "usage: " << argv[0] << " [--verbose=N]" << endl;
            return 1;
        }
    }

    // Example: Eisenstein extension of Z_5
    example_eisenstein();

    // Example: Unramified extension and its arithmetic
    example_unramified();

    // Example: Fraction fields and coercion
    example_fraction_field();

    // Example: Construction functors
    example_construction();

    return 0;
}

void example_eisenstein()
{
    print_example_banner("Example: Eisenstein Extension");

    /*
    We start from the 5-adic integers, capped at 5 digits of precision. Elements of this ring are handled
    as residues modulo 5^5 = 3125.
    */
    auto zp = PAdicBaseRing::acquire_ring(5, 5);
    cout << "Base ring: " << zp->to_string() << endl;

    /*
    An extension is described by an ExtensionParameters object. At a minimum we need a defining polynomial
    and a name for the generator. The polynomial below is Eisenstein at 5: every lower coefficient is
    divisible by 5 and the constant term is not divisible by 25.
    */
    ExtensionParameters parms;
    parms.set_defining_polynomial("x^5 + 75*x^3 - 15*x^2 + 125*x - 5");
    parms.set_variable_name("w");

    /*
    ExtensionFactory checks the polynomial, detects its shape and returns the extension.
    */
    auto ring = ExtensionFactory::create(zp, parms);
    cout << "Extension: " << ring->to_string() << endl;
    cout << "Degree: " << ring->degree() << ", e = " << ring->ramification_index()
        << ", f = " << ring->inertia_degree() << endl;
    cout << "Exact modulus: " << ring->exact_modulus().to_string() << endl;
    cout << "Working modulus: " << ring->modulus().to_string() << endl;
    cout << "Ground ring of tower: " << ring->ground_ring_of_tower()->to_string() << endl;
    cout << "Exact field: " << ring->exact_field()->to_string() << endl;

    /*
    The generator w is a uniformizer: w^5 is 5 times a unit.
    */
    ExtensionElement w = ring->gen();
    cout << "w^5 = " << (w ^ 5).to_string() << endl;
    cout << "A random element: " << ring->random_element().to_string() << endl;
}

void example_unramified()
{
    print_example_banner("Example: Unramified Extension");

    /*
    The polynomial x^2 + x + 2 is irreducible modulo 5, so adjoining its root gives the unramified
    extension of degree 2. Its elements are pairs of residues modulo 5^5.
    */
    auto zp = PAdicBaseRing::acquire_ring(5, 5);
    ExtensionParameters parms;
    parms.set_defining_polynomial("x^2 + x + 2");
    parms.set_variable_name("a");
    auto ring = ExtensionFactory::create(zp, parms);
    cout << "Extension: " << ring->to_string() << endl;
    cout << "Backend: " << extension_backend_name(ring->backend()) << endl;

    ExtensionElement a = ring->gen();
    ExtensionElement b = ring->element(vector<uint64_t>{ 3, 1 });
    cout << "a = " << a.to_string() << endl;
    cout << "b = " << b.to_string() << endl;
    cout << "a + b = " << (a + b).to_string() << endl;
    cout << "a * b = " << (a * b).to_string() << endl;
    cout << "a^2 + a + 2 = " << ((a ^ 2) + a + ring->from_ground(2)).to_string() << endl;

    /*
    An element known only modulo 5^2 keeps that precision through arithmetic.
    */
    ExtensionElement c = b.with_precision(2);
    cout << "c = " << c.to_string() << endl;
    cout << "a * c = " << (a * c).to_string() << endl;
}

void example_fraction_field()
{
    print_example_banner("Example: Fraction Fields and Coercion");

    /*
    A ring with capped absolute precision has a fraction field with capped relative precision. Elements
    of the ring coerce into the field through a map chosen by the precision type of the ring.
    */
    auto zp = PAdicBaseRing::acquire_ring(7, 6, PrecisionType::capped_abs);
    ExtensionParameters parms;
    parms.set_defining_polynomial("x^3 + x + 1");
    parms.set_variable_name("t");
    auto ring = ExtensionFactory::create(zp, parms);
    auto field = ring->fraction_field();
    cout << "Ring: " << ring->to_string() << endl;
    cout << "Field: " << field->to_string() << endl;
    cout << "Fraction field of the field is the field: " << boolalpha
        << (field->fraction_field() == field) << endl;
    cout << "Ring of integers of the field: " << field->integer_ring()->to_string() << endl;

    Coercion coercion = field->coerce_map_from(*ring);
    cout << "Coercion from ring to field: " << coercion_kind_name(coercion.kind());
    if (coercion.map())
    {
        cout << " (" << coercion.map()->name() << ")";
    }
    cout << endl;

    ExtensionElement t = ring->gen();
    cout << "t in the field: " << field->convert(t).to_string() << endl;

    /*
    There is no coercion in the opposite direction.
    */
    coercion = ring->coerce_map_from(*field);
    cout << "Coercion from field to ring: " << coercion_kind_name(coercion.kind()) << endl;
}

void example_construction()
{
    print_example_banner("Example: Construction Functors");

    /*
    Every extension can tell how it was built: a functor and a base ring. Applying the functor to the base
    ring gives back the same extension.
    */
    auto qp = PAdicBaseRing::acquire_field(3, 10);
    ExtensionParameters parms;
    parms.set_defining_polynomial("x^2 - 3");
    parms.set_variable_name("pi");
    auto field = ExtensionFactory::create(qp, parms);

    auto construction = field->construction();
    cout << "Functor: " << construction.first.to_string() << endl;
    cout << "Base: " << construction.second->to_string() << endl;
    auto rebuilt = construction.first(construction.second);
    cout << "Rebuilt equals original: " << boolalpha << (*rebuilt == *field) << endl;

    /*
    Print options are part of the identity of a ring. Changing them gives a different ring.
    */
    PrintModeOverrides overrides;
    overrides.style = PrintStyle::terse;
    auto terse = field->fraction_field(overrides);
    cout << "Terse field equals original: " << boolalpha << (*terse == *field) << endl;
}

void print_example_banner(string title)
{
    if (!title.empty())
    {
        size_t title_length = title.length();
        size_t banner_length = title_length + 2 + 2 * 10;
        string banner_top(banner_length, '*');
        string banner_middle = string(10, '*') + " " + title + " " + string(10, '*');

        cout << endl
            << banner_top << endl
            << banner_middle << endl
            << banner_top << endl
            << endl;
    }
}
