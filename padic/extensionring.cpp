#include "extensionring.h"
#include "coercion.h"
#include "extensionfactory.h"
#include "extensionfunctor.h"
#include "extensionparams.h"
#include "numberfield.h"
#include "util/common.h"
#include "util/logging.h"
#include "util/polyarithsmallmod.h"
#include "util/uintarithsmallmod.h"
#include <algorithm>
#include <sstream>
#include <stdexcept>

using namespace std;
using namespace padic::util;

namespace padic
{
    string extension_kind_name(ExtensionKind kind)
    {
        switch (kind)
        {
        case ExtensionKind::unramified:
            return "unramified";
        case ExtensionKind::eisenstein:
            return "eisenstein";
        case ExtensionKind::general:
            return "general";
        }
        throw invalid_argument("kind");
    }

    string extension_backend_name(ExtensionBackend backend)
    {
        switch (backend)
        {
        case ExtensionBackend::generic:
            return "generic";
        case ExtensionBackend::specialized:
            return "specialized";
        }
        throw invalid_argument("backend");
    }

    ExtensionRing::ExtensionRing(PAdicPolynomial given_poly, ExactPolynomial exact_modulus, int precision_cap,
        const PrintMode &print_mode, const ExtensionNames &names, ExtensionBackend backend) :
        PAdicRing(given_poly.base_ring()->prime(), precision_cap,
            print_mode.with_names(names.variable, names.unramified, names.ramified), names.variable),
        given_poly_(move(given_poly)), exact_modulus_(move(exact_modulus)), ground_ring_(given_poly_.base_ring()),
        names_(names), backend_(backend)
    {
        register_coercion(ground_ring_);
    }

    shared_ptr<const ExtensionRing> ExtensionRing::shared_extension() const
    {
        return static_pointer_cast<const ExtensionRing>(shared_from_this());
    }

    bool ExtensionRing::equals(const PAdicRing &other) const
    {
        if (this == &other)
        {
            return true;
        }
        if (other.is_base_ring())
        {
            return false;
        }
        const ExtensionRing *extension = dynamic_cast<const ExtensionRing *>(&other);
        if (extension == nullptr)
        {
            return false;
        }
        return ground_ring_->equals(*extension->ground_ring_)
            && exact_modulus_ == extension->exact_modulus_
            && precision_cap() == extension->precision_cap()
            && print_mode().equals_mode(extension->print_mode());
    }

    Coercion ExtensionRing::coerce_map_from(const PAdicRing &source) const
    {
        if (&source == this)
        {
            return Coercion::identity();
        }
        if (in_coercion_list(source))
        {
            return Coercion::base();
        }
        const ExtensionRing *extension = source.is_base_ring() ? nullptr : dynamic_cast<const ExtensionRing *>(&source);
        if (extension == nullptr)
        {
            return Coercion::none();
        }
        if (extension->fraction_field().get() != this)
        {
            return Coercion::none();
        }
        if (backend_ == ExtensionBackend::generic)
        {
            PADIC_REPORT(PADIC_LOG_DEBUG, "generic coercion from " << source.to_string());
            return Coercion::generic();
        }
        auto map = make_fraction_field_coercion(extension->shared_extension(), shared_extension());
        if (!map)
        {
            PADIC_REPORT(PADIC_LOG_DEBUG, "no coercion map for " << precision_type_name(source.precision_type())
                << " precision into " << to_string());
            return Coercion::none();
        }
        PADIC_REPORT(PADIC_LOG_DEBUG, "coercion from " << source.to_string() << " via " << map->name());
        return Coercion::mapped(map);
    }

    ExtensionElement ExtensionRing::convert(const ExtensionElement &element) const
    {
        if (element.is_empty())
        {
            throw invalid_argument("element is empty");
        }
        Coercion coercion = coerce_map_from(*element.ring());
        switch (coercion.kind())
        {
        case Coercion::Kind::identity:
            return element;

        case Coercion::Kind::generic:
            return ExtensionElement(shared_extension(), element.coeffs(),
                min(element.precision(), ground_ring_->precision_cap()));

        case Coercion::Kind::mapped:
            return coercion.map()->apply(element);

        default:
            throw logic_error("no coercion from " + element.ring()->to_string() + " to " + to_string());
        }
    }

    shared_ptr<const PAdicBaseRing> ExtensionRing::ground_ring_of_tower() const
    {
        shared_ptr<const PAdicRing> ring = ground_ring_;
        while (!ring->is_base_ring())
        {
            ring = ring->base_ring();
        }
        return static_pointer_cast<const PAdicBaseRing>(ring);
    }

    shared_ptr<const NumberField> ExtensionRing::exact_field() const
    {
        return ground_ring_->exact_field()->extension(exact_modulus_, variable_name());
    }

    pair<ExtensionFunctor, shared_ptr<const PAdicBaseRing> > ExtensionRing::construction() const
    {
        ExtensionFunctor functor(vector<ExactPolynomial>{ exact_modulus_ }, vector<string>{ variable_name() },
            precision_cap(), print_mode(), backend_);
        return make_pair(functor, ground_ring_);
    }

    shared_ptr<const ExtensionRing> ExtensionRing::fraction_field(const PrintModeOverrides &overrides) const
    {
        if (is_field() && overrides.empty())
        {
            return shared_extension();
        }
        return change(true, overrides);
    }

    shared_ptr<const ExtensionRing> ExtensionRing::integer_ring(const PrintModeOverrides &overrides) const
    {
        if (!is_field() && overrides.empty())
        {
            return shared_extension();
        }
        if (!exact_modulus_.is_integral())
        {
            throw logic_error("ring of integers of an extension with non-integral defining polynomial "
                + exact_modulus_.to_string() + " is not supported");
        }
        return change(false, overrides);
    }

    shared_ptr<const ExtensionRing> ExtensionRing::change(bool field, const PrintModeOverrides &overrides) const
    {
        ExtensionNames names = names_;
        if (overrides.var_name)
        {
            // Names that defaulted to the generator follow it
            const string &old_variable = names_.variable;
            names.variable = *overrides.var_name;
            if (names.residue == old_variable + "0")
            {
                names.residue = names.variable + "0";
            }
            if (names.unramified == old_variable)
            {
                names.unramified = names.variable;
            }
            if (names.ramified == old_variable)
            {
                names.ramified = names.variable;
            }
        }
        if (overrides.unram_name)
        {
            names.unramified = *overrides.unram_name;
        }
        if (overrides.ram_name)
        {
            names.ramified = *overrides.ram_name;
        }

        ExtensionParameters parms;
        parms.set_defining_polynomial(exact_modulus_);
        parms.set_names(names);
        parms.set_precision_cap(precision_cap());
        parms.set_print_mode(print_mode().with_overrides(overrides));
        parms.set_backend(backend_);
        parms.set_kind(kind());

        auto ground = field ? ground_ring_->fraction_field() : ground_ring_->integer_ring();
        return ExtensionFactory::create(ground, parms);
    }

    ExtensionElement ExtensionRing::random_element() const
    {
        ExtensionElement result = zero();
        ExtensionElement power = one();
        ExtensionElement generator = gen();
        for (int i = 0; i < degree(); i++)
        {
            result += power * ground_ring_->random_element();
            power *= generator;
        }
        return result;
    }

    ExtensionElement ExtensionRing::gen() const
    {
        return element(vector<uint64_t>{ 0, 1 });
    }

    ExtensionElement ExtensionRing::one() const
    {
        return element(vector<uint64_t>{ 1 });
    }

    ExtensionElement ExtensionRing::zero() const
    {
        return ExtensionElement(shared_extension());
    }

    ExtensionElement ExtensionRing::element(vector<uint64_t> coeffs) const
    {
        return ExtensionElement(shared_extension(), move(coeffs), ground_ring_->precision_cap());
    }

    ExtensionElement ExtensionRing::from_ground(uint64_t value) const
    {
        return element(vector<uint64_t>{ value });
    }

    string ExtensionRing::to_string() const
    {
        string shape;
        switch (kind())
        {
        case ExtensionKind::unramified:
            shape = "Unramified";
            break;
        case ExtensionKind::eisenstein:
            shape = "Eisenstein";
            break;
        case ExtensionKind::general:
            shape = "General";
            break;
        }
        ostringstream result;
        result << prime() << "-adic " << shape << " Extension " << (is_field() ? "Field" : "Ring") << " in "
            << variable_name() << " defined by " << exact_modulus_.to_string() << " with "
            << precision_type_name(precision_type()) << " precision " << precision_cap() << " over " << prime()
            << "-adic " << (ground_ring_->is_field() ? "Field" : "Ring");
        return result.str();
    }

    void ExtensionRing::check_operand(const ExtensionElement &operand) const
    {
        if (operand.is_empty())
        {
            throw invalid_argument("operand is empty");
        }
        if (operand.ring_.get() != this && !equals(*operand.ring_))
        {
            throw invalid_argument("operand is not an element of " + to_string());
        }
    }

    void ExtensionRing::add(const ExtensionElement &operand1, const ExtensionElement &operand2, ExtensionElement &result) const
    {
        check_operand(operand1);
        check_operand(operand2);
        int precision = min(operand1.precision_, operand2.precision_);
        vector<uint64_t> sum(degree());
        add_poly_poly_coeff_smallmod(operand1.coeffs_.data(), operand2.coeffs_.data(), degree(), coeff_modulus(), sum.data());
        result.ring_ = shared_extension();
        result.coeffs_ = move(sum);
        result.precision_ = precision;
        result.reduce_to_precision();
    }

    void ExtensionRing::sub(const ExtensionElement &operand1, const ExtensionElement &operand2, ExtensionElement &result) const
    {
        check_operand(operand1);
        check_operand(operand2);
        int precision = min(operand1.precision_, operand2.precision_);
        vector<uint64_t> difference(degree());
        sub_poly_poly_coeff_smallmod(operand1.coeffs_.data(), operand2.coeffs_.data(), degree(), coeff_modulus(), difference.data());
        result.ring_ = shared_extension();
        result.coeffs_ = move(difference);
        result.precision_ = precision;
        result.reduce_to_precision();
    }

    void ExtensionRing::negate(const ExtensionElement &operand, ExtensionElement &result) const
    {
        check_operand(operand);
        vector<uint64_t> negated(degree());
        negate_poly_coeff_smallmod(operand.coeffs_.data(), degree(), coeff_modulus(), negated.data());
        result.ring_ = shared_extension();
        result.precision_ = operand.precision_;
        result.coeffs_ = move(negated);
        result.reduce_to_precision();
    }

    void ExtensionRing::multiply(const ExtensionElement &operand1, const ExtensionElement &operand2, ExtensionElement &result) const
    {
        check_operand(operand1);
        check_operand(operand2);
        int precision = min(operand1.precision_, operand2.precision_);
        vector<uint64_t> product(degree());
        nonfft_multiply_poly_poly_polymod_coeff_smallmod(operand1.coeffs_.data(), operand2.coeffs_.data(),
            given_poly_.coeffs().data(), given_poly_.coeff_count(), coeff_modulus(), product.data());
        result.ring_ = shared_extension();
        result.coeffs_ = move(product);
        result.precision_ = precision;
        result.reduce_to_precision();
    }

    void ExtensionRing::multiply_scalar(const ExtensionElement &operand, uint64_t scalar, ExtensionElement &result) const
    {
        check_operand(operand);
        uint64_t reduced = small_modulo_uint64(scalar, coeff_modulus());
        vector<uint64_t> product(degree());
        multiply_poly_scalar_coeff_smallmod(operand.coeffs_.data(), degree(), &reduced, coeff_modulus(), product.data());
        result.ring_ = shared_extension();
        result.precision_ = operand.precision_;
        result.coeffs_ = move(product);
        result.reduce_to_precision();
    }

    void ExtensionRing::exponentiate(const ExtensionElement &base, uint64_t exponent, ExtensionElement &result) const
    {
        check_operand(base);
        vector<uint64_t> power(degree());
        exponentiate_poly_polymod_coeff_smallmod(base.coeffs_.data(), exponent, given_poly_.coeffs().data(),
            given_poly_.coeff_count(), coeff_modulus(), power.data());
        result.ring_ = shared_extension();
        result.precision_ = base.precision_;
        result.coeffs_ = move(power);
        result.reduce_to_precision();
    }

    ExtensionElement::ExtensionElement(shared_ptr<const ExtensionRing> ring) : ring_(move(ring)), precision_(0)
    {
        if (!ring_)
        {
            throw invalid_argument("ring cannot be null");
        }
        coeffs_.assign(ring_->degree(), 0);
        precision_ = ring_->ground_ring()->precision_cap();
    }

    ExtensionElement::ExtensionElement(shared_ptr<const ExtensionRing> ring, vector<uint64_t> coeffs, int precision) :
        ring_(move(ring)), coeffs_(move(coeffs)), precision_(precision)
    {
        if (!ring_)
        {
            throw invalid_argument("ring cannot be null");
        }
        if (precision_ < 0 || precision_ > ring_->ground_ring()->precision_cap())
        {
            throw invalid_argument("precision must be between 0 and the precision cap of the ground ring");
        }
        const SmallModulus &modulus = ring_->coeff_modulus();
        for (auto &coeff : coeffs_)
        {
            coeff = small_modulo_uint64(coeff, modulus);
        }
        int degree = ring_->degree();
        if (coeff_count() > degree)
        {
            const PAdicPolynomial &poly_modulus = ring_->defining_polynomial();
            modulo_poly_monic_inplace(coeffs_.data(), coeff_count(), poly_modulus.coeffs().data(),
                poly_modulus.coeff_count(), modulus);
        }
        coeffs_.resize(degree, 0);
        reduce_to_precision();
    }

    void ExtensionElement::reduce_to_precision()
    {
        int cap = ring_->ground_ring()->precision_cap();
        if (precision_ >= cap)
        {
            return;
        }
        uint64_t truncation = exponentiate_uint64_checked(ring_->prime(), precision_);
        for (auto &coeff : coeffs_)
        {
            coeff %= truncation;
        }
    }

    const ExtensionRing &ExtensionElement::checked_ring() const
    {
        if (!ring_)
        {
            throw logic_error("element is empty");
        }
        return *ring_;
    }

    const uint64_t *ExtensionElement::pointer(int coeff_index) const
    {
        if (coeff_index < 0 || coeff_index >= coeff_count())
        {
            throw out_of_range("coeff_index");
        }
        return coeffs_.data() + coeff_index;
    }

    uint64_t ExtensionElement::coeff(int index) const
    {
        return *pointer(index);
    }

    bool ExtensionElement::is_zero() const
    {
        return all_of(coeffs_.begin(), coeffs_.end(), [](uint64_t coeff) { return coeff == 0; });
    }

    ExtensionElement ExtensionElement::with_precision(int precision) const
    {
        if (precision < 0 || precision > precision_)
        {
            throw invalid_argument("precision must be between 0 and the current precision");
        }
        ExtensionElement result(*this);
        result.precision_ = precision;
        result.reduce_to_precision();
        return result;
    }

    bool ExtensionElement::operator ==(const ExtensionElement &operand2) const
    {
        if (ring_ != operand2.ring_)
        {
            if (!ring_ || !operand2.ring_ || !ring_->equals(*operand2.ring_))
            {
                return false;
            }
        }
        return precision_ == operand2.precision_ && coeffs_ == operand2.coeffs_;
    }

    ExtensionElement ExtensionElement::operator +(const ExtensionElement &operand2) const
    {
        ExtensionElement result;
        checked_ring().add(*this, operand2, result);
        return result;
    }

    ExtensionElement &ExtensionElement::operator +=(const ExtensionElement &operand2)
    {
        checked_ring().add(*this, operand2, *this);
        return *this;
    }

    ExtensionElement ExtensionElement::operator -(const ExtensionElement &operand2) const
    {
        ExtensionElement result;
        checked_ring().sub(*this, operand2, result);
        return result;
    }

    ExtensionElement &ExtensionElement::operator -=(const ExtensionElement &operand2)
    {
        checked_ring().sub(*this, operand2, *this);
        return *this;
    }

    ExtensionElement ExtensionElement::operator -() const
    {
        ExtensionElement result;
        checked_ring().negate(*this, result);
        return result;
    }

    ExtensionElement ExtensionElement::operator *(const ExtensionElement &operand2) const
    {
        ExtensionElement result;
        checked_ring().multiply(*this, operand2, result);
        return result;
    }

    ExtensionElement &ExtensionElement::operator *=(const ExtensionElement &operand2)
    {
        checked_ring().multiply(*this, operand2, *this);
        return *this;
    }

    ExtensionElement ExtensionElement::operator *(uint64_t scalar) const
    {
        ExtensionElement result;
        checked_ring().multiply_scalar(*this, scalar, result);
        return result;
    }

    ExtensionElement &ExtensionElement::operator *=(uint64_t scalar)
    {
        checked_ring().multiply_scalar(*this, scalar, *this);
        return *this;
    }

    ExtensionElement ExtensionElement::operator ^(uint64_t exponent) const
    {
        ExtensionElement result;
        checked_ring().exponentiate(*this, exponent, result);
        return result;
    }

    string ExtensionElement::to_string() const
    {
        if (!ring_)
        {
            return "";
        }
        ostringstream result;
        result << poly_to_dec_string(coeffs_.data(), coeff_count(), ring_->variable_name()) << " + O("
            << ring_->prime() << "^" << precision_ << ")";
        return result.str();
    }
}
