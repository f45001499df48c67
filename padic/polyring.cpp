#include "polyring.h"
#include "util/common.h"
#include "util/polyarithsmallmod.h"
#include "util/uintarithsmallmod.h"
#include <stdexcept>

using namespace std;
using namespace padic::util;

namespace padic
{
    PolynomialRing::PolynomialRing(shared_ptr<const PAdicBaseRing> base_ring, string variable_name) :
        base_ring_(move(base_ring)), variable_name_(move(variable_name))
    {
        if (!base_ring_)
        {
            throw invalid_argument("base_ring cannot be null");
        }
        if (variable_name_.empty())
        {
            throw invalid_argument("variable_name cannot be empty");
        }
    }

    PAdicPolynomial PolynomialRing::element(vector<uint64_t> coeffs) const
    {
        return PAdicPolynomial(shared_from_this(), move(coeffs));
    }

    PAdicPolynomial PolynomialRing::reduce(const ExactPolynomial &poly) const
    {
        return PAdicPolynomial(shared_from_this(), poly.reduce(base_ring_->modulus()));
    }

    bool PolynomialRing::operator ==(const PolynomialRing &other) const
    {
        return variable_name_ == other.variable_name_ && base_ring_->equals(*other.base_ring_);
    }

    string PolynomialRing::to_string() const
    {
        return "Univariate Polynomial Ring in " + variable_name_ + " over " + base_ring_->to_string();
    }

    PAdicPolynomial::PAdicPolynomial(shared_ptr<const PolynomialRing> parent, vector<uint64_t> coeffs) :
        parent_(move(parent)), coeffs_(move(coeffs))
    {
        if (!parent_)
        {
            throw invalid_argument("parent cannot be null");
        }
        const SmallModulus &modulus = parent_->base_ring()->modulus();
        for (auto &coeff : coeffs_)
        {
            coeff = small_modulo_uint64(coeff, modulus);
        }
        trim_poly(coeffs_);
    }

    uint64_t PAdicPolynomial::coeff(int index) const
    {
        if (index < 0)
        {
            throw out_of_range("index cannot be negative");
        }
        return index < coeff_count() ? coeffs_[index] : 0;
    }

    bool PAdicPolynomial::operator ==(const PAdicPolynomial &other) const
    {
        return coeffs_ == other.coeffs_ && (parent_ == other.parent_ || *parent_ == *other.parent_);
    }

    string PAdicPolynomial::to_string() const
    {
        return poly_to_dec_string(coeffs_.data(), coeff_count(), parent_->variable_name());
    }
}
