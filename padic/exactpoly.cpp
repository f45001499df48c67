#include "exactpoly.h"
#include "util/defines.h"
#include "util/uintarithsmallmod.h"
#include <cctype>
#include <sstream>
#include <stdexcept>

using namespace std;
using namespace padic::util;

namespace padic
{
    namespace
    {
        int remove_prime(mpz_class value, const mpz_class &prime)
        {
            mpz_class stripped;
            return static_cast<int>(mpz_remove(stripped.get_mpz_t(), value.get_mpz_t(), prime.get_mpz_t()));
        }

        class PolynomialParser
        {
        public:
            PolynomialParser(const string &text) : text_(text), position_(0)
            {
            }

            vector<mpq_class> parse()
            {
                vector<mpq_class> coeffs;
                skip_spaces();
                if (at_end())
                {
                    fail("empty polynomial");
                }
                bool first = true;
                while (!at_end())
                {
                    int sign = 1;
                    if (peek() == '+' || peek() == '-')
                    {
                        sign = (peek() == '-') ? -1 : 1;
                        position_++;
                        skip_spaces();
                    }
                    else if (!first)
                    {
                        fail("expected '+' or '-'");
                    }
                    first = false;

                    mpq_class coeff;
                    int exponent;
                    parse_term(coeff, exponent);
                    if (sign < 0)
                    {
                        coeff = -coeff;
                    }
                    if (coeffs.size() <= static_cast<size_t>(exponent))
                    {
                        coeffs.resize(exponent + 1);
                    }
                    coeffs[exponent] += coeff;
                    skip_spaces();
                }
                return coeffs;
            }

        private:
            void parse_term(mpq_class &coeff, int &exponent)
            {
                bool has_coeff = false;
                coeff = 1;
                if (isdigit(static_cast<unsigned char>(peek())))
                {
                    mpz_class numerator(read_digits());
                    mpz_class denominator(1);
                    skip_spaces();
                    if (peek() == '/')
                    {
                        position_++;
                        skip_spaces();
                        denominator = mpz_class(read_digits());
                        if (denominator == 0)
                        {
                            fail("zero denominator");
                        }
                    }
                    coeff = mpq_class(numerator, denominator);
                    coeff.canonicalize();
                    has_coeff = true;
                    skip_spaces();
                    if (peek() == '*')
                    {
                        position_++;
                        skip_spaces();
                        if (!isalpha(static_cast<unsigned char>(peek())))
                        {
                            fail("expected a variable after '*'");
                        }
                    }
                }

                exponent = 0;
                if (isalpha(static_cast<unsigned char>(peek())))
                {
                    string name;
                    while (!at_end() && (isalnum(static_cast<unsigned char>(peek())) || peek() == '_'))
                    {
                        name += text_[position_++];
                    }
                    if (variable_.empty())
                    {
                        variable_ = name;
                    }
                    else if (variable_ != name)
                    {
                        fail("more than one variable (" + variable_ + " and " + name + ")");
                    }
                    exponent = 1;
                    skip_spaces();
                    if (peek() == '^')
                    {
                        position_++;
                        skip_spaces();
                        istringstream digits(read_digits());
                        if (!(digits >> exponent) || exponent > PADIC_POLY_DEGREE_MAX)
                        {
                            fail("exponent exceeds " + std::to_string(PADIC_POLY_DEGREE_MAX));
                        }
                    }
                }
                else if (!has_coeff)
                {
                    fail("expected a coefficient or a variable");
                }
            }

            string read_digits()
            {
                string digits;
                while (!at_end() && isdigit(static_cast<unsigned char>(peek())))
                {
                    digits += text_[position_++];
                }
                if (digits.empty())
                {
                    fail("expected digits");
                }
                return digits;
            }

            void skip_spaces()
            {
                while (!at_end() && isspace(static_cast<unsigned char>(peek())))
                {
                    position_++;
                }
            }

            bool at_end() const
            {
                return position_ >= text_.size();
            }

            char peek() const
            {
                return at_end() ? '\0' : text_[position_];
            }

            void fail(const string &reason) const
            {
                throw invalid_argument("cannot parse polynomial \"" + text_ + "\" at position "
                    + std::to_string(position_) + ": " + reason);
            }

            const string &text_;

            size_t position_;

            string variable_;
        };
    }

    int p_adic_valuation(const mpq_class &value, uint64_t prime)
    {
        if (value == 0)
        {
            return infinite_valuation;
        }
        mpz_class p(static_cast<unsigned long>(prime));
        return remove_prime(value.get_num(), p) - remove_prime(value.get_den(), p);
    }

    uint64_t reduce_rational(const mpq_class &value, const SmallModulus &modulus)
    {
        unsigned long m = static_cast<unsigned long>(modulus.value());
        mpz_class numerator = value.get_num();
        uint64_t numerator_residue = mpz_fdiv_ui(numerator.get_mpz_t(), m);
        uint64_t denominator_residue = mpz_fdiv_ui(value.get_den().get_mpz_t(), m);
        uint64_t denominator_inverse;
        if (!try_invert_uint_smallmod(&denominator_residue, modulus, &denominator_inverse))
        {
            throw invalid_argument("coefficient " + value.get_str() + " is not integral modulo " + modulus.to_string());
        }
        uint64_t result;
        multiply_uint64_smallmod(&numerator_residue, &denominator_inverse, modulus, &result);
        return result;
    }

    ExactPolynomial::ExactPolynomial(vector<mpq_class> coeffs) : coeffs_(move(coeffs))
    {
        for (auto &coeff : coeffs_)
        {
            coeff.canonicalize();
        }
        trim();
    }

    ExactPolynomial::ExactPolynomial(const vector<long> &coeffs)
    {
        coeffs_.reserve(coeffs.size());
        for (long coeff : coeffs)
        {
            coeffs_.push_back(mpq_class(coeff));
        }
        trim();
    }

    ExactPolynomial::ExactPolynomial(const string &text)
    {
        PolynomialParser parser(text);
        coeffs_ = parser.parse();
        trim();
    }

    mpq_class ExactPolynomial::coeff(int index) const
    {
        if (index < 0)
        {
            throw out_of_range("index cannot be negative");
        }
        if (index > degree())
        {
            return mpq_class(0);
        }
        return coeffs_[index];
    }

    const mpq_class &ExactPolynomial::leading_coefficient() const
    {
        if (coeffs_.empty())
        {
            throw logic_error("zero polynomial has no leading coefficient");
        }
        return coeffs_.back();
    }

    bool ExactPolynomial::is_monic() const
    {
        return !coeffs_.empty() && coeffs_.back() == 1;
    }

    bool ExactPolynomial::is_integral() const
    {
        for (const auto &coeff : coeffs_)
        {
            if (coeff.get_den() != 1)
            {
                return false;
            }
        }
        return true;
    }

    bool ExactPolynomial::is_p_integral(uint64_t prime) const
    {
        for (const auto &coeff : coeffs_)
        {
            if (p_adic_valuation(coeff, prime) < 0)
            {
                return false;
            }
        }
        return true;
    }

    ExactPolynomial ExactPolynomial::monic() const
    {
        mpq_class leading = leading_coefficient();
        vector<mpq_class> coeffs(coeffs_);
        for (auto &coeff : coeffs)
        {
            coeff /= leading;
        }
        return ExactPolynomial(move(coeffs));
    }

    vector<uint64_t> ExactPolynomial::reduce(const SmallModulus &modulus) const
    {
        vector<uint64_t> result;
        result.reserve(coeffs_.size());
        for (const auto &coeff : coeffs_)
        {
            result.push_back(reduce_rational(coeff, modulus));
        }
        return result;
    }

    string ExactPolynomial::to_string(const string &var_name) const
    {
        if (coeffs_.empty())
        {
            return "0";
        }
        ostringstream result;
        bool first = true;
        for (int i = degree(); i >= 0; i--)
        {
            const mpq_class &coeff = coeffs_[i];
            if (coeff == 0)
            {
                continue;
            }
            mpq_class magnitude = abs(coeff);
            if (first)
            {
                if (coeff < 0)
                {
                    result << "-";
                }
            }
            else
            {
                result << (coeff < 0 ? " - " : " + ");
            }
            first = false;
            if (magnitude != 1 || i == 0)
            {
                result << magnitude.get_str();
                if (i > 0)
                {
                    result << "*";
                }
            }
            if (i > 0)
            {
                result << var_name;
                if (i > 1)
                {
                    result << "^" << i;
                }
            }
        }
        return result.str();
    }

    void ExactPolynomial::trim()
    {
        while (!coeffs_.empty() && coeffs_.back() == 0)
        {
            coeffs_.pop_back();
        }
    }
}
