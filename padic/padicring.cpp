#include "padicring.h"
#include <stdexcept>

using namespace std;

namespace padic
{
    string precision_type_name(PrecisionType type)
    {
        switch (type)
        {
        case PrecisionType::capped_rel:
            return "capped relative";
        case PrecisionType::capped_abs:
            return "capped absolute";
        case PrecisionType::fixed_mod:
            return "fixed modulus";
        case PrecisionType::floating_point:
            return "floating point";
        }
        throw invalid_argument("type");
    }

    PAdicRing::PAdicRing(uint64_t prime, int precision_cap, PrintMode print_mode, string variable_name) :
        prime_(prime), precision_cap_(precision_cap), print_mode_(move(print_mode)), variable_name_(move(variable_name))
    {
    }

    void PAdicRing::register_coercion(shared_ptr<const PAdicRing> source)
    {
        if (!source)
        {
            throw invalid_argument("source cannot be null");
        }
        coerce_list_.push_back(move(source));
    }

    bool PAdicRing::in_coercion_list(const PAdicRing &source) const
    {
        for (const auto &registered : coerce_list_)
        {
            if (registered.get() == &source || registered->equals(source))
            {
                return true;
            }
        }
        return false;
    }
}
