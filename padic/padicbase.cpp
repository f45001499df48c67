#include "padicbase.h"
#include "numberfield.h"
#include "util/common.h"
#include "util/logging.h"
#include "util/uniquecache.h"
#include <random>
#include <sstream>
#include <stdexcept>

using namespace std;
using namespace padic::util;

namespace padic
{
    namespace
    {
        UniqueCache<PAdicBaseRing> &base_ring_cache()
        {
            static UniqueCache<PAdicBaseRing> cache;
            return cache;
        }

        string make_key(uint64_t prime, int precision_cap, PrecisionType type, bool field, const PrintMode &print_mode)
        {
            ostringstream key;
            key << prime << ';' << precision_cap << ';' << static_cast<int>(type) << ';' << field << ';' << print_mode.mode_key();
            return key.str();
        }
    }

    shared_ptr<const PAdicBaseRing> PAdicBaseRing::acquire_ring(uint64_t prime, int precision_cap, PrecisionType type,
        const PrintMode &print_mode)
    {
        return acquire(prime, precision_cap, type, false, print_mode);
    }

    shared_ptr<const PAdicBaseRing> PAdicBaseRing::acquire_field(uint64_t prime, int precision_cap, PrecisionType type,
        const PrintMode &print_mode)
    {
        if (type == PrecisionType::capped_abs || type == PrecisionType::fixed_mod)
        {
            throw invalid_argument("p-adic fields must have capped relative or floating point precision");
        }
        return acquire(prime, precision_cap, type, true, print_mode);
    }

    shared_ptr<const PAdicBaseRing> PAdicBaseRing::acquire(uint64_t prime, int precision_cap, PrecisionType type,
        bool field, const PrintMode &print_mode)
    {
        if (!is_prime(prime))
        {
            throw invalid_argument("p must be prime");
        }
        if (precision_cap <= 0)
        {
            throw invalid_argument("precision cap must be positive");
        }

        // Names of a base ring default to p itself.
        string prime_name = std::to_string(prime);
        PrintMode named_mode = print_mode.with_names(
            print_mode.var_name().empty() ? prime_name : print_mode.var_name(),
            print_mode.unram_name(),
            print_mode.ram_name().empty() ? prime_name : print_mode.ram_name());

        bool created;
        auto ring = base_ring_cache().acquire(make_key(prime, precision_cap, type, field, named_mode), [&]() {
            return make_shared<PAdicBaseRing>(prime, precision_cap, type, field, named_mode);
        }, created);
        if (created)
        {
            PADIC_REPORT(PADIC_LOG_DEBUG, "created " << ring->to_string());
        }
        return ring;
    }

    PAdicBaseRing::PAdicBaseRing(uint64_t prime, int precision_cap, PrecisionType type, bool field, const PrintMode &print_mode) :
        PAdicRing(prime, precision_cap, print_mode, print_mode.var_name()), type_(type), field_(field),
        modulus_(exponentiate_uint64_checked(prime, precision_cap))
    {
    }

    shared_ptr<const PAdicRing> PAdicBaseRing::base_ring() const
    {
        return shared_from_this();
    }

    string PAdicBaseRing::to_string() const
    {
        ostringstream result;
        result << prime() << "-adic " << (field_ ? "Field" : "Ring") << " with " << precision_type_name(type_)
            << " precision " << precision_cap();
        return result.str();
    }

    bool PAdicBaseRing::equals(const PAdicRing &other) const
    {
        if (this == &other)
        {
            return true;
        }
        if (!other.is_base_ring())
        {
            return false;
        }
        const PAdicBaseRing &base = static_cast<const PAdicBaseRing &>(other);
        return prime() == base.prime() && precision_cap() == base.precision_cap() && type_ == base.type_
            && field_ == base.field_ && print_mode().equals_mode(base.print_mode());
    }

    uint64_t PAdicBaseRing::random_element() const
    {
        random_device rd;
        uniform_int_distribution<uint64_t> distribution(0, modulus_.value() - 1);
        return distribution(rd);
    }

    shared_ptr<const PAdicBaseRing> PAdicBaseRing::fraction_field() const
    {
        if (field_)
        {
            return static_pointer_cast<const PAdicBaseRing>(shared_from_this());
        }
        PrecisionType field_type = type_;
        if (type_ == PrecisionType::capped_abs || type_ == PrecisionType::fixed_mod)
        {
            field_type = PrecisionType::capped_rel;
        }
        return acquire_field(prime(), precision_cap(), field_type, print_mode());
    }

    shared_ptr<const PAdicBaseRing> PAdicBaseRing::integer_ring() const
    {
        if (!field_)
        {
            return static_pointer_cast<const PAdicBaseRing>(shared_from_this());
        }
        return acquire_ring(prime(), precision_cap(), type_, print_mode());
    }

    shared_ptr<const RationalField> PAdicBaseRing::exact_field() const
    {
        return RationalField::acquire_field();
    }

    string PAdicBaseRing::key() const
    {
        return make_key(prime(), precision_cap(), type_, field_, print_mode());
    }
}
