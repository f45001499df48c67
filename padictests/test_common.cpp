#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "util/common.h"
#include "util/logging.h"
#include "util/uniquecache.h"

using namespace padic::util;
using namespace std;

BOOST_AUTO_TEST_SUITE(CommonTests)

BOOST_AUTO_TEST_CASE(IsPrime)
{
    BOOST_CHECK(!is_prime(0));
    BOOST_CHECK(!is_prime(1));
    BOOST_CHECK(is_prime(2));
    BOOST_CHECK(is_prime(3));
    BOOST_CHECK(!is_prime(4));
    BOOST_CHECK(is_prime(97));
    BOOST_CHECK(!is_prime(91));
    BOOST_CHECK(!is_prime(3125));
    BOOST_CHECK(is_prime(1000003));
}

BOOST_AUTO_TEST_CASE(ExponentiateUInt64Checked)
{
    BOOST_CHECK_EQUAL(1ULL, exponentiate_uint64_checked(5, 0));
    BOOST_CHECK_EQUAL(3125ULL, exponentiate_uint64_checked(5, 5));
    BOOST_CHECK_EQUAL(1ULL << 61, exponentiate_uint64_checked(2, 61));
    BOOST_CHECK_THROW(exponentiate_uint64_checked(2, 62), invalid_argument);
    BOOST_CHECK_THROW(exponentiate_uint64_checked(5, 30), invalid_argument);
    BOOST_CHECK_THROW(exponentiate_uint64_checked(5, -1), invalid_argument);
}

BOOST_AUTO_TEST_CASE(PolyToDecString)
{
    vector<uint64_t> poly{ 4, 1, 3 };
    BOOST_CHECK_EQUAL("3*x^2 + x + 4", poly_to_dec_string(poly.data(), 3, "x"));
    poly = { 0, 0, 1 };
    BOOST_CHECK_EQUAL("w^2", poly_to_dec_string(poly.data(), 3, "w"));
    poly = { 7, 0, 0 };
    BOOST_CHECK_EQUAL("7", poly_to_dec_string(poly.data(), 3, "w"));
    poly = { 0, 0 };
    BOOST_CHECK_EQUAL("0", poly_to_dec_string(poly.data(), 2, "w"));
    BOOST_CHECK_EQUAL("0", poly_to_dec_string(nullptr, 0, "w"));
}

BOOST_AUTO_TEST_CASE(UniqueCacheReusesLiveObjects)
{
    UniqueCache<string> cache;
    bool created = false;
    int calls = 0;
    auto create = [&]() { calls++; return make_shared<const string>("value"); };

    auto first = cache.acquire("key", create, created);
    BOOST_CHECK(created);
    auto second = cache.acquire("key", create, created);
    BOOST_CHECK(!created);
    BOOST_CHECK(first == second);
    BOOST_CHECK_EQUAL(1, calls);

    auto other = cache.acquire("other", create, created);
    BOOST_CHECK(created);
    BOOST_CHECK(other != first);
    BOOST_CHECK_EQUAL(2U, cache.size());

    // Expired entries are created again
    first.reset();
    second.reset();
    BOOST_CHECK_EQUAL(1U, cache.size());
    auto third = cache.acquire("key", create, created);
    BOOST_CHECK(created);
    BOOST_CHECK_EQUAL(3, calls);
    BOOST_CHECK_EQUAL(2U, cache.size());
}

BOOST_AUTO_TEST_CASE(UniqueCacheForgetsReleasedObjects)
{
    UniqueCache<string> cache;
    bool created = false;
    auto create = [&]() { return make_shared<const string>("value"); };

    vector<shared_ptr<const string> > held;
    for (int i = 0; i < 100; i++)
    {
        held.push_back(cache.acquire("key" + std::to_string(i), create, created));
    }
    BOOST_CHECK_EQUAL(100U, cache.size());

    held.clear();
    BOOST_CHECK_EQUAL(0U, cache.size());
    auto kept = cache.acquire("last", create, created);
    BOOST_CHECK(created);
    BOOST_CHECK_EQUAL(1U, cache.size());
}

BOOST_AUTO_TEST_CASE(ReportLevels)
{
    int saved = max_log_level();
    set_max_log_level(PADIC_LOG_INFO);
    BOOST_CHECK_EQUAL(PADIC_LOG_INFO, max_log_level());

    int evaluated = 0;
    PADIC_REPORT(PADIC_LOG_FULL, "never written " << (++evaluated));
    BOOST_CHECK_EQUAL(0, evaluated);
    PADIC_REPORT(PADIC_LOG_INFO, "report levels " << (++evaluated));
    BOOST_CHECK_EQUAL(1, evaluated);

    BOOST_CHECK_EQUAL(string("common.cpp"), string(remove_leading_path("padictests/common.cpp", "padictests/common.cpp")));
    set_max_log_level(saved);
}

BOOST_AUTO_TEST_SUITE_END()
