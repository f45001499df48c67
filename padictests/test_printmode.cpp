#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>
#include <map>
#include <stdexcept>
#include <string>
#include "printmode.h"

using namespace padic;
using namespace std;

BOOST_AUTO_TEST_SUITE(PrintModeTests)

BOOST_AUTO_TEST_CASE(DefaultPrintMode)
{
    PrintMode mode;
    BOOST_CHECK(mode.style() == PrintStyle::series);
    BOOST_CHECK(mode.pos());
    BOOST_CHECK_EQUAL(-1, mode.max_ram_terms());
    BOOST_CHECK_EQUAL(-1, mode.max_unram_terms());
    BOOST_CHECK_EQUAL(-1, mode.max_terse_terms());
    BOOST_CHECK_EQUAL("|", mode.sep());
    BOOST_CHECK(mode.show_prec());
    BOOST_CHECK(mode.ram_name().empty());
    BOOST_CHECK_EQUAL(62U, mode.alphabet().size());

    auto options = mode.to_map();
    BOOST_CHECK_EQUAL("series", options["mode"]);
    BOOST_CHECK_EQUAL("true", options["pos"]);
    BOOST_CHECK_EQUAL("-1", options["max_terse_terms"]);
}

BOOST_AUTO_TEST_CASE(ParsePrintStyle)
{
    BOOST_CHECK(parse_print_style("series") == PrintStyle::series);
    BOOST_CHECK(parse_print_style("val-unit") == PrintStyle::val_unit);
    BOOST_CHECK(parse_print_style("terse") == PrintStyle::terse);
    BOOST_CHECK(parse_print_style("digits") == PrintStyle::digits);
    BOOST_CHECK(parse_print_style("bars") == PrintStyle::bars);
    BOOST_CHECK_THROW(parse_print_style("latex"), invalid_argument);
    BOOST_CHECK_EQUAL("val-unit", print_style_name(PrintStyle::val_unit));
}

BOOST_AUTO_TEST_CASE(OverridesFromMap)
{
    map<string, string> options;
    options["mode"] = "terse";
    options["max_terse_terms"] = "3";
    options["pos"] = "False";
    PrintModeOverrides overrides = PrintModeOverrides::from_map(options);
    BOOST_CHECK(!overrides.empty());
    BOOST_CHECK(!overrides.sep);

    PrintMode mode(overrides);
    BOOST_CHECK(mode.style() == PrintStyle::terse);
    BOOST_CHECK_EQUAL(3, mode.max_terse_terms());
    BOOST_CHECK(!mode.pos());

    BOOST_CHECK(PrintModeOverrides::from_map(map<string, string>()).empty());

    options.clear();
    options["color"] = "red";
    BOOST_CHECK_THROW(PrintModeOverrides::from_map(options), invalid_argument);
    options.clear();
    options["max_ram_terms"] = "many";
    BOOST_CHECK_THROW(PrintModeOverrides::from_map(options), invalid_argument);
    options.clear();
    options["show_prec"] = "maybe";
    BOOST_CHECK_THROW(PrintModeOverrides::from_map(options), invalid_argument);
    options.clear();
    options["mode"] = "latex";
    BOOST_CHECK_THROW(PrintModeOverrides::from_map(options), invalid_argument);
}

BOOST_AUTO_TEST_CASE(WithOverridesChecksValues)
{
    PrintMode mode;
    PrintModeOverrides overrides;
    overrides.max_ram_terms = -2;
    BOOST_CHECK_THROW(mode.with_overrides(overrides), invalid_argument);

    overrides = PrintModeOverrides();
    overrides.alphabet = string();
    BOOST_CHECK_THROW(mode.with_overrides(overrides), invalid_argument);

    overrides = PrintModeOverrides();
    overrides.max_ram_terms = 0;
    BOOST_CHECK_EQUAL(0, mode.with_overrides(overrides).max_ram_terms());

    PrintMode named = mode.with_names("w", "", "w");
    BOOST_CHECK_EQUAL("w", named.var_name());
    BOOST_CHECK_EQUAL("", named.unram_name());
    BOOST_CHECK_EQUAL("w", named.ram_name());
}

BOOST_AUTO_TEST_CASE(EqualsModeComparesUsedFields)
{
    PrintMode series;
    PrintModeOverrides overrides;
    overrides.sep = "/";
    PrintMode series_sep = series.with_overrides(overrides);
    BOOST_CHECK(series.equals_mode(series_sep));
    BOOST_CHECK_EQUAL(series.mode_key(), series_sep.mode_key());

    overrides = PrintModeOverrides();
    overrides.style = PrintStyle::bars;
    PrintMode bars = series.with_overrides(overrides);
    PrintMode bars_sep = series_sep.with_overrides(overrides);
    BOOST_CHECK(!bars.equals_mode(bars_sep));
    BOOST_CHECK(bars.mode_key() != bars_sep.mode_key());
    BOOST_CHECK(!bars.equals_mode(series));

    overrides = PrintModeOverrides();
    overrides.style = PrintStyle::terse;
    PrintMode terse = series.with_overrides(overrides);
    overrides.max_ram_terms = 4;
    PrintMode terse_ram = series.with_overrides(overrides);
    BOOST_CHECK(terse.equals_mode(terse_ram));
    overrides.max_terse_terms = 4;
    PrintMode terse_limited = series.with_overrides(overrides);
    BOOST_CHECK(!terse.equals_mode(terse_limited));

    BOOST_CHECK(!series.equals_mode(series.with_names("a", "a", "5")));
    BOOST_CHECK(series.with_names("a", "a", "5").equals_mode(series.with_names("a", "a", "5")));

    overrides = PrintModeOverrides();
    overrides.show_prec = false;
    BOOST_CHECK(!series.equals_mode(series.with_overrides(overrides)));
}

BOOST_AUTO_TEST_SUITE_END()
