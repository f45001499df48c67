#include "printmode.h"
#include <sstream>
#include <stdexcept>
#include <boost/lexical_cast.hpp>

using namespace std;

namespace padic
{
    namespace
    {
        const char *default_alphabet = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

        bool parse_bool(const string &key, const string &value)
        {
            if (value == "true" || value == "True" || value == "1")
            {
                return true;
            }
            if (value == "false" || value == "False" || value == "0")
            {
                return false;
            }
            throw invalid_argument("print option " + key + " expects a boolean, got " + value);
        }

        int parse_term_limit(const string &key, const string &value)
        {
            try
            {
                return boost::lexical_cast<int>(value);
            }
            catch (const boost::bad_lexical_cast &)
            {
                throw invalid_argument("print option " + key + " expects an integer, got " + value);
            }
        }

        void check_term_limit(const char *name, int value)
        {
            if (value < -1)
            {
                throw invalid_argument(string(name) + " must be -1 (unlimited) or non-negative");
            }
        }
    }

    PrintStyle parse_print_style(const string &name)
    {
        if (name == "series")
        {
            return PrintStyle::series;
        }
        if (name == "val-unit")
        {
            return PrintStyle::val_unit;
        }
        if (name == "terse")
        {
            return PrintStyle::terse;
        }
        if (name == "digits")
        {
            return PrintStyle::digits;
        }
        if (name == "bars")
        {
            return PrintStyle::bars;
        }
        throw invalid_argument("unknown print mode " + name);
    }

    string print_style_name(PrintStyle style)
    {
        switch (style)
        {
        case PrintStyle::series:
            return "series";
        case PrintStyle::val_unit:
            return "val-unit";
        case PrintStyle::terse:
            return "terse";
        case PrintStyle::digits:
            return "digits";
        case PrintStyle::bars:
            return "bars";
        }
        throw invalid_argument("style");
    }

    bool PrintModeOverrides::empty() const
    {
        return !style && !pos && !ram_name && !unram_name && !var_name && !max_ram_terms && !max_unram_terms
            && !max_terse_terms && !sep && !alphabet && !show_prec;
    }

    PrintModeOverrides PrintModeOverrides::from_map(const map<string, string> &options)
    {
        PrintModeOverrides overrides;
        for (const auto &option : options)
        {
            const string &key = option.first;
            const string &value = option.second;
            if (key == "mode")
            {
                overrides.style = parse_print_style(value);
            }
            else if (key == "pos")
            {
                overrides.pos = parse_bool(key, value);
            }
            else if (key == "ram_name")
            {
                overrides.ram_name = value;
            }
            else if (key == "unram_name")
            {
                overrides.unram_name = value;
            }
            else if (key == "var_name")
            {
                overrides.var_name = value;
            }
            else if (key == "max_ram_terms")
            {
                overrides.max_ram_terms = parse_term_limit(key, value);
            }
            else if (key == "max_unram_terms")
            {
                overrides.max_unram_terms = parse_term_limit(key, value);
            }
            else if (key == "max_terse_terms")
            {
                overrides.max_terse_terms = parse_term_limit(key, value);
            }
            else if (key == "sep")
            {
                overrides.sep = value;
            }
            else if (key == "alphabet")
            {
                overrides.alphabet = value;
            }
            else if (key == "show_prec")
            {
                overrides.show_prec = parse_bool(key, value);
            }
            else
            {
                throw invalid_argument("unknown print option " + key);
            }
        }
        return overrides;
    }

    PrintMode::PrintMode() :
        style_(PrintStyle::series), pos_(true), max_ram_terms_(-1), max_unram_terms_(-1), max_terse_terms_(-1),
        sep_("|"), alphabet_(default_alphabet), show_prec_(true)
    {
    }

    PrintMode::PrintMode(const PrintModeOverrides &overrides) : PrintMode()
    {
        *this = with_overrides(overrides);
    }

    PrintMode PrintMode::with_overrides(const PrintModeOverrides &overrides) const
    {
        PrintMode result(*this);
        if (overrides.style)
        {
            result.style_ = *overrides.style;
        }
        if (overrides.pos)
        {
            result.pos_ = *overrides.pos;
        }
        if (overrides.ram_name)
        {
            result.ram_name_ = *overrides.ram_name;
        }
        if (overrides.unram_name)
        {
            result.unram_name_ = *overrides.unram_name;
        }
        if (overrides.var_name)
        {
            result.var_name_ = *overrides.var_name;
        }
        if (overrides.max_ram_terms)
        {
            check_term_limit("max_ram_terms", *overrides.max_ram_terms);
            result.max_ram_terms_ = *overrides.max_ram_terms;
        }
        if (overrides.max_unram_terms)
        {
            check_term_limit("max_unram_terms", *overrides.max_unram_terms);
            result.max_unram_terms_ = *overrides.max_unram_terms;
        }
        if (overrides.max_terse_terms)
        {
            check_term_limit("max_terse_terms", *overrides.max_terse_terms);
            result.max_terse_terms_ = *overrides.max_terse_terms;
        }
        if (overrides.sep)
        {
            result.sep_ = *overrides.sep;
        }
        if (overrides.alphabet)
        {
            if (overrides.alphabet->empty())
            {
                throw invalid_argument("alphabet cannot be empty");
            }
            result.alphabet_ = *overrides.alphabet;
        }
        if (overrides.show_prec)
        {
            result.show_prec_ = *overrides.show_prec;
        }
        return result;
    }

    PrintMode PrintMode::with_names(const string &var_name, const string &unram_name, const string &ram_name) const
    {
        PrintMode result(*this);
        result.var_name_ = var_name;
        result.unram_name_ = unram_name;
        result.ram_name_ = ram_name;
        return result;
    }

    map<string, string> PrintMode::to_map() const
    {
        map<string, string> result;
        result["mode"] = print_style_name(style_);
        result["pos"] = pos_ ? "true" : "false";
        result["ram_name"] = ram_name_;
        result["unram_name"] = unram_name_;
        result["var_name"] = var_name_;
        result["max_ram_terms"] = to_string(max_ram_terms_);
        result["max_unram_terms"] = to_string(max_unram_terms_);
        result["max_terse_terms"] = to_string(max_terse_terms_);
        result["sep"] = sep_;
        result["alphabet"] = alphabet_;
        result["show_prec"] = show_prec_ ? "true" : "false";
        return result;
    }

    bool PrintMode::uses_max_ram_terms() const
    {
        return style_ == PrintStyle::series || style_ == PrintStyle::digits || style_ == PrintStyle::bars;
    }

    bool PrintMode::uses_max_unram_terms() const
    {
        return style_ == PrintStyle::series || style_ == PrintStyle::bars;
    }

    bool PrintMode::uses_max_terse_terms() const
    {
        return style_ == PrintStyle::terse || style_ == PrintStyle::val_unit;
    }

    bool PrintMode::uses_sep() const
    {
        return style_ == PrintStyle::bars;
    }

    bool PrintMode::uses_alphabet() const
    {
        return style_ == PrintStyle::digits || style_ == PrintStyle::bars;
    }

    bool PrintMode::equals_mode(const PrintMode &other) const
    {
        if (style_ != other.style_ || pos_ != other.pos_ || show_prec_ != other.show_prec_)
        {
            return false;
        }
        if (ram_name_ != other.ram_name_ || unram_name_ != other.unram_name_ || var_name_ != other.var_name_)
        {
            return false;
        }
        if (uses_max_ram_terms() && max_ram_terms_ != other.max_ram_terms_)
        {
            return false;
        }
        if (uses_max_unram_terms() && max_unram_terms_ != other.max_unram_terms_)
        {
            return false;
        }
        if (uses_max_terse_terms() && max_terse_terms_ != other.max_terse_terms_)
        {
            return false;
        }
        if (uses_sep() && sep_ != other.sep_)
        {
            return false;
        }
        if (uses_alphabet() && alphabet_ != other.alphabet_)
        {
            return false;
        }
        return true;
    }

    string PrintMode::mode_key() const
    {
        // Names are length-prefixed so that no choice of names can make two keys collide
        ostringstream key;
        key << print_style_name(style_) << ';' << pos_ << ';' << show_prec_ << ';'
            << ram_name_.size() << ':' << ram_name_ << ';'
            << unram_name_.size() << ':' << unram_name_ << ';'
            << var_name_.size() << ':' << var_name_;
        if (uses_max_ram_terms())
        {
            key << ";r" << max_ram_terms_;
        }
        if (uses_max_unram_terms())
        {
            key << ";u" << max_unram_terms_;
        }
        if (uses_max_terse_terms())
        {
            key << ";t" << max_terse_terms_;
        }
        if (uses_sep())
        {
            key << ";s" << sep_.size() << ':' << sep_;
        }
        if (uses_alphabet())
        {
            key << ";a" << alphabet_.size() << ':' << alphabet_;
        }
        return key.str();
    }
}
