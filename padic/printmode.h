#pragma once

#include <map>
#include <string>
#include <boost/optional.hpp>

namespace padic
{
    /**
    The textual conventions a p-adic ring uses for its elements.
    */
    enum class PrintStyle
    {
        series,
        val_unit,
        terse,
        digits,
        bars
    };

    /**
    Returns the style named by "series", "val-unit", "terse", "digits" or "bars".

    @throws std::invalid_argument if name is not one of those
    */
    PrintStyle parse_print_style(const std::string &name);

    std::string print_style_name(PrintStyle style);

    /**
    A partial set of print options. Unset fields leave the corresponding option of the PrintMode they are
    applied to unchanged.
    */
    struct PrintModeOverrides
    {
        boost::optional<PrintStyle> style;

        boost::optional<bool> pos;

        boost::optional<std::string> ram_name;

        boost::optional<std::string> unram_name;

        boost::optional<std::string> var_name;

        boost::optional<int> max_ram_terms;

        boost::optional<int> max_unram_terms;

        boost::optional<int> max_terse_terms;

        boost::optional<std::string> sep;

        boost::optional<std::string> alphabet;

        boost::optional<bool> show_prec;

        /**
        Returns true if no option is set.
        */
        bool empty() const;

        /**
        Parses overrides from a dictionary using the keys of PrintMode::to_map() ("mode", "pos", ...).

        @throws std::invalid_argument if a key is unknown or a value cannot be parsed
        */
        static PrintModeOverrides from_map(const std::map<std::string, std::string> &options);
    };

    /**
    Immutable print configuration of a p-adic ring. Omitted options take their defaults when the PrintMode
    is constructed, so every PrintMode is complete.

    The print mode is part of a ring's identity: rings that differ only in their print modes are different
    rings. Two print modes are compared with equals_mode(), which only looks at the options the style uses.

    @par Thread Safety
    PrintMode is immutable and can be shared freely between threads.
    */
    class PrintMode
    {
    public:
        /**
        Creates a print mode with the series style and default options.
        */
        PrintMode();

        /**
        Creates a print mode from the default options with the given overrides applied.

        @param[in] overrides The options that differ from the defaults
        @throws std::invalid_argument if a term limit is below -1 or the alphabet is empty
        */
        explicit PrintMode(const PrintModeOverrides &overrides);

        /**
        Returns a copy of this print mode with the given overrides applied.
        */
        PrintMode with_overrides(const PrintModeOverrides &overrides) const;

        /**
        Returns a copy of this print mode with the variable, unramified and ramified names replaced.
        */
        PrintMode with_names(const std::string &var_name, const std::string &unram_name, const std::string &ram_name) const;

        inline PrintStyle style() const
        {
            return style_;
        }

        inline bool pos() const
        {
            return pos_;
        }

        inline const std::string &ram_name() const
        {
            return ram_name_;
        }

        inline const std::string &unram_name() const
        {
            return unram_name_;
        }

        inline const std::string &var_name() const
        {
            return var_name_;
        }

        inline int max_ram_terms() const
        {
            return max_ram_terms_;
        }

        inline int max_unram_terms() const
        {
            return max_unram_terms_;
        }

        inline int max_terse_terms() const
        {
            return max_terse_terms_;
        }

        inline const std::string &sep() const
        {
            return sep_;
        }

        inline const std::string &alphabet() const
        {
            return alphabet_;
        }

        inline bool show_prec() const
        {
            return show_prec_;
        }

        /**
        Exports every option as a dictionary, keyed "mode", "pos", "ram_name", "unram_name", "var_name",
        "max_ram_terms", "max_unram_terms", "max_terse_terms", "sep", "alphabet" and "show_prec".
        */
        std::map<std::string, std::string> to_map() const;

        /**
        Returns whether two print modes print elements the same way. Styles, positivity, names and
        show_prec always take part; term limits, separator and alphabet only when the style uses them.
        */
        bool equals_mode(const PrintMode &other) const;

        /**
        Returns a string made of exactly the options equals_mode() compares; equal modes give equal keys.
        */
        std::string mode_key() const;

    private:
        bool uses_max_ram_terms() const;

        bool uses_max_unram_terms() const;

        bool uses_max_terse_terms() const;

        bool uses_sep() const;

        bool uses_alphabet() const;

        PrintStyle style_;

        bool pos_;

        std::string ram_name_;

        std::string unram_name_;

        std::string var_name_;

        int max_ram_terms_;

        int max_unram_terms_;

        int max_terse_terms_;

        std::string sep_;

        std::string alphabet_;

        bool show_prec_;
    };
}
