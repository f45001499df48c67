#pragma once

#include <iostream>
#include <sstream>
#include <string>

namespace padic
{
    namespace util
    {
        constexpr const char *remove_leading_path(const char *input, const char *last)
        {
            return (*input == '\0') ? last : remove_leading_path(input + 1, (*input == '/') ? input + 1 : last);
        }

        /**
        Returns the maximum level that PADIC_REPORT writes. Initialized from the environment variable
        PADIC_LOG_LEVEL on first use, 0 when it is not set.
        */
        int max_log_level();

        void set_max_log_level(int level);

        void write_report(const char *file, const std::string &message);
    }
}

// Reporting levels
#define PADIC_LOG_LIST 0       // information necessary to the user
#define PADIC_LOG_INFO 1       // information useful to the user
#define PADIC_LOG_DETAILED 2   // information that shows how rings are constructed
#define PADIC_LOG_DEBUG 3      // debug info, useful mostly to developers
#define PADIC_LOG_FULL 4       // pure noise

#define PADIC_REPORT(level, stream) {                                               \
    if ((level) <= ::padic::util::max_log_level())                                  \
    {                                                                               \
        std::ostringstream padic_report_stream;                                     \
        padic_report_stream << stream;                                              \
        ::padic::util::write_report(                                                \
            ::padic::util::remove_leading_path(__FILE__, __FILE__),                 \
            padic_report_stream.str());                                             \
    }                                                                               \
}
