#include "util/logging.h"
#include <atomic>
#include <cstdlib>
#include <mutex>

using namespace std;

namespace padic
{
    namespace util
    {
        namespace
        {
            int initial_log_level()
            {
                const char *value = getenv("PADIC_LOG_LEVEL");
                if (value == nullptr)
                {
                    return PADIC_LOG_LIST;
                }
                return atoi(value);
            }

            atomic<int> &log_level()
            {
                static atomic<int> level(initial_log_level());
                return level;
            }

            mutex &report_mutex()
            {
                static mutex instance;
                return instance;
            }
        }

        int max_log_level()
        {
            return log_level().load();
        }

        void set_max_log_level(int level)
        {
            log_level().store(level);
        }

        void write_report(const char *file, const string &message)
        {
            lock_guard<mutex> lock(report_mutex());
            clog << "> " << file << ": " << message << endl;
        }
    }
}
