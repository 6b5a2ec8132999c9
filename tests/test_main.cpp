#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <cstring>

int main(int argc, char** argv) {
#ifdef WC_LOG_DEBUG
    WC::set_logging_enabled(false);
#endif

    doctest::Context context;
    context.applyCommandLine(argc, argv);

#ifdef WC_LOG_DEBUG
    // WIDGETCORE_LOG enables logging unless it is "0".
    bool enableLog = false;
    if (const char* env_log = std::getenv("WIDGETCORE_LOG")) {
        if (std::strcmp(env_log, "0") != 0)
            enableLog = true;
    }
#endif

    if (context.shouldExit()) {
        return context.run();
    }

#ifdef WC_LOG_DEBUG
    if (enableLog) {
        WC::set_logging_enabled(true);
        if (const char* env_tags = std::getenv("WIDGETCORE_LOG_TAGS"))
            WC::set_logging_tags(env_tags);
        wc_log("Starting test execution", "TEST", "INFO");
    }
#endif

    int res = context.run();

#ifdef WC_LOG_DEBUG
    if (enableLog) {
        if (res == 0) {
            wc_log("All tests passed successfully", "TEST", "SUCCESS");
        } else {
            wc_log("Some tests failed", "TEST", "FAILURE");
        }
        WC::logger().flush();
    }
#endif

    return res;
}
