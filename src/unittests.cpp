#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "spdlog/spdlog.h"

int main(int argc, char* argv[]) {
    // Diagnostics log at debug level, so failing conversions show up in the test output.
    spdlog::set_level(spdlog::level::debug);
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
