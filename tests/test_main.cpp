// tests/test_main.cpp
//
// The only translation unit in spirits_tests that defines DOCTEST_CONFIG_IMPLEMENT.
// Every other test file includes doctest without implementation macros.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include <cstdlib>
#include <cstring>

namespace {

bool env_truthy(const char* v) {
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

bool running_in_ci() {
    return env_truthy(std::getenv("CI")) || env_truthy(std::getenv("GITHUB_ACTIONS"));
}

} // namespace

int main(int argc, char** argv) {
    doctest::Context context;

    // Defaults; command-line flags override them
    context.setOption("order-by", "name");
    context.setOption("duration", true);

    if (running_in_ci()) {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    context.applyCommandLine(argc, argv);

    const int res = context.run();
    if (context.shouldExit())
        return res;

    return res;
}
