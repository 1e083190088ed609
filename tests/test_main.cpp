// Only translation unit of parkgen_tests that defines DOCTEST_CONFIG_IMPLEMENT.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include <cstdlib>
#include <cstring>

namespace {

bool env_truthy(const char* v) {
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

}  // namespace

int main(int argc, char** argv) {
    doctest::Context context;
    context.setOption("order-by", "name");
    context.setOption("duration", true);
    if (env_truthy(std::getenv("CI"))) {
        context.setOption("no-colors", true);
    }
    context.applyCommandLine(argc, argv);

    return context.run();
}
