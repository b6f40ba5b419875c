// Only translation unit that defines DOCTEST_CONFIG_IMPLEMENT.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include <spdlog/spdlog.h>

int main(int argc, char **argv) {
    doctest::Context context;
    context.setOption("order-by", "name");
    context.setOption("duration", true);
    context.applyCommandLine(argc, argv);

    // Storage and scheduler log on every transition; keep test output readable.
    spdlog::set_level(spdlog::level::warn);

    const int res = context.run();
    if (context.shouldExit()) {
        return res;
    }
    return res;
}
