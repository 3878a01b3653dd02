#define DOCTEST_CONFIG_IMPLEMENT
#include<doctest/doctest.h>

#include<ATen/Parallel.h>
#include<spdlog/spdlog.h>

int main(int argc, char **argv)
{
    spdlog::set_level(spdlog::level::warn);
    spdlog::set_pattern("%^[%T %7l] %v%$");
    at::set_num_threads(1);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
