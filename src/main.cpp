#include <spdlog/spdlog.h>

#include "cli/ctbind.hpp"

int main(int argc, char* argv[])
{
    try {
        return ctbind::run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
