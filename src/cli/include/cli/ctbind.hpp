#pragma once

#include "options.hpp"

#include <iostream>

namespace ctbind {

/**
 * @brief The entry point of ctbind.
 *
 * This function is the entry point of ctbind and is separated
 * from main() for testability.
 *
 * @param argc The number of command line arguments.
 * @param argv The command line arguments.
 * @param out Stream receiving generated bindings, help and JSON output.
 * @return int The exit code.
 */
int run(int argc, char* argv[], std::ostream& out = std::cout);

}  // namespace ctbind
