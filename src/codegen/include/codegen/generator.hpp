#pragma once

#include "codegen/options.hpp"
#include "frontend/program.hpp"

#include <expected>
#include <iostream>
#include <string>

namespace ctbind::codegen
{

/**
 * @brief Drives one generation run over a validated program.
 *
 * The whole module is rendered into memory first; nothing is written unless
 * every mapped type and every operation lowered successfully.
 */
class Generator
{
public:
    Generator(const frontend::Program& program, GenerationOptions options);

    /// Render the bindings module.
    std::expected<std::string, std::string> render() const;

    /// Render and write to GenerationOptions::output.
    std::expected<void, std::string> run(std::ostream& stdout_stream = std::cout) const;

private:
    const frontend::Program& _program;
    GenerationOptions _options;
};

}  // namespace ctbind::codegen
