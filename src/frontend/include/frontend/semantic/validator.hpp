#pragma once

#include "frontend/diagnostic.hpp"
#include "frontend/program.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace ctbind::frontend::semantic
{

class Pass;

/**
 * @brief Runs the semantic passes over a parsed program.
 *
 * Every pass runs even after errors so that one run reports as many
 * problems as possible.
 */
class Validator
{
public:
    using PassFactory = std::function<std::unique_ptr<Pass>()>;

    Validator(const Program& program, DiagnosticSink& sink);
    ~Validator();

    template <typename Pass>
    void add_pass()
    {
        add_pass_factory([] {
            return std::make_unique<Pass>();
        });
    }

    void add_pass_factory(PassFactory factory);
    void clear_passes();
    void use_default_passes();
    void run();

private:
    void register_default_passes();
    std::vector<std::unique_ptr<Pass>> instantiate_passes() const;

    const Program& program_;
    DiagnosticSink& sink_;
    std::vector<PassFactory> pass_factories_;
};

}  // namespace ctbind::frontend::semantic
