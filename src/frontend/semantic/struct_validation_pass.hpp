#pragma once

#include "semantic_pass.hpp"

namespace ctbind::frontend::semantic
{

class StructValidationPass : public Pass
{
public:
    std::string name() const override
    {
        return "struct-validation";
    }

    void run(Context& context) override;
};

}  // namespace ctbind::frontend::semantic
