#pragma once

#include "semantic_pass.hpp"

namespace ctbind::frontend::semantic
{

class EnumValidationPass : public Pass
{
public:
    std::string name() const override
    {
        return "enum-validation";
    }

    void run(Context& context) override;
};

}  // namespace ctbind::frontend::semantic
