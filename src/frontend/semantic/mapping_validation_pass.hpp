#pragma once

#include "semantic_pass.hpp"

namespace ctbind::frontend::semantic
{

class MappingValidationPass : public Pass
{
public:
    std::string name() const override
    {
        return "mapping-validation";
    }

    void run(Context& context) override;
};

}  // namespace ctbind::frontend::semantic
