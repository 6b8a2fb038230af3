#pragma once

#include "semantic_pass.hpp"

namespace ctbind::frontend::semantic
{

class OperationValidationPass : public Pass
{
public:
    std::string name() const override
    {
        return "operation-validation";
    }

    void run(Context& context) override;
};

}  // namespace ctbind::frontend::semantic
