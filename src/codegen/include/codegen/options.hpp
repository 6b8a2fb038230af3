#pragma once

#include <string>

namespace ctbind::codegen
{

/**
 * @brief Knobs of one generation run.
 *
 * The defaults produce bindings for a runtime package that ships the support
 * module next to the generated file.
 */
struct GenerationOptions {
    std::string output = "-";                       ///< output file, "-" writes to stdout
    std::string generator_name = "ctbind";          ///< shown in the banner of the generated file
    std::string runtime_module = ".lib";            ///< module providing c_uint128, dataclass, validate_uint
    std::string library_handle = "rpclib";          ///< name of the loaded native library in runtime_module
    std::string function_prefix = "rpc_client";    ///< prefix of the exported lifecycle functions
    std::string mixin_name = "StateMachineMixin";   ///< base name of the method-set classes
};

}  // namespace ctbind::codegen
