#pragma once

#include "model/types.hpp"

#include <cstdint>
#include <string>

namespace ctbind::model
{

enum class Arity {
    Single,  ///< one event value, wrapped into a one-element batch before dispatch
    Batch,   ///< a sequence of event values
};

struct Operation {
    std::string name;
    std::uint64_t value = 0;  ///< operation code on the wire
    std::string event_name;   ///< name of the wrapper method parameter
    Arity arity = Arity::Single;
    Type event;
    Type result;
    SourceLocation location;
};

}  // namespace ctbind::model
