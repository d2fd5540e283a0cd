#pragma once
#include <string>
#include "guard_core/commands.hpp"

namespace guard {

// Message payload: {"commands":[{"type":"brake",...}, ...]}, field names as on
// the bus ("vehicleId", "reasonCode", "governingEntityId", ...).
std::string encode(const CommandBatch& batch);

// Throws std::runtime_error on malformed JSON or unknown command fields.
CommandBatch decode(const std::string& payload);

} // namespace guard
