#pragma once

#include <cstdint>
#include <string>
#include <dlinkwm/core/types.h>

namespace dlinkwm::runtime {

class IGuestMemory;

// Reads bytes starting at `offset` up to (not including) the first NUL. There is no length
// bound: a missing terminator reads until the end of guest memory and fails there.
Result<std::string> readGuestCString(IGuestMemory& memory, uint32_t offset);

// Copies `text` plus a terminating NUL into guest memory at `offset`.
Result<void> writeGuestCString(IGuestMemory& memory, uint32_t offset, const std::string& text);

} // namespace dlinkwm::runtime
