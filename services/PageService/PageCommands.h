#pragma once

#include "plugins/CommandRegistry.h"

namespace ByteBlock {

// Adds the "page" command type: encode, decode, inspect, capacity
void registerPageCommands(CommandTable& commandTable);

} // namespace ByteBlock
