#pragma once

#include "forge/config.h"

namespace forge {

// forge plugins <list|install|update|remove> ...
int cmd_plugins(int argc, char** argv, const ForgeConfig& cfg);

} // namespace forge
