/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file wdevcli.hpp
 * @brief wireless-dev CLI.
 **/

#ifndef _WDEV_WDEVCLI_HPP_
#define _WDEV_WDEVCLI_HPP_

#include "wdev/wdev.h"
#include "wdev/expected.hpp"
#include "wdev/bridge_client.hpp"
#include "wdev/preferences.hpp"
#include "common/logger_macros.hpp"
#include "common/utils.hpp"
#include "CLI/CLI.hpp"
#include <string>

using namespace wdev;

class Prompt;

// State shared by every command of one invocation
struct CliContext {
    BridgeClient &bridge;
    Preferences &preferences;
    Prompt &prompt;
};

#endif /* _WDEV_WDEVCLI_HPP_ */
