#pragma once

// kbtap-io - kbtap_io.hpp
// Umbrella header that includes the public API.
//
// Include this single header to pull in:
//   - <kbtap-io/core.hpp>               : version and export macros
//   - <kbtap-io/log.hpp>                : logging macros and configuration
//   - <kbtap-io/keyboard/layout.hpp>    : layouts and reverse maps
//   - <kbtap-io/keyboard/sender.hpp>    : Sender (keystroke synthesis) API
//   - <kbtap-io/keyboard/capture.hpp>   : Capture (grab and suppress) API

#include <kbtap-io/core.hpp>
#include <kbtap-io/keyboard/capture.hpp>
#include <kbtap-io/keyboard/layout.hpp>
#include <kbtap-io/keyboard/sender.hpp>
#include <kbtap-io/log.hpp>
