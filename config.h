/* Copyright 2023 Adam Green (https://github.com/adamgreen/)

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/
// Configuration settings for the dbg-bridge library.
#ifndef CONFIG_H_
#define CONFIG_H_

// Number of elements in a statically sized array.
#ifndef count_of
#define count_of(a) (sizeof(a)/sizeof((a)[0]))
#endif


// Maximum length of a chip identity string (not counting the \0 terminator). Any name that fits in a configuration
// value must fit here too so that unrecognized names can still fall back to the generic bridge.
#define MAX_CHIP_NAME_LENGTH MAX_CONFIG_VALUE_LENGTH

// Maximum number of chip variants that can be held in a ChipRegistry, not counting the generic fallback.
#define MAX_CHIP_VARIANTS 16

// Maximum number of memory regions that can be supplied for a target through configuration.
#define MAX_MEMORY_REGIONS 8

// Maximum number of cores (and therefore debug units) on a single target. This is currently 9 for the GAP8 and
// Wolfe devices (fabric controller + 8 cluster cores).
#define MAX_CORES 9

// Configuration path pattern used to locate the chip declaration. The chip node sits directly below a pulp_chip
// node and carries the chip identity in its CHIP_NAME_FIELD field.
#define CHIP_NODE_PATTERN "**/pulp_chip/*"
#define CHIP_NAME_FIELD   "name"

// Identity used for the generic fallback bridge.
#define GENERIC_CHIP_NAME "generic"

// Default timeout in milliseconds for every blocking operation (transport round trip, waiting for a core to halt or
// finish a single step). Can be changed through the timeout_ms configuration field or DebugBridge::setTimeout().
#define DEFAULT_OPERATION_TIMEOUT_MS 1000

// Length of the pulse applied to the target's reset line during attach/reset.
#define RESET_PULSE_MS 10

// Largest payload sent in a single TargetLink READ or WRITE frame. Larger transfers are split into chunks of this
// size.
#define LINK_MAX_TRANSFER_SIZE 1024

// Load progress is reported in verbose mode every time this many bytes have been streamed to the target.
#define LOAD_PROGRESS_INTERVAL (16 * 1024)

// Capacity of the MemoryConfigTree implementation.
#define MAX_CONFIG_NODES        128
#define MAX_CONFIG_FIELDS       256
#define MAX_CONFIG_DEPTH        16
#define MAX_CONFIG_NAME_LENGTH  63
#define MAX_CONFIG_VALUE_LENGTH 127

// Size of the formatted message stored in a BridgeError.
#define MAX_ERROR_MESSAGE_LENGTH 159


// Set each of these to 1 or 0 to enable or disable error/debug logging for each of the modules.
// debug_bridge.cpp logging
#define LOGGING_BRIDGE_ERROR_ENABLED 1
#define LOGGING_BRIDGE_DEBUG_ENABLED 0

// bridge_selector.cpp & bridge_config.cpp logging
#define LOGGING_SELECTOR_ERROR_ENABLED 1
#define LOGGING_SELECTOR_DEBUG_ENABLED 0

// target_link.cpp logging
#define LOGGING_LINK_ERROR_ENABLED 1
#define LOGGING_LINK_DEBUG_ENABLED 0

// config_tree.cpp logging
#define LOGGING_CONFIG_ERROR_ENABLED 1
#define LOGGING_CONFIG_DEBUG_ENABLED 0

// Modules under the devices/ directory
#define LOGGING_DEVICE_ERROR_ENABLED 1
#define LOGGING_DEVICE_DEBUG_ENABLED 0

#endif // CONFIG_H_
