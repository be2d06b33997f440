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
// Immutable snapshot of the target parameters that a DebugBridge is constructed from.
#ifndef BRIDGE_CONFIG_H_
#define BRIDGE_CONFIG_H_

#include <stdint.h>
#include "config.h"
#include "config_tree.h"
#include "bridge_error.h"
#include "devices/devices.h"


// Tri-state used for settings which fall back to the chip's built-in default when not configured.
enum ConfigSetting
{
    SETTING_DEFAULT = 0,
    SETTING_ENABLED,
    SETTING_DISABLED
};

// Every numeric field uses 0 to mean "not configured, use the chip's built-in value".
struct BridgeConfig
{
    // Chip identity read from the configuration.
    char               chipName[MAX_CHIP_NAME_LENGTH + 1];
    // Memory map which replaces the chip's built-in one when memoryRegionCount is non-zero.
    DeviceMemoryRegion memoryRegions[MAX_MEMORY_REGIONS];
    uint32_t           memoryRegionCount;
    // Number of cores to place under debug control.
    uint32_t           coreCount;
    // Requested link clock frequency in Hz.
    uint32_t           clockFrequency;
    // Timeout for every blocking operation.
    uint32_t           timeout_ms;
    // Exact IDCODE that the target must report on attach.
    uint32_t           idCode;
    // Can memory be accessed while the cores run?
    ConfigSetting      liveMemoryAccess;
};


// Set every field of pConfig to its "not configured" value and copy in pChipName.
void bridgeConfigInit(BridgeConfig* pConfig, const char* pChipName);

// Fill in pConfig from the fields and memory/* children of chipNode. The chip name field itself must already have
// been validated by the caller.
//
// Returns true on success. Returns false and fills in pError with a BRIDGE_CONFIGURATION_ERROR if any of the
// optional target parameters is present but malformed.
bool bridgeConfigRead(BridgeConfig* pConfig, const ConfigTree* pTree, ConfigNode chipNode, BridgeError* pError);

#endif // BRIDGE_CONFIG_H_
