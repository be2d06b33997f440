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
// Single entry point used by callers to turn a target configuration into a ready to attach DebugBridge.
#ifndef BRIDGE_SELECTOR_H_
#define BRIDGE_SELECTOR_H_

#include <memory>
#include "binary_set.h"
#include "bridge_error.h"
#include "config_tree.h"
#include "debug_bridge.h"
#include "transport.h"
#include "devices/devices.h"


// Locate the single chip declaration (CHIP_NODE_PATTERN) in pConfig, read its chip identity and target parameters,
// and construct the bridge registered for that identity. Identities which aren't registered get the generic bridge.
// Nothing is sent to the target. Call attach() on the returned bridge to connect.
//
// pConfig - Configuration describing the target system.
// pTransport - Link to the target. It is only opened once the bridge is attached and is never deleted by the bridge
//              so it must outlive it.
// pBinaries - Images loaded by DebugBridge::load() when called without arguments. Can be NULL. Must outlive the bridge.
// verbose - Emit human readable progress for each protocol step.
// pError - Filled in with the cause of a failure. Can be NULL.
//
// Returns the unattached bridge, owned by the caller. Returns NULL with a BRIDGE_CONFIGURATION_ERROR if the
// chip declaration is missing, ambiguous, has no name, or has malformed target parameters.
std::unique_ptr<DebugBridge> createBridge(const ConfigTree* pConfig, Transport* pTransport,
                                          const BinarySet* pBinaries = NULL, bool verbose = false,
                                          BridgeError* pError = NULL);

// Same as above but resolves the chip identity through pRegistry rather than getChipRegistry().
std::unique_ptr<DebugBridge> createBridge(const ChipRegistry* pRegistry, const ConfigTree* pConfig,
                                          Transport* pTransport, const BinarySet* pBinaries, bool verbose,
                                          BridgeError* pError);

#endif // BRIDGE_SELECTOR_H_
