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
#define SELECTOR_MODULE "bridge_selector.cpp"
#include "logging.h"
#include <string.h>
#include "bridge_selector.h"
#include "bridge_config.h"


static const char g_operation[] = "create_bridge";


// Forward function declarations.
static bool findChipNode(const ConfigTree* pConfig, ConfigNode* pChipNode, BridgeError* pError);
static bool readChipName(const ConfigTree* pConfig, ConfigNode chipNode, char* pName, size_t nameSize,
                         BridgeError* pError);


std::unique_ptr<DebugBridge> createBridge(const ConfigTree* pConfig, Transport* pTransport,
                                          const BinarySet* pBinaries, bool verbose, BridgeError* pError)
{
    return createBridge(getChipRegistry(), pConfig, pTransport, pBinaries, verbose, pError);
}

std::unique_ptr<DebugBridge> createBridge(const ChipRegistry* pRegistry, const ConfigTree* pConfig,
                                          Transport* pTransport, const BinarySet* pBinaries, bool verbose,
                                          BridgeError* pError)
{
    BridgeError  error;
    BridgeConfig config;
    ConfigNode   chipNode = NULL;
    char         chipName[MAX_CONFIG_VALUE_LENGTH + 1];

    if (pError == NULL)
    {
        pError = &error;
    }
    bridgeErrorClear(pError);

    if (pConfig == NULL || pTransport == NULL)
    {
        bridgeErrorSet(pError, BRIDGE_CONFIGURATION_ERROR, NULL, g_operation, "a configuration and transport are required");
        logError("A configuration and transport are required.");
        return NULL;
    }
    if (!findChipNode(pConfig, &chipNode, pError) ||
        !readChipName(pConfig, chipNode, chipName, sizeof(chipName), pError))
    {
        return NULL;
    }

    bridgeConfigInit(&config, chipName);
    if (!bridgeConfigRead(&config, pConfig, chipNode, pError))
    {
        return NULL;
    }

    ChipBridgeFactory factory = pRegistry->resolve(chipName);
    logVerboseF(verbose, "%s: Creating %s bridge.", chipName,
                pRegistry->isRegistered(chipName) ? chipName : GENERIC_CHIP_NAME);
    std::unique_ptr<DebugBridge> pBridge = factory(&config, pTransport, pBinaries, verbose);
    if (!pBridge->isConfigValid())
    {
        *pError = *pBridge->getLastError();
        return NULL;
    }
    return pBridge;
}

static bool findChipNode(const ConfigTree* pConfig, ConfigNode* pChipNode, BridgeError* pError)
{
    ConfigNode nodes[2];
    size_t nodeCount = pConfig->findNodes(NULL, CHIP_NODE_PATTERN, nodes, count_of(nodes));

    if (nodeCount == 0)
    {
        bridgeErrorSet(pError, BRIDGE_CONFIGURATION_ERROR, NULL, g_operation,
                       "no chip declaration matches %s", CHIP_NODE_PATTERN);
        logError("No chip declaration found in configuration.");
        return false;
    }
    if (nodeCount > 1)
    {
        bridgeErrorSet(pError, BRIDGE_CONFIGURATION_ERROR, NULL, g_operation,
                       "%zu chip declarations match %s but only one is allowed", nodeCount, CHIP_NODE_PATTERN);
        logErrorF("Found %zu chip declarations in configuration.", nodeCount);
        return false;
    }
    *pChipNode = nodes[0];
    return true;
}

static bool readChipName(const ConfigTree* pConfig, ConfigNode chipNode, char* pName, size_t nameSize,
                         BridgeError* pError)
{
    if (!pConfig->readField(chipNode, CHIP_NAME_FIELD, pName, nameSize))
    {
        bridgeErrorSet(pError, BRIDGE_CONFIGURATION_ERROR, NULL, g_operation,
                       "chip declaration has no usable %s field", CHIP_NAME_FIELD);
        logError("Chip declaration has no usable name field.");
        return false;
    }
    if (pName[0] == '\0')
    {
        bridgeErrorSet(pError, BRIDGE_CONFIGURATION_ERROR, NULL, g_operation, "chip name is empty");
        logError("Chip name is empty.");
        return false;
    }
    logDebugF("Chip identity is \"%s\".", pName);
    return true;
}
