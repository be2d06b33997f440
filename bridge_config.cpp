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
#define SELECTOR_MODULE "bridge_config.cpp"
#include "logging.h"
#include <stdio.h>
#include <string.h>
#include "bridge_config.h"


static const char g_operation[] = "create_bridge";


// Forward function declarations.
static bool readU32Setting(const ConfigTree* pTree, ConfigNode node, const char* pFieldName, uint32_t* pValue,
                           const char* pChipName, BridgeError* pError);
static bool readMemoryRegions(BridgeConfig* pConfig, const ConfigTree* pTree, ConfigNode chipNode, BridgeError* pError);
static bool readMemoryRegion(DeviceMemoryRegion* pRegion, const ConfigTree* pTree, ConfigNode regionNode,
                             const char* pChipName, BridgeError* pError);
static bool parseMemoryType(const char* pText, DeviceMemoryType* pType);


void bridgeConfigInit(BridgeConfig* pConfig, const char* pChipName)
{
    memset(pConfig, 0, sizeof(*pConfig));
    snprintf(pConfig->chipName, sizeof(pConfig->chipName), "%s", pChipName);
    pConfig->liveMemoryAccess = SETTING_DEFAULT;
}

bool bridgeConfigRead(BridgeConfig* pConfig, const ConfigTree* pTree, ConfigNode chipNode, BridgeError* pError)
{
    const char* pChip = pConfig->chipName;

    if (!readU32Setting(pTree, chipNode, "cores", &pConfig->coreCount, pChip, pError) ||
        !readU32Setting(pTree, chipNode, "clock_frequency", &pConfig->clockFrequency, pChip, pError) ||
        !readU32Setting(pTree, chipNode, "timeout_ms", &pConfig->timeout_ms, pChip, pError) ||
        !readU32Setting(pTree, chipNode, "idcode", &pConfig->idCode, pChip, pError))
    {
        return false;
    }

    bool liveMemoryAccess = false;
    switch (pTree->readBoolField(chipNode, "live_memory_access", &liveMemoryAccess))
    {
        case ConfigTree::FIELD_FOUND:
            pConfig->liveMemoryAccess = liveMemoryAccess ? SETTING_ENABLED : SETTING_DISABLED;
            break;
        case ConfigTree::FIELD_MISSING:
            pConfig->liveMemoryAccess = SETTING_DEFAULT;
            break;
        case ConfigTree::FIELD_INVALID:
            bridgeErrorSet(pError, BRIDGE_CONFIGURATION_ERROR, pChip, g_operation,
                           "live_memory_access must be true or false");
            logErrorF("%s: live_memory_access must be true or false.", pChip);
            return false;
    }

    return readMemoryRegions(pConfig, pTree, chipNode, pError);
}

static bool readU32Setting(const ConfigTree* pTree, ConfigNode node, const char* pFieldName, uint32_t* pValue,
                           const char* pChipName, BridgeError* pError)
{
    if (pTree->readU32Field(node, pFieldName, pValue) == ConfigTree::FIELD_INVALID)
    {
        bridgeErrorSet(pError, BRIDGE_CONFIGURATION_ERROR, pChipName, g_operation,
                       "%s is not a valid 32-bit number", pFieldName);
        logErrorF("%s: %s is not a valid 32-bit number.", pChipName, pFieldName);
        return false;
    }
    return true;
}

static bool readMemoryRegions(BridgeConfig* pConfig, const ConfigTree* pTree, ConfigNode chipNode, BridgeError* pError)
{
    ConfigNode regionNodes[MAX_MEMORY_REGIONS];
    size_t regionCount = pTree->findNodes(chipNode, "memory/*", regionNodes, MAX_MEMORY_REGIONS);
    if (regionCount > MAX_MEMORY_REGIONS)
    {
        bridgeErrorSet(pError, BRIDGE_CONFIGURATION_ERROR, pConfig->chipName, g_operation,
                       "%zu memory regions configured but at most %d are supported", regionCount, MAX_MEMORY_REGIONS);
        logErrorF("%s: Too many memory regions (%zu).", pConfig->chipName, regionCount);
        return false;
    }

    for (size_t i = 0 ; i < regionCount ; i++)
    {
        if (!readMemoryRegion(&pConfig->memoryRegions[i], pTree, regionNodes[i], pConfig->chipName, pError))
        {
            return false;
        }
    }
    pConfig->memoryRegionCount = regionCount;
    return true;
}

static bool readMemoryRegion(DeviceMemoryRegion* pRegion, const ConfigTree* pTree, ConfigNode regionNode,
                             const char* pChipName, BridgeError* pError)
{
    memset(pRegion, 0, sizeof(*pRegion));

    if (pTree->readU32Field(regionNode, "base", &pRegion->address) != ConfigTree::FIELD_FOUND ||
        pTree->readU32Field(regionNode, "size", &pRegion->length) != ConfigTree::FIELD_FOUND ||
        pRegion->length == 0)
    {
        bridgeErrorSet(pError, BRIDGE_CONFIGURATION_ERROR, pChipName, g_operation,
                       "memory region needs a valid base and non-zero size");
        logErrorF("%s: Memory region is missing a valid base/size.", pChipName);
        return false;
    }
    if ((uint64_t)pRegion->address + pRegion->length > 0x100000000ULL)
    {
        bridgeErrorSet(pError, BRIDGE_CONFIGURATION_ERROR, pChipName, g_operation,
                       "memory region at 0x%08X wraps past the end of the address space", pRegion->address);
        bridgeErrorSetAddress(pError, pRegion->address);
        logErrorF("%s: Memory region at 0x%08X wraps around.", pChipName, pRegion->address);
        return false;
    }
    if (pTree->readU32Field(regionNode, "block_size", &pRegion->blockSize) == ConfigTree::FIELD_INVALID)
    {
        bridgeErrorSet(pError, BRIDGE_CONFIGURATION_ERROR, pChipName, g_operation, "block_size is not a valid number");
        logErrorF("%s: Memory region has an invalid block_size.", pChipName);
        return false;
    }

    char type[MAX_CONFIG_VALUE_LENGTH + 1];
    pRegion->type = DEVICE_MEMORY_RAM;
    if (pTree->readField(regionNode, "type", type, sizeof(type)) && !parseMemoryType(type, &pRegion->type))
    {
        bridgeErrorSet(pError, BRIDGE_CONFIGURATION_ERROR, pChipName, g_operation,
                       "unknown memory type \"%s\" (expected ram, rom or flash)", type);
        logErrorF("%s: Unknown memory type \"%s\".", pChipName, type);
        return false;
    }
    return true;
}

static bool parseMemoryType(const char* pText, DeviceMemoryType* pType)
{
    if (strcmp(pText, "ram") == 0)
    {
        *pType = DEVICE_MEMORY_RAM;
    }
    else if (strcmp(pText, "rom") == 0)
    {
        *pType = DEVICE_MEMORY_ROM;
    }
    else if (strcmp(pText, "flash") == 0)
    {
        *pType = DEVICE_MEMORY_FLASH;
    }
    else
    {
        return false;
    }
    return true;
}
