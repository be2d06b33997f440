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
// List of chips or family of chips supported by dbg-bridge and the registry used to look them up.
// Also contains a few tables shared by the chip specific modules.
#define DEVICE_MODULE "devices.cpp"
#include "logging.h"
#include <string.h>
#include "devices.h"
#include "gap.h"
#include "wolfe.h"
#include "fulmine.h"
#include "generic.h"


// The list of all supported chips can be found in this table.
const ChipVariant g_supportedChips[] = {
    { .pName = "gap", .create = gapCreateBridge },
    { .pName = "wolfe", .create = wolfeCreateBridge },
    { .pName = "fulmine", .create = fulmineCreateBridge },
};

// The number of entries in the g_supportedChips array.
const size_t g_supportedChipsLength = count_of(g_supportedChips);

// Used for every chip identity not found above.
const ChipVariant g_genericChip = { .pName = GENERIC_CHIP_NAME, .create = genericCreateBridge };




ChipRegistry::ChipRegistry(ChipBridgeFactory genericFactory)
{
    memset(m_entries, 0, sizeof(m_entries));
    m_genericFactory = genericFactory;
}

bool ChipRegistry::registerChip(const char* pName, ChipBridgeFactory factory)
{
    if (pName == NULL || factory == NULL)
    {
        logError("Can't register a chip without a name and factory.");
        return false;
    }
    size_t nameLength = strlen(pName);
    if (nameLength == 0 || nameLength > MAX_CHIP_NAME_LENGTH)
    {
        logErrorF("Chip name \"%s\" must be 1 to %d characters long.", pName, MAX_CHIP_NAME_LENGTH);
        return false;
    }

    Entry* pEntry = findEntry(pName);
    if (pEntry == NULL)
    {
        if (m_count >= count_of(m_entries))
        {
            logErrorF("Registry is full. Can't register \"%s\".", pName);
            return false;
        }
        pEntry = &m_entries[m_count++];
        memcpy(pEntry->name, pName, nameLength + 1);
    }
    pEntry->create = factory;
    logDebugF("Registered \"%s\".", pName);
    return true;
}

bool ChipRegistry::registerChips(const ChipVariant* pVariants, size_t variantCount)
{
    for (size_t i = 0 ; i < variantCount ; i++)
    {
        if (!registerChip(pVariants[i].pName, pVariants[i].create))
        {
            return false;
        }
    }
    return true;
}

ChipBridgeFactory ChipRegistry::resolve(const char* pName) const
{
    const Entry* pEntry = findEntry(pName);
    if (pEntry == NULL)
    {
        logDebugF("\"%s\" isn't registered. Falling back to the generic bridge.", pName ? pName : "");
        return m_genericFactory;
    }
    return pEntry->create;
}

bool ChipRegistry::isRegistered(const char* pName) const
{
    return findEntry(pName) != NULL;
}

ChipRegistry::Entry* ChipRegistry::findEntry(const char* pName)
{
    if (pName == NULL)
    {
        return NULL;
    }
    for (size_t i = 0 ; i < m_count ; i++)
    {
        if (strcmp(m_entries[i].name, pName) == 0)
        {
            return &m_entries[i];
        }
    }
    return NULL;
}

const ChipRegistry::Entry* ChipRegistry::findEntry(const char* pName) const
{
    if (pName == NULL)
    {
        return NULL;
    }
    for (size_t i = 0 ; i < m_count ; i++)
    {
        if (strcmp(m_entries[i].name, pName) == 0)
        {
            return &m_entries[i];
        }
    }
    return NULL;
}


ChipRegistry* getChipRegistry()
{
    // Function scoped static so that construction is thread safe and happens on first use.
    static ChipRegistry s_registry(g_genericChip.create);
    static bool s_populated = s_registry.registerChips(g_supportedChips, g_supportedChipsLength);

    (void)s_populated;
    return &s_registry;
}




// Register set shared by the RI5CY and OR10N debug units.
static const DeviceRegisterBank g_defaultRegisterBanks[] =
{
    { .firstId = 0, .count = 32, .debugUnitOffset = 0x0400, .pName = "x" },
    { .firstId = 32, .count = 1, .debugUnitOffset = 0x2000, .pName = "npc" },
    { .firstId = 33, .count = 1, .debugUnitOffset = 0x2004, .pName = "ppc" },
};
const DeviceRegisterSet g_defaultRegisterSet =
{
    .pBanks = g_defaultRegisterBanks,
    .bankCount = count_of(g_defaultRegisterBanks)
};


// Default memory layout of PULP chips to use if we don't have chip specific memory layout information.
static const DeviceMemoryRegion g_defaultMemoryRegions[] =
{
    { .address = 0x1C000000, .length = 512 * 1024, .blockSize = 0, .type = DEVICE_MEMORY_RAM },
};
static const DeviceMemoryLayout g_defaultMemoryLayout =
{
    .pRegions = g_defaultMemoryRegions,
    .regionCount = count_of(g_defaultMemoryRegions)
};

const DeviceMemoryLayout* deviceDefaultMemoryLayout()
{
    return &g_defaultMemoryLayout;
}
