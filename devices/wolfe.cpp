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
// Interface used to add support for Wolfe chips: a fabric controller plus an 8 core cluster with FPUs.

// **********************************************************************************************************
// **** DEVICE_MODULE must be set to reflect the filename of this source file before including logging.h ****
// **********************************************************************************************************
#define DEVICE_MODULE "devices/wolfe.cpp"
#include "logging.h"
#include "wolfe.h"
#include "debug_bridge.h"


static const uint32_t FC_DEBUG_UNIT = 0x1A110000;
static const uint32_t CLUSTER_DEBUG_UNIT_BASE = 0x10300000;
static const uint32_t CLUSTER_DEBUG_UNIT_STRIDE = 0x8000;
static const uint32_t CLUSTER_CORE_COUNT = 8;

// Cluster control unit. The cluster cores can't be reached through their debug units until their clock is enabled.
static const uint32_t CLUSTER_CTRL = 0x10200000;
static const uint32_t CLUSTER_CTRL_CLKGATE = CLUSTER_CTRL + 0x20;
static const uint32_t CLKGATE_ENABLE = 1 << 0;


static const DeviceMemoryRegion g_wolfeMemoryRegions[] =
{
    { .address = 0x1A000000, .length = 8 * 1024, .blockSize = 0, .type = DEVICE_MEMORY_ROM },
    // Cluster L1
    { .address = 0x10000000, .length = 64 * 1024, .blockSize = 0, .type = DEVICE_MEMORY_RAM },
    // L2
    { .address = 0x1C000000, .length = 512 * 1024, .blockSize = 0, .type = DEVICE_MEMORY_RAM },
};
static const DeviceMemoryLayout g_wolfeMemoryLayout =
{
    .pRegions = g_wolfeMemoryRegions,
    .regionCount = count_of(g_wolfeMemoryRegions)
};

// The RISC-V registers of g_defaultRegisterSet plus f0 - f31 as register ids 34 - 65.
static const DeviceRegisterBank g_wolfeRegisterBanks[] =
{
    { .firstId = 0, .count = 32, .debugUnitOffset = 0x0400, .pName = "x" },
    { .firstId = 32, .count = 1, .debugUnitOffset = 0x2000, .pName = "npc" },
    { .firstId = 33, .count = 1, .debugUnitOffset = 0x2004, .pName = "ppc" },
    { .firstId = 34, .count = 32, .debugUnitOffset = 0x0500, .pName = "f" },
};
static const DeviceRegisterSet g_wolfeRegisterSet =
{
    .pBanks = g_wolfeRegisterBanks,
    .bankCount = count_of(g_wolfeRegisterBanks)
};

static const ChipDescription g_wolfeDescription =
{
    .pName = "wolfe",
    .idCode = 0,
    .idCodeMask = 0,
    .maximumClockFrequency = 15000000,
    .pMemoryLayout = &g_wolfeMemoryLayout,
    .pRegisterSet = &g_wolfeRegisterSet,
    .defaultCoreCount = 1,
    .maximumCoreCount = 1 + CLUSTER_CORE_COUNT,
    .liveMemoryAccess = true
};


class WolfeBridge : public DebugBridge
{
    public:
        WolfeBridge(const BridgeConfig* pConfig, Transport* pTransport, const BinarySet* pBinaries, bool verbose)
            : DebugBridge(&g_wolfeDescription, pConfig, pTransport, pBinaries, verbose)
        {
        }

    protected:
        virtual bool resetAndHandshake()
        {
            if (!pulseReset() || !checkIdCode() || !haltCore(0))
            {
                return false;
            }

            logVerboseF(m_verbose, "%s: Enabling cluster clock.", getChipName());
            if (!writeTargetWord(CLUSTER_CTRL_CLKGATE, CLKGATE_ENABLE))
            {
                return false;
            }
            for (uint32_t i = 1 ; i < m_coreCount ; i++)
            {
                if (!haltCore(i))
                {
                    return false;
                }
            }
            return true;
        }

        virtual uint32_t getDebugUnitAddress(uint32_t coreIndex)
        {
            if (coreIndex == 0)
            {
                return FC_DEBUG_UNIT;
            }
            return CLUSTER_DEBUG_UNIT_BASE + CLUSTER_DEBUG_UNIT_STRIDE * (coreIndex - 1);
        }
};


std::unique_ptr<DebugBridge> wolfeCreateBridge(const BridgeConfig* pConfig, Transport* pTransport,
                                               const BinarySet* pBinaries, bool verbose)
{
    return std::make_unique<WolfeBridge>(pConfig, pTransport, pBinaries, verbose);
}
