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
// Interface used to add support for GAP8 chips: a fabric controller (FC) which boots from ROM plus an 8 core cluster.

// **********************************************************************************************************
// **** DEVICE_MODULE must be set to reflect the filename of this source file before including logging.h ****
// **********************************************************************************************************
#define DEVICE_MODULE "devices/gap.cpp"
#include "logging.h"
#include "gap.h"
#include "debug_bridge.h"


// Debug unit of the fabric controller. It is always core 0.
static const uint32_t FC_DEBUG_UNIT = 0x1B300000;
// Debug units of the cluster cores which are cores 1 - 8.
static const uint32_t CLUSTER_DEBUG_UNIT_BASE = 0x10300000;
static const uint32_t CLUSTER_DEBUG_UNIT_STRIDE = 0x8000;
static const uint32_t CLUSTER_CORE_COUNT = 8;

// APB SoC control block.
static const uint32_t APB_SOC_CTRL = 0x1A104000;
// Address that the ROM jumps to once it has finished booting the FC.
static const uint32_t APB_SOC_BOOT_ADDR = APB_SOC_CTRL + 0x04;
// Register polled by the boot ROM to decide where to boot from.
static const uint32_t APB_SOC_JTAG_REG = APB_SOC_CTRL + 0x74;
static const uint32_t JTAG_REG_BOOT_MODE_JTAG = 1 << 1;


static const DeviceMemoryRegion g_gapMemoryRegions[] =
{
    { .address = 0x1A000000, .length = 8 * 1024, .blockSize = 0, .type = DEVICE_MEMORY_ROM },
    // FC tightly coupled data memory.
    { .address = 0x1B000000, .length = 16 * 1024, .blockSize = 0, .type = DEVICE_MEMORY_RAM },
    // L2
    { .address = 0x1C000000, .length = 512 * 1024, .blockSize = 0, .type = DEVICE_MEMORY_RAM },
};
static const DeviceMemoryLayout g_gapMemoryLayout =
{
    .pRegions = g_gapMemoryRegions,
    .regionCount = count_of(g_gapMemoryRegions)
};

static const ChipDescription g_gapDescription =
{
    .pName = "gap",
    .idCode = 0,
    .idCodeMask = 0,
    .maximumClockFrequency = 10000000,
    .pMemoryLayout = &g_gapMemoryLayout,
    .pRegisterSet = &g_defaultRegisterSet,
    .defaultCoreCount = 1,
    .maximumCoreCount = 1 + CLUSTER_CORE_COUNT,
    .liveMemoryAccess = true
};


class GapBridge : public DebugBridge
{
    public:
        GapBridge(const BridgeConfig* pConfig, Transport* pTransport, const BinarySet* pBinaries, bool verbose)
            : DebugBridge(&g_gapDescription, pConfig, pTransport, pBinaries, verbose)
        {
        }

    protected:
        virtual bool resetAndHandshake();
        virtual uint32_t getDebugUnitAddress(uint32_t coreIndex);
        virtual bool setEntryPoint(uint32_t entryPoint);
};


bool GapBridge::resetAndHandshake()
{
    if (!pulseReset() || !checkIdCode() || !haltCore(0))
    {
        return false;
    }

    // Stop the ROM from trying to boot out of external flash once the FC is released.
    logVerboseF(m_verbose, "%s: Selecting JTAG boot mode.", getChipName());
    if (!writeTargetWord(APB_SOC_JTAG_REG, JTAG_REG_BOOT_MODE_JTAG))
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

uint32_t GapBridge::getDebugUnitAddress(uint32_t coreIndex)
{
    if (coreIndex == 0)
    {
        return FC_DEBUG_UNIT;
    }
    return CLUSTER_DEBUG_UNIT_BASE + CLUSTER_DEBUG_UNIT_STRIDE * (coreIndex - 1);
}

bool GapBridge::setEntryPoint(uint32_t entryPoint)
{
    // The boot address is used if the FC goes back through the ROM. NPC is used when it is simply resumed.
    return writeTargetWord(APB_SOC_BOOT_ADDR, entryPoint) && writeDebugRegister(0, DBG_NPC, entryPoint);
}


std::unique_ptr<DebugBridge> gapCreateBridge(const BridgeConfig* pConfig, Transport* pTransport,
                                             const BinarySet* pBinaries, bool verbose)
{
    return std::make_unique<GapBridge>(pConfig, pTransport, pBinaries, verbose);
}
