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
// Interface used to add support for Fulmine chips: a 4 core OR10N cluster without a fabric controller.
// The cluster interconnect can't service debug accesses while the cores are running so memory is only accessible
// while they are halted.

// **********************************************************************************************************
// **** DEVICE_MODULE must be set to reflect the filename of this source file before including logging.h ****
// **********************************************************************************************************
#define DEVICE_MODULE "devices/fulmine.cpp"
#include "logging.h"
#include "fulmine.h"
#include "debug_bridge.h"


static const uint32_t DEBUG_UNIT_BASE = 0x10300000;
static const uint32_t DEBUG_UNIT_STRIDE = 0x8000;
static const uint32_t CORE_COUNT = 4;


static const DeviceMemoryRegion g_fulmineMemoryRegions[] =
{
    // Cluster L1
    { .address = 0x10000000, .length = 64 * 1024, .blockSize = 0, .type = DEVICE_MEMORY_RAM },
    // L2
    { .address = 0x1C000000, .length = 192 * 1024, .blockSize = 0, .type = DEVICE_MEMORY_RAM },
};
static const DeviceMemoryLayout g_fulmineMemoryLayout =
{
    .pRegions = g_fulmineMemoryRegions,
    .regionCount = count_of(g_fulmineMemoryRegions)
};

static const ChipDescription g_fulmineDescription =
{
    .pName = "fulmine",
    .idCode = 0,
    .idCodeMask = 0,
    .maximumClockFrequency = 5000000,
    .pMemoryLayout = &g_fulmineMemoryLayout,
    .pRegisterSet = &g_defaultRegisterSet,
    .defaultCoreCount = CORE_COUNT,
    .maximumCoreCount = CORE_COUNT,
    .liveMemoryAccess = false
};


class FulmineBridge : public DebugBridge
{
    public:
        FulmineBridge(const BridgeConfig* pConfig, Transport* pTransport, const BinarySet* pBinaries, bool verbose)
            : DebugBridge(&g_fulmineDescription, pConfig, pTransport, pBinaries, verbose)
        {
        }

    protected:
        virtual bool resetAndHandshake()
        {
            return pulseReset() && checkIdCode() && haltAllCores();
        }

        virtual uint32_t getDebugUnitAddress(uint32_t coreIndex)
        {
            return DEBUG_UNIT_BASE + DEBUG_UNIT_STRIDE * coreIndex;
        }

        // There is no boot core. Every core of the cluster starts at the entry point.
        virtual bool setEntryPoint(uint32_t entryPoint)
        {
            for (uint32_t i = 0 ; i < m_coreCount ; i++)
            {
                if (!writeDebugRegister(i, DBG_NPC, entryPoint))
                {
                    return false;
                }
            }
            logDebugF("Set NPC of %u cores to 0x%08X.", m_coreCount, entryPoint);
            return true;
        }
};


std::unique_ptr<DebugBridge> fulmineCreateBridge(const BridgeConfig* pConfig, Transport* pTransport,
                                                 const BinarySet* pBinaries, bool verbose)
{
    return std::make_unique<FulmineBridge>(pConfig, pTransport, pBinaries, verbose);
}
