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
// Bridge used for any PULP target whose chip identity isn't found in g_supportedChips.
// Everything about the target comes from its configuration: memory map, core count and live memory access.

// **********************************************************************************************************
// **** DEVICE_MODULE must be set to reflect the filename of this source file before including logging.h ****
// **********************************************************************************************************
#define DEVICE_MODULE "devices/generic.cpp"
#include "logging.h"
#include "generic.h"
#include "debug_bridge.h"


// Debug units of the generic target's cores.
static const uint32_t DEBUG_UNIT_BASE = 0x1A110000;
static const uint32_t DEBUG_UNIT_STRIDE = 0x8000;

static const ChipDescription g_genericDescription =
{
    .pName = GENERIC_CHIP_NAME,
    // Any well formed IDCODE is accepted unless the configuration pins one.
    .idCode = 0,
    .idCodeMask = 0,
    .maximumClockFrequency = 10000000,
    // Uses the configured memory map or deviceDefaultMemoryLayout().
    .pMemoryLayout = NULL,
    .pRegisterSet = &g_defaultRegisterSet,
    .defaultCoreCount = 1,
    .maximumCoreCount = MAX_CORES,
    .liveMemoryAccess = true
};


class GenericBridge : public DebugBridge
{
    public:
        GenericBridge(const BridgeConfig* pConfig, Transport* pTransport, const BinarySet* pBinaries, bool verbose)
            : DebugBridge(&g_genericDescription, pConfig, pTransport, pBinaries, verbose)
        {
        }

    protected:
        virtual bool resetAndHandshake()
        {
            if (!pulseReset() || !checkIdCode())
            {
                return false;
            }
            logDebugF("%s: Halting %u core(s).", getChipName(), m_coreCount);
            return haltAllCores();
        }

        virtual uint32_t getDebugUnitAddress(uint32_t coreIndex)
        {
            return DEBUG_UNIT_BASE + DEBUG_UNIT_STRIDE * coreIndex;
        }
};


std::unique_ptr<DebugBridge> genericCreateBridge(const BridgeConfig* pConfig, Transport* pTransport,
                                                 const BinarySet* pBinaries, bool verbose)
{
    return std::make_unique<GenericBridge>(pConfig, pTransport, pBinaries, verbose);
}
