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
// Test fixture which builds a target configuration, wires up a SimulatedTarget with the debug units of the chip
// being tested and creates the bridge through createBridge().
#ifndef BRIDGE_FIXTURE_H_
#define BRIDGE_FIXTURE_H_

#include <gtest/gtest.h>
#include <string.h>
#include <memory>
#include <string>
#include "bridge_selector.h"
#include "config_tree.h"
#include "debug_bridge.h"
#include "simulated_target.h"


class BridgeFixture : public ::testing::Test
{
    protected:
        virtual void TearDown()
        {
            pBridge.reset();
        }

        // Declare a single chip in the configuration and give the simulated target matching debug units.
        void declareChip(const char* pChipName, uint32_t coreCount = 0)
        {
            chipPath = std::string("system/board/pulp_chip/") + pChipName;
            ASSERT_TRUE(config.setField(chipPath.c_str(), "name", pChipName));
            if (coreCount)
            {
                setChipField("cores", std::to_string(coreCount).c_str());
            }
            addDebugUnitsFor(pChipName);
        }

        void setChipField(const char* pName, const char* pValue)
        {
            ASSERT_TRUE(config.setField(chipPath.c_str(), pName, pValue));
        }

        void addMemoryRegion(const char* pRegionName, const char* pBase, const char* pSize, const char* pType)
        {
            std::string path = chipPath + "/memory/" + pRegionName;
            ASSERT_TRUE(config.setField(path.c_str(), "base", pBase));
            ASSERT_TRUE(config.setField(path.c_str(), "size", pSize));
            ASSERT_TRUE(config.setField(path.c_str(), "type", pType));
        }

        void addDebugUnitsFor(const char* pChipName)
        {
            if (strcmp(pChipName, "gap") == 0)
            {
                target.addDebugUnit(GAP_FC_DEBUG_UNIT);
                target.addDebugUnits(CLUSTER_DEBUG_UNIT, CLUSTER_STRIDE, 8);
            }
            else if (strcmp(pChipName, "wolfe") == 0)
            {
                target.addDebugUnit(WOLFE_FC_DEBUG_UNIT);
                target.addDebugUnits(CLUSTER_DEBUG_UNIT, CLUSTER_STRIDE, 8);
            }
            else if (strcmp(pChipName, "fulmine") == 0)
            {
                target.addDebugUnits(CLUSTER_DEBUG_UNIT, CLUSTER_STRIDE, 4);
            }
            else
            {
                target.addDebugUnits(GENERIC_DEBUG_UNIT, CLUSTER_STRIDE, MAX_CORES);
            }
        }

        void create(const BinarySet* pBinaries = NULL)
        {
            pBridge = createBridge(&config, &target, pBinaries, false, &error);
            ASSERT_TRUE(pBridge.get() != NULL) << error.message;
        }

        void createAndAttach(const BinarySet* pBinaries = NULL)
        {
            create(pBinaries);
            ASSERT_TRUE(pBridge->attach()) << pBridge->getLastError()->message;
            ASSERT_EQ(BRIDGE_STATE_STOPPED, pBridge->getState());
        }

        BridgeErrorCode lastErrorCode()
        {
            return pBridge->getLastError()->code;
        }

        static const uint32_t GAP_FC_DEBUG_UNIT = 0x1B300000;
        static const uint32_t WOLFE_FC_DEBUG_UNIT = 0x1A110000;
        static const uint32_t GENERIC_DEBUG_UNIT = 0x1A110000;
        static const uint32_t CLUSTER_DEBUG_UNIT = 0x10300000;
        static const uint32_t CLUSTER_STRIDE = 0x8000;

        MemoryConfigTree             config;
        SimulatedTarget              target;
        BridgeError                  error;
        std::unique_ptr<DebugBridge> pBridge;
        std::string                  chipPath;
};

#endif // BRIDGE_FIXTURE_H_
