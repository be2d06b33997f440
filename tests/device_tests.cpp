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
#include "bridge_fixture.h"


// Chip specific reset/handshake sequences, debug unit maps, entry point handling and memory layouts.
class DeviceTest : public BridgeFixture
{
    protected:
        void loadAndRun(uint32_t address, uint32_t entryPoint)
        {
            static const uint8_t data[16] = { 0 };
            BinaryImage image = { address, data, sizeof(data), entryPoint };
            BinarySet binaries = { &image, 1 };

            ASSERT_TRUE(pBridge->load(&binaries)) << pBridge->getLastError()->message;
            ASSERT_TRUE(pBridge->run()) << pBridge->getLastError()->message;
        }

        static const uint32_t GAP_JTAG_REG = 0x1A104074;
        static const uint32_t GAP_BOOT_ADDR = 0x1A104004;
        static const uint32_t WOLFE_CLKGATE = 0x10200020;
        static const uint32_t NPC_OFFSET = 0x2000;
};


TEST_F(DeviceTest, Gap_AttachShouldHaltFabricControllerAndSelectJtagBoot)
{
    declareChip("gap");
    ASSERT_NO_FATAL_FAILURE(createAndAttach());

    EXPECT_TRUE(target.isCoreHalted(GAP_FC_DEBUG_UNIT));
    EXPECT_FALSE(target.isCoreHalted(CLUSTER_DEBUG_UNIT));
    EXPECT_EQ(2u, target.peekWord(GAP_JTAG_REG));
    EXPECT_EQ(10000000u, target.getClockFrequency());
}

TEST_F(DeviceTest, Gap_AttachWithClusterShouldHaltEveryCore)
{
    declareChip("gap", 9);
    ASSERT_NO_FATAL_FAILURE(createAndAttach());

    EXPECT_TRUE(target.isCoreHalted(GAP_FC_DEBUG_UNIT));
    for (uint32_t i = 0 ; i < 8 ; i++)
    {
        EXPECT_TRUE(target.isCoreHalted(CLUSTER_DEBUG_UNIT + CLUSTER_STRIDE * i)) << "cluster core " << i;
    }
}

TEST_F(DeviceTest, Gap_RunShouldSetBootAddressAndFabricControllerNpc)
{
    declareChip("gap");
    ASSERT_NO_FATAL_FAILURE(createAndAttach());

    ASSERT_NO_FATAL_FAILURE(loadAndRun(0x1C000000, 0x1C000080));

    EXPECT_EQ(0x1C000080u, target.peekWord(GAP_BOOT_ADDR));
    EXPECT_EQ(0x1C000080u, target.peekWord(GAP_FC_DEBUG_UNIT + NPC_OFFSET));
    EXPECT_FALSE(target.isCoreHalted(GAP_FC_DEBUG_UNIT));
}

TEST_F(DeviceTest, Gap_RomShouldNotBeLoadable)
{
    uint8_t data[16] = { 0 };
    BinaryImage image = { 0x1A000000, data, sizeof(data), 0 };
    BinarySet binaries = { &image, 1 };
    declareChip("gap");
    ASSERT_NO_FATAL_FAILURE(createAndAttach());
    target.clearWriteLog();

    EXPECT_FALSE(pBridge->load(&binaries));
    EXPECT_EQ(BRIDGE_OUT_OF_RANGE_ERROR, lastErrorCode());
    EXPECT_EQ(0u, target.getWriteRequestCount());
}

TEST_F(DeviceTest, Gap_FloatingPointRegistersShouldBeUnknown)
{
    uint32_t value = 0;
    declareChip("gap");
    ASSERT_NO_FATAL_FAILURE(createAndAttach());

    EXPECT_FALSE(pBridge->readRegister(34, &value));
    EXPECT_EQ(BRIDGE_UNKNOWN_REGISTER_ERROR, lastErrorCode());
}


TEST_F(DeviceTest, Wolfe_AttachShouldUngateClusterClock)
{
    declareChip("wolfe");
    ASSERT_NO_FATAL_FAILURE(createAndAttach());

    EXPECT_TRUE(target.isCoreHalted(WOLFE_FC_DEBUG_UNIT));
    EXPECT_EQ(1u, target.peekWord(WOLFE_CLKGATE));
    EXPECT_EQ(15000000u, target.getClockFrequency());
}

TEST_F(DeviceTest, Wolfe_FloatingPointRegistersShouldMapAfterGprs)
{
    uint32_t value = 0;
    declareChip("wolfe");
    ASSERT_NO_FATAL_FAILURE(createAndAttach());
    target.pokeWord(WOLFE_FC_DEBUG_UNIT + 0x500, 0x3F800000);

    EXPECT_TRUE(pBridge->readRegister(34, &value));
    EXPECT_EQ(0x3F800000u, value);
    EXPECT_TRUE(pBridge->writeRegister(65, 0x40000000));
    EXPECT_EQ(0x40000000u, target.peekWord(WOLFE_FC_DEBUG_UNIT + 0x500 + 31 * 4));

    EXPECT_FALSE(pBridge->readRegister(66, &value));
    EXPECT_EQ(BRIDGE_UNKNOWN_REGISTER_ERROR, lastErrorCode());
}

TEST_F(DeviceTest, Wolfe_L1ShouldBeLoadable)
{
    declareChip("wolfe");
    ASSERT_NO_FATAL_FAILURE(createAndAttach());

    ASSERT_NO_FATAL_FAILURE(loadAndRun(0x10000100, 0x10000100));
    EXPECT_EQ(0x10000100u, target.peekWord(WOLFE_FC_DEBUG_UNIT + NPC_OFFSET));
}


TEST_F(DeviceTest, Fulmine_AttachShouldHaltAllFourCores)
{
    declareChip("fulmine");
    ASSERT_NO_FATAL_FAILURE(createAndAttach());

    EXPECT_EQ(4u, pBridge->getCoreCount());
    for (uint32_t i = 0 ; i < 4 ; i++)
    {
        EXPECT_TRUE(target.isCoreHalted(CLUSTER_DEBUG_UNIT + CLUSTER_STRIDE * i)) << "core " << i;
    }
    EXPECT_EQ(5000000u, target.getClockFrequency());
}

TEST_F(DeviceTest, Fulmine_RunShouldStartEveryCoreAtEntryPoint)
{
    declareChip("fulmine");
    ASSERT_NO_FATAL_FAILURE(createAndAttach());

    ASSERT_NO_FATAL_FAILURE(loadAndRun(0x1C000000, 0x1C000000));

    for (uint32_t i = 0 ; i < 4 ; i++)
    {
        uint32_t debugUnit = CLUSTER_DEBUG_UNIT + CLUSTER_STRIDE * i;
        EXPECT_EQ(0x1C000000u, target.peekWord(debugUnit + NPC_OFFSET)) << "core " << i;
        EXPECT_FALSE(target.isCoreHalted(debugUnit)) << "core " << i;
    }
}

TEST_F(DeviceTest, Fulmine_MemoryAccessWhileRunningShouldFail)
{
    uint32_t value = 0;
    declareChip("fulmine");
    ASSERT_NO_FATAL_FAILURE(createAndAttach());
    ASSERT_TRUE(pBridge->run());

    EXPECT_FALSE(pBridge->readMemory(0x1C000000, &value, sizeof(value)));
    EXPECT_EQ(BRIDGE_INVALID_STATE_ERROR, lastErrorCode());
    EXPECT_EQ(BRIDGE_STATE_RUNNING, pBridge->getState());

    ASSERT_TRUE(pBridge->stop());
    EXPECT_TRUE(pBridge->readMemory(0x1C000000, &value, sizeof(value)));
}

TEST_F(DeviceTest, Fulmine_LiveMemoryAccessCanBeEnabledByConfiguration)
{
    uint32_t value = 0;
    declareChip("fulmine");
    setChipField("live_memory_access", "true");
    ASSERT_NO_FATAL_FAILURE(createAndAttach());
    ASSERT_TRUE(pBridge->run());

    EXPECT_TRUE(pBridge->readMemory(0x1C000000, &value, sizeof(value)));
}

TEST_F(DeviceTest, Fulmine_FewerCoresCanBeConfigured)
{
    declareChip("fulmine", 2);

    pBridge = createBridge(&config, &target, NULL, false, &error);

    ASSERT_TRUE(pBridge.get() != NULL);
    EXPECT_EQ(2u, pBridge->getCoreCount());
}


TEST_F(DeviceTest, Generic_ShouldUseDefaultL2LayoutWhenNoneConfigured)
{
    declareChip("my-soc");
    ASSERT_NO_FATAL_FAILURE(create());

    const DeviceMemoryLayout* pLayout = pBridge->getMemoryLayout();
    ASSERT_EQ(1u, pLayout->regionCount);
    EXPECT_EQ(0x1C000000u, pLayout->pRegions[0].address);
    EXPECT_EQ(512u * 1024u, pLayout->pRegions[0].length);
}

TEST_F(DeviceTest, Generic_LiveMemoryAccessCanBeDisabledByConfiguration)
{
    uint32_t value = 0;
    declareChip("my-soc");
    setChipField("live_memory_access", "false");
    ASSERT_NO_FATAL_FAILURE(createAndAttach());
    ASSERT_TRUE(pBridge->run());

    EXPECT_FALSE(pBridge->readMemory(0x1C000000, &value, sizeof(value)));
    EXPECT_EQ(BRIDGE_INVALID_STATE_ERROR, lastErrorCode());
}

TEST_F(DeviceTest, Generic_ClockShouldBeCappedAtChipMaximum)
{
    declareChip("my-soc");
    setChipField("clock_frequency", "50000000");
    ASSERT_NO_FATAL_FAILURE(createAndAttach());

    EXPECT_EQ(10000000u, target.getClockFrequency());
}

TEST_F(DeviceTest, Generic_SlowerConfiguredClockShouldBeUsed)
{
    declareChip("my-soc");
    setChipField("clock_frequency", "1000000");
    ASSERT_NO_FATAL_FAILURE(createAndAttach());

    EXPECT_EQ(1000000u, target.getClockFrequency());
}

TEST_F(DeviceTest, Generic_ConfiguredRomShouldNotBeLoadable)
{
    uint8_t data[16] = { 0 };
    BinaryImage image = { 0x0000, data, sizeof(data), 0 };
    BinarySet binaries = { &image, 1 };
    declareChip("my-soc");
    addMemoryRegion("rom", "0x0000", "0x1000", "rom");
    ASSERT_NO_FATAL_FAILURE(createAndAttach());

    EXPECT_FALSE(pBridge->load(&binaries));
    EXPECT_EQ(BRIDGE_OUT_OF_RANGE_ERROR, lastErrorCode());
}

TEST_F(DeviceTest, Generic_ConfiguredFlashShouldBeLoadable)
{
    uint8_t data[16] = { 0 };
    BinaryImage image = { 0x20000000, data, sizeof(data), 0 };
    BinarySet binaries = { &image, 1 };
    declareChip("my-soc");
    addMemoryRegion("flash", "0x20000000", "0x100000", "flash");
    ASSERT_NO_FATAL_FAILURE(createAndAttach());

    EXPECT_TRUE(pBridge->load(&binaries));
    EXPECT_EQ(16u, target.countBytesWrittenInRange(0x20000000, 16));
}
