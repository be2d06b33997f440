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
#include <gtest/gtest.h>
#include <stdio.h>
#include <string.h>
#include "debug_bridge.h"
#include "devices/devices.h"
#include "devices/gap.h"
#include "devices/generic.h"
#include "devices/wolfe.h"
#include "devices/fulmine.h"


// Distinct factories so that resolve() results can be told apart. They are never called.
static std::unique_ptr<DebugBridge> factoryA(const BridgeConfig* pConfig, Transport* pTransport,
                                             const BinarySet* pBinaries, bool verbose)
{
    return nullptr;
}

static std::unique_ptr<DebugBridge> factoryB(const BridgeConfig* pConfig, Transport* pTransport,
                                             const BinarySet* pBinaries, bool verbose)
{
    return nullptr;
}

static std::unique_ptr<DebugBridge> fallbackFactory(const BridgeConfig* pConfig, Transport* pTransport,
                                                    const BinarySet* pBinaries, bool verbose)
{
    return nullptr;
}


TEST(ChipRegistry, Resolve_EmptyRegistryShouldReturnGenericFactory)
{
    ChipRegistry registry(fallbackFactory);

    EXPECT_TRUE(registry.resolve("gap") == fallbackFactory);
    EXPECT_TRUE(registry.resolve("") == fallbackFactory);
    EXPECT_TRUE(registry.resolve(NULL) == fallbackFactory);
    EXPECT_EQ(0u, registry.getCount());
}

TEST(ChipRegistry, Resolve_ShouldReturnRegisteredFactory)
{
    ChipRegistry registry(fallbackFactory);
    ASSERT_TRUE(registry.registerChip("alpha", factoryA));
    ASSERT_TRUE(registry.registerChip("beta", factoryB));

    EXPECT_TRUE(registry.resolve("alpha") == factoryA);
    EXPECT_TRUE(registry.resolve("beta") == factoryB);
    EXPECT_TRUE(registry.resolve("gamma") == fallbackFactory);
    EXPECT_TRUE(registry.resolve("Alpha") == fallbackFactory);
    EXPECT_TRUE(registry.isRegistered("alpha"));
    EXPECT_FALSE(registry.isRegistered("gamma"));
}

TEST(ChipRegistry, RegisterChip_SameFactoryTwiceShouldChangeNothing)
{
    ChipRegistry registry(fallbackFactory);
    ASSERT_TRUE(registry.registerChip("alpha", factoryA));
    ASSERT_TRUE(registry.registerChip("alpha", factoryA));

    EXPECT_EQ(1u, registry.getCount());
    EXPECT_TRUE(registry.resolve("alpha") == factoryA);
}

TEST(ChipRegistry, RegisterChip_ShouldOverwriteExistingEntry)
{
    ChipRegistry registry(fallbackFactory);
    ASSERT_TRUE(registry.registerChip("alpha", factoryA));
    ASSERT_TRUE(registry.registerChip("alpha", factoryB));

    EXPECT_EQ(1u, registry.getCount());
    EXPECT_TRUE(registry.resolve("alpha") == factoryB);
}

TEST(ChipRegistry, RegisterChip_ShouldRejectBadNames)
{
    ChipRegistry registry(fallbackFactory);
    char tooLong[MAX_CHIP_NAME_LENGTH + 2];
    memset(tooLong, 'x', sizeof(tooLong) - 1);
    tooLong[sizeof(tooLong) - 1] = '\0';

    EXPECT_FALSE(registry.registerChip("", factoryA));
    EXPECT_FALSE(registry.registerChip(NULL, factoryA));
    EXPECT_FALSE(registry.registerChip(tooLong, factoryA));
    EXPECT_FALSE(registry.registerChip("alpha", NULL));
    EXPECT_EQ(0u, registry.getCount());
}

TEST(ChipRegistry, RegisterChip_ShouldFailOnceFullButKeepResolving)
{
    ChipRegistry registry(fallbackFactory);
    for (int i = 0 ; i < MAX_CHIP_VARIANTS ; i++)
    {
        char name[16];
        snprintf(name, sizeof(name), "chip%d", i);
        ASSERT_TRUE(registry.registerChip(name, factoryA));
    }

    EXPECT_FALSE(registry.registerChip("one-too-many", factoryB));
    EXPECT_TRUE(registry.resolve("one-too-many") == fallbackFactory);
    // Overwriting an existing entry still works when full.
    EXPECT_TRUE(registry.registerChip("chip0", factoryB));
    EXPECT_TRUE(registry.resolve("chip0") == factoryB);
}

TEST(ChipRegistry, RegisterChips_ShouldAddWholeTable)
{
    ChipRegistry registry(fallbackFactory);

    ASSERT_TRUE(registry.registerChips(g_supportedChips, g_supportedChipsLength));
    EXPECT_EQ(g_supportedChipsLength, registry.getCount());
}


TEST(ProcessRegistry, ShouldMapEverySupportedChipToItsOwnFactory)
{
    ChipRegistry* pRegistry = getChipRegistry();

    ASSERT_TRUE(pRegistry != NULL);
    EXPECT_EQ(pRegistry, getChipRegistry());
    EXPECT_TRUE(pRegistry->resolve("gap") == gapCreateBridge);
    EXPECT_TRUE(pRegistry->resolve("wolfe") == wolfeCreateBridge);
    EXPECT_TRUE(pRegistry->resolve("fulmine") == fulmineCreateBridge);
    EXPECT_TRUE(pRegistry->getGenericFactory() == genericCreateBridge);
}

TEST(ProcessRegistry, UnknownIdentitiesShouldResolveToGeneric)
{
    ChipRegistry* pRegistry = getChipRegistry();

    EXPECT_TRUE(pRegistry->resolve("unknown-chip-123") == genericCreateBridge);
    EXPECT_TRUE(pRegistry->resolve("GAP") == genericCreateBridge);
    EXPECT_TRUE(pRegistry->resolve(GENERIC_CHIP_NAME) == genericCreateBridge);
}
