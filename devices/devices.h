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
// Tables used to add support for specific chips or family of chips, and the registry which maps a chip identity
// onto the code which knows how to debug it.
//
// * When adding support for a new chip, .h and .cpp source files will be added with a name reflecting that chip.
//   * The header will declare the factory function which constructs the chip's DebugBridge subclass. You can see
//     examples of this in gap.h and wolfe.h
//   * The chip_name.cpp source file will derive a class from DebugBridge, fill in a ChipDescription for it and
//     implement the chip specific hooks (reset/handshake, debug unit addresses, entry point sequence). The gap.cpp
//     and fulmine.cpp source files give working example implementations.
// * The new factory then needs to be added to the g_supportedChips array in devices.cpp
// * The last thing that needs to be done is adding the new devices/chip_name.cpp module to the CMakeLists.txt
#ifndef DEVICES_H_
#define DEVICES_H_

#include <stdint.h>
#include <stddef.h>
#include <memory>
#include "config.h"
#include "binary_set.h"

class DebugBridge;
class Transport;
struct BridgeConfig;


// Types of memory that can be defined in the chip's memory layout.
enum DeviceMemoryType
{
    DEVICE_MEMORY_RAM,
    DEVICE_MEMORY_ROM,
    DEVICE_MEMORY_FLASH
};

// Description of a region of chip memory (RAM, ROM, FLASH): Starting address, size, etc.
struct DeviceMemoryRegion
{
    // Starting address of this region.
    uint32_t address;
    // Number of bytes in this region.
    uint32_t length;
    // Erase FLASH in blocks of this size.
    uint32_t blockSize;
    DeviceMemoryType type;
};

// Memory layout of the chip's various memory regions.
struct DeviceMemoryLayout
{
    // Pointer to an array of memory regions.
    const DeviceMemoryRegion* pRegions;
    // The number of regions in the pRegions array.
    uint32_t regionCount;
};

// A contiguous range of register ids which map onto consecutive 32-bit words of a core's debug unit.
struct DeviceRegisterBank
{
    // Register id of the first register in this bank.
    uint32_t firstId;
    // Number of registers in this bank.
    uint32_t count;
    // Offset of the first register from the start of the debug unit.
    uint32_t debugUnitOffset;
    const char* pName;
};

// The full set of register ids that a chip accepts in read_register() / write_register().
struct DeviceRegisterSet
{
    const DeviceRegisterBank* pBanks;
    uint32_t bankCount;
};

// Static description of a chip variant. Values here are the built-in defaults and can be replaced from the target's
// configuration (see bridge_config.h).
struct ChipDescription
{
    // Chip identity, as found in the configuration.
    const char* pName;
    // The IDCODE read during attach must match idCode in the bits set in idCodeMask. A mask of 0 accepts any well
    // formed IDCODE.
    uint32_t idCode;
    uint32_t idCodeMask;
    // The link clock will be lowered to this frequency (Hz) if configured higher.
    uint32_t maximumClockFrequency;
    const DeviceMemoryLayout* pMemoryLayout;
    const DeviceRegisterSet* pRegisterSet;
    // Number of cores placed under debug control by default and the most that can be configured.
    uint32_t defaultCoreCount;
    uint32_t maximumCoreCount;
    // Can memory be read/written while the cores are running?
    bool liveMemoryAccess;
};


// Function which constructs the DebugBridge subclass for a particular chip. The returned object is unattached and
// owned by the caller.
//
// pConfig is the configuration snapshot. The bridge makes its own copy.
// pTransport is the link to the target. It is claimed on attach() and released on detach().
// pBinaries is the set of images loaded by DebugBridge::load() with no arguments. Can be NULL.
// verbose enables human readable tracing of each protocol step.
typedef std::unique_ptr<DebugBridge> (*ChipBridgeFactory)(const BridgeConfig* pConfig, Transport* pTransport,
                                                          const BinarySet* pBinaries, bool verbose);

// Element of the g_supportedChips table.
struct ChipVariant
{
    const char*       pName;
    ChipBridgeFactory create;
};


// Mapping from chip identity to bridge factory with a designated generic entry for everything else.
//
// Lifecycle: the process wide instance returned by getChipRegistry() is populated from g_supportedChips on first
// use. Extra variants can be added with registerChip() during start up. Once bridges start being created from
// several threads, the registry must be treated as read-only.
class ChipRegistry
{
    public:
        ChipRegistry(ChipBridgeFactory genericFactory);

        // Add the factory for pName or overwrite the one already registered for it. Registering the same name with
        // the same factory again changes nothing.
        //
        // Returns false if pName is empty or too long, or the registry is full.
        bool registerChip(const char* pName, ChipBridgeFactory factory);

        // Add every entry of a ChipVariant table.
        bool registerChips(const ChipVariant* pVariants, size_t variantCount);

        // Returns the factory registered for pName or the generic factory if there isn't one. Never returns NULL.
        ChipBridgeFactory resolve(const char* pName) const;

        // Returns true if pName has its own entry (ie. resolve() won't fall back to the generic factory).
        bool isRegistered(const char* pName) const;

        ChipBridgeFactory getGenericFactory() const
        {
            return m_genericFactory;
        }

        size_t getCount() const
        {
            return m_count;
        }

    protected:
        struct Entry
        {
            char              name[MAX_CHIP_NAME_LENGTH + 1];
            ChipBridgeFactory create;
        };

        Entry* findEntry(const char* pName);
        const Entry* findEntry(const char* pName) const;

        Entry             m_entries[MAX_CHIP_VARIANTS];
        size_t            m_count = 0;
        ChipBridgeFactory m_genericFactory;
};


// Returns the process wide registry, populated from g_supportedChips with g_genericChip as the fallback.
ChipRegistry* getChipRegistry();


// Register set shared by the RI5CY/OR10N style debug units: GPRs 0-31, NPC as 32 and PPC as 33.
extern const DeviceRegisterSet g_defaultRegisterSet;

// Memory layout used when neither the chip nor the configuration supply one: the 512k L2 found on PULP chips.
const DeviceMemoryLayout* deviceDefaultMemoryLayout();


// The list of all supported chips can be found in this table, defined in devices/devices.cpp
extern const ChipVariant g_supportedChips[];
extern const size_t      g_supportedChipsLength;
// Fallback used for any chip identity which isn't in g_supportedChips.
extern const ChipVariant g_genericChip;

#endif // DEVICES_H_
