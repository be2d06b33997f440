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
// DebugBridge base class which implements the attach/load/run/stop/step state machine shared by every chip. The
// chip specific subclasses found in devices/ supply the reset sequence, debug unit addresses and entry point
// handling.
#ifndef DEBUG_BRIDGE_H_
#define DEBUG_BRIDGE_H_

#include <stdint.h>
#include "config.h"
#include "binary_set.h"
#include "bridge_config.h"
#include "bridge_error.h"
#include "target_link.h"
#include "transport.h"
#include "devices/devices.h"


// States of the bridge's connection to the target.
enum BridgeState
{
    // Constructed but attach() hasn't succeeded yet.
    BRIDGE_STATE_UNATTACHED,
    // Attached with the cores halted.
    BRIDGE_STATE_STOPPED,
    // Attached with the cores executing.
    BRIDGE_STATE_RUNNING,
    // Attached but a blocking operation timed out so the target state is unknown. Only detach() is accepted.
    BRIDGE_STATE_DEGRADED,
    // detach() has released the transport. attach() can be called again to start over.
    BRIDGE_STATE_DETACHED
};


class DebugBridge
{
    public:
        DebugBridge(const ChipDescription* pChip, const BridgeConfig* pConfig, Transport* pTransport,
                    const BinarySet* pBinaries, bool verbose);
        virtual ~DebugBridge();

        // The transport claimed by an attached bridge is a unique resource.
        DebugBridge(const DebugBridge& other) = delete;
        DebugBridge& operator=(const DebugBridge& other) = delete;

        // Every operation below returns true on success. On failure it returns false and getLastError() describes
        // what went wrong. A successful call resets getLastError() to BRIDGE_SUCCESS.

        // Open the transport, apply the link clock and run the chip's reset/handshake sequence. Leaves the target in
        // the BRIDGE_STATE_STOPPED state. Valid from BRIDGE_STATE_UNATTACHED and BRIDGE_STATE_DETACHED.
        bool attach();

        // Stream the images of pBinaries into target memory. Every image is checked against the memory layout before
        // the first byte is sent. A failure partway through leaves the images already written in place and sets
        // isLoadIncomplete().
        bool load(const BinarySet* pBinaries);
        // Load the BinarySet handed to the constructor.
        bool load();

        // Release the cores from halt. Does nothing if already running.
        bool run();
        // Halt the cores. Does nothing if already stopped.
        bool stop();
        // Execute a single instruction on the selected core. Only valid while stopped.
        bool step();

        bool readMemory(uint32_t address, void* pvBuffer, uint32_t bufferSize);
        bool writeMemory(uint32_t address, const void* pvBuffer, uint32_t bufferSize);

        // Access a register of the selected core. Only valid while stopped. Register ids which aren't part of the
        // chip's register set fail with BRIDGE_UNKNOWN_REGISTER_ERROR.
        bool readRegister(uint32_t registerId, uint32_t* pValue);
        bool writeRegister(uint32_t registerId, uint32_t value);

        // Release the transport. Valid from any state and calling it again does nothing.
        bool detach();

        // Pulse the reset line and redo the chip's handshake. Leaves the target stopped.
        bool reset();

        // Select the core that register accesses and step() act upon.
        bool selectCore(uint32_t coreIndex);

        // Time limit for each transport round trip and each wait for a core to halt.
        void setTimeout(uint32_t timeout_ms);

        BridgeState getState() const
        {
            return m_state;
        }
        const char* getChipName() const
        {
            return m_config.chipName;
        }
        uint32_t getCoreCount() const
        {
            return m_coreCount;
        }
        uint32_t getSelectedCore() const
        {
            return m_selectedCore;
        }
        const DeviceMemoryLayout* getMemoryLayout() const
        {
            return &m_memoryLayout;
        }
        const ChipDescription* getChipDescription() const
        {
            return m_pChip;
        }
        const BridgeError* getLastError() const
        {
            return &m_lastError;
        }
        // Returns true if the last load() failed after some of its bytes were already sent.
        bool isLoadIncomplete() const
        {
            return m_loadIncomplete;
        }
        bool isVerbose() const
        {
            return m_verbose;
        }
        // Returns false if the BridgeConfig handed to the constructor can't be used with this chip. getLastError()
        // holds the reason.
        bool isConfigValid() const
        {
            return m_configValid;
        }

        // Human readable name of a BridgeState value.
        static const char* stateName(BridgeState state);

    protected:
        // Derived classes must implement these virtual methods.

        // Bring a freshly opened or reset target into a halted, debuggable state. Called by attach() and reset()
        // with the link already initialized. Implementations typically call pulseReset(), checkIdCode() and then
        // halt the cores that they control.
        virtual bool resetAndHandshake() = 0;

        // Base address of the debug unit for core coreIndex (0 being the boot core).
        virtual uint32_t getDebugUnitAddress(uint32_t coreIndex) = 0;

        // Derived classes can override these virtual methods.

        // Set the address where the boot core starts executing on the next run(). Defaults to writing the boot core's
        // NPC.
        virtual bool setEntryPoint(uint32_t entryPoint);

        // Can memory be accessed while the cores run? Defaults to the chip description unless the configuration
        // overrides it.
        virtual bool isMemoryAccessAllowedWhileRunning();


        // Debug unit register offsets and bits.
        static const uint32_t DBG_CTRL = 0x0000;
        static const uint32_t DBG_HIT = 0x0004;
        static const uint32_t DBG_GPR = 0x0400;
        static const uint32_t DBG_FPR = 0x0500;
        static const uint32_t DBG_NPC = 0x2000;
        static const uint32_t DBG_PPC = 0x2004;
        static const uint32_t DBG_CTRL_HALT = 1 << 16;
        static const uint32_t DBG_CTRL_SSTE = 1 << 0;
        static const uint32_t DBG_HIT_SSTH = 1 << 0;

        // Helpers for the chip specific hooks. They all set m_lastError on failure.
        bool pulseReset();
        bool checkIdCode();
        bool haltCore(uint32_t coreIndex);
        bool haltAllCores();
        bool resumeAllCores();
        bool stepCore(uint32_t coreIndex);
        bool waitForHalt(uint32_t coreIndex);
        bool readDebugRegister(uint32_t coreIndex, uint32_t offset, uint32_t* pValue);
        bool writeDebugRegister(uint32_t coreIndex, uint32_t offset, uint32_t value);
        bool readTargetWord(uint32_t address, uint32_t* pValue);
        bool writeTargetWord(uint32_t address, uint32_t value);

        // Record a failure in m_lastError (and log it).
        void setError(BridgeErrorCode code, const char* pFormat, ...) __attribute__ ((format (printf, 3, 4)));
        void setErrorWithAddress(BridgeErrorCode code, uint32_t address, const char* pFormat, ...)
            __attribute__ ((format (printf, 4, 5)));
        // Translate the last TargetLink failure into m_lastError. Timeouts place the bridge in BRIDGE_STATE_DEGRADED.
        void setLinkError(uint32_t address, const char* pWhat);
        void setTimeoutError(uint32_t address, const char* pWhat);

        bool beginOperation(const char* pOperation);
        bool requireAttached();
        bool requireStopped();
        bool requireMemoryAccess();
        bool validateConfig();
        bool validateImages(const BinarySet* pBinaries);
        bool isLoadable(uint32_t address, uint32_t size);
        bool writeImage(const BinaryImage* pImage);
        bool findRegister(uint32_t registerId, uint32_t* pOffset);
        void releaseTransport();
        static uint64_t getTimeInMs();

        TargetLink             m_link;
        BridgeConfig           m_config;
        BridgeError            m_lastError;
        DeviceMemoryLayout     m_memoryLayout;
        const ChipDescription* m_pChip;
        Transport*             m_pTransport;
        const BinarySet*       m_pBinaries;
        const char*            m_pOperation = NULL;
        BridgeState            m_state = BRIDGE_STATE_UNATTACHED;
        uint32_t               m_timeout_ms = DEFAULT_OPERATION_TIMEOUT_MS;
        uint32_t               m_coreCount = 1;
        uint32_t               m_selectedCore = 0;
        uint32_t               m_entryPoint = 0;
        uint32_t               m_clockFrequency = 0;
        bool                   m_transportOpen = false;
        bool                   m_loadIncomplete = false;
        bool                   m_configValid = false;
        bool                   m_verbose;
};

#endif // DEBUG_BRIDGE_H_
