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
// DebugBridge base class which implements the attach/load/run/stop/step state machine shared by every chip.
#define BRIDGE_MODULE "debug_bridge.cpp"
#include "logging.h"
#include <assert.h>
#include <stdarg.h>
#include <string.h>
#include <time.h>
#include "debug_bridge.h"


DebugBridge::DebugBridge(const ChipDescription* pChip, const BridgeConfig* pConfig, Transport* pTransport,
                         const BinarySet* pBinaries, bool verbose)
{
    assert ( pChip != NULL && pConfig != NULL );

    m_pChip = pChip;
    m_config = *pConfig;
    m_pTransport = pTransport;
    m_pBinaries = pBinaries;
    m_verbose = verbose;
    bridgeErrorClear(&m_lastError);

    if (m_config.timeout_ms != 0)
    {
        m_timeout_ms = m_config.timeout_ms;
    }

    // Memory regions from the configuration replace the chip's built-in layout.
    if (m_config.memoryRegionCount > 0)
    {
        m_memoryLayout.pRegions = m_config.memoryRegions;
        m_memoryLayout.regionCount = m_config.memoryRegionCount;
    }
    else if (m_pChip->pMemoryLayout != NULL)
    {
        m_memoryLayout = *m_pChip->pMemoryLayout;
    }
    else
    {
        m_memoryLayout = *deviceDefaultMemoryLayout();
    }

    m_coreCount = m_config.coreCount ? m_config.coreCount : m_pChip->defaultCoreCount;
    m_clockFrequency = m_pChip->maximumClockFrequency;
    if (m_config.clockFrequency != 0 && m_config.clockFrequency < m_clockFrequency)
    {
        m_clockFrequency = m_config.clockFrequency;
    }

    m_configValid = validateConfig();
}

bool DebugBridge::validateConfig()
{
    beginOperation("create_bridge");
    if (m_pTransport == NULL)
    {
        setError(BRIDGE_CONFIGURATION_ERROR, "no transport was supplied");
        return false;
    }
    if (m_coreCount == 0 || m_coreCount > m_pChip->maximumCoreCount || m_coreCount > MAX_CORES)
    {
        setError(BRIDGE_CONFIGURATION_ERROR, "%u cores requested but %s supports 1 to %u",
                 m_coreCount, m_pChip->pName, m_pChip->maximumCoreCount);
        return false;
    }
    return true;
}

DebugBridge::~DebugBridge()
{
    releaseTransport();
}


bool DebugBridge::attach()
{
    beginOperation("attach");
    if (m_state != BRIDGE_STATE_UNATTACHED && m_state != BRIDGE_STATE_DETACHED)
    {
        setError(BRIDGE_INVALID_STATE_ERROR, "can't attach while %s%s", stateName(m_state),
                 m_state == BRIDGE_STATE_DEGRADED ? " (detach first)" : "");
        return false;
    }
    if (!m_configValid)
    {
        setError(BRIDGE_CONFIGURATION_ERROR, "bridge configuration is invalid");
        return false;
    }

    logVerboseF(m_verbose, "%s: Opening transport.", getChipName());
    TransportResult result = m_pTransport->open();
    if (result != TRANSPORT_SUCCESS)
    {
        // Transport implementations must accept close() after a failed open().
        m_pTransport->close();
        setError(BRIDGE_TRANSPORT_ERROR, "failed to establish the physical link");
        m_lastError.timedOut = result == TRANSPORT_TIMEOUT;
        return false;
    }
    m_transportOpen = true;

    logVerboseF(m_verbose, "%s: Setting link clock to %u Hz.", getChipName(), m_clockFrequency);
    result = m_pTransport->setClockFrequency(m_clockFrequency);
    if (result != TRANSPORT_SUCCESS)
    {
        setError(BRIDGE_TRANSPORT_ERROR, "failed to set the link clock to %u Hz", m_clockFrequency);
        m_lastError.timedOut = result == TRANSPORT_TIMEOUT;
        releaseTransport();
        return false;
    }

    m_link.init(m_pTransport, m_timeout_ms);
    m_entryPoint = 0;
    m_loadIncomplete = false;
    m_selectedCore = 0;
    if (!resetAndHandshake())
    {
        // m_state is still unattached/detached so the failure above didn't mark the bridge as degraded.
        releaseTransport();
        return false;
    }

    m_state = BRIDGE_STATE_STOPPED;
    logVerboseF(m_verbose, "%s: Attached with %u core(s) halted.", getChipName(), m_coreCount);
    return true;
}

bool DebugBridge::detach()
{
    beginOperation("detach");
    if (m_state == BRIDGE_STATE_DETACHED)
    {
        return true;
    }

    releaseTransport();
    m_state = BRIDGE_STATE_DETACHED;
    logVerboseF(m_verbose, "%s: Detached.", getChipName());
    return true;
}

void DebugBridge::releaseTransport()
{
    m_link.uninit();
    if (m_transportOpen)
    {
        m_pTransport->close();
        m_transportOpen = false;
    }
}

bool DebugBridge::reset()
{
    beginOperation("reset");
    if (!requireAttached())
    {
        return false;
    }

    logVerboseF(m_verbose, "%s: Resetting target.", getChipName());
    if (!resetAndHandshake())
    {
        // The target didn't come back from reset in a known state.
        m_state = BRIDGE_STATE_DEGRADED;
        return false;
    }
    m_state = BRIDGE_STATE_STOPPED;
    return true;
}


bool DebugBridge::load()
{
    return load(m_pBinaries);
}

bool DebugBridge::load(const BinarySet* pBinaries)
{
    beginOperation("load");
    if (!requireMemoryAccess())
    {
        return false;
    }
    if (pBinaries == NULL || pBinaries->imageCount == 0)
    {
        logVerboseF(m_verbose, "%s: Nothing to load.", getChipName());
        return true;
    }
    // Every image is checked before anything is sent to the target.
    if (!validateImages(pBinaries))
    {
        return false;
    }

    uint32_t entryPoint = 0;
    uint32_t totalBytes = 0;
    m_loadIncomplete = false;
    for (size_t i = 0 ; i < pBinaries->imageCount ; i++)
    {
        const BinaryImage* pImage = &pBinaries->pImages[i];
        if (!writeImage(pImage))
        {
            m_loadIncomplete = true;
            return false;
        }
        if (entryPoint == 0)
        {
            entryPoint = pImage->entryPoint;
        }
        totalBytes += pImage->size;
    }

    if (entryPoint != 0)
    {
        m_entryPoint = entryPoint;
        logVerboseF(m_verbose, "%s: Entry point is 0x%08X.", getChipName(), entryPoint);
    }
    logVerboseF(m_verbose, "%s: Loaded %u bytes from %zu image(s).", getChipName(), totalBytes, pBinaries->imageCount);
    return true;
}

bool DebugBridge::validateImages(const BinarySet* pBinaries)
{
    if (pBinaries->pImages == NULL)
    {
        setError(BRIDGE_CONFIGURATION_ERROR, "binary set has %zu images but no image array", pBinaries->imageCount);
        return false;
    }

    for (size_t i = 0 ; i < pBinaries->imageCount ; i++)
    {
        const BinaryImage* pImage = &pBinaries->pImages[i];
        if (pImage->size == 0)
        {
            continue;
        }
        if (pImage->pData == NULL)
        {
            setErrorWithAddress(BRIDGE_CONFIGURATION_ERROR, pImage->address,
                                "image %zu at 0x%08X has no data", i, pImage->address);
            return false;
        }
        if (!isLoadable(pImage->address, pImage->size))
        {
            setErrorWithAddress(BRIDGE_OUT_OF_RANGE_ERROR, pImage->address,
                                "image %zu (0x%08X - 0x%08llX) doesn't fit in a loadable memory region",
                                i, pImage->address, (unsigned long long)pImage->address + pImage->size - 1);
            return false;
        }
    }
    return true;
}

bool DebugBridge::isLoadable(uint32_t address, uint32_t size)
{
    uint64_t end = (uint64_t)address + size;

    for (uint32_t i = 0 ; i < m_memoryLayout.regionCount ; i++)
    {
        const DeviceMemoryRegion* pRegion = &m_memoryLayout.pRegions[i];
        uint64_t regionEnd = (uint64_t)pRegion->address + pRegion->length;

        if (pRegion->type == DEVICE_MEMORY_ROM)
        {
            continue;
        }
        if (address >= pRegion->address && end <= regionEnd)
        {
            return true;
        }
    }
    return false;
}

bool DebugBridge::writeImage(const BinaryImage* pImage)
{
    uint32_t address = pImage->address;
    const uint8_t* pCurr = pImage->pData;
    uint32_t bytesLeft = pImage->size;

    logVerboseF(m_verbose, "%s: Loading %u bytes to 0x%08X.", getChipName(), pImage->size, pImage->address);
    while (bytesLeft > 0)
    {
        uint32_t chunkSize = bytesLeft > LOAD_PROGRESS_INTERVAL ? LOAD_PROGRESS_INTERVAL : bytesLeft;
        uint32_t bytesWritten = m_link.writeMemory(address, pCurr, chunkSize);
        if (bytesWritten != chunkSize)
        {
            setLinkError(address + bytesWritten, "image write");
            return false;
        }

        address += chunkSize;
        pCurr += chunkSize;
        bytesLeft -= chunkSize;
        logVerboseF(m_verbose, "%s:   %u/%u bytes", getChipName(), pImage->size - bytesLeft, pImage->size);
    }
    return true;
}


bool DebugBridge::run()
{
    beginOperation("run");
    if (!requireAttached())
    {
        return false;
    }
    if (m_state == BRIDGE_STATE_RUNNING)
    {
        return true;
    }

    if (m_entryPoint != 0)
    {
        logVerboseF(m_verbose, "%s: Starting execution at 0x%08X.", getChipName(), m_entryPoint);
        if (!setEntryPoint(m_entryPoint))
        {
            return false;
        }
        m_entryPoint = 0;
    }
    if (!resumeAllCores())
    {
        return false;
    }
    m_state = BRIDGE_STATE_RUNNING;
    logVerboseF(m_verbose, "%s: Running.", getChipName());
    return true;
}

bool DebugBridge::stop()
{
    beginOperation("stop");
    if (!requireAttached())
    {
        return false;
    }
    if (m_state == BRIDGE_STATE_STOPPED)
    {
        return true;
    }

    if (!haltAllCores())
    {
        return false;
    }
    m_state = BRIDGE_STATE_STOPPED;
    logVerboseF(m_verbose, "%s: Stopped.", getChipName());
    return true;
}

bool DebugBridge::step()
{
    beginOperation("step");
    if (!requireStopped())
    {
        return false;
    }

    if (!stepCore(m_selectedCore))
    {
        return false;
    }
    logVerboseF(m_verbose, "%s: Stepped core %u.", getChipName(), m_selectedCore);
    return true;
}


bool DebugBridge::readMemory(uint32_t address, void* pvBuffer, uint32_t bufferSize)
{
    beginOperation("read_memory");
    if (!requireMemoryAccess())
    {
        return false;
    }
    if ((uint64_t)address + bufferSize > 0x100000000ULL)
    {
        setErrorWithAddress(BRIDGE_OUT_OF_RANGE_ERROR, address, "%u bytes at 0x%08X wraps around", bufferSize, address);
        return false;
    }

    uint32_t bytesRead = m_link.readMemory(address, pvBuffer, bufferSize);
    if (bytesRead != bufferSize)
    {
        setLinkError(address + bytesRead, "memory read");
        return false;
    }
    return true;
}

bool DebugBridge::writeMemory(uint32_t address, const void* pvBuffer, uint32_t bufferSize)
{
    beginOperation("write_memory");
    if (!requireMemoryAccess())
    {
        return false;
    }
    if ((uint64_t)address + bufferSize > 0x100000000ULL)
    {
        setErrorWithAddress(BRIDGE_OUT_OF_RANGE_ERROR, address, "%u bytes at 0x%08X wraps around", bufferSize, address);
        return false;
    }

    uint32_t bytesWritten = m_link.writeMemory(address, pvBuffer, bufferSize);
    if (bytesWritten != bufferSize)
    {
        setLinkError(address + bytesWritten, "memory write");
        return false;
    }
    return true;
}


bool DebugBridge::readRegister(uint32_t registerId, uint32_t* pValue)
{
    uint32_t offset = 0;

    beginOperation("read_register");
    if (!requireStopped())
    {
        return false;
    }
    if (!findRegister(registerId, &offset))
    {
        setErrorWithAddress(BRIDGE_UNKNOWN_REGISTER_ERROR, registerId, "register %u isn't part of %s's register set",
                            registerId, m_pChip->pName);
        return false;
    }
    return readDebugRegister(m_selectedCore, offset, pValue);
}

bool DebugBridge::writeRegister(uint32_t registerId, uint32_t value)
{
    uint32_t offset = 0;

    beginOperation("write_register");
    if (!requireStopped())
    {
        return false;
    }
    if (!findRegister(registerId, &offset))
    {
        setErrorWithAddress(BRIDGE_UNKNOWN_REGISTER_ERROR, registerId, "register %u isn't part of %s's register set",
                            registerId, m_pChip->pName);
        return false;
    }
    return writeDebugRegister(m_selectedCore, offset, value);
}

bool DebugBridge::findRegister(uint32_t registerId, uint32_t* pOffset)
{
    const DeviceRegisterSet* pSet = m_pChip->pRegisterSet ? m_pChip->pRegisterSet : &g_defaultRegisterSet;

    for (uint32_t i = 0 ; i < pSet->bankCount ; i++)
    {
        const DeviceRegisterBank* pBank = &pSet->pBanks[i];
        if (registerId >= pBank->firstId && registerId - pBank->firstId < pBank->count)
        {
            *pOffset = pBank->debugUnitOffset + (registerId - pBank->firstId) * sizeof(uint32_t);
            return true;
        }
    }
    return false;
}


bool DebugBridge::selectCore(uint32_t coreIndex)
{
    beginOperation("select_core");
    if (coreIndex >= m_coreCount)
    {
        setError(BRIDGE_INVALID_STATE_ERROR, "core %u doesn't exist (%u cores under debug)", coreIndex, m_coreCount);
        return false;
    }
    m_selectedCore = coreIndex;
    return true;
}

void DebugBridge::setTimeout(uint32_t timeout_ms)
{
    m_timeout_ms = timeout_ms ? timeout_ms : DEFAULT_OPERATION_TIMEOUT_MS;
    m_link.setTimeout(m_timeout_ms);
}


bool DebugBridge::setEntryPoint(uint32_t entryPoint)
{
    return writeDebugRegister(0, DBG_NPC, entryPoint);
}

bool DebugBridge::isMemoryAccessAllowedWhileRunning()
{
    switch (m_config.liveMemoryAccess)
    {
        case SETTING_ENABLED:
            return true;
        case SETTING_DISABLED:
            return false;
        default:
            return m_pChip->liveMemoryAccess;
    }
}


bool DebugBridge::pulseReset()
{
    logVerboseF(m_verbose, "%s: Pulsing reset for %d ms.", getChipName(), RESET_PULSE_MS);
    TransportResult result = m_pTransport->resetTarget(RESET_PULSE_MS);
    if (result != TRANSPORT_SUCCESS)
    {
        setError(BRIDGE_TRANSPORT_ERROR, "failed to pulse the reset line");
        m_lastError.timedOut = result == TRANSPORT_TIMEOUT;
        return false;
    }
    return true;
}

bool DebugBridge::checkIdCode()
{
    uint32_t idCode = 0;
    if (!m_link.readIdCode(&idCode))
    {
        setLinkError(0, "IDCODE read");
        return false;
    }
    logVerboseF(m_verbose, "%s: IDCODE=0x%08X", getChipName(), idCode);

    if (idCode == 0x00000000 || idCode == 0xFFFFFFFF)
    {
        setError(BRIDGE_PROTOCOL_ERROR, "IDCODE 0x%08X indicates that no target is responding", idCode);
        return false;
    }

    uint32_t expected = m_pChip->idCode;
    uint32_t mask = m_pChip->idCodeMask;
    if (m_config.idCode != 0)
    {
        expected = m_config.idCode;
        mask = 0xFFFFFFFF;
    }
    if ((idCode & mask) != (expected & mask))
    {
        setError(BRIDGE_PROTOCOL_ERROR, "IDCODE 0x%08X doesn't match the expected 0x%08X", idCode, expected);
        return false;
    }
    return true;
}

bool DebugBridge::haltCore(uint32_t coreIndex)
{
    return writeDebugRegister(coreIndex, DBG_CTRL, DBG_CTRL_HALT) && waitForHalt(coreIndex);
}

bool DebugBridge::haltAllCores()
{
    // Request every halt up front so that the cores stop as close together as possible.
    for (uint32_t i = 0 ; i < m_coreCount ; i++)
    {
        if (!writeDebugRegister(i, DBG_CTRL, DBG_CTRL_HALT))
        {
            return false;
        }
    }
    for (uint32_t i = 0 ; i < m_coreCount ; i++)
    {
        if (!waitForHalt(i))
        {
            return false;
        }
    }
    return true;
}

bool DebugBridge::resumeAllCores()
{
    // The boot core is released last.
    for (uint32_t i = m_coreCount ; i-- > 0 ; )
    {
        if (!writeDebugRegister(i, DBG_HIT, 0) || !writeDebugRegister(i, DBG_CTRL, 0))
        {
            return false;
        }
    }
    return true;
}

bool DebugBridge::stepCore(uint32_t coreIndex)
{
    if (!writeDebugRegister(coreIndex, DBG_CTRL, DBG_CTRL_SSTE) || !waitForHalt(coreIndex))
    {
        return false;
    }
    return writeDebugRegister(coreIndex, DBG_CTRL, DBG_CTRL_HALT) && writeDebugRegister(coreIndex, DBG_HIT, 0);
}

bool DebugBridge::waitForHalt(uint32_t coreIndex)
{
    uint64_t endTime = getTimeInMs() + m_timeout_ms;
    uint32_t dbgCtrl = 0;

    do
    {
        if (!readDebugRegister(coreIndex, DBG_CTRL, &dbgCtrl))
        {
            return false;
        }
        if (dbgCtrl & DBG_CTRL_HALT)
        {
            return true;
        }
    } while (getTimeInMs() < endTime);

    setTimeoutError(getDebugUnitAddress(coreIndex), "halt wait");
    return false;
}

bool DebugBridge::readDebugRegister(uint32_t coreIndex, uint32_t offset, uint32_t* pValue)
{
    return readTargetWord(getDebugUnitAddress(coreIndex) + offset, pValue);
}

bool DebugBridge::writeDebugRegister(uint32_t coreIndex, uint32_t offset, uint32_t value)
{
    return writeTargetWord(getDebugUnitAddress(coreIndex) + offset, value);
}

bool DebugBridge::readTargetWord(uint32_t address, uint32_t* pValue)
{
    if (!m_link.readWord(address, pValue))
    {
        setLinkError(address, "read");
        return false;
    }
    return true;
}

bool DebugBridge::writeTargetWord(uint32_t address, uint32_t value)
{
    if (!m_link.writeWord(address, value))
    {
        setLinkError(address, "write");
        return false;
    }
    return true;
}


bool DebugBridge::beginOperation(const char* pOperation)
{
    m_pOperation = pOperation;
    bridgeErrorClear(&m_lastError);
    m_lastError.pOperation = pOperation;
    return true;
}

bool DebugBridge::requireAttached()
{
    switch (m_state)
    {
        case BRIDGE_STATE_STOPPED:
        case BRIDGE_STATE_RUNNING:
            return true;
        case BRIDGE_STATE_DEGRADED:
            setError(BRIDGE_INVALID_STATE_ERROR, "target state is unknown after a timeout; detach and attach again");
            return false;
        default:
            setError(BRIDGE_INVALID_STATE_ERROR, "not valid while %s", stateName(m_state));
            return false;
    }
}

bool DebugBridge::requireStopped()
{
    if (!requireAttached())
    {
        return false;
    }
    if (m_state != BRIDGE_STATE_STOPPED)
    {
        setError(BRIDGE_INVALID_STATE_ERROR, "only valid while stopped");
        return false;
    }
    return true;
}

bool DebugBridge::requireMemoryAccess()
{
    if (!requireAttached())
    {
        return false;
    }
    if (m_state == BRIDGE_STATE_RUNNING && !isMemoryAccessAllowedWhileRunning())
    {
        setError(BRIDGE_INVALID_STATE_ERROR, "%s only allows memory access while stopped", m_pChip->pName);
        return false;
    }
    return true;
}


void DebugBridge::setError(BridgeErrorCode code, const char* pFormat, ...)
{
    va_list args;

    va_start(args, pFormat);
    bridgeErrorSetV(&m_lastError, code, getChipName(), m_pOperation, pFormat, args);
    va_end(args);
    logErrorF("%s: %s failed with %s: %s", getChipName(), m_pOperation, bridgeErrorName(code), m_lastError.message);
}

void DebugBridge::setErrorWithAddress(BridgeErrorCode code, uint32_t address, const char* pFormat, ...)
{
    va_list args;

    va_start(args, pFormat);
    bridgeErrorSetV(&m_lastError, code, getChipName(), m_pOperation, pFormat, args);
    va_end(args);
    bridgeErrorSetAddress(&m_lastError, address);
    logErrorF("%s: %s failed with %s at 0x%08X: %s",
              getChipName(), m_pOperation, bridgeErrorName(code), address, m_lastError.message);
}

void DebugBridge::setLinkError(uint32_t address, const char* pWhat)
{
    TargetLink::LinkError linkError = m_link.getLastError();

    switch (linkError)
    {
        case TargetLink::LINK_TIMEOUT:
            setTimeoutError(address, pWhat);
            break;
        case TargetLink::LINK_PROTOCOL:
            setErrorWithAddress(BRIDGE_PROTOCOL_ERROR, address, "malformed response to %s", pWhat);
            break;
        default:
            setErrorWithAddress(BRIDGE_TRANSPORT_ERROR, address, "%s failed (%s)", pWhat,
                                TargetLink::errorName(linkError));
            break;
    }
}

void DebugBridge::setTimeoutError(uint32_t address, const char* pWhat)
{
    setErrorWithAddress(BRIDGE_TRANSPORT_ERROR, address, "%s timed out after %u ms", pWhat, m_timeout_ms);
    m_lastError.timedOut = true;
    if (m_state == BRIDGE_STATE_STOPPED || m_state == BRIDGE_STATE_RUNNING)
    {
        m_state = BRIDGE_STATE_DEGRADED;
    }
}

uint64_t DebugBridge::getTimeInMs()
{
    struct timespec now;

    clock_gettime(CLOCK_MONOTONIC, &now);
    return (uint64_t)now.tv_sec * 1000 + now.tv_nsec / 1000000;
}

const char* DebugBridge::stateName(BridgeState state)
{
    switch (state)
    {
        case BRIDGE_STATE_UNATTACHED:
            return "unattached";
        case BRIDGE_STATE_STOPPED:
            return "stopped";
        case BRIDGE_STATE_RUNNING:
            return "running";
        case BRIDGE_STATE_DEGRADED:
            return "degraded";
        case BRIDGE_STATE_DETACHED:
            return "detached";
    }
    return "unknown";
}
