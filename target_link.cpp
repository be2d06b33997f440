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
// Debug command layer which runs on top of a Transport and gives memory mapped access to the target.
#define LINK_MODULE "target_link.cpp"
#include "logging.h"
#include <assert.h>
#include <string.h>
#include "target_link.h"


TargetLink::TargetLink()
{
}

void TargetLink::init(Transport* pTransport, uint32_t timeout_ms)
{
    assert ( pTransport != NULL );
    m_pTransport = pTransport;
    m_timeout_ms = timeout_ms;
    m_totalFramesSent = 0;
    m_totalBytesWritten = 0;
    m_lastError = LINK_SUCCESS;
}

void TargetLink::uninit()
{
    m_pTransport = NULL;
}

bool TargetLink::readIdCode(uint32_t* pIdCode)
{
    uint8_t idCode[sizeof(uint32_t)];

    m_lastError = LINK_SUCCESS;
    if (!sendRequest(LINK_OP_IDCODE, 0, sizeof(idCode), NULL) || !receiveAck() || !receivePayload(idCode, sizeof(idCode)))
    {
        return false;
    }
    *pIdCode = unpackU32(idCode);
    logDebugF("IDCODE=0x%08X", *pIdCode);
    return true;
}

uint32_t TargetLink::readMemory(uint32_t address, void* pvBuffer, uint32_t bufferSize)
{
    uint32_t totalBytesRead = 0;
    uint32_t bytesLeft = bufferSize;
    uint8_t* pBuffer = (uint8_t*)pvBuffer;

    m_lastError = LINK_SUCCESS;
    while (bytesLeft > 0)
    {
        uint32_t bytesRead = readChunk(address, pBuffer, bytesLeft);
        if (bytesRead == 0)
        {
            // No retries at this level. The caller decides what to do with a failed transfer.
            logErrorF("Failed to read from address 0x%08X (%s).", address, errorName(m_lastError));
            return totalBytesRead;
        }

        address += bytesRead;
        pBuffer += bytesRead;
        bytesLeft -= bytesRead;
        totalBytesRead += bytesRead;
    }

    return totalBytesRead;
}

uint32_t TargetLink::readChunk(uint32_t address, uint8_t* pDest, uint32_t bufferSize)
{
    uint32_t chunkSize = calculateChunkSize(address, bufferSize);

    if (!sendRequest(LINK_OP_READ, address, chunkSize, NULL) || !receiveAck() || !receivePayload(pDest, chunkSize))
    {
        return 0;
    }
    return chunkSize;
}

uint32_t TargetLink::writeMemory(uint32_t address, const void* pvBuffer, uint32_t bufferSize)
{
    uint32_t totalBytesWritten = 0;
    uint32_t bytesLeft = bufferSize;
    const uint8_t* pBuffer = (const uint8_t*)pvBuffer;

    m_lastError = LINK_SUCCESS;
    while (bytesLeft > 0)
    {
        uint32_t bytesWritten = writeChunk(address, pBuffer, bytesLeft);
        if (bytesWritten == 0)
        {
            logErrorF("Failed to write to address 0x%08X (%s).", address, errorName(m_lastError));
            return totalBytesWritten;
        }

        address += bytesWritten;
        pBuffer += bytesWritten;
        bytesLeft -= bytesWritten;
        totalBytesWritten += bytesWritten;
    }

    return totalBytesWritten;
}

uint32_t TargetLink::writeChunk(uint32_t address, const uint8_t* pSrc, uint32_t bufferSize)
{
    uint32_t chunkSize = calculateChunkSize(address, bufferSize);

    if (!sendRequest(LINK_OP_WRITE, address, chunkSize, pSrc) || !receiveAck())
    {
        return 0;
    }
    m_totalBytesWritten += chunkSize;
    return chunkSize;
}

uint32_t TargetLink::calculateChunkSize(uint32_t address, uint32_t bytesLeft)
{
    // Have each frame stop at the next LINK_MAX_TRANSFER_SIZE boundary and let the caller deal with starting the
    // next chunk. This keeps every frame within a single auto-increment window on the target side.
    uint32_t offsetInChunk = address & (LINK_MAX_TRANSFER_SIZE - 1);
    uint32_t bytesToNextChunk = LINK_MAX_TRANSFER_SIZE - offsetInChunk;
    return (bytesLeft > bytesToNextChunk) ? bytesToNextChunk : bytesLeft;
}

bool TargetLink::readWord(uint32_t address, uint32_t* pValue)
{
    uint8_t buffer[sizeof(uint32_t)];
    if (readMemory(address, buffer, sizeof(buffer)) != sizeof(buffer))
    {
        return false;
    }
    *pValue = unpackU32(buffer);
    return true;
}

bool TargetLink::writeWord(uint32_t address, uint32_t value)
{
    uint8_t buffer[sizeof(uint32_t)];
    packU32(buffer, value);
    return writeMemory(address, buffer, sizeof(buffer)) == sizeof(buffer);
}

bool TargetLink::sendRequest(LinkOp op, uint32_t address, uint32_t length, const uint8_t* pPayload)
{
    assert ( m_pTransport != NULL );
    assert ( length <= LINK_MAX_TRANSFER_SIZE );

    // The whole frame is built up in m_frame so that it goes out in a single send() call.
    uint32_t frameSize = REQUEST_HEADER_SIZE;
    m_frame[0] = (uint8_t)op;
    packU32(&m_frame[1], address);
    packU32(&m_frame[5], length);
    if (pPayload)
    {
        memcpy(&m_frame[REQUEST_HEADER_SIZE], pPayload, length);
        frameSize += length;
    }

    m_totalFramesSent++;
    return handleTransportResult(m_pTransport->send(m_frame, frameSize));
}

bool TargetLink::receiveAck()
{
    uint8_t ack = 0;
    if (!handleTransportResult(m_pTransport->receive(&ack, sizeof(ack), m_timeout_ms)))
    {
        return false;
    }

    switch (ack)
    {
        case ACK_OK:
            return true;
        case ACK_WAIT:
            m_lastError = LINK_WAIT;
            return false;
        case ACK_FAULT:
            m_lastError = LINK_FAULT;
            return false;
        default:
            // Any unrecognized response will be treated as a protocol error.
            logErrorF("Received invalid ACK value 0x%02X.", ack);
            m_lastError = LINK_PROTOCOL;
            return false;
    }
}

bool TargetLink::receivePayload(void* pBuffer, uint32_t bufferSize)
{
    return handleTransportResult(m_pTransport->receive(pBuffer, bufferSize, m_timeout_ms));
}

bool TargetLink::handleTransportResult(TransportResult result)
{
    switch (result)
    {
        case TRANSPORT_SUCCESS:
            return true;
        case TRANSPORT_TIMEOUT:
            m_lastError = LINK_TIMEOUT;
            return false;
        default:
            m_lastError = LINK_TRANSPORT;
            return false;
    }
}

const char* TargetLink::errorName(LinkError error)
{
    switch (error)
    {
        case LINK_SUCCESS:
            return "success";
        case LINK_TRANSPORT:
            return "transport failure";
        case LINK_TIMEOUT:
            return "timeout";
        case LINK_PROTOCOL:
            return "malformed response";
        case LINK_WAIT:
            return "target busy";
        case LINK_FAULT:
            return "target fault";
    }
    return "unknown";
}

void TargetLink::packU32(uint8_t* pDest, uint32_t value)
{
    pDest[0] = value & 0xFF;
    pDest[1] = (value >> 8) & 0xFF;
    pDest[2] = (value >> 16) & 0xFF;
    pDest[3] = (value >> 24) & 0xFF;
}

uint32_t TargetLink::unpackU32(const uint8_t* pSrc)
{
    return (uint32_t)pSrc[0] | ((uint32_t)pSrc[1] << 8) | ((uint32_t)pSrc[2] << 16) | ((uint32_t)pSrc[3] << 24);
}
