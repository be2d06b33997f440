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
//
// Request frame sent to the target:
//  [op u8][address u32 LE][length u32 LE][payload (WRITE only)]
// Response frame returned by the target:
//  [ack u8][payload (IDCODE: 4 bytes, READ: length bytes)]
#ifndef TARGET_LINK_H_
#define TARGET_LINK_H_

#include <stdint.h>
#include "config.h"
#include "transport.h"


class TargetLink
{
    public:
        // Operation codes placed in the first byte of each request frame.
        enum LinkOp
        {
            LINK_OP_IDCODE = 0x01,
            LINK_OP_READ = 0x02,
            LINK_OP_WRITE = 0x03
        };

        // Acknowledge values placed in the first byte of each response frame. These use the same encoding as the
        // ARM debug port ACK field.
        static const uint8_t ACK_OK = 0x1;
        static const uint8_t ACK_WAIT = 0x2;
        static const uint8_t ACK_FAULT = 0x4;

        // Number of bytes in the request header (op + address + length).
        static const uint32_t REQUEST_HEADER_SIZE = 9;

        // Error codes that can be returned by getLastError() to give more information about a failed call.
        enum LinkError
        {
            LINK_SUCCESS = 0,
            // Transport reported an I/O failure.
            LINK_TRANSPORT,
            // Transport didn't answer before the timeout expired.
            LINK_TIMEOUT,
            // Response had an ACK value which isn't one of the ones listed above.
            LINK_PROTOCOL,
            // Target was busy and asked for the request to be retried later.
            LINK_WAIT,
            // Target reported a bus fault for the requested address.
            LINK_FAULT
        };

        TargetLink();

        // Start issuing commands over an already opened transport.
        //
        // pTransport - The opened transport to be used for all future requests.
        // timeout_ms - Time to wait for each response.
        void init(Transport* pTransport, uint32_t timeout_ms);

        // Stop using the transport. It isn't closed by this call.
        void uninit();

        bool isInitialized()
        {
            return m_pTransport != NULL;
        }

        void setTimeout(uint32_t timeout_ms)
        {
            m_timeout_ms = timeout_ms;
        }

        // Read the IDCODE of the target's debug port.
        //
        // Returns true if a well formed IDCODE response was received.
        bool readIdCode(uint32_t* pIdCode);

        // Issue a target memory read. Transfers larger than LINK_MAX_TRANSFER_SIZE are split into several frames.
        //
        // Returns the number of bytes successfully read. Less than bufferSize on error.
        uint32_t readMemory(uint32_t address, void* pvBuffer, uint32_t bufferSize);

        // Issue a target memory write. Transfers larger than LINK_MAX_TRANSFER_SIZE are split into several frames.
        //
        // Returns the number of bytes successfully written. Less than bufferSize on error.
        uint32_t writeMemory(uint32_t address, const void* pvBuffer, uint32_t bufferSize);

        // 32-bit register sized helpers built on top of readMemory() / writeMemory().
        bool readWord(uint32_t address, uint32_t* pValue);
        bool writeWord(uint32_t address, uint32_t value);

        // Fetch the cause of the last call which has failed.
        LinkError getLastError()
        {
            return m_lastError;
        }

        // Human readable name of a LinkError value.
        static const char* errorName(LinkError error);

        // Retrieves the total number of frames and payload bytes sent since init().
        uint32_t getTotalFramesSent()
        {
            return m_totalFramesSent;
        }
        uint32_t getTotalBytesWritten()
        {
            return m_totalBytesWritten;
        }

    protected:
        uint32_t readChunk(uint32_t address, uint8_t* pDest, uint32_t bufferSize);
        uint32_t writeChunk(uint32_t address, const uint8_t* pSrc, uint32_t bufferSize);
        static uint32_t calculateChunkSize(uint32_t address, uint32_t bytesLeft);
        bool sendRequest(LinkOp op, uint32_t address, uint32_t length, const uint8_t* pPayload);
        bool receiveAck();
        bool receivePayload(void* pBuffer, uint32_t bufferSize);
        bool handleTransportResult(TransportResult result);
        static void packU32(uint8_t* pDest, uint32_t value);
        static uint32_t unpackU32(const uint8_t* pSrc);

        Transport* m_pTransport = NULL;
        uint32_t   m_timeout_ms = DEFAULT_OPERATION_TIMEOUT_MS;
        uint32_t   m_totalFramesSent = 0;
        uint32_t   m_totalBytesWritten = 0;
        LinkError  m_lastError = LINK_SUCCESS;
        uint8_t    m_frame[REQUEST_HEADER_SIZE + LINK_MAX_TRANSFER_SIZE];
};

#endif // TARGET_LINK_H_
