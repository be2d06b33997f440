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
// Abstract byte pipe to the physical debug link (JTAG adapter, USB bridge, TCP proxy to a cable server, etc).
// The concrete implementation lives outside of this library and is handed to createBridge() by the caller.
#ifndef TRANSPORT_H_
#define TRANSPORT_H_

#include <stdint.h>
#include <stddef.h>


// Result of each Transport operation.
enum TransportResult
{
    TRANSPORT_SUCCESS = 0,
    // The link failed (adapter unplugged, target unpowered, I/O error).
    TRANSPORT_ERROR,
    // The operation didn't complete within the requested time.
    TRANSPORT_TIMEOUT
};


class Transport
{
    public:
        virtual ~Transport() {}

        // Derived classes must implement these virtual methods.

        // Claim and open the physical link. Called from DebugBridge::attach().
        virtual TransportResult open() = 0;

        // Release the physical link. Must be safe to call on a link that failed to open.
        virtual void close() = 0;

        // Send all bufferSize bytes from pBuffer to the target.
        virtual TransportResult send(const void* pBuffer, size_t bufferSize) = 0;

        // Receive exactly bufferSize bytes into pBuffer, giving up after timeout_ms milliseconds.
        virtual TransportResult receive(void* pBuffer, size_t bufferSize, uint32_t timeout_ms) = 0;

        // Pulse the target's reset line for pulse_ms milliseconds.
        virtual TransportResult resetTarget(uint32_t pulse_ms) = 0;

        // Run the link clock at the requested frequency (Hz). The link may pick a lower rate.
        virtual TransportResult setClockFrequency(uint32_t frequency) = 0;
};

#endif // TRANSPORT_H_
