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
// Error taxonomy shared by the bridge selector and every DebugBridge implementation.
#ifndef BRIDGE_ERROR_H_
#define BRIDGE_ERROR_H_

#include <stdarg.h>
#include <stdint.h>
#include "config.h"


// Error codes that can be found in BridgeError::code after a failed call.
enum BridgeErrorCode
{
    BRIDGE_SUCCESS = 0,
    // Chip identity missing or ambiguous, malformed target parameters, missing transport.
    BRIDGE_CONFIGURATION_ERROR,
    // Physical link failure or timeout. BridgeError::timedOut tells the two apart.
    BRIDGE_TRANSPORT_ERROR,
    // Malformed or unexpected response from the target (bad ACK, wrong IDCODE).
    BRIDGE_PROTOCOL_ERROR,
    // Binary image doesn't fit in the target's declared memory map.
    BRIDGE_OUT_OF_RANGE_ERROR,
    // Operation isn't valid in the bridge's current state.
    BRIDGE_INVALID_STATE_ERROR,
    // Register id isn't part of the chip's declared register set.
    BRIDGE_UNKNOWN_REGISTER_ERROR
};

// Everything needed to diagnose a failure without re-running with extra logging.
struct BridgeError
{
    BridgeErrorCode code;
    // Set for BRIDGE_TRANSPORT_ERROR when the link stopped answering rather than failing outright.
    bool            timedOut;
    // Name of the public operation which failed (ie. "load", "write_register").
    const char*     pOperation;
    // Address or register id involved in the failure. Only meaningful when hasAddress is true.
    uint32_t        address;
    bool            hasAddress;
    char            chip[MAX_CHIP_NAME_LENGTH + 1];
    char            message[MAX_ERROR_MESSAGE_LENGTH + 1];
};


// Reset pError to BRIDGE_SUCCESS with no context.
void bridgeErrorClear(BridgeError* pError);

// Fill in all of the fields of pError. pChip and pOperation can be NULL. The message is formatted with printf()
// style arguments.
void bridgeErrorSet(BridgeError* pError, BridgeErrorCode code, const char* pChip, const char* pOperation,
                    const char* pFormat, ...) __attribute__ ((format (printf, 5, 6)));
void bridgeErrorSetV(BridgeError* pError, BridgeErrorCode code, const char* pChip, const char* pOperation,
                     const char* pFormat, va_list args);

// Attach the address or register id involved in the failure to an error already filled in by bridgeErrorSet().
void bridgeErrorSetAddress(BridgeError* pError, uint32_t address);

// Returns a \0 terminated name for the error code (ie. "OutOfRangeError").
const char* bridgeErrorName(BridgeErrorCode code);

#endif // BRIDGE_ERROR_H_
