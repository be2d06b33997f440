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
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include "bridge_error.h"


void bridgeErrorClear(BridgeError* pError)
{
    memset(pError, 0, sizeof(*pError));
    pError->code = BRIDGE_SUCCESS;
    pError->pOperation = "";
}

void bridgeErrorSet(BridgeError* pError, BridgeErrorCode code, const char* pChip, const char* pOperation,
                    const char* pFormat, ...)
{
    va_list args;

    va_start(args, pFormat);
    bridgeErrorSetV(pError, code, pChip, pOperation, pFormat, args);
    va_end(args);
}

void bridgeErrorSetV(BridgeError* pError, BridgeErrorCode code, const char* pChip, const char* pOperation,
                     const char* pFormat, va_list args)
{
    bridgeErrorClear(pError);
    pError->code = code;
    pError->pOperation = pOperation ? pOperation : "";
    if (pChip)
    {
        snprintf(pError->chip, sizeof(pError->chip), "%s", pChip);
    }
    vsnprintf(pError->message, sizeof(pError->message), pFormat, args);
}

void bridgeErrorSetAddress(BridgeError* pError, uint32_t address)
{
    pError->address = address;
    pError->hasAddress = true;
}

const char* bridgeErrorName(BridgeErrorCode code)
{
    switch (code)
    {
        case BRIDGE_SUCCESS:
            return "Success";
        case BRIDGE_CONFIGURATION_ERROR:
            return "ConfigurationError";
        case BRIDGE_TRANSPORT_ERROR:
            return "TransportError";
        case BRIDGE_PROTOCOL_ERROR:
            return "ProtocolError";
        case BRIDGE_OUT_OF_RANGE_ERROR:
            return "OutOfRangeError";
        case BRIDGE_INVALID_STATE_ERROR:
            return "InvalidStateError";
        case BRIDGE_UNKNOWN_REGISTER_ERROR:
            return "UnknownRegisterError";
    }
    return "UnknownError";
}
