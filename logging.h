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
// Simple printf() logging module.
//
// Before including this header, the module should #define modname_MODULE to be its filename.
// For example target_link.cpp might have this:
//  #define LINK_MODULE "target_link.cpp"
//  #include "logging.h"
// The currently supported modules are:
//  BRIDGE_MODULE (debug_bridge.cpp)
//  SELECTOR_MODULE (bridge_selector.cpp, bridge_config.cpp)
//  LINK_MODULE (target_link.cpp)
//  CONFIG_MODULE (config_tree.cpp)
//  DEVICE_MODULE (devices/*.cpp)
//
// config.h is used to enable/disable error and/or debug logging for each of the modules.
// Example config.h which enables all logging for the link module:
// #define LOGGING_LINK_ERROR_ENABLED 1
// #define LOGGING_LINK_DEBUG_ENABLED 1
//
// Verbose protocol tracing is controlled at run time by the verbose flag handed to each bridge rather than by
// config.h. Use logVerbose()/logVerboseF() with that flag as the first parameter.
#ifndef LOGGING_H_
#define LOGGING_H_

#include <stdio.h>
#include "config.h"

#if defined(BRIDGE_MODULE)
    #define LOGGING_MODULE_FILENAME BRIDGE_MODULE

    #if LOGGING_BRIDGE_ERROR_ENABLED
        #define logError  logError_
        #define logErrorF logErrorF_
    #else
        #define logError(X)
        #define logErrorF(X, ...)
    #endif
    #if LOGGING_BRIDGE_DEBUG_ENABLED
        #define logDebug  logDebug_
        #define logDebugF logDebugF_
    #else
        #define logDebug(X)
        #define logDebugF(X, ...)
    #endif
#elif defined (SELECTOR_MODULE)
    #define LOGGING_MODULE_FILENAME SELECTOR_MODULE

    #if LOGGING_SELECTOR_ERROR_ENABLED
        #define logError logError_
        #define logErrorF logErrorF_
    #else
        #define logError(X)
        #define logErrorF(X, ...)
    #endif
    #if LOGGING_SELECTOR_DEBUG_ENABLED
        #define logDebug logDebug_
        #define logDebugF logDebugF_
    #else
        #define logDebug(X)
        #define logDebugF(X, ...)
    #endif
#elif defined (LINK_MODULE)
    #define LOGGING_MODULE_FILENAME LINK_MODULE

    #if LOGGING_LINK_ERROR_ENABLED
        #define logError logError_
        #define logErrorF logErrorF_
    #else
        #define logError(X)
        #define logErrorF(X, ...)
    #endif
    #if LOGGING_LINK_DEBUG_ENABLED
        #define logDebug logDebug_
        #define logDebugF logDebugF_
    #else
        #define logDebug(X)
        #define logDebugF(X, ...)
    #endif
#elif defined (CONFIG_MODULE)
    #define LOGGING_MODULE_FILENAME CONFIG_MODULE

    #if LOGGING_CONFIG_ERROR_ENABLED
        #define logError logError_
        #define logErrorF logErrorF_
    #else
        #define logError(X)
        #define logErrorF(X, ...)
    #endif
    #if LOGGING_CONFIG_DEBUG_ENABLED
        #define logDebug logDebug_
        #define logDebugF logDebugF_
    #else
        #define logDebug(X)
        #define logDebugF(X, ...)
    #endif
#elif defined (DEVICE_MODULE)
    #define LOGGING_MODULE_FILENAME DEVICE_MODULE

    #if LOGGING_DEVICE_ERROR_ENABLED
        #define logError logError_
        #define logErrorF logErrorF_
    #else
        #define logError(X)
        #define logErrorF(X, ...)
    #endif
    #if LOGGING_DEVICE_DEBUG_ENABLED
        #define logDebug logDebug_
        #define logDebugF logDebugF_
    #else
        #define logDebug(X)
        #define logDebugF(X, ...)
    #endif
#endif // BRIDGE_MODULE


#define logError_(X) g_logErrorF("error: %s:%u %s() - " X "\n", LOGGING_MODULE_FILENAME, __LINE__, __FUNCTION__)
#define logErrorF_(X, ...) g_logErrorF("error: %s:%u %s() - " X "\n", LOGGING_MODULE_FILENAME, __LINE__, __FUNCTION__, __VA_ARGS__)
#define logDebug_(X) g_logDebugF("debug: %s:%u %s() - " X "\n", LOGGING_MODULE_FILENAME, __LINE__, __FUNCTION__)
#define logDebugF_(X, ...) g_logDebugF("debug: %s:%u %s() - " X "\n", LOGGING_MODULE_FILENAME, __LINE__, __FUNCTION__, __VA_ARGS__)
#define logInfo(X) printf(" info: %s:%u %s() - " X "\n", LOGGING_MODULE_FILENAME, __LINE__, __FUNCTION__)
#define logInfoF(X, ...) printf(" info: %s:%u %s() - " X "\n", LOGGING_MODULE_FILENAME, __LINE__, __FUNCTION__, __VA_ARGS__)
#define logVerbose(ENABLED, X) do { if (ENABLED) { logInfo(X); } } while (0)
#define logVerboseF(ENABLED, X, ...) do { if (ENABLED) { logInfoF(X, __VA_ARGS__); } } while (0)

static int (*g_logErrorF)(const char* format, ...) = printf;
static int (*g_logDebugF)(const char* format, ...) = printf;

static int dummyf(const char* format, ...)
{
    return 0;
}

static inline void logErrorDisable()
{
    g_logErrorF = dummyf;
}

static inline void logErrorEnable()
{
    g_logErrorF = printf;
}

static inline void logDebugDisable()
{
    g_logDebugF = dummyf;
}

static inline void logDebugEnable()
{
    g_logDebugF = printf;
}

#endif // LOGGING_H_
