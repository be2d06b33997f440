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
// Interface used to add support for Fulmine chips.
#ifndef FULMINE_H_
#define FULMINE_H_

#include "devices.h"

std::unique_ptr<DebugBridge> fulmineCreateBridge(const BridgeConfig* pConfig, Transport* pTransport,
                                                 const BinarySet* pBinaries, bool verbose);

#endif // FULMINE_H_
