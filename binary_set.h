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
// Binary images to be deployed to the target. They are parsed from ELF (or whatever format is used) outside of this
// library and only borrowed by the bridge while it loads them.
#ifndef BINARY_SET_H_
#define BINARY_SET_H_

#include <stdint.h>
#include <stddef.h>


// A single code/data image.
struct BinaryImage
{
    // Target address where the first byte of pData is to be placed.
    uint32_t       address;
    // Pointer to the bytes of the image.
    const uint8_t* pData;
    // Number of bytes in pData.
    uint32_t       size;
    // Address where execution should start for this image. 0 if the image has no entry point (ie. data only).
    uint32_t       entryPoint;
};

// Ordered list of images. Default constructed sets are empty.
struct BinarySet
{
    // Pointer to an array of images.
    const BinaryImage* pImages;
    // The number of images in the pImages array.
    size_t             imageCount;
};

#endif // BINARY_SET_H_
