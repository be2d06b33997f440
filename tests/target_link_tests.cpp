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
#include <gtest/gtest.h>
#include <string.h>
#include <deque>
#include <vector>
#include "target_link.h"


// Transport which records every frame sent and plays back canned response bytes.
class ScriptedTransport : public Transport
{
    public:
        virtual TransportResult open()
        {
            return TRANSPORT_SUCCESS;
        }
        virtual void close()
        {
        }
        virtual TransportResult send(const void* pBuffer, size_t bufferSize)
        {
            const uint8_t* pBytes = (const uint8_t*)pBuffer;
            if (sendResult != TRANSPORT_SUCCESS)
            {
                return sendResult;
            }
            frames.push_back(std::vector<uint8_t>(pBytes, pBytes + bufferSize));
            return TRANSPORT_SUCCESS;
        }
        virtual TransportResult receive(void* pBuffer, size_t bufferSize, uint32_t timeout_ms)
        {
            uint8_t* pDest = (uint8_t*)pBuffer;
            lastTimeout_ms = timeout_ms;
            if (responses.size() < bufferSize)
            {
                return TRANSPORT_TIMEOUT;
            }
            for (size_t i = 0 ; i < bufferSize ; i++)
            {
                pDest[i] = responses.front();
                responses.pop_front();
            }
            return TRANSPORT_SUCCESS;
        }
        virtual TransportResult resetTarget(uint32_t pulse_ms)
        {
            return TRANSPORT_SUCCESS;
        }
        virtual TransportResult setClockFrequency(uint32_t frequency)
        {
            return TRANSPORT_SUCCESS;
        }

        void queue(uint8_t byte)
        {
            responses.push_back(byte);
        }
        void queueOk(uint32_t count = 1)
        {
            for (uint32_t i = 0 ; i < count ; i++)
            {
                queue(TargetLink::ACK_OK);
            }
        }

        std::vector< std::vector<uint8_t> > frames;
        std::deque<uint8_t>                 responses;
        TransportResult                     sendResult = TRANSPORT_SUCCESS;
        uint32_t                            lastTimeout_ms = 0;
};


class TargetLinkTest : public ::testing::Test
{
    protected:
        virtual void SetUp()
        {
            link.init(&transport, 250);
        }
        virtual void TearDown()
        {
            link.uninit();
        }

        static uint32_t headerU32(const std::vector<uint8_t>& frame, size_t offset)
        {
            return (uint32_t)frame[offset] | ((uint32_t)frame[offset + 1] << 8) |
                   ((uint32_t)frame[offset + 2] << 16) | ((uint32_t)frame[offset + 3] << 24);
        }

        ScriptedTransport transport;
        TargetLink        link;
};


TEST_F(TargetLinkTest, ReadIdCode_ShouldSendHeaderOnlyFrameAndDecodeLittleEndianResponse)
{
    transport.queueOk();
    transport.queue(0xC3);
    transport.queue(0x11);
    transport.queue(0x95);
    transport.queue(0x14);

    uint32_t idCode = 0;
    ASSERT_TRUE(link.readIdCode(&idCode));

    EXPECT_EQ(0x149511C3u, idCode);
    ASSERT_EQ(1u, transport.frames.size());
    ASSERT_EQ((size_t)TargetLink::REQUEST_HEADER_SIZE, transport.frames[0].size());
    EXPECT_EQ(TargetLink::LINK_OP_IDCODE, transport.frames[0][0]);
    EXPECT_EQ(0u, headerU32(transport.frames[0], 1));
    EXPECT_EQ(4u, headerU32(transport.frames[0], 5));
    EXPECT_EQ(250u, transport.lastTimeout_ms);
}

TEST_F(TargetLinkTest, WriteWord_ShouldPlaceAddressLengthAndPayloadInSingleFrame)
{
    transport.queueOk();

    ASSERT_TRUE(link.writeWord(0x1A110000, 0x00010000));

    ASSERT_EQ(1u, transport.frames.size());
    const std::vector<uint8_t>& frame = transport.frames[0];
    ASSERT_EQ(TargetLink::REQUEST_HEADER_SIZE + 4, frame.size());
    EXPECT_EQ(TargetLink::LINK_OP_WRITE, frame[0]);
    EXPECT_EQ(0x1A110000u, headerU32(frame, 1));
    EXPECT_EQ(4u, headerU32(frame, 5));
    EXPECT_EQ(0x00010000u, headerU32(frame, 9));
    EXPECT_EQ(4u, link.getTotalBytesWritten());
}

TEST_F(TargetLinkTest, ReadMemory_ShouldSplitTransfersAtMaximumTransferBoundaries)
{
    // 0x1C0003F0 is 16 bytes before a 1024 byte boundary so 2048 bytes needs 3 frames: 16 + 1024 + 1008.
    const uint32_t address = 0x1C0003F0;
    const uint32_t size = 2048;
    uint32_t expectedSizes[] = { 16, 1024, 1008 };
    for (size_t i = 0 ; i < 3 ; i++)
    {
        transport.queueOk();
        for (uint32_t j = 0 ; j < expectedSizes[i] ; j++)
        {
            transport.queue((uint8_t)(i + 1));
        }
    }

    std::vector<uint8_t> buffer(size);
    EXPECT_EQ(size, link.readMemory(address, buffer.data(), size));

    ASSERT_EQ(3u, transport.frames.size());
    EXPECT_EQ(address, headerU32(transport.frames[0], 1));
    EXPECT_EQ(16u, headerU32(transport.frames[0], 5));
    EXPECT_EQ(0x1C000400u, headerU32(transport.frames[1], 1));
    EXPECT_EQ(1024u, headerU32(transport.frames[1], 5));
    EXPECT_EQ(0x1C000800u, headerU32(transport.frames[2], 1));
    EXPECT_EQ(1008u, headerU32(transport.frames[2], 5));
    EXPECT_EQ(1, buffer[0]);
    EXPECT_EQ(2, buffer[16]);
    EXPECT_EQ(3, buffer[size - 1]);
}

TEST_F(TargetLinkTest, WriteMemory_NoFrameShouldExceedMaximumTransferSize)
{
    std::vector<uint8_t> data(3 * LINK_MAX_TRANSFER_SIZE, 0xA5);
    transport.queueOk(3);

    EXPECT_EQ(data.size(), link.writeMemory(0x1C000000, data.data(), data.size()));

    ASSERT_EQ(3u, transport.frames.size());
    for (size_t i = 0 ; i < transport.frames.size() ; i++)
    {
        EXPECT_EQ(TargetLink::REQUEST_HEADER_SIZE + LINK_MAX_TRANSFER_SIZE, transport.frames[i].size());
    }
    EXPECT_EQ(3u, link.getTotalFramesSent());
}

TEST_F(TargetLinkTest, WaitAck_ShouldFailWithoutRetrying)
{
    transport.queue(TargetLink::ACK_WAIT);

    uint32_t value = 0;
    EXPECT_FALSE(link.readWord(0x1C000000, &value));
    EXPECT_EQ(TargetLink::LINK_WAIT, link.getLastError());
    EXPECT_EQ(1u, transport.frames.size());
}

TEST_F(TargetLinkTest, FaultAck_ShouldReportFault)
{
    transport.queue(TargetLink::ACK_FAULT);

    EXPECT_FALSE(link.writeWord(0x00000000, 0));
    EXPECT_EQ(TargetLink::LINK_FAULT, link.getLastError());
}

TEST_F(TargetLinkTest, UnknownAck_ShouldReportProtocolError)
{
    transport.queue(0x07);

    uint32_t idCode = 0;
    EXPECT_FALSE(link.readIdCode(&idCode));
    EXPECT_EQ(TargetLink::LINK_PROTOCOL, link.getLastError());
}

TEST_F(TargetLinkTest, MissingResponse_ShouldReportTimeout)
{
    uint32_t value = 0;
    EXPECT_FALSE(link.readWord(0x1C000000, &value));
    EXPECT_EQ(TargetLink::LINK_TIMEOUT, link.getLastError());
}

TEST_F(TargetLinkTest, SendFailure_ShouldReportTransportErrorAndPartialCount)
{
    std::vector<uint8_t> data(2 * LINK_MAX_TRANSFER_SIZE, 0);
    transport.queueOk();

    // First frame goes out, then the transport dies.
    EXPECT_EQ(LINK_MAX_TRANSFER_SIZE, link.writeMemory(0x1C000000, data.data(), LINK_MAX_TRANSFER_SIZE));
    transport.sendResult = TRANSPORT_ERROR;
    EXPECT_EQ(0u, link.writeMemory(0x1C000400, data.data(), data.size()));
    EXPECT_EQ(TargetLink::LINK_TRANSPORT, link.getLastError());
}

TEST_F(TargetLinkTest, SuccessfulCall_ShouldClearPreviousError)
{
    uint32_t value = 0;
    EXPECT_FALSE(link.readWord(0x1C000000, &value));
    ASSERT_EQ(TargetLink::LINK_TIMEOUT, link.getLastError());

    transport.queueOk();
    for (int i = 0 ; i < 4 ; i++)
    {
        transport.queue(0x11);
    }
    EXPECT_TRUE(link.readWord(0x1C000000, &value));
    EXPECT_EQ(0x11111111u, value);
    EXPECT_EQ(TargetLink::LINK_SUCCESS, link.getLastError());
}

TEST(TargetLinkErrorName, ShouldNameEveryError)
{
    EXPECT_STREQ("success", TargetLink::errorName(TargetLink::LINK_SUCCESS));
    EXPECT_STREQ("timeout", TargetLink::errorName(TargetLink::LINK_TIMEOUT));
    EXPECT_STREQ("target fault", TargetLink::errorName(TargetLink::LINK_FAULT));
}
