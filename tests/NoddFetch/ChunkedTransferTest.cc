/***************************************************************
 *
 * Copyright (C) 2025, Pelican Project, Morgridge Institute for Research
 *
 * Licensed under the Apache License, Version 2.0 (the "License"); you
 * may not use this file except in compliance with the License.  You may
 * obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 ***************************************************************/

#include "NoddFetch/ChunkedTransfer.hh"
#include "StubBackend.hh"

#include <XrdCl/XrdClDefaultEnv.hh>

#include <gtest/gtest.h>

using namespace NoddFetch;

namespace {

std::string MakeBody(size_t size)
{
    std::string body;
    body.reserve(size);
    for (size_t idx = 0; idx < size; idx++) {
        body.push_back(static_cast<char>('a' + (idx * 7) % 26));
    }
    return body;
}

void CheckPartition(uint64_t size, uint64_t chunk_size)
{
    auto chunks = PlanChunks(size, chunk_size);
    ASSERT_FALSE(chunks.empty());
    uint64_t expected_start = 0;
    for (const auto &chunk : chunks) {
        ASSERT_TRUE(chunk.end.has_value());
        EXPECT_EQ(chunk.start, expected_start);
        EXPECT_GE(*chunk.end, chunk.start);
        EXPECT_LE(chunk.Length(), chunk_size);
        expected_start = *chunk.end + 1;
    }
    EXPECT_EQ(*chunks.back().end, size - 1);
    EXPECT_EQ(expected_start, size);
}

}

TEST(ChunkedTransfer, PlanPartitions) {
    CheckPartition(1, 1);
    CheckPartition(10, 3);
    CheckPartition(9, 3);
    CheckPartition(1000, 1000);
    CheckPartition(1000, 5000);
    CheckPartition(1ULL << 33, 500ULL * 1024 * 1024);

    auto chunks = PlanChunks(10, 3);
    ASSERT_EQ(chunks.size(), 4);
    EXPECT_EQ(chunks[0].ToString(), "bytes=0-2");
    EXPECT_EQ(chunks[3].ToString(), "bytes=9-9");

    EXPECT_TRUE(PlanChunks(0, 3).empty());
}

TEST(ChunkedTransfer, PlanFromBackend) {
    StubBackend backend(XrdCl::DefaultEnv::GetLog());
    backend.Put("big.grib2", MakeBody(25));

    std::vector<ByteRange> chunks;
    auto status = PlanChunks(backend, "big.grib2", 10, chunks);
    ASSERT_TRUE(status.IsOK()) << status.ToStr();
    ASSERT_EQ(chunks.size(), 3);
    EXPECT_EQ(chunks[2].ToString(), "bytes=20-24");

    status = PlanChunks(backend, "missing.grib2", 10, chunks);
    EXPECT_EQ(Classify(status), ErrorClass::NotFound);
    EXPECT_TRUE(chunks.empty());
}

TEST(ChunkedTransfer, OrderPreservedWithReorderedCompletion) {
    StubBackend backend(XrdCl::DefaultEnv::GetLog());
    auto body = MakeBody(300);
    backend.Put("obj", body);

    std::vector<ByteRange> ranges{{0, 99}, {100, 199}, {200, 299}};
    // The first range completes last and the last range first.
    backend.GetState().range_delays[0] = std::chrono::milliseconds(150);
    backend.GetState().range_delays[100] = std::chrono::milliseconds(75);

    std::string sequential;
    for (const auto &range : ranges) {
        std::string piece;
        ASSERT_TRUE(backend.Download("obj", range, piece).IsOK());
        sequential += piece;
    }

    ChunkedTransfer transfer(backend, 3, nullptr, XrdCl::DefaultEnv::GetLog());
    std::string result;
    auto status = transfer.FetchRanges("obj", ranges, result);
    ASSERT_TRUE(status.IsOK()) << status.ToStr();
    EXPECT_EQ(result, sequential);
    EXPECT_EQ(result, body);
    EXPECT_EQ(backend.GetState().clones.load(), 3);
}

TEST(ChunkedTransfer, BoundedWorkers) {
    StubBackend backend(XrdCl::DefaultEnv::GetLog());
    auto body = MakeBody(1000);
    backend.Put("obj", body);

    ChunkedTransfer transfer(backend, 4, nullptr, XrdCl::DefaultEnv::GetLog());
    std::string result;
    auto status = transfer.FetchRanges("obj", PlanChunks(body.size(), 10), result);
    ASSERT_TRUE(status.IsOK()) << status.ToStr();
    EXPECT_EQ(result, body);
    EXPECT_EQ(backend.GetState().clones.load(), 4);
    EXPECT_EQ(backend.GetState().downloads.load(), 100);
}

TEST(ChunkedTransfer, FailedRangeFailsTransfer) {
    StubBackend backend(XrdCl::DefaultEnv::GetLog());
    backend.Put("obj", MakeBody(100));

    ChunkedTransfer transfer(backend, 2, nullptr, XrdCl::DefaultEnv::GetLog());
    std::string result;
    auto status = transfer.FetchRanges("obj", {{0, 49}, {500, 599}}, result);
    EXPECT_EQ(Classify(status), ErrorClass::Fatal);
    EXPECT_TRUE(result.empty());

    status = transfer.FetchRanges("missing", {{0, 49}, {50, 99}}, result);
    EXPECT_EQ(Classify(status), ErrorClass::NotFound);
    EXPECT_TRUE(result.empty());
}

TEST(ChunkedTransfer, CancelledBeforeStart) {
    StubBackend backend(XrdCl::DefaultEnv::GetLog());
    backend.Put("obj", MakeBody(100));

    std::atomic<bool> cancel{true};
    ChunkedTransfer transfer(backend, 2, &cancel, XrdCl::DefaultEnv::GetLog());
    std::string result;
    auto status = transfer.FetchRanges("obj", {{0, 49}, {50, 99}}, result);
    EXPECT_EQ(status.code, XrdCl::errOperationInterrupted);
    EXPECT_TRUE(result.empty());
    EXPECT_EQ(backend.GetState().downloads.load(), 0);
}

TEST(ChunkedTransfer, FetchFull) {
    StubBackend backend(XrdCl::DefaultEnv::GetLog());
    auto body = MakeBody(257);
    backend.Put("obj", body);

    ChunkedTransfer transfer(backend, 10, nullptr, XrdCl::DefaultEnv::GetLog());
    std::string result;
    ASSERT_TRUE(transfer.FetchFull("obj", false, 64, result).IsOK());
    EXPECT_EQ(result, body);
    EXPECT_EQ(backend.GetState().downloads.load(), 1);
    EXPECT_EQ(backend.GetState().size_calls.load(), 0);

    ASSERT_TRUE(transfer.FetchFull("obj", true, 64, result).IsOK());
    EXPECT_EQ(result, body);
    EXPECT_EQ(backend.GetState().size_calls.load(), 1);
    EXPECT_EQ(backend.GetState().downloads.load(), 1 + 5);

    auto status = transfer.FetchFull("missing", true, 64, result);
    EXPECT_EQ(Classify(status), ErrorClass::NotFound);
    EXPECT_TRUE(result.empty());
}
