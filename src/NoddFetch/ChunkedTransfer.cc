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

#include "Backend.hh"
#include "ChunkedTransfer.hh"
#include "CurlUtil.hh"

#include <XrdCl/XrdClLog.hh>

#include <algorithm>
#include <functional>
#include <thread>

using namespace NoddFetch;

std::vector<ByteRange>
NoddFetch::PlanChunks(uint64_t size, uint64_t chunk_size)
{
    std::vector<ByteRange> chunks;
    if (!size) {
        return chunks;
    }
    if (!chunk_size) {
        chunk_size = size;
    }
    for (uint64_t start = 0; start < size; start += chunk_size) {
        auto end = std::min(start + chunk_size, size) - 1;
        chunks.emplace_back(start, end);
    }
    return chunks;
}

XrdCl::XRootDStatus
NoddFetch::PlanChunks(Backend &backend, const std::string &key, uint64_t chunk_size, std::vector<ByteRange> &chunks)
{
    chunks.clear();
    uint64_t size = 0;
    auto status = backend.GetSize(key, size);
    if (!status.IsOK()) {
        return status;
    }
    chunks = PlanChunks(size, chunk_size);
    if (chunks.empty()) {
        return NotFoundStatus("Object " + key + " has no content");
    }
    return XrdCl::XRootDStatus();
}

ChunkedTransfer::ChunkedTransfer(const Backend &prototype, unsigned workers, const std::atomic<bool> *cancel,
    XrdCl::Log *log)
    : m_prototype(prototype), m_workers(workers ? workers : 1), m_cancel(cancel), m_logger(log)
{}

XrdCl::XRootDStatus
ChunkedTransfer::FetchRanges(const std::string &key, const std::vector<ByteRange> &ranges, std::string &result)
{
    result.clear();
    if (ranges.empty()) {
        return XrdCl::XRootDStatus();
    }

    std::vector<std::string> bodies(ranges.size());
    std::vector<XrdCl::XRootDStatus> statuses(ranges.size());
    std::atomic<size_t> next{0};
    std::atomic<size_t> completed{0};
    std::atomic<bool> failed{false};

    auto worker = [&](Backend &backend) {
        while (!failed.load(std::memory_order_relaxed) && !Cancelled()) {
            auto idx = next.fetch_add(1, std::memory_order_relaxed);
            if (idx >= ranges.size()) {
                return;
            }
            m_logger->Dump(kLogNoddFetch, "Fetching %s of %s", ranges[idx].ToString().c_str(), key.c_str());
            auto status = backend.Download(key, ranges[idx], bodies[idx]);
            if (!status.IsOK()) {
                bodies[idx].clear();
                failed.store(true, std::memory_order_relaxed);
            }
            statuses[idx] = status;
            completed.fetch_add(1, std::memory_order_relaxed);
        }
    };

    auto thread_count = std::min<size_t>(m_workers, ranges.size());
    m_logger->Debug(kLogNoddFetch, "Downloading %zu ranges of %s with %zu workers", ranges.size(), key.c_str(),
        thread_count);

    std::vector<std::unique_ptr<Backend>> clones;
    clones.reserve(thread_count);
    for (size_t idx = 0; idx < thread_count; idx++) {
        clones.emplace_back(m_prototype.Clone());
    }
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (auto &clone : clones) {
        threads.emplace_back(worker, std::ref(*clone));
    }
    for (auto &thread : threads) {
        thread.join();
    }

    for (const auto &status : statuses) {
        if (!status.IsOK()) {
            return status;
        }
    }
    // Workers stopped early without a failure of their own; some slots were never filled.
    if (completed.load() < ranges.size()) {
        return XrdCl::XRootDStatus(XrdCl::stError, XrdCl::errOperationInterrupted, 0,
            "Download of " + key + " was interrupted");
    }

    size_t total = 0;
    for (const auto &body : bodies) {
        total += body.size();
    }
    result.reserve(total);
    for (const auto &body : bodies) {
        result += body;
    }
    return XrdCl::XRootDStatus();
}

XrdCl::XRootDStatus
ChunkedTransfer::FetchFull(const std::string &key, bool use_chunking, uint64_t chunk_size, std::string &result)
{
    result.clear();
    if (!use_chunking) {
        auto backend = m_prototype.Clone();
        return backend->Download(key, std::nullopt, result);
    }

    auto backend = m_prototype.Clone();
    std::vector<ByteRange> chunks;
    auto status = PlanChunks(*backend, key, chunk_size, chunks);
    if (!status.IsOK()) {
        return status;
    }
    m_logger->Debug(kLogNoddFetch, "Fetching %s in %zu chunks of up to %llu bytes", key.c_str(), chunks.size(),
        static_cast<unsigned long long>(chunk_size));
    return FetchRanges(key, chunks, result);
}
