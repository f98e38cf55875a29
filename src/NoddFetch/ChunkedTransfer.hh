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

#ifndef NODDFETCH_CHUNKEDTRANSFER_HH
#define NODDFETCH_CHUNKEDTRANSFER_HH

#include "ByteRange.hh"

#include <XrdCl/XrdClXRootDResponses.hh>

#include <atomic>
#include <string>
#include <vector>

namespace XrdCl {

class Log;

}

namespace NoddFetch {

class Backend;

// Partition an object of `size` bytes into contiguous, non-overlapping ranges
// of at most `chunk_size` bytes.  The final range ends at `size - 1`.
std::vector<ByteRange> PlanChunks(uint64_t size, uint64_t chunk_size);

// Determine the size of `key` and partition it as above.  A missing size
// (object absent) is reported as NotFound.
XrdCl::XRootDStatus PlanChunks(Backend &backend, const std::string &key, uint64_t chunk_size,
    std::vector<ByteRange> &chunks);

// Downloads a set of byte ranges of one object in parallel.
//
// Each worker thread operates on its own clone of the prototype backend and
// pulls range indices from a shared counter; results land in per-index slots
// so the final concatenation is always in request order regardless of the
// order in which the workers complete.
class ChunkedTransfer {
public:
    // `cancel` may be null; when it is set, workers stop picking up new ranges.
    ChunkedTransfer(const Backend &prototype, unsigned workers, const std::atomic<bool> *cancel, XrdCl::Log *log);

    // Fetch every range of `key` and concatenate the bodies in the order given.
    //
    // If any range fails, the first failure (by index) is returned and `result`
    // is left empty.
    XrdCl::XRootDStatus FetchRanges(const std::string &key, const std::vector<ByteRange> &ranges,
        std::string &result);

    // Fetch the whole object.  If `use_chunking` is set, the object is sized
    // and fetched as parallel chunks of `chunk_size`; otherwise it is a single
    // request.
    XrdCl::XRootDStatus FetchFull(const std::string &key, bool use_chunking, uint64_t chunk_size,
        std::string &result);

private:
    bool Cancelled() const {return m_cancel && m_cancel->load(std::memory_order_relaxed);}

    const Backend &m_prototype;
    const unsigned m_workers;
    const std::atomic<bool> *m_cancel;
    XrdCl::Log *m_logger;
};

}

#endif // NODDFETCH_CHUNKEDTRANSFER_HH
