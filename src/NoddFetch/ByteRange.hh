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

#ifndef NODDFETCH_BYTERANGE_HH
#define NODDFETCH_BYTERANGE_HH

#include <cstdint>
#include <optional>
#include <string>

namespace NoddFetch {

// A byte range within a remote object.
//
// The end offset is inclusive, matching the HTTP `Range` header; an absent
// end means "through the end of the object".
struct ByteRange {
    ByteRange() {}
    ByteRange(uint64_t start_offset, std::optional<uint64_t> end_offset = std::nullopt)
        : start(start_offset), end(end_offset)
    {}

    uint64_t start{0};
    std::optional<uint64_t> end;

    bool IsOpen() const {return !end.has_value();}

    // Serialize as a single token: "bytes=<start>-<end>" or "bytes=<start>-".
    std::string ToString() const;

    // The range without the "bytes=" prefix, as expected by CURLOPT_RANGE.
    std::string ToCurlRange() const;

    // Number of bytes covered by the range; 0 for an open range.
    uint64_t Length() const {return end ? *end - start + 1 : 0;}

    bool operator<(const ByteRange &other) const;
    bool operator==(const ByteRange &other) const {return start == other.start && end == other.end;}
    bool operator!=(const ByteRange &other) const {return !(*this == other);}
};

}

#endif // NODDFETCH_BYTERANGE_HH
