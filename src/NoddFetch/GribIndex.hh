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

#ifndef NODDFETCH_GRIBINDEX_HH
#define NODDFETCH_GRIBINDEX_HH

#include "ByteRange.hh"

#include <XrdCl/XrdClXRootDResponses.hh>

#include <map>
#include <string>
#include <vector>

namespace XrdCl {

class Log;

}

namespace NoddFetch {

class Backend;

// Suffix appended to an object key to locate its sidecar index.
constexpr const char *kIndexSuffix = ".idx";

// One line of a GRIB sidecar index (wgrib2 "-s" inventory format):
//
//   <n>:<offset>:<reference time>:<variable>:<level>:<forecast>:<...>
struct IdxEntry {
    std::string message;        // Message number; may be "3.1" for sub-messages
    uint64_t offset{0};         // Starting byte of the message within the object
    std::string reference_time;
    std::string variable;
    std::string level;
    std::string forecast;
    std::string line;           // The raw line, used for expression matching
    unsigned lineno{0};
    bool complete{false};       // At least 7 fields and a numeric offset
};

// Selected ranges, ordered by start offset, mapped to the entry they came from.
using ByteRangeMap = std::map<ByteRange, IdxEntry>;

// Parse an index document.  Blank lines are dropped.  Lines with fewer than 7
// colon-separated fields or a non-numeric offset are kept with `complete`
// unset; they only matter if a selection touches them.
void ParseIndex(const std::string &text, std::vector<IdxEntry> &entries);

// Fetch and parse the index for object `key`.
//
// A missing or empty index is reported as a NotFound status with no entries;
// it is not an error in its own right.
XrdCl::XRootDStatus FetchIndex(Backend &backend, const std::string &key, std::vector<IdxEntry> &entries,
    XrdCl::Log *log);

// Select the byte ranges of all entries whose raw line contains a match for
// the regular expression `expression`.
//
// Each range starts at the entry's offset and ends at the offset of the next
// line in the document, matching or not; the last line's range is open.
// Fails with errInvalidArgs if the expression does not compile.  A selected
// line, or the line bounding its range, that is not complete yields a
// NotFound status so the object is skipped.
XrdCl::XRootDStatus SelectByteRanges(const std::vector<IdxEntry> &entries, const std::string &expression,
    ByteRangeMap &ranges);

// Write the index lines to `path`, newline-separated.
bool WriteIndex(const std::vector<IdxEntry> &entries, const std::string &path, std::string &err);

}

#endif // NODDFETCH_GRIBINDEX_HH
