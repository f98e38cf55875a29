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

#ifndef NODDFETCH_FETCHER_HH
#define NODDFETCH_FETCHER_HH

#include "FetchRequest.hh"
#include "KeySequencer.hh"
#include "Settings.hh"

#include <XrdCl/XrdClXRootDResponses.hh>

#include <atomic>
#include <string>

namespace XrdCl {

class Log;

}

namespace NoddFetch {

class Backend;

// Drives one retrieval request end to end: enumerates the candidate files,
// skips those already present at the destination and fetches the rest, either
// as a subset of GRIB messages or as full files.
//
// The loop over candidate files is sequential; only the byte ranges of a
// single file are fetched concurrently.
class Fetcher {
public:
    struct Summary {
        unsigned candidates{0};
        unsigned existing{0};   // Skipped because the destination was present
        unsigned missing{0};    // Object (or its index) not found at the source
        unsigned written{0};
        uint64_t bytes{0};
    };

    // `cancel` may be null.  When set, the run stops before the next file.
    Fetcher(const FetchRequest &request, Backend &backend, const Settings &settings,
        const std::atomic<bool> *cancel, XrdCl::Log *log);

    // Resolve the window relative to `now` and process every candidate file.
    XrdCl::XRootDStatus Run(TimePoint now);

    // Process every file produced by `sequence`.  NotFound results are logged
    // and skipped; any other failure stops the run and is returned.
    XrdCl::XRootDStatus Run(KeySequence &sequence);

    // Retrieve the content for `key` according to the request: a subset of
    // fields when an expression is configured and the backend can subset, the
    // full object otherwise.  `content` is left empty on a dry run.
    XrdCl::XRootDStatus FetchOne(const std::string &key, const std::string &destination, std::string &content);

    // The field expression used for `key`, after any per-product correction.
    std::string EffectiveExpression(const std::string &key) const;

    // Local path for a candidate file.
    std::string DestinationFor(const RemoteFile &file) const;

    const Summary &GetSummary() const {return m_summary;}

private:
    XrdCl::XRootDStatus FetchSubset(const std::string &key, const std::string &destination, std::string &content);
    XrdCl::XRootDStatus SaveIndexOnly(const std::string &key, const std::string &destination);
    XrdCl::XRootDStatus Save(const std::string &destination, const std::string &content);

    bool Cancelled() const {return m_cancel && m_cancel->load(std::memory_order_relaxed);}

    const FetchRequest &m_request;
    Backend &m_backend;
    const Settings m_settings;
    const std::atomic<bool> *m_cancel;
    Summary m_summary;
    XrdCl::Log *m_logger;
};

}

#endif // NODDFETCH_FETCHER_HH
