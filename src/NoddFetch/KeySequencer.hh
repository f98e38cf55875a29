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

#ifndef NODDFETCH_KEYSEQUENCER_HH
#define NODDFETCH_KEYSEQUENCER_HH

#include "RunCycle.hh"

#include <XrdCl/XrdClXRootDResponses.hh>

#include <deque>
#include <memory>
#include <string>

namespace XrdCl {

class Log;

}

namespace NoddFetch {

class Backend;
struct FetchRequest;

// A candidate file: the remote key and the name it is saved under when ODS
// naming is requested.
struct RemoteFile {
    std::string key;
    std::string name;
};

// A forward-only sequence of candidate files.
//
// Files are produced lazily, one per call to `Next()`.  Once `Next()` returns
// false the sequence is exhausted and cannot be restarted; a new sequence must
// be created.  `GetStatus()` distinguishes normal exhaustion (OK) from a
// failure that ended the sequence early.
class KeySequence {
public:
    virtual ~KeySequence() {}

    virtual bool Next(RemoteFile &file) = 0;

    const XrdCl::XRootDStatus &GetStatus() const {return m_status;}
    const Window &GetWindow() const {return m_window;}

protected:
    KeySequence(const FetchRequest &request, const Window &window, XrdCl::Log *log)
        : m_request(request), m_window(window), m_current(window.start), m_logger(log)
    {}

    void Advance();

    const FetchRequest &m_request;
    const Window m_window;
    TimePoint m_current;
    XrdCl::XRootDStatus m_status;
    XrdCl::Log *m_logger;
};

// Renders keys from the product templates for every cycle in the window,
// every member (if any) and every forecast hour, in that nesting order.
class TemplateKeySequence final : public KeySequence {
public:
    TemplateKeySequence(const FetchRequest &request, const Window &window, XrdCl::Log *log);

    bool Next(RemoteFile &file) override;

private:
    size_t m_mem_idx{0};
    size_t m_fxx_idx{0};
};

// Lists each cycle's directory for objects containing the match pattern.
// A cycle whose directory cannot be found is skipped.
class MatchKeySequence final : public KeySequence {
public:
    MatchKeySequence(const FetchRequest &request, const Window &window, Backend &backend, XrdCl::Log *log);

    bool Next(RemoteFile &file) override;

private:
    Backend &m_backend;
    std::deque<std::string> m_pending;
};

// Resolve the fetch window for `request` and create the sequence for its
// discovery mode: listing when a match pattern is set, templates otherwise.
XrdCl::XRootDStatus MakeKeySequence(const FetchRequest &request, TimePoint now, Backend &backend,
    XrdCl::Log *log, std::unique_ptr<KeySequence> &sequence);

}

#endif // NODDFETCH_KEYSEQUENCER_HH
