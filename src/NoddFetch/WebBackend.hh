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

#ifndef NODDFETCH_WEBBACKEND_HH
#define NODDFETCH_WEBBACKEND_HH

#include "CurlBackend.hh"

namespace NoddFetch {

// Plain HTTP(S) server access.
//
// Object keys are appended to the server root ("https://host/"); any path in
// the configured source is dropped as key patterns carry the full path.
class WebBackend final : public CurlBackend {
public:
    virtual ~WebBackend() {}

    // Parse a "http(s)://host[/path]" source; returns nullptr and sets `err` if malformed.
    static std::unique_ptr<Backend> Create(const std::string &source, const Settings &settings,
        XrdCl::Log *log, std::string &err);

    // Split a URL into its scheme and hostname (including any port).
    // Returns false if the URL has no scheme or no hostname.
    static bool SplitUrl(const std::string &url, std::string &scheme, std::string &host);

    bool CanSubset() const override {return true;}

    std::unique_ptr<Backend> Clone() const override;

private:
    WebBackend(const std::string &name, const std::string &url, const Settings &settings, XrdCl::Log *log)
        : CurlBackend(name, url, settings, log)
    {}
};

}

#endif // NODDFETCH_WEBBACKEND_HH
