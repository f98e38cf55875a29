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

#ifndef NODDFETCH_CURLBACKEND_HH
#define NODDFETCH_CURLBACKEND_HH

#include "Backend.hh"
#include "CurlUtil.hh"

namespace NoddFetch {

// Common libcurl plumbing shared by all three transports.
//
// Each instance holds a single easy handle which is reused (and its
// connection kept alive) across requests made by the owning thread.
class CurlBackend : public Backend {
public:
    virtual ~CurlBackend() {}

    XrdCl::XRootDStatus Download(const std::string &key, const std::optional<ByteRange> &range,
        std::string &result) override;

    XrdCl::XRootDStatus GetSize(const std::string &key, uint64_t &size) override;

    struct Response {
        CURLcode code{CURLE_OK};
        long status{0};       // HTTP status or FTP reply code
        int64_t length{-1};   // Content length reported by the server, if any
        std::string error;    // libcurl error buffer contents
    };

    // Convert a completed request into a status; `body` holds the response body.
    virtual XrdCl::XRootDStatus ToStatus(const Response &resp, const std::string &body,
        const std::string &url) const;

    // Fails a successful HTTP response that ignored a byte range request.  A
    // 200 is only acceptable for an open range starting at zero.
    XrdCl::XRootDStatus CheckRangeResponse(const Response &resp, const std::optional<ByteRange> &range,
        const std::string &url) const;

protected:
    CurlBackend(const std::string &name, const std::string &url, const Settings &settings, XrdCl::Log *log);

    // The full URL for an object key.
    virtual std::string ObjectUrl(const std::string &key) const {return m_url + key;}

    // Whether the response status is an HTTP status (as opposed to an FTP reply code).
    virtual bool IsHttp() const {return true;}

    // Perform a single request against `url`.  When `nobody` is set, only the
    // metadata is requested (HEAD for HTTP, SIZE for FTP).
    Response Perform(const std::string &url, const std::optional<ByteRange> &range, bool nobody,
        std::string &body);

    const Settings m_settings;

private:
    static size_t WriteCallback(char *buffer, size_t size, size_t nitems, void *this_ptr);

    CurlPtr m_curl;
};

}

#endif // NODDFETCH_CURLBACKEND_HH
