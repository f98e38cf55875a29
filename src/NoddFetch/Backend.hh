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

#ifndef NODDFETCH_BACKEND_HH
#define NODDFETCH_BACKEND_HH

#include "ByteRange.hh"
#include "Settings.hh"

#include <XrdCl/XrdClXRootDResponses.hh>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace XrdCl {

class Log;

}

namespace NoddFetch {

// Uniform access to one data source (an S3 bucket, a web server or an FTP
// server).
//
// Every operation returns a status; a missing object is reported with the
// `kXR_NotFound` error number (see `Classify`) and an empty result.  A backend
// instance owns its connection and must only be used by one thread at a time;
// use `Clone()` to obtain an independent instance for another thread.
class Backend {
public:
    virtual ~Backend() {}

    Backend(const Backend &) = delete;
    Backend &operator=(const Backend &) = delete;

    // Download the object `key`, optionally restricted to `range`.
    virtual XrdCl::XRootDStatus Download(const std::string &key, const std::optional<ByteRange> &range,
        std::string &result) = 0;

    // Determine the length of the object `key`.
    virtual XrdCl::XRootDStatus GetSize(const std::string &key, uint64_t &size) = 0;

    // List objects under `prefix` whose key contains `pattern`, excluding
    // sidecar index objects.  Keys are returned in listing order.
    //
    // Only the object store implements listing; other backends return errNotSupported.
    virtual XrdCl::XRootDStatus ListMatches(const std::string &prefix, const std::string &pattern,
        std::vector<std::string> &keys);

    // Whether byte-range requests are honored, allowing GRIB subsetting.
    virtual bool CanSubset() const = 0;

    // Create an independent instance (with its own connection) for the same source.
    virtual std::unique_ptr<Backend> Clone() const = 0;

    // The server name (bucket or hostname).
    const std::string &GetName() const {return m_name;}

    // The base URL of the source, used as a prefix for object keys in log messages.
    const std::string &GetURL() const {return m_url;}

protected:
    Backend(const std::string &name, const std::string &url, XrdCl::Log *log)
        : m_name(name), m_url(url), m_logger(log)
    {}

    // Log the status of an operation according to its classification and
    // return it unchanged.
    XrdCl::XRootDStatus Report(const XrdCl::XRootDStatus &status, const char *operation,
        const std::string &key) const;

    const std::string m_name;
    const std::string m_url;
    XrdCl::Log *m_logger;
};

// Construct the backend for a product source.
//
// The source is disambiguated by prefix: "http://" or "https://" selects the
// web backend, "ftp://" the FTP backend and anything else (a bare bucket name
// or "s3://bucket") the object store.  If `force_http` is set, object-store
// sources are accessed through their public HTTPS endpoint instead.
std::pair<XrdCl::XRootDStatus, std::unique_ptr<Backend>> CreateBackend(const std::string &source,
    bool force_http, const Settings &settings, XrdCl::Log *log);

}

#endif // NODDFETCH_BACKEND_HH
