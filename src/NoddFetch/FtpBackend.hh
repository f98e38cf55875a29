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

#ifndef NODDFETCH_FTPBACKEND_HH
#define NODDFETCH_FTPBACKEND_HH

#include "CurlBackend.hh"

namespace NoddFetch {

// FTP server access.
//
// Byte ranges are sent as a REST offset plus a transfer limit; subsetting is
// only advertised when the linked libcurl supports FTP.
class FtpBackend final : public CurlBackend {
public:
    virtual ~FtpBackend() {}

    static std::unique_ptr<Backend> Create(const std::string &source, const Settings &settings,
        XrdCl::Log *log, std::string &err);

    bool CanSubset() const override {return m_can_subset;}

    std::unique_ptr<Backend> Clone() const override;

    XrdCl::XRootDStatus ToStatus(const Response &resp, const std::string &body,
        const std::string &url) const override;

protected:
    bool IsHttp() const override {return false;}

private:
    FtpBackend(const std::string &name, const std::string &url, const Settings &settings, XrdCl::Log *log,
        bool can_subset)
        : CurlBackend(name, url, settings, log),
        m_can_subset(can_subset)
    {}

    const bool m_can_subset;
};

}

#endif // NODDFETCH_FTPBACKEND_HH
