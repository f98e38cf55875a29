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

#include "FtpBackend.hh"
#include "WebBackend.hh"

#include <XrdCl/XrdClLog.hh>

using namespace NoddFetch;

std::unique_ptr<Backend>
FtpBackend::Create(const std::string &source, const Settings &settings, XrdCl::Log *log, std::string &err)
{
    std::string scheme, host;
    if (!WebBackend::SplitUrl(source, scheme, host) || (scheme != "ftp" && scheme != "ftps")) {
        err = "Invalid FTP server source: " + source;
        return nullptr;
    }
    auto can_subset = CurlSupportsProtocol(scheme);
    if (!can_subset) {
        log->Warning(kLogNoddFetch, "libcurl was built without %s support; GRIB subsetting is disabled for %s",
            scheme.c_str(), host.c_str());
    }
    return std::unique_ptr<Backend>(new FtpBackend(host, scheme + "://" + host + "/", settings, log, can_subset));
}

std::unique_ptr<Backend>
FtpBackend::Clone() const
{
    return std::unique_ptr<Backend>(new FtpBackend(m_name, m_url, m_settings, m_logger, m_can_subset));
}

XrdCl::XRootDStatus
FtpBackend::ToStatus(const Response &resp, const std::string & /*body*/, const std::string &url) const
{
    switch (resp.code) {
    case CURLE_OK:
        return XrdCl::XRootDStatus();
    // A 550 reply surfaces as "access denied" when a directory along the path
    // is missing and as "file not found" when the file itself is.
    case CURLE_REMOTE_ACCESS_DENIED:
    case CURLE_REMOTE_FILE_NOT_FOUND:
        return NotFoundStatus("FTP object " + url + " is unavailable: " + resp.error);
    default:
        break;
    }
    auto [code, errNo] = CurlCodeConvert(resp.code);
    return XrdCl::XRootDStatus(XrdCl::stError, code, errNo,
        "FTP request for " + url + " failed (reply " + std::to_string(resp.status) + "): " + resp.error);
}
