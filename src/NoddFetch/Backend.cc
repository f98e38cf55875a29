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

#include "Backend.hh"
#include "CurlUtil.hh"
#include "FtpBackend.hh"
#include "S3Backend.hh"
#include "WebBackend.hh"

#include <XrdCl/XrdClLog.hh>

using namespace NoddFetch;

XrdCl::XRootDStatus
Backend::ListMatches(const std::string &prefix, const std::string & /*pattern*/, std::vector<std::string> &keys)
{
    keys.clear();
    return XrdCl::XRootDStatus(XrdCl::stError, XrdCl::errNotSupported, 0,
        "Listing objects under " + m_url + prefix + " is not supported by this source");
}

XrdCl::XRootDStatus
Backend::Report(const XrdCl::XRootDStatus &status, const char *operation, const std::string &key) const
{
    switch (Classify(status)) {
    case ErrorClass::Ok:
        break;
    case ErrorClass::NotFound:
        m_logger->Warning(kLogNoddFetch, "Couldn't find %s%s during %s - skipping download",
            m_url.c_str(), key.c_str(), operation);
        break;
    case ErrorClass::Fatal:
        m_logger->Error(kLogNoddFetch, "Failed %s of %s%s: %s", operation, m_url.c_str(), key.c_str(),
            status.ToStr().c_str());
        break;
    }
    return status;
}

std::pair<XrdCl::XRootDStatus, std::unique_ptr<Backend>>
NoddFetch::CreateBackend(const std::string &source, bool force_http, const Settings &settings, XrdCl::Log *log)
{
    std::unique_ptr<Backend> backend;
    std::string err;
    if (source.empty()) {
        return {XrdCl::XRootDStatus(XrdCl::stError, XrdCl::errInvalidArgs, 0, "Product source is empty"), nullptr};
    }

    if (!source.compare(0, 4, "http")) {
        backend = WebBackend::Create(source, settings, log, err);
    } else if (!source.compare(0, 3, "ftp")) {
        backend = FtpBackend::Create(source, settings, log, err);
    } else if (force_http) {
        auto bucket = S3Backend::BucketFromSource(source);
        log->Info(kLogNoddFetch, "Using the HTTPS endpoint for bucket %s", bucket.c_str());
        backend = WebBackend::Create("https://" + bucket + ".s3.amazonaws.com/", settings, log, err);
    } else {
        backend = S3Backend::Create(source, settings, log, err);
    }

    if (!backend) {
        return {XrdCl::XRootDStatus(XrdCl::stError, XrdCl::errInvalidArgs, 0, err), nullptr};
    }
    return {XrdCl::XRootDStatus(), std::move(backend)};
}
