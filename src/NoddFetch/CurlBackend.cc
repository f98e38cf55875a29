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

#include "CurlBackend.hh"

#include <XrdCl/XrdClLog.hh>

using namespace NoddFetch;

CurlBackend::CurlBackend(const std::string &name, const std::string &url, const Settings &settings, XrdCl::Log *log)
    : Backend(name, url, log),
    m_settings(settings),
    m_curl(MakeCurlHandle())
{}

size_t
CurlBackend::WriteCallback(char *buffer, size_t size, size_t nitems, void *this_ptr)
{
    auto body = static_cast<std::string*>(this_ptr);
    body->append(buffer, size * nitems);
    return size * nitems;
}

CurlBackend::Response
CurlBackend::Perform(const std::string &url, const std::optional<ByteRange> &range, bool nobody, std::string &body)
{
    Response resp;
    auto curl = m_curl.get();
    if (!curl) {
        resp.code = CURLE_FAILED_INIT;
        resp.error = "Failed to initialize a libcurl handle";
        return resp;
    }
    // Resetting the handle keeps the connection cache, so consecutive requests
    // from this backend reuse their connection.
    curl_easy_reset(curl);

    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "nodd-fetch/1.0");
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, m_settings.connect_timeout);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1024L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, m_settings.low_speed_time);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlBackend::WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    if (nobody) {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    }
    std::string range_str;
    if (range) {
        range_str = range->ToCurlRange();
        curl_easy_setopt(curl, CURLOPT_RANGE, range_str.c_str());
    }

    resp.code = curl_easy_perform(curl);
    if (resp.code != CURLE_OK) {
        resp.error = errbuf[0] ? errbuf : curl_easy_strerror(resp.code);
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    curl_off_t length = -1;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK) {
        resp.length = length;
    }
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, nullptr);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, nullptr);
    return resp;
}

XrdCl::XRootDStatus
CurlBackend::ToStatus(const Response &resp, const std::string & /*body*/, const std::string &url) const
{
    if (resp.code != CURLE_OK) {
        auto [code, errNo] = CurlCodeConvert(resp.code);
        return XrdCl::XRootDStatus(XrdCl::stError, code, errNo, "Request for " + url + " failed: " + resp.error);
    }
    if (HTTPStatusIsError(resp.status)) {
        auto [code, errNo] = HTTPStatusConvert(resp.status);
        return XrdCl::XRootDStatus(XrdCl::stError, code, errNo,
            "Request for " + url + " failed with HTTP status " + std::to_string(resp.status));
    }
    return XrdCl::XRootDStatus();
}

XrdCl::XRootDStatus
CurlBackend::CheckRangeResponse(const Response &resp, const std::optional<ByteRange> &range,
    const std::string &url) const
{
    if (!range || !IsHttp() || resp.status == 206 || (range->start == 0 && range->IsOpen())) {
        return XrdCl::XRootDStatus();
    }
    return XrdCl::XRootDStatus(XrdCl::stError, XrdCl::errErrorResponse, kXR_ServerError,
        "Server did not honor the byte range request " + range->ToString() + " for " + url);
}

XrdCl::XRootDStatus
CurlBackend::Download(const std::string &key, const std::optional<ByteRange> &range, std::string &result)
{
    result.clear();
    auto url = ObjectUrl(key);
    if (range) {
        m_logger->Dump(kLogNoddFetch, "Requesting %s of %s", range->ToString().c_str(), url.c_str());
    } else {
        m_logger->Debug(kLogNoddFetch, "Requesting %s", url.c_str());
    }

    std::string body;
    auto resp = Perform(url, range, false, body);
    auto status = ToStatus(resp, body, url);
    if (status.IsOK()) {
        status = CheckRangeResponse(resp, range, url);
    }
    if (status.IsOK()) {
        result.swap(body);
    }
    return Report(status, "download", key);
}

XrdCl::XRootDStatus
CurlBackend::GetSize(const std::string &key, uint64_t &size)
{
    size = 0;
    auto url = ObjectUrl(key);
    std::string body;
    auto resp = Perform(url, std::nullopt, true, body);
    auto status = ToStatus(resp, body, url);
    if (status.IsOK()) {
        if (resp.length < 0) {
            status = XrdCl::XRootDStatus(XrdCl::stError, XrdCl::errDataError, 0,
                "Server did not report a content length for " + url);
        } else {
            size = static_cast<uint64_t>(resp.length);
        }
    }
    return Report(status, "size lookup", key);
}
