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

#include "CurlUtil.hh"

#include <cerrno>
#include <cstring>
#include <mutex>

#include <strings.h>

using namespace NoddFetch;

namespace {

std::once_flag g_curl_init;

} // namespace

ErrorClass
NoddFetch::Classify(const XrdCl::XRootDStatus &status)
{
    if (status.IsOK()) {
        return ErrorClass::Ok;
    }
    if (status.code == XrdCl::errErrorResponse && status.errNo == kXR_NotFound) {
        return ErrorClass::NotFound;
    }
    return ErrorClass::Fatal;
}

XrdCl::XRootDStatus
NoddFetch::NotFoundStatus(const std::string &message)
{
    return XrdCl::XRootDStatus(XrdCl::stError, XrdCl::errErrorResponse, kXR_NotFound, message);
}

bool
NoddFetch::HTTPStatusIsError(long status)
{
    return (status < 100) || (status >= 400);
}

std::pair<uint16_t, uint32_t>
NoddFetch::HTTPStatusConvert(long status)
{
    switch (status) {
        case 400: // Bad Request
        case 405: // Method not allowed
        case 406: // Not acceptable
        case 411: // Length required
        case 412: // Precondition failed
        case 414: // URI too long
        case 416: // Range Not Satisfiable
            return std::make_pair(XrdCl::errErrorResponse, kXR_InvalidRequest);
        case 401: // Unauthorized
        case 403: // Forbidden
        case 407: // Proxy Authentication Required
            return std::make_pair(XrdCl::errErrorResponse, kXR_NotAuthorized);
        case 404: // Not Found
        case 410: // Gone
            return std::make_pair(XrdCl::errErrorResponse, kXR_NotFound);
        case 408: // Request timeout
        case 504: // Gateway Timeout
            return std::make_pair(XrdCl::errErrorResponse, kXR_ReqTimedOut);
        case 429: // Too Many Requests
            return std::make_pair(XrdCl::errErrorResponse, kXR_Overloaded);
        case 500: // Internal Server Error
        case 501: // Not Implemented
        case 502: // Bad Gateway
        case 503: // Service Unavailable
            return std::make_pair(XrdCl::errErrorResponse, kXR_ServerError);
    }
    return std::make_pair(XrdCl::errUnknown, static_cast<uint32_t>(status));
}

std::pair<uint16_t, uint32_t>
NoddFetch::CurlCodeConvert(CURLcode res)
{
    switch (res) {
        case CURLE_OK:
            return std::make_pair(XrdCl::errNone, 0);
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
            return std::make_pair(XrdCl::errInvalidAddr, 0);
        case CURLE_LOGIN_DENIED:
        case CURLE_REMOTE_ACCESS_DENIED:
            return std::make_pair(XrdCl::errLoginFailed, EACCES);
        case CURLE_REMOTE_FILE_NOT_FOUND:
            return std::make_pair(XrdCl::errErrorResponse, kXR_NotFound);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_PEER_FAILED_VERIFICATION:
            return std::make_pair(XrdCl::errTlsError, 0);
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
            return std::make_pair(XrdCl::errSocketError, EIO);
        case CURLE_COULDNT_CONNECT:
        case CURLE_GOT_NOTHING:
            return std::make_pair(XrdCl::errConnectionError, ECONNREFUSED);
        case CURLE_OPERATION_TIMEDOUT:
            return std::make_pair(XrdCl::errOperationExpired, ETIMEDOUT);
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_NOT_BUILT_IN:
        case CURLE_RANGE_ERROR:
            return std::make_pair(XrdCl::errNotSupported, ENOSYS);
        case CURLE_FAILED_INIT:
            return std::make_pair(XrdCl::errInternal, 0);
        case CURLE_URL_MALFORMAT:
            return std::make_pair(XrdCl::errInvalidArgs, res);
        case CURLE_PARTIAL_FILE:
            return std::make_pair(XrdCl::errDataError, res);
        case CURLE_WRITE_ERROR:
            return std::make_pair(XrdCl::errInternal, res);
        case CURLE_TOO_MANY_REDIRECTS:
            return std::make_pair(XrdCl::errRedirectLimit, res);
        default:
            return std::make_pair(XrdCl::errUnknown, res);
    }
}

CurlPtr
NoddFetch::MakeCurlHandle()
{
    std::call_once(g_curl_init, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    return CurlPtr(curl_easy_init(), &curl_easy_cleanup);
}

bool
NoddFetch::CurlSupportsProtocol(const std::string &protocol)
{
    std::call_once(g_curl_init, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    auto info = curl_version_info(CURLVERSION_NOW);
    if (!info || !info->protocols) {
        return false;
    }
    for (auto proto = info->protocols; *proto; proto++) {
        if (!strcasecmp(*proto, protocol.c_str())) {
            return true;
        }
    }
    return false;
}

std::string
NoddFetch::UrlEscape(const std::string &value)
{
    auto curl = MakeCurlHandle();
    if (!curl) {
        return "";
    }
    auto escaped = curl_easy_escape(curl.get(), value.data(), static_cast<int>(value.size()));
    if (!escaped) {
        return "";
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}
