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

#ifndef NODDFETCH_CURLUTIL_HH
#define NODDFETCH_CURLUTIL_HH

#include <XrdCl/XrdClXRootDResponses.hh>

#include <memory>
#include <string>
#include <utility>

#include <curl/curl.h>

namespace NoddFetch {

// Outcome of a transport operation, as seen by the fetch loop.
enum class ErrorClass {
    Ok,       // Operation succeeded
    NotFound, // The object (or its index) does not exist; skip it and move on
    Fatal,    // Anything else; abort the run
};

// Classify the status returned by a backend operation.
ErrorClass Classify(const XrdCl::XRootDStatus &status);

// Construct the canonical "object does not exist" status.
XrdCl::XRootDStatus NotFoundStatus(const std::string &message);

bool HTTPStatusIsError(long status);

// Convert an HTTP response status into an XRootD error code / errno pair.
std::pair<uint16_t, uint32_t> HTTPStatusConvert(long status);

// Convert a libcurl result code into an XRootD error code / errno pair.
std::pair<uint16_t, uint32_t> CurlCodeConvert(CURLcode res);

using CurlPtr = std::unique_ptr<CURL, void(*)(CURL *)>;

// Create a new easy handle; performs the process-wide libcurl initialization
// on first use.
CurlPtr MakeCurlHandle();

// Returns true if the linked libcurl was built with support for the protocol
// (e.g., "ftp").
bool CurlSupportsProtocol(const std::string &protocol);

// Percent-encode a string for use as a URL query parameter value.
std::string UrlEscape(const std::string &value);

}

#endif // NODDFETCH_CURLUTIL_HH
