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

#include "WebBackend.hh"

using namespace NoddFetch;

bool
WebBackend::SplitUrl(const std::string &url, std::string &scheme, std::string &host)
{
    auto pos = url.find("://");
    if (pos == std::string::npos || pos == 0) {
        return false;
    }
    scheme = url.substr(0, pos);
    auto host_start = pos + 3;
    auto host_end = url.find('/', host_start);
    host = url.substr(host_start, host_end == std::string::npos ? std::string::npos : host_end - host_start);
    return !host.empty();
}

std::unique_ptr<Backend>
WebBackend::Create(const std::string &source, const Settings &settings, XrdCl::Log *log, std::string &err)
{
    std::string scheme, host;
    if (!SplitUrl(source, scheme, host) || (scheme != "http" && scheme != "https")) {
        err = "Invalid web server source: " + source;
        return nullptr;
    }
    return std::unique_ptr<Backend>(new WebBackend(host, scheme + "://" + host + "/", settings, log));
}

std::unique_ptr<Backend>
WebBackend::Clone() const
{
    return std::unique_ptr<Backend>(new WebBackend(m_name, m_url, m_settings, m_logger));
}
