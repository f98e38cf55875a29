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

#include "S3Backend.hh"

#include <XrdCl/XrdClLog.hh>

#include <tinyxml2.h>

#include <cstring>

using namespace NoddFetch;

std::string
S3Backend::BucketFromSource(const std::string &source)
{
    std::string bucket = source;
    if (!bucket.compare(0, 5, "s3://")) {
        bucket = bucket.substr(5);
    }
    auto pos = bucket.find('/');
    if (pos != std::string::npos) {
        bucket.resize(pos);
    }
    return bucket;
}

std::unique_ptr<Backend>
S3Backend::Create(const std::string &source, const Settings &settings, XrdCl::Log *log, std::string &err)
{
    auto bucket = BucketFromSource(source);
    if (bucket.empty() || bucket.find("://") != std::string::npos || bucket.find(':') != std::string::npos) {
        err = "Invalid S3 bucket source: " + source;
        return nullptr;
    }
    return std::unique_ptr<Backend>(new S3Backend(bucket, settings, log));
}

std::unique_ptr<Backend>
S3Backend::Clone() const
{
    return std::unique_ptr<Backend>(new S3Backend(m_name, m_settings, m_logger));
}

std::string
S3Backend::GenerateHttpUrl(const std::string &bucket, const std::string &key, const std::string &region,
    const std::string &endpoint)
{
    if (!endpoint.empty()) {
        return endpoint + "/" + bucket + "/" + key;
    }
    return "https://" + bucket + ".s3." + region + ".amazonaws.com/" + key;
}

std::string
S3Backend::ObjectUrl(const std::string &key) const
{
    return GenerateHttpUrl(m_name, key, m_settings.s3_region, m_settings.s3_endpoint);
}

std::string
S3Backend::ParseErrorCode(const std::string &xml)
{
    if (xml.empty()) {
        return "";
    }
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.c_str()) != tinyxml2::XML_SUCCESS) {
        return "";
    }
    auto elem = doc.RootElement();
    if (!elem || strcmp(elem->Name(), "Error")) {
        return "";
    }
    auto code = elem->FirstChildElement("Code");
    if (!code || !code->GetText()) {
        return "";
    }
    return code->GetText();
}

XrdCl::XRootDStatus
S3Backend::ToStatus(const Response &resp, const std::string &body, const std::string &url) const
{
    auto status = CurlBackend::ToStatus(resp, body, url);
    if (status.IsOK() || resp.code != CURLE_OK) {
        return status;
    }
    auto code = ParseErrorCode(body);
    if (code == "NoSuchKey" || code == "NoSuchBucket") {
        return NotFoundStatus("S3 object " + url + " does not exist (" + code + ")");
    }
    if (!code.empty()) {
        status.SetErrorMessage(status.GetErrorMessage() + " (" + code + ")");
    }
    return status;
}

bool
S3Backend::ParseListResponse(const std::string &xml, std::vector<std::string> &keys, std::string &next_token,
    std::string &err)
{
    next_token.clear();
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.c_str()) != tinyxml2::XML_SUCCESS) {
        err = "Server responded to object listing with invalid XML";
        return false;
    }
    auto elem = doc.RootElement();
    if (!elem || strcmp(elem->Name(), "ListBucketResult")) {
        err = "Server responded to object listing with an unexpected XML root";
        return false;
    }

    bool truncated = false;
    for (auto child = elem->FirstChildElement(); child != nullptr; child = child->NextSiblingElement()) {
        if (!strcmp(child->Name(), "Contents")) {
            auto key = child->FirstChildElement("Key");
            if (!key || !key->GetText()) {
                err = "Object listing entry is missing its key";
                return false;
            }
            keys.emplace_back(key->GetText());
        } else if (!strcmp(child->Name(), "NextContinuationToken")) {
            next_token = child->GetText() ? child->GetText() : "";
        } else if (!strcmp(child->Name(), "IsTruncated")) {
            truncated = child->GetText() && !strcmp(child->GetText(), "true");
        }
    }
    if (truncated && next_token.empty()) {
        err = "Truncated object listing did not include a continuation token";
        return false;
    }
    if (!truncated) {
        next_token.clear();
    }
    return true;
}

XrdCl::XRootDStatus
S3Backend::ListMatches(const std::string &prefix, const std::string &pattern, std::vector<std::string> &keys)
{
    keys.clear();

    // Normalize the prefix the way a filesystem path would be: no trailing
    // slash, and "." for the bucket root.
    std::string list_prefix = prefix;
    while (list_prefix.size() > 1 && list_prefix.back() == '/') {
        list_prefix.pop_back();
    }
    if (list_prefix == "." || list_prefix == "/") {
        list_prefix.clear();
    }
    m_logger->Info(kLogNoddFetch, "Listing objects under %s%s matching %s", m_url.c_str(), list_prefix.c_str(),
        pattern.c_str());

    auto base_url = GenerateHttpUrl(m_name, "", m_settings.s3_region, m_settings.s3_endpoint);
    std::string token;
    unsigned pages = 0;
    do {
        auto url = base_url + "?list-type=2&prefix=" + UrlEscape(list_prefix);
        if (!token.empty()) {
            url += "&continuation-token=" + UrlEscape(token);
        }
        std::string body;
        auto resp = Perform(url, std::nullopt, false, body);
        auto status = ToStatus(resp, body, url);
        if (!status.IsOK()) {
            keys.clear();
            return Report(status, "listing", list_prefix);
        }

        std::vector<std::string> page;
        std::string err;
        if (!ParseListResponse(body, page, token, err)) {
            m_logger->Error(kLogNoddFetch, "Failed to parse listing response: %s", body.substr(0, 1024).c_str());
            keys.clear();
            return Report(XrdCl::XRootDStatus(XrdCl::stError, XrdCl::errDataError, 0, err), "listing", list_prefix);
        }
        pages++;
        for (auto &key : page) {
            if (key.find(pattern) == std::string::npos) {
                continue;
            }
            if (key.size() >= 4 && !key.compare(key.size() - 4, 4, ".idx")) {
                continue;
            }
            keys.push_back(key);
        }
    } while (!token.empty());

    m_logger->Debug(kLogNoddFetch, "Found %zu matching objects in %u listing pages", keys.size(), pages);
    return XrdCl::XRootDStatus();
}
