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
#include "GribIndex.hh"

#include <XrdCl/XrdClLog.hh>

#include <charconv>
#include <fstream>
#include <regex>
#include <sstream>

using namespace NoddFetch;

namespace {

std::vector<std::string> SplitFields(const std::string &line)
{
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        auto pos = line.find(':', start);
        if (pos == std::string::npos) {
            fields.emplace_back(line.substr(start));
            break;
        }
        fields.emplace_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

XrdCl::XRootDStatus Malformed(const IdxEntry &entry)
{
    return NotFoundStatus("Index line " + std::to_string(entry.lineno) +
        " needs at least 7 fields and a numeric byte offset: " + entry.line);
}

} // namespace

void
NoddFetch::ParseIndex(const std::string &text, std::vector<IdxEntry> &entries)
{
    entries.clear();
    std::istringstream stream(text);
    std::string line;
    unsigned lineno = 0;
    while (std::getline(stream, line)) {
        lineno++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        IdxEntry entry;
        entry.lineno = lineno;
        entry.line = line;
        auto fields = SplitFields(line);
        if (fields.size() >= 7) {
            const auto &offset = fields[1];
            auto [ptr, ec] = std::from_chars(offset.data(), offset.data() + offset.size(), entry.offset);
            entry.complete = !offset.empty() && ec == std::errc() && ptr == offset.data() + offset.size();
            entry.message = fields[0];
            entry.reference_time = fields[2];
            entry.variable = fields[3];
            entry.level = fields[4];
            entry.forecast = fields[5];
        }
        entries.emplace_back(std::move(entry));
    }
}

XrdCl::XRootDStatus
NoddFetch::FetchIndex(Backend &backend, const std::string &key, std::vector<IdxEntry> &entries, XrdCl::Log *log)
{
    entries.clear();
    auto idx_key = key + kIndexSuffix;
    log->Debug(kLogNoddFetch, "Getting index from %s%s", backend.GetURL().c_str(), idx_key.c_str());

    std::string text;
    auto status = backend.Download(idx_key, std::nullopt, text);
    if (!status.IsOK()) {
        return status;
    }
    ParseIndex(text, entries);
    if (entries.empty()) {
        log->Warning(kLogNoddFetch, "Index %s%s has no GRIB fields - skipping download", backend.GetURL().c_str(),
            idx_key.c_str());
        return NotFoundStatus("Index " + idx_key + " is empty");
    }
    return XrdCl::XRootDStatus();
}

XrdCl::XRootDStatus
NoddFetch::SelectByteRanges(const std::vector<IdxEntry> &entries, const std::string &expression, ByteRangeMap &ranges)
{
    ranges.clear();
    std::regex expr;
    try {
        expr = std::regex(expression);
    } catch (std::regex_error &exc) {
        return XrdCl::XRootDStatus(XrdCl::stError, XrdCl::errInvalidArgs, 0,
            "Invalid field selection expression '" + expression + "': " + exc.what());
    }

    for (size_t idx = 0; idx < entries.size(); idx++) {
        const auto &entry = entries[idx];
        if (!std::regex_search(entry.line, expr)) {
            continue;
        }
        if (!entry.complete) {
            ranges.clear();
            return Malformed(entry);
        }
        ByteRange range(entry.offset);
        if (idx + 1 < entries.size()) {
            const auto &next = entries[idx + 1];
            if (!next.complete) {
                ranges.clear();
                return Malformed(next);
            }
            range.end = next.offset;
        }
        ranges.insert_or_assign(range, entry);
    }
    return XrdCl::XRootDStatus();
}

bool
NoddFetch::WriteIndex(const std::vector<IdxEntry> &entries, const std::string &path, std::string &err)
{
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        err = "Failed to open " + path + " for writing";
        return false;
    }
    for (size_t idx = 0; idx < entries.size(); idx++) {
        if (idx) {
            out << "\n";
        }
        out << entries[idx].line;
    }
    out.close();
    if (!out) {
        err = "Failed to write index to " + path;
        return false;
    }
    return true;
}
