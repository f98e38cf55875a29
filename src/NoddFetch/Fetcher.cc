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
#include "ChunkedTransfer.hh"
#include "CurlUtil.hh"
#include "Fetcher.hh"
#include "GribIndex.hh"

#include <XrdCl/XrdClLog.hh>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>

using namespace NoddFetch;

namespace {

const std::string kPrecipField = "APCP:surface";

XrdCl::XRootDStatus LocalError(const std::string &msg)
{
    return XrdCl::XRootDStatus(XrdCl::stError, XrdCl::errOSError, 0, msg);
}

} // namespace

Fetcher::Fetcher(const FetchRequest &request, Backend &backend, const Settings &settings,
    const std::atomic<bool> *cancel, XrdCl::Log *log)
    : m_request(request), m_backend(backend), m_settings(settings), m_cancel(cancel), m_logger(log)
{}

XrdCl::XRootDStatus
Fetcher::Run(TimePoint now)
{
    if (!m_request.post) {
        m_logger->Info(kLogNoddFetch, "Processing a data request for %s %s (path:%s, cycles_back:%u, vars:%s)",
            m_request.product.c_str(), m_request.product_type.c_str(),
            m_request.alt_path ? m_request.alt_path->c_str() : "none", m_request.cycles_back,
            m_request.search_str.c_str());
    }
    std::unique_ptr<KeySequence> sequence;
    auto status = MakeKeySequence(m_request, now, m_backend, m_logger, sequence);
    if (!status.IsOK()) {
        m_logger->Error(kLogNoddFetch, "%s", status.ToStr().c_str());
        return status;
    }
    return Run(*sequence);
}

XrdCl::XRootDStatus
Fetcher::Run(KeySequence &sequence)
{
    RemoteFile file;
    while (sequence.Next(file)) {
        if (Cancelled()) {
            m_logger->Info(kLogNoddFetch, "Cancellation requested; stopping before %s", file.key.c_str());
            return XrdCl::XRootDStatus();
        }
        m_summary.candidates++;

        auto destination = DestinationFor(file);
        std::error_code ec;
        if (std::filesystem::exists(destination, ec)) {
            m_logger->Debug(kLogNoddFetch, "Skipping existing file: %s", destination.c_str());
            m_summary.existing++;
            continue;
        }
        if (m_request.post) {
            std::cout << destination << std::endl;
        } else {
            m_logger->Info(kLogNoddFetch, "Downloading to %s", destination.c_str());
        }
        auto parent = std::filesystem::path(destination).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                auto status = LocalError("Failed to create directory " + parent.string() + ": " + ec.message());
                m_logger->Error(kLogNoddFetch, "%s", status.GetErrorMessage().c_str());
                return status;
            }
        }

        std::string content;
        auto status = FetchOne(file.key, destination, content);
        switch (Classify(status)) {
        case ErrorClass::Ok:
            break;
        case ErrorClass::NotFound:
            m_summary.missing++;
            continue;
        case ErrorClass::Fatal:
            if (Cancelled()) {
                m_logger->Info(kLogNoddFetch, "Cancellation requested; abandoned %s", file.key.c_str());
                return XrdCl::XRootDStatus();
            }
            m_logger->Error(kLogNoddFetch, "Aborting run after failure on %s%s: %s", m_backend.GetURL().c_str(),
                file.key.c_str(), status.ToStr().c_str());
            return status;
        }
        if (content.empty()) {
            continue;
        }
        status = Save(destination, content);
        if (!status.IsOK()) {
            m_logger->Error(kLogNoddFetch, "%s", status.GetErrorMessage().c_str());
            return status;
        }
        m_summary.written++;
        m_summary.bytes += content.size();
    }
    return sequence.GetStatus();
}

std::string
Fetcher::DestinationFor(const RemoteFile &file) const
{
    auto path = std::filesystem::path(m_request.out_dir) / (m_request.ods ? file.name : file.key);
    return path.lexically_normal().string();
}

std::string
Fetcher::EffectiveExpression(const std::string &key) const
{
    if (!m_request.precip_fix || m_request.search_str.find(kPrecipField) == std::string::npos) {
        return m_request.search_str;
    }
    // Only the one-hour accumulation ending at this forecast hour decodes
    // correctly; pin the field to it.  At f000 this yields "-1".
    static const std::regex fxx_expr("f([0-9]{3})");
    auto basename = std::filesystem::path(key).filename().string();
    std::smatch match;
    if (!std::regex_search(basename, match, fxx_expr)) {
        return m_request.search_str;
    }
    auto prev_fcst_hr = std::to_string(std::stoi(match[1].str()) - 1);

    auto result = m_request.search_str;
    auto replacement = kPrecipField + ":" + prev_fcst_hr;
    size_t pos = 0;
    while ((pos = result.find(kPrecipField, pos)) != std::string::npos) {
        result.replace(pos, kPrecipField.size(), replacement);
        pos += replacement.size();
    }
    return result;
}

XrdCl::XRootDStatus
Fetcher::FetchOne(const std::string &key, const std::string &destination, std::string &content)
{
    content.clear();
    if (!m_request.search_str.empty() && m_backend.CanSubset()) {
        return FetchSubset(key, destination, content);
    }

    if (m_request.save_idx) {
        auto status = SaveIndexOnly(key, destination);
        if (Classify(status) == ErrorClass::Fatal) {
            return status;
        }
    }
    if (m_request.dryrun) {
        m_logger->Info(kLogNoddFetch, "  Dry Run: Success! Would save.");
        return XrdCl::XRootDStatus();
    }
    m_logger->Debug(kLogNoddFetch, "Downloading full file from %s%s", m_backend.GetURL().c_str(), key.c_str());
    ChunkedTransfer transfer(m_backend, m_settings.workers, m_cancel, m_logger);
    return transfer.FetchFull(key, m_request.use_chunks, m_settings.chunk_size, content);
}

XrdCl::XRootDStatus
Fetcher::SaveIndexOnly(const std::string &key, const std::string &destination)
{
    std::vector<IdxEntry> entries;
    auto status = FetchIndex(m_backend, key, entries, m_logger);
    if (!status.IsOK()) {
        return status;
    }
    std::string err;
    if (!WriteIndex(entries, destination + kIndexSuffix, err)) {
        return LocalError(err);
    }
    return status;
}

XrdCl::XRootDStatus
Fetcher::FetchSubset(const std::string &key, const std::string &destination, std::string &content)
{
    auto expression = EffectiveExpression(key);
    m_logger->Debug(kLogNoddFetch, "  Getting grib subset for %s%s, vars: %s", m_backend.GetURL().c_str(),
        key.c_str(), expression.c_str());

    std::vector<IdxEntry> entries;
    auto status = FetchIndex(m_backend, key, entries, m_logger);
    if (!status.IsOK()) {
        return status;
    }
    if (m_request.save_idx) {
        std::string err;
        if (!WriteIndex(entries, destination + kIndexSuffix, err)) {
            return LocalError(err);
        }
    }

    ByteRangeMap selected;
    status = SelectByteRanges(entries, expression, selected);
    if (Classify(status) == ErrorClass::NotFound) {
        m_logger->Warning(kLogNoddFetch, "Unusable index for %s%s - skipping download: %s",
            m_backend.GetURL().c_str(), key.c_str(), status.GetErrorMessage().c_str());
        return status;
    } else if (!status.IsOK()) {
        return status;
    }
    std::vector<ByteRange> ranges;
    ranges.reserve(selected.size());
    for (const auto &[range, entry] : selected) {
        m_logger->Debug(kLogNoddFetch, "  %s GRIB line [%s]: date=%s, variable=%s, level=%s, forecast=%s",
            m_request.dryrun ? "Dry Run: Found" : "Downloading", entry.message.c_str(),
            entry.reference_time.c_str(), entry.variable.c_str(), entry.level.c_str(), entry.forecast.c_str());
        m_logger->Dump(kLogNoddFetch, "  %s -> %s", range.ToString().c_str(), entry.line.c_str());
        ranges.push_back(range);
    }

    if (m_request.dryrun) {
        m_logger->Info(kLogNoddFetch, "  Dry Run: Success! Searched for [%s] and found [%zu] GRIB fields.",
            expression.c_str(), ranges.size());
        return XrdCl::XRootDStatus();
    }

    ChunkedTransfer transfer(m_backend, m_settings.workers, m_cancel, m_logger);
    status = transfer.FetchRanges(key, ranges, content);
    if (status.IsOK()) {
        m_logger->Debug(kLogNoddFetch, "  Success! Searched for [%s] and found [%zu] GRIB fields.",
            expression.c_str(), ranges.size());
    }
    return status;
}

XrdCl::XRootDStatus
Fetcher::Save(const std::string &destination, const std::string &content)
{
    // Only complete files appear under the final name; later runs skip any
    // destination that exists.
    auto partial = destination + ".part";
    std::ofstream out(partial, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
        return LocalError("Failed to open " + partial + " for writing");
    }
    out.write(content.data(), content.size());
    out.close();
    std::error_code ec;
    if (!out) {
        std::filesystem::remove(partial, ec);
        return LocalError("Failed to write " + partial);
    }
    std::filesystem::rename(partial, destination, ec);
    if (ec) {
        auto status = LocalError("Failed to rename " + partial + " to " + destination + ": " + ec.message());
        std::filesystem::remove(partial, ec);
        return status;
    }
    return XrdCl::XRootDStatus();
}
