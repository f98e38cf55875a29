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
#include "FetchRequest.hh"
#include "KeySequencer.hh"
#include "KeyTemplate.hh"

#include <XrdCl/XrdClLog.hh>

using namespace NoddFetch;

void
KeySequence::Advance()
{
    m_current += std::chrono::hours(m_request.cycle_hours);
}

TemplateKeySequence::TemplateKeySequence(const FetchRequest &request, const Window &window, XrdCl::Log *log)
    : KeySequence(request, window, log)
{}

bool
TemplateKeySequence::Next(RemoteFile &file)
{
    if (!m_status.IsOK()) {
        return false;
    }
    auto mem_count = m_request.mems ? m_request.mems->size() : 1;
    while (m_current < m_window.end) {
        if (m_mem_idx < mem_count && m_fxx_idx < m_request.forecasts.size()) {
            KeyFields fields;
            fields.cycle = m_current;
            fields.fxx = m_request.forecasts[m_fxx_idx];
            if (m_request.mems) {
                fields.mem = (*m_request.mems)[m_mem_idx];
            }
            fields.prod_type = m_request.product_type;

            if (++m_fxx_idx == m_request.forecasts.size()) {
                m_fxx_idx = 0;
                m_mem_idx++;
            }

            std::string err;
            if (!RenderTemplate(m_request.key_pattern, fields, file.key, err) ||
                !RenderTemplate(m_request.ods_name, fields, file.name, err))
            {
                m_logger->Error(kLogNoddFetch, "%s", err.c_str());
                m_status = XrdCl::XRootDStatus(XrdCl::stError, XrdCl::errInvalidArgs, 0, err);
                return false;
            }
            return true;
        }
        m_mem_idx = 0;
        m_fxx_idx = 0;
        Advance();
    }
    return false;
}

MatchKeySequence::MatchKeySequence(const FetchRequest &request, const Window &window, Backend &backend,
    XrdCl::Log *log)
    : KeySequence(request, window, log), m_backend(backend)
{}

bool
MatchKeySequence::Next(RemoteFile &file)
{
    while (m_pending.empty()) {
        if (!m_status.IsOK() || m_current >= m_window.end) {
            return false;
        }
        KeyFields fields;
        fields.cycle = m_current;
        fields.prod_type = m_request.product_type;
        Advance();

        std::string key_path, err;
        if (!RenderTemplate(m_request.key_pattern, fields, key_path, err)) {
            m_logger->Error(kLogNoddFetch, "%s", err.c_str());
            m_status = XrdCl::XRootDStatus(XrdCl::stError, XrdCl::errInvalidArgs, 0, err);
            return false;
        }
        auto key_dir = ParentPath(key_path);
        m_logger->Info(kLogNoddFetch, "Looking for live data under %s that matches the pattern %s",
            key_dir.c_str(), m_request.match_pattern->c_str());

        std::vector<std::string> keys;
        auto status = m_backend.ListMatches(key_dir, *m_request.match_pattern, keys);
        switch (Classify(status)) {
        case ErrorClass::Ok:
            m_pending.insert(m_pending.end(), keys.begin(), keys.end());
            break;
        case ErrorClass::NotFound:
            m_logger->Warning(kLogNoddFetch, "Nothing found under %s: %s", key_dir.c_str(),
                status.ToStr().c_str());
            break;
        case ErrorClass::Fatal:
            m_status = status;
            return false;
        }
    }
    file.key = m_pending.front();
    file.name = file.key;
    m_pending.pop_front();
    return true;
}

XrdCl::XRootDStatus
NoddFetch::MakeKeySequence(const FetchRequest &request, TimePoint now, Backend &backend, XrdCl::Log *log,
    std::unique_ptr<KeySequence> &sequence)
{
    Window window;
    std::string err;
    if (!ResolveWindow(request.last_run, request.product_type, now, request.start, request.end,
        request.cycle_hours, request.cycles_back, window, err))
    {
        return XrdCl::XRootDStatus(XrdCl::stError, XrdCl::errConfig, 0, err);
    }
    if (!request.post) {
        log->Info(kLogNoddFetch, "Fetching cycles from %s through %s (exclusive) every %u hour(s)",
            FormatTime(window.start, "%Y-%m-%d-%H").c_str(), FormatTime(window.end, "%Y-%m-%d-%H").c_str(),
            request.cycle_hours);
    }

    if (request.match_pattern) {
        sequence.reset(new MatchKeySequence(request, window, backend, log));
    } else {
        sequence.reset(new TemplateKeySequence(request, window, log));
    }
    return XrdCl::XRootDStatus();
}
