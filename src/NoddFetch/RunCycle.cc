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

#include "RunCycle.hh"

#include <fmt/format.h>

#include <cctype>
#include <ctime>

using namespace NoddFetch;

namespace {

// Offsets used when deriving the reference times.
const std::chrono::minutes kGfsLag{216};  // 3.6 hours
const std::chrono::minutes kOfsLag{126};  // 2.1 hours

std::tm ToTm(TimePoint tp)
{
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm result;
    gmtime_r(&tt, &result);
    return result;
}

std::string SixHourBoundary(TimePoint tp)
{
    static const char *boundaries[] = {"00", "06", "12", "18"};
    return boundaries[ToTm(tp).tm_hour / 6];
}

bool FromTm(std::tm &tm, TimePoint &tp)
{
    auto tt = timegm(&tm);
    if (tt == static_cast<time_t>(-1)) {
        return false;
    }
    tp = std::chrono::system_clock::from_time_t(tt);
    return true;
}

bool AllDigits(const std::string &value, size_t offset, size_t count)
{
    if (value.size() < offset + count) {
        return false;
    }
    for (size_t idx = offset; idx < offset + count; idx++) {
        if (!std::isdigit(static_cast<unsigned char>(value[idx]))) {
            return false;
        }
    }
    return true;
}

} // namespace

TimePoint
NoddFetch::TruncateToHour(TimePoint tp)
{
    return std::chrono::time_point_cast<std::chrono::hours>(tp);
}

std::string
NoddFetch::FormatTime(TimePoint tp, const char *format)
{
    auto tm = ToTm(tp);
    char buf[64];
    auto len = strftime(buf, sizeof(buf), format, &tm);
    return std::string(buf, len);
}

bool
NoddFetch::ParseRunTime(const std::string &value, TimePoint &tp)
{
    if (value.size() != 10 || !AllDigits(value, 0, 10)) {
        return false;
    }
    std::tm tm{};
    if (strptime(value.c_str(), "%Y%m%d%H", &tm) == nullptr) {
        return false;
    }
    return FromTm(tm, tp);
}

bool
NoddFetch::ParseDate(const std::string &value, TimePoint &tp)
{
    if (value.size() != 10 && value.size() != 13) {
        return false;
    }
    if (!AllDigits(value, 0, 4) || value[4] != '-' || !AllDigits(value, 5, 2) || value[7] != '-' ||
        !AllDigits(value, 8, 2))
    {
        return false;
    }
    std::tm tm{};
    if (strptime(value.substr(0, 10).c_str(), "%Y-%m-%d", &tm) == nullptr) {
        return false;
    }
    if (value.size() == 13) {
        if (!AllDigits(value, 11, 2)) {
            return false;
        }
        tm.tm_hour = std::stoi(value.substr(11, 2));
        if (tm.tm_hour > 23) {
            return false;
        }
    }
    return FromTm(tm, tp);
}

ReferenceTimes
ReferenceTimes::FromNow(TimePoint now)
{
    ReferenceTimes result;
    auto last_hr = now - std::chrono::hours(1);
    result.year = FormatTime(last_hr, "%Y");
    result.day = FormatTime(last_hr, "%Y%m%d");
    result.prev_hr = FormatTime(last_hr, "%H");
    result.day_sub3h = FormatTime(now - kGfsLag, "%Y%m%d");
    result.two_hrs_back = FormatTime(now - std::chrono::hours(2), "%Y%m%d%H");
    result.last_gfs_run = SixHourBoundary(now - kGfsLag);
    result.last_ofs_run = FormatTime(now - kOfsLag, "%Y%m%d") + SixHourBoundary(now - kOfsLag);
    return result;
}

bool
NoddFetch::ResolveLatestRun(const std::string &last_run, const std::string &product_type, TimePoint now,
    TimePoint &run, std::string &err)
{
    auto ref = ReferenceTimes::FromNow(now);
    std::string rendered;
    try {
        rendered = fmt::format(fmt::runtime(last_run),
            fmt::arg("year", ref.year),
            fmt::arg("prev_hr", ref.prev_hr),
            fmt::arg("two_hrs_back", ref.two_hrs_back),
            fmt::arg("last_gfs_run", ref.last_gfs_run),
            fmt::arg("last_ofs_run", ref.last_ofs_run),
            fmt::arg("day", ref.day),
            fmt::arg("day_sub3h", ref.day_sub3h),
            fmt::arg("prod_type", product_type));
    } catch (fmt::format_error &exc) {
        err = "Invalid last_run template '" + last_run + "': " + exc.what();
        return false;
    }
    TimePoint parsed;
    if (!ParseRunTime(rendered, parsed)) {
        err = "last_run template '" + last_run + "' rendered to '" + rendered + "', which is not YYYYMMDDHH";
        return false;
    }
    run = TruncateToHour(parsed);
    return true;
}

bool
NoddFetch::ResolveWindow(const std::string &last_run, const std::string &product_type, TimePoint now,
    const std::optional<TimePoint> &start, const std::optional<TimePoint> &end, unsigned step_hours,
    unsigned cycles_back, Window &window, std::string &err)
{
    if (start) {
        window.start = *start;
    } else if (!ResolveLatestRun(last_run, product_type, now, window.start, err)) {
        return false;
    }
    window.end = end ? *end : window.start + std::chrono::hours(step_hours);
    if (cycles_back) {
        window.start -= std::chrono::hours(static_cast<long>(step_hours) * cycles_back);
    }
    return true;
}
