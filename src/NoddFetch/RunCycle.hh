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

#ifndef NODDFETCH_RUNCYCLE_HH
#define NODDFETCH_RUNCYCLE_HH

#include <chrono>
#include <optional>
#include <string>

namespace NoddFetch {

using TimePoint = std::chrono::system_clock::time_point;

// Reference values derived from "now", available to a product's `last_run`
// template as named fields.  All values are UTC.
struct ReferenceTimes {
    std::string year;          // Year of the previous hour ("2025")
    std::string day;           // Date of the previous hour ("20250131")
    std::string prev_hr;       // Hour of the previous hour ("07")
    std::string day_sub3h;     // Date 3.6 hours ago
    std::string two_hrs_back;  // Date and hour two hours ago ("2025013106")
    std::string last_gfs_run;  // 6-hour boundary as of 3.6 hours ago ("00", "06", "12" or "18")
    std::string last_ofs_run;  // Date and 6-hour boundary as of 2.1 hours ago ("2025013106")

    static ReferenceTimes FromNow(TimePoint now);
};

// Resolve the most recent run of a product whose cadence template is
// `last_run`, truncated to the hour.  The rendered template must have the form
// YYYYMMDDHH.
bool ResolveLatestRun(const std::string &last_run, const std::string &product_type, TimePoint now,
    TimePoint &run, std::string &err);

// A half-open interval of cycle times [start, end).
struct Window {
    TimePoint start;
    TimePoint end;
};

// Determine the fetch window.
//
// A missing start resolves to the latest run, a missing end to one step after
// the (unshifted) start.  With `cycles_back`, the start is then moved
// `step_hours * cycles_back` earlier.
bool ResolveWindow(const std::string &last_run, const std::string &product_type, TimePoint now,
    const std::optional<TimePoint> &start, const std::optional<TimePoint> &end, unsigned step_hours,
    unsigned cycles_back, Window &window, std::string &err);

TimePoint TruncateToHour(TimePoint tp);

// Format with strftime conventions in UTC.
std::string FormatTime(TimePoint tp, const char *format);

// Parse a YYYYMMDDHH run time.
bool ParseRunTime(const std::string &value, TimePoint &tp);

// Parse a command-line date: "YYYY-MM-DD" or "YYYY-MM-DD?HH" where '?' is any
// single separator character.
bool ParseDate(const std::string &value, TimePoint &tp);

}

#endif // NODDFETCH_RUNCYCLE_HH
