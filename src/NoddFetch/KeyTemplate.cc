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

#include "KeyTemplate.hh"

#include <fmt/format.h>

#include <ctime>

using namespace NoddFetch;

bool
NoddFetch::RenderTemplate(const std::string &pattern, const KeyFields &fields, std::string &result,
    std::string &err)
{
    auto tt = std::chrono::system_clock::to_time_t(fields.cycle);
    std::tm tm;
    gmtime_r(&tt, &tm);

    try {
        result = fmt::format(fmt::runtime(pattern),
            fmt::arg("year", tm.tm_year + 1900),
            fmt::arg("hr", tm.tm_hour),
            fmt::arg("day", FormatTime(fields.cycle, "%Y%m%d")),
            fmt::arg("yyjjj", FormatTime(fields.cycle, "%y%j")),
            fmt::arg("prod_type", fields.prod_type),
            fmt::arg("fxx", fields.fxx),
            fmt::arg("mem", fields.mem.value_or(0)));
    } catch (fmt::format_error &exc) {
        err = "Failed to render template '" + pattern + "': " + exc.what();
        return false;
    }
    return true;
}

std::string
NoddFetch::ParentPath(const std::string &key)
{
    auto pos = key.rfind('/');
    if (pos == std::string::npos) {
        return "";
    }
    return key.substr(0, pos);
}
