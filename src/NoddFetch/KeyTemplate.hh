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

#ifndef NODDFETCH_KEYTEMPLATE_HH
#define NODDFETCH_KEYTEMPLATE_HH

#include "RunCycle.hh"

#include <optional>
#include <string>

namespace NoddFetch {

// Values substituted into key, ODS-name and listing-prefix templates.
struct KeyFields {
    TimePoint cycle;
    unsigned fxx{0};
    std::optional<unsigned> mem;
    std::string prod_type;
};

// Render a template such as
//
//   "hrrr.{day:s}/conus/hrrr.t{hr:02d}z.wrf{prod_type}f{fxx:02d}.grib2"
//
// The named fields are `year` and `hr` (integers), `day` (YYYYMMDD), `yyjjj`
// (two-digit year plus day of year), `prod_type`, `fxx` and `mem` (integers;
// `mem` is 0 when the product has no members).  Format specifications follow
// the Python/fmt mini-language.
bool RenderTemplate(const std::string &pattern, const KeyFields &fields, std::string &result, std::string &err);

// Parent directory of a rendered key ("" when the key has no directory part).
std::string ParentPath(const std::string &key);

}

#endif // NODDFETCH_KEYTEMPLATE_HH
