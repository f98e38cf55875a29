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

#include "ProductSpec.hh"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace NoddFetch;

namespace {

const char *kBuiltInProducts = R"json({
  "hrrr": {
    "name": "NOAA High-Resolution Rapid Refresh (HRRR) Model",
    "source": "noaa-hrrr-bdp-pds",
    "types": {"": "sfc", "subh": "subh", "prs": "prs", "nat": "nat"},
    "last_run": "{day:s}{prev_hr:s}",
    "key_pattern": "hrrr.{day:s}/conus/hrrr.t{hr:02d}z.wrf{prod_type}f{fxx:02d}.grib2",
    "forecasts": {"start": 0, "stop": 19},
    "search_str": "FRICV|HPBL",
    "search_str_subh": "DSWRF",
    "search_str_prs": "PRES:surface",
    "search_str_nat": "GUST"
  },
  "gfs": {
    "name": "NOAA Global Forecast System (GFS)",
    "source": "noaa-gfs-bdp-pds",
    "types": {"": "0p25", "half": "0p50"},
    "last_run": "{day_sub3h:s}{last_gfs_run:s}",
    "key_pattern": "gfs.{day:s}/{hr:02d}/atmos/gfs.t{hr:02d}z.pgrb2.{prod_type}.f{fxx:03d}",
    "ods_name": "{day}_{hr:02d}00/{yyjjj}{hr:02d}000{fxx:03d}",
    "forecasts": {"start": 0, "stop": 64},
    "search_str": "(:TMP:surface|:PRATE:surface|:APCP:surface)",
    "cycle_hours": 6
  },
  "blend": {
    "name": "NOAA National Blend of Models (NBM)",
    "source": "noaa-nbm-grib2-pds",
    "types": {"": "core"},
    "last_run": "{day:s}{prev_hr:s}",
    "key_pattern": "blend.{day:s}/{hr:02d}/core/blend.t{hr:02d}z.core.f{fxx:03d}.co.grib2",
    "forecasts": {"start": 1, "stop": 19},
    "search_str": "(:TMP:surface|:WIND:surface|:WDIR:surface|:APCP:surface|:PTYPE:surface)",
    "precip_fix": true
  },
  "rrfs_hr": {
    "name": "NOAA Rapid Refresh Forecast System (RRFS) - hourly runtimes",
    "source": "noaa-rrfs-pds",
    "types": {"": "natlev", "prs": "prslev", "test": "testbed", "fip": "ififip"},
    "last_run": "{two_hrs_back}",
    "path_def": "ALTPATH",
    "key_pattern": "rrfs_a/rrfs_a.{day:s}/{hr:02d}/control/rrfs.t{hr:02d}z.{prod_type}.f{fxx:03d}.grib2",
    "key_pattern_alt": "rrfs_a/rrfs_a.{day:s}/{hr:02d}/control/rrfs.t{hr:02d}z.{prod_type}.f{fxx:03d}.ALTPATH.grib2",
    "forecasts": {"start": 0, "stop": 19},
    "chunked_types": ["natlev", "prslev"]
  },
  "rrfs": {
    "name": "NOAA Rapid Refresh Forecast System (RRFS) - at 6 hour runtimes",
    "source": "noaa-rrfs-pds",
    "types": {"": "natlev", "prs": "prslev", "test": "testbed", "fip": "ififip"},
    "last_run": "{last_ofs_run}",
    "path_def": "ALTPATH",
    "key_pattern": "rrfs_a/rrfs_a.{day:s}/{hr:02d}/control/rrfs.t{hr:02d}z.{prod_type}.f{fxx:03d}.grib2",
    "key_pattern_alt": "rrfs_a/rrfs_a.{day:s}/{hr:02d}/control/rrfs.t{hr:02d}z.{prod_type}.f{fxx:03d}.ALTPATH.grib2",
    "forecasts": {"start": 19, "stop": 61},
    "cycle_hours": 6,
    "chunked_types": ["natlev", "prslev"]
  },
  "rrfs_ens": {
    "name": "NOAA Rapid Refresh Forecast System (RRFS) - Multi physics ensemble",
    "source": "noaa-rrfs-pds",
    "types": {"": "prslev", "test": "testbed"},
    "last_run": "{last_ofs_run}",
    "path_def": "ALTPATH",
    "key_pattern": "rrfs_a/rrfs_a.{day:s}/{hr:02d}/mem{mem:04d}/rrfs.t{hr:02d}z.m{mem:02d}.{prod_type}.f{fxx:03d}.conus.grib2",
    "key_pattern_alt": "rrfs_a/rrfs_a.{day:s}/{hr:02d}/mem{mem:04d}/rrfs.t{hr:02d}z.m{mem:02d}.{prod_type}.f{fxx:03d}.ALTPATH.grib2",
    "forecasts": {"start": 0, "stop": 61},
    "mems": {"start": 1, "stop": 6},
    "cycle_hours": 6,
    "chunked_types": ["prslev"]
  },
  "rap": {
    "name": "NOAA Rapid Refresh (RAP)",
    "source": "noaa-rap-pds",
    "types": {"": "prs", "nat": "nat"},
    "last_run": "{day:s}{prev_hr:s}",
    "key_pattern": "rap.{day:s}/rap.t{hr:02d}z.wrf{prod_type}f{fxx:02d}.grib2",
    "forecasts": {"start": 0, "stop": 19},
    "search_str": "REF"
  }
})json";

const std::string kSearchStrPrefix = "search_str_";

// Accepts either an explicit list of integers or a half-open range object
// {"start": a, "stop": b, "step": c}.
std::vector<unsigned> ParseHours(const nlohmann::json &value, const std::string &field)
{
    std::vector<unsigned> result;
    if (value.is_array()) {
        for (const auto &entry : value) {
            result.push_back(entry.get<unsigned>());
        }
        return result;
    }
    if (!value.is_object()) {
        throw std::invalid_argument(field + " must be a list of integers or a range object");
    }
    auto start = value.value("start", 0u);
    auto stop = value.at("stop").get<unsigned>();
    auto step = value.value("step", 1u);
    if (!step) {
        throw std::invalid_argument(field + " has a zero step");
    }
    for (auto hour = start; hour < stop; hour += step) {
        result.push_back(hour);
    }
    return result;
}

std::optional<std::string> OptionalString(const nlohmann::json &obj, const char *field)
{
    auto iter = obj.find(field);
    if (iter == obj.end() || iter->is_null()) {
        return std::nullopt;
    }
    return iter->get<std::string>();
}

ProductSpec ParseProduct(const std::string &key, const nlohmann::json &obj)
{
    if (!obj.is_object()) {
        throw std::invalid_argument("entry is not an object");
    }
    ProductSpec spec;
    spec.key = key;
    spec.name = obj.at("name").get<std::string>();
    spec.source = obj.at("source").get<std::string>();
    spec.types = obj.at("types").get<std::map<std::string, std::string>>();
    spec.last_run = obj.at("last_run").get<std::string>();
    spec.key_pattern = obj.at("key_pattern").get<std::string>();
    spec.key_pattern_alt = OptionalString(obj, "key_pattern_alt");
    spec.path_def = obj.value("path_def", std::string());
    if (spec.key_pattern_alt && spec.path_def.empty()) {
        throw std::invalid_argument("key_pattern_alt requires path_def");
    }
    spec.forecasts = ParseHours(obj.at("forecasts"), "forecasts");
    if (obj.contains("mems")) {
        spec.mems = ParseHours(obj.at("mems"), "mems");
    }
    spec.search_str = OptionalString(obj, "search_str");
    for (const auto &[field, value] : obj.items()) {
        if (field.compare(0, kSearchStrPrefix.size(), kSearchStrPrefix) == 0) {
            spec.search_str_types[field.substr(kSearchStrPrefix.size())] = value.get<std::string>();
        }
    }
    spec.ods_name = OptionalString(obj, "ods_name");
    spec.match_pattern = OptionalString(obj, "match_pattern");
    spec.cycle_hours = obj.value("cycle_hours", 1u);
    if (!spec.cycle_hours) {
        throw std::invalid_argument("cycle_hours must be positive");
    }
    spec.chunked_types = obj.value("chunked_types", std::vector<std::string>());
    spec.precip_fix = obj.value("precip_fix", false);
    return spec;
}

} // namespace

ProductRegistry
ProductRegistry::BuiltIn()
{
    ProductRegistry registry;
    std::string err;
    // The compiled-in document is covered by the unit tests; a failure here is a build defect.
    if (!registry.Merge(kBuiltInProducts, err)) {
        throw std::logic_error("Built-in product registry is invalid: " + err);
    }
    return registry;
}

bool
ProductRegistry::Merge(const std::string &json_text, std::string &err)
{
    nlohmann::json jobj;
    try {
        jobj = nlohmann::json::parse(json_text);
    } catch (nlohmann::json::exception &jexc) {
        err = std::string("Error when parsing the product registry JSON: ") + jexc.what();
        return false;
    }
    if (!jobj.is_object()) {
        err = "Product registry must be a JSON object keyed by product name";
        return false;
    }

    std::map<std::string, ProductSpec> parsed;
    for (const auto &[key, value] : jobj.items()) {
        try {
            parsed.emplace(key, ParseProduct(key, value));
        } catch (nlohmann::json::exception &jexc) {
            err = "Invalid registry entry '" + key + "': " + jexc.what();
            return false;
        } catch (std::invalid_argument &exc) {
            err = "Invalid registry entry '" + key + "': " + exc.what();
            return false;
        }
    }
    for (auto &[key, spec] : parsed) {
        m_products[key] = std::move(spec);
    }
    return true;
}

bool
ProductRegistry::MergeFile(const std::string &path, std::string &err)
{
    std::ifstream in(path);
    if (!in) {
        err = "Unable to open product registry " + path;
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (!Merge(buffer.str(), err)) {
        err = path + ": " + err;
        return false;
    }
    return true;
}

const ProductSpec *
ProductRegistry::Find(const std::string &key) const
{
    auto iter = m_products.find(key);
    return iter == m_products.end() ? nullptr : &iter->second;
}

std::vector<std::string>
ProductRegistry::Names() const
{
    std::vector<std::string> result;
    result.reserve(m_products.size());
    for (const auto &entry : m_products) {
        result.push_back(entry.first);
    }
    return result;
}
