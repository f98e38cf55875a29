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

#include "FetchRequest.hh"
#include "ProductSpec.hh"
#include "Settings.hh"

#include <XrdCl/XrdClLog.hh>

#include <algorithm>
#include <regex>

using namespace NoddFetch;

namespace {

XrdCl::XRootDStatus InvalidArgs(const std::string &msg)
{
    return XrdCl::XRootDStatus(XrdCl::stError, XrdCl::errInvalidArgs, 0, msg);
}

} // namespace

XrdCl::XRootDStatus
FetchRequest::Resolve(const ProductSpec &spec, const FetchOptions &options, const std::string &server_name,
    FetchRequest &request, XrdCl::Log *log)
{
    request = FetchRequest();
    request.product = spec.key;
    request.name = spec.name;
    request.type_alias = options.type_alias;

    auto type_iter = spec.types.find(options.type_alias);
    if (type_iter == spec.types.end()) {
        std::string known;
        for (const auto &entry : spec.types) {
            known += (known.empty() ? "'" : ", '") + entry.first + "'";
        }
        return InvalidArgs("Unknown product type '" + options.type_alias + "' for " + spec.key +
            "; known types are " + known);
    }
    request.product_type = type_iter->second;

    request.last_run = spec.last_run;
    request.key_pattern = spec.key_pattern;
    if (options.alt_path) {
        if (!spec.key_pattern_alt) {
            return InvalidArgs("Product " + spec.key + " does not define an alternate path");
        }
        request.alt_path = options.alt_path;
        request.key_pattern = *spec.key_pattern_alt;
        size_t pos = 0;
        while ((pos = request.key_pattern.find(spec.path_def, pos)) != std::string::npos) {
            request.key_pattern.replace(pos, spec.path_def.size(), *options.alt_path);
            pos += options.alt_path->size();
        }
    }

    if (spec.ods_name) {
        request.ods_name = *spec.ods_name;
    } else {
        request.ods_name = spec.key_pattern;
        if (options.ods && !options.post) {
            log->Warning(kLogNoddFetch, "No ods_name defined for %s; using the source layout", spec.key.c_str());
        }
    }

    request.forecasts = options.forecasts.empty() ? spec.forecasts : options.forecasts;
    if (spec.mems) {
        request.mems = options.mems.empty() ? *spec.mems : options.mems;
    }

    // Field selection: the command line wins, then the per-type default, then
    // the product default.
    if (options.vars) {
        request.search_str = *options.vars;
    } else {
        auto search_iter = spec.search_str_types.find(options.type_alias);
        if (!options.type_alias.empty() && search_iter != spec.search_str_types.end()) {
            request.search_str = search_iter->second;
        } else if (spec.search_str) {
            request.search_str = *spec.search_str;
        }
    }
    if (!request.search_str.empty()) {
        try {
            std::regex expr(request.search_str);
        } catch (std::regex_error &exc) {
            return InvalidArgs("Invalid field selection expression '" + request.search_str + "': " + exc.what());
        }
    }
    request.precip_fix = spec.precip_fix;

    request.match_pattern = options.match ? options.match : spec.match_pattern;

    request.start = options.start;
    request.end = options.end;
    request.cycles_back = options.cycles_back;
    request.cycle_hours = spec.cycle_hours;

    request.use_chunks = !options.alt_path && std::find(spec.chunked_types.begin(), spec.chunked_types.end(),
        request.product_type) != spec.chunked_types.end();

    request.out_dir = options.dest.empty() ? std::string(kDefaultDestination) + "/" + server_name : options.dest;
    request.ods = options.ods;
    request.dryrun = options.dryrun;
    request.save_idx = options.save_idx;
    request.post = options.post;
    return XrdCl::XRootDStatus();
}
