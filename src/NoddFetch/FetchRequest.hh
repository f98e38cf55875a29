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

#ifndef NODDFETCH_FETCHREQUEST_HH
#define NODDFETCH_FETCHREQUEST_HH

#include "RunCycle.hh"

#include <XrdCl/XrdClXRootDResponses.hh>

#include <optional>
#include <string>
#include <vector>

namespace XrdCl {

class Log;

}

namespace NoddFetch {

struct ProductSpec;

// Default output root; the server name is appended when no destination is given.
constexpr const char *kDefaultDestination = "/tmp/nodd_fetched";

// Caller-supplied options for one invocation, prior to resolution against a
// product.  Unset members fall back to the product's defaults.
struct FetchOptions {
    std::string type_alias;                  // Short product type ("" selects the default type)
    std::optional<TimePoint> start;
    std::optional<TimePoint> end;
    unsigned cycles_back{0};
    std::vector<unsigned> forecasts;
    std::vector<unsigned> mems;
    std::optional<std::string> vars;         // Field-selection override; "" forces full files
    std::optional<std::string> alt_path;
    std::optional<std::string> match;
    std::string dest;
    bool ods{false};
    bool dryrun{false};
    bool save_idx{false};
    bool post{false};
};

// The fully resolved parameters of one invocation.
//
// Every effective value (forecast and member sets, key templates, field
// expression) is settled here, before any key is generated.
struct FetchRequest {
    std::string product;        // Registry key
    std::string name;           // Display name
    std::string type_alias;
    std::string product_type;   // Canonical type substituted for {prod_type}

    std::string last_run;
    std::string key_pattern;    // With any alternate path applied
    std::string ods_name;       // Template for ODS naming
    std::optional<std::string> match_pattern;

    std::optional<TimePoint> start;
    std::optional<TimePoint> end;
    unsigned cycles_back{0};
    unsigned cycle_hours{1};

    std::vector<unsigned> forecasts;
    std::optional<std::vector<unsigned>> mems;

    std::string search_str;     // Empty means fetch full files
    bool precip_fix{false};
    bool use_chunks{false};

    std::string out_dir;
    std::optional<std::string> alt_path;
    bool ods{false};
    bool dryrun{false};
    bool save_idx{false};
    bool post{false};

    // Resolve `options` against `spec`.  `server_name` names the default output
    // directory.  Problems with the options (unknown type, no alternate key
    // pattern, an invalid expression) are returned as errInvalidArgs.
    static XrdCl::XRootDStatus Resolve(const ProductSpec &spec, const FetchOptions &options,
        const std::string &server_name, FetchRequest &request, XrdCl::Log *log);
};

}

#endif // NODDFETCH_FETCHREQUEST_HH
