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

#ifndef NODDFETCH_PRODUCTSPEC_HH
#define NODDFETCH_PRODUCTSPEC_HH

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace NoddFetch {

// Static configuration for one data product, loaded from the registry.
struct ProductSpec {
    std::string key;            // Registry key ("hrrr")
    std::string name;           // Display name
    std::string source;         // Bucket name, http(s):// base URL or ftp:// URL

    // Short type aliases (as given on the command line) mapped to the
    // canonical product type substituted for `{prod_type}`.  The empty alias
    // is the default type.
    std::map<std::string, std::string> types;

    std::string last_run;       // Cadence template; see ResolveLatestRun
    std::string key_pattern;
    std::optional<std::string> key_pattern_alt;
    std::string path_def;       // Placeholder in key_pattern_alt replaced by the alternate path

    std::vector<unsigned> forecasts;
    std::optional<std::vector<unsigned>> mems;

    std::optional<std::string> search_str;
    std::map<std::string, std::string> search_str_types;  // Per type-alias overrides

    std::optional<std::string> ods_name;
    std::optional<std::string> match_pattern;

    unsigned cycle_hours{1};
    std::vector<std::string> chunked_types;  // Canonical types whose full files are fetched in chunks
    bool precip_fix{false};                  // Pin APCP:surface to the one-hour accumulation
};

// The name-keyed table of known products.
class ProductRegistry {
public:
    // The registry compiled into the library.
    static ProductRegistry BuiltIn();

    // Merge the products defined in a JSON document; entries replace existing
    // ones with the same key.  On failure, the registry is unchanged.
    bool Merge(const std::string &json_text, std::string &err);

    bool MergeFile(const std::string &path, std::string &err);

    // Returns nullptr if the product is unknown.
    const ProductSpec *Find(const std::string &key) const;

    std::vector<std::string> Names() const;

private:
    std::map<std::string, ProductSpec> m_products;
};

}

#endif // NODDFETCH_PRODUCTSPEC_HH
