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

#ifndef NODDFETCH_SETTINGS_HH
#define NODDFETCH_SETTINGS_HH

#include <cstdint>
#include <string>

namespace XrdCl {

class Env;
class Log;

}

namespace NoddFetch {

const uint64_t kLogNoddFetch = 73180;

// Transfer tunables, read once at startup from the client environment and
// passed by value into every component that needs them.
struct Settings {
    static constexpr uint64_t kDefaultChunkSize{500ULL * 1024 * 1024};
    static constexpr unsigned kDefaultWorkers{10};
    static constexpr long kDefaultConnectTimeout{30};
    static constexpr long kDefaultLowSpeedTime{60};

    // Maximum size of a single piece when a full object is fetched in chunks.
    uint64_t chunk_size{kDefaultChunkSize};

    // Number of concurrent range requests issued for a single object.
    unsigned workers{kDefaultWorkers};

    // Seconds allowed for establishing a connection.
    long connect_timeout{kDefaultConnectTimeout};

    // A transfer averaging under 1KB/s for this many seconds is aborted.
    long low_speed_time{kDefaultLowSpeedTime};

    // Region used to build virtual-hosted-style S3 URLs.
    std::string s3_region{"us-east-1"};

    // If set, S3 requests use path-style URLs against this endpoint instead of AWS.
    std::string s3_endpoint;

    // Register the configuration knobs with the environment (importing any
    // NODDFETCH_* shell variables) and return the validated values.
    static Settings FromEnv(XrdCl::Env *env, XrdCl::Log *log);
};

}

#endif // NODDFETCH_SETTINGS_HH
