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

#include "Settings.hh"

#include <XrdCl/XrdClEnv.hh>
#include <XrdCl/XrdClLog.hh>

using namespace NoddFetch;

namespace {

int ImportIntSetting(XrdCl::Env *env, XrdCl::Log *log, const std::string &name, const std::string &shell_name,
    int default_value, int min_value, int max_value)
{
    env->PutInt(name, default_value);
    env->ImportInt(name, shell_name);
    int value = default_value;
    if (env->GetInt(name, value)) {
        if (value < min_value || value > max_value) {
            log->Error(kLogNoddFetch, "Invalid value for %s (%d); using default value of %d",
                name.c_str(), value, default_value);
            value = default_value;
            env->PutInt(name, value);
        }
        log->Debug(kLogNoddFetch, "Using %d for %s", value, name.c_str());
    }
    return value;
}

std::string ImportStringSetting(XrdCl::Env *env, XrdCl::Log *log, const std::string &name,
    const std::string &shell_name, const std::string &default_value)
{
    std::string value;
    if (!env->GetString(name, value) || value.empty()) {
        env->PutString(name, default_value);
        env->ImportString(name, shell_name);
    }
    if (env->GetString(name, value) && !value.empty()) {
        log->Debug(kLogNoddFetch, "Setting %s to value '%s'", name.c_str(), value.c_str());
    }
    return value;
}

} // namespace

Settings
Settings::FromEnv(XrdCl::Env *env, XrdCl::Log *log)
{
    Settings settings;
    if (!env || !log) {
        return settings;
    }
    log->SetTopicName(kLogNoddFetch, "NoddFetch");

    // Chunk size for large full-file transfers, in bytes.  Between 1MB and 2GB.
    settings.chunk_size = ImportIntSetting(env, log, "NoddFetchChunkSize", "NODDFETCH_CHUNKSIZE",
        static_cast<int>(kDefaultChunkSize), 1024 * 1024, 2047 * 1024 * 1024);

    // Concurrent range requests per object.
    settings.workers = ImportIntSetting(env, log, "NoddFetchWorkers", "NODDFETCH_WORKERS",
        kDefaultWorkers, 1, 256);

    settings.connect_timeout = ImportIntSetting(env, log, "NoddFetchConnectTimeout", "NODDFETCH_CONNECTTIMEOUT",
        kDefaultConnectTimeout, 1, 3'600);

    settings.low_speed_time = ImportIntSetting(env, log, "NoddFetchLowSpeedTime", "NODDFETCH_LOWSPEEDTIME",
        kDefaultLowSpeedTime, 1, 86'400);

    auto region = ImportStringSetting(env, log, "NoddFetchS3Region", "NODDFETCH_S3REGION", settings.s3_region);
    if (!region.empty()) {
        settings.s3_region = region;
    }
    settings.s3_endpoint = ImportStringSetting(env, log, "NoddFetchS3Endpoint", "NODDFETCH_S3ENDPOINT", "");
    while (!settings.s3_endpoint.empty() && settings.s3_endpoint.back() == '/') {
        settings.s3_endpoint.pop_back();
    }

    return settings;
}
