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

#include "NoddFetch/Backend.hh"
#include "NoddFetch/Fetcher.hh"
#include "NoddFetch/FetchRequest.hh"
#include "NoddFetch/ProductSpec.hh"
#include "NoddFetch/RunCycle.hh"
#include "NoddFetch/Settings.hh"

#include <CLI/CLI.hpp>
#include <XrdCl/XrdClDefaultEnv.hh>
#include <XrdCl/XrdClLog.hh>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>

using namespace NoddFetch;

namespace {

std::atomic<bool> g_cancel{false};
volatile std::sig_atomic_t g_signal{0};

extern "C" void HandleSignal(int signum)
{
    g_signal = signum;
    g_cancel.store(true);
}

bool ParseDateOption(const std::string &value, const char *name, std::optional<TimePoint> &result,
    XrdCl::Log *log)
{
    if (value.empty()) {
        return true;
    }
    TimePoint tp;
    if (!ParseDate(value, tp)) {
        log->Error(kLogNoddFetch, "Invalid %s date '%s'; expected YYYY-MM-DD or YYYY-MM-DD-HH", name, value.c_str());
        return false;
    }
    result = tp;
    return true;
}

}

int main(int argc, char *argv[])
{
    CLI::App app{"Data retrieval tool for NODD (and other) products from aws (s3), http(s) or ftp"};

    FetchOptions options;
    std::string product, start, end, vars, alt_path, match, conf, logfile;
    int verbosity = 0;
    bool force_http = false;

    app.add_option("product", product, "The product dataset to fetch (e.g., hrrr, gfs)")->required();
    app.add_option("product_type", options.type_alias, "The product type, if not the default");
    app.add_flag("-v,--verbose", verbosity, "Make output more verbose; may be repeated");
    app.add_option("-l,--log", logfile, "Path to a log file");
    app.add_option("-d,--dest", options.dest, "Destination directory for downloads");
    app.add_option("--start", start, "Start of the fetch window <YYYY-MM-DD[-HH]>");
    app.add_option("--end", end, "End of the fetch window <YYYY-MM-DD[-HH]>");
    app.add_option("--vars", vars, "Regular expression selecting the GRIB fields to download; '' for full files");
    app.add_flag("--idx", options.save_idx, "Save the GRIB index alongside each downloaded file");
    app.add_option("--fcsts", options.forecasts, "Forecast hours to retrieve");
    app.add_option("--mems", options.mems, "Ensemble members to retrieve");
    app.add_option("--path", alt_path, "Alternate path for the product (e.g., hi, ak, pr)");
    app.add_option("--conf", conf, "JSON file with additional product definitions");
    app.add_option("-b,--cycles-back", options.cycles_back, "Number of cycles before the start to include")
        ->check(CLI::Range(0, 10'000));
    app.add_flag("--ods", options.ods, "Use ODS file naming (default mirrors the source)");
    app.add_flag("--dryrun", options.dryrun, "Only show what would be downloaded");
    app.add_flag("--http", force_http, "Access object-store sources over HTTPS");
    app.add_flag("--post", options.post, "Only print the downloaded filenames");
    app.add_option("--match", match, "Discover files by listing for keys containing this pattern");

    CLI11_PARSE(app, argc, argv);

    auto log = XrdCl::DefaultEnv::GetLog();
    if (options.post) {
        log->SetLevel(XrdCl::Log::WarningMsg);
    } else if (verbosity >= 2) {
        log->SetLevel(XrdCl::Log::DumpMsg);
    } else if (verbosity == 1) {
        log->SetLevel(XrdCl::Log::DebugMsg);
    } else {
        log->SetLevel(XrdCl::Log::InfoMsg);
    }
    if (!logfile.empty()) {
        auto parent = std::filesystem::path(logfile).parent_path();
        std::error_code ec;
        if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
            log->Info(kLogNoddFetch, "Creating log directory %s", parent.c_str());
            std::filesystem::create_directories(parent, ec);
        }
        auto output = new XrdCl::LogOutFile();
        if (!output->Open(logfile)) {
            delete output;
            std::cerr << "Unable to open log file " << logfile << std::endl;
            return 1;
        }
        log->SetOutput(output);
    }
    auto settings = Settings::FromEnv(XrdCl::DefaultEnv::GetEnv(), log);

    if (app.count("--vars")) {
        options.vars = vars;
    }
    if (app.count("--path")) {
        options.alt_path = alt_path;
    }
    if (app.count("--match")) {
        options.match = match;
    }
    if (!ParseDateOption(start, "start", options.start, log) || !ParseDateOption(end, "end", options.end, log)) {
        return 1;
    }

    auto registry = ProductRegistry::BuiltIn();
    if (!conf.empty()) {
        std::string err;
        if (!registry.MergeFile(conf, err)) {
            log->Error(kLogNoddFetch, "%s", err.c_str());
            return 1;
        }
    }
    auto spec = registry.Find(product);
    if (!spec) {
        std::string known;
        for (const auto &name : registry.Names()) {
            known += (known.empty() ? "" : ", ") + name;
        }
        log->Error(kLogNoddFetch, "Unknown product '%s'; known products are %s", product.c_str(), known.c_str());
        return 1;
    }

    for (auto signum : {SIGINT, SIGTERM, SIGHUP}) {
        std::signal(signum, HandleSignal);
    }

    auto start_time = std::chrono::system_clock::now();
    auto [status, backend] = CreateBackend(spec->source, force_http, settings, log);
    if (!status.IsOK()) {
        log->Error(kLogNoddFetch, "Failed to set up access to %s: %s", spec->source.c_str(),
            status.ToStr().c_str());
        return 1;
    }

    FetchRequest request;
    status = FetchRequest::Resolve(*spec, options, backend->GetName(), request, log);
    if (!status.IsOK()) {
        log->Error(kLogNoddFetch, "%s", status.GetErrorMessage().c_str());
        return 1;
    }
    if (!options.post) {
        log->Info(kLogNoddFetch, "Run started at %s, source: %s can_subset:%s",
            FormatTime(start_time, "%Y-%m-%d %H:%M:%S").c_str(), backend->GetURL().c_str(),
            backend->CanSubset() ? "true" : "false");
    }

    Fetcher fetcher(request, *backend, settings, &g_cancel, log);
    status = fetcher.Run(start_time);
    if (g_signal) {
        log->Info(kLogNoddFetch, "Run interrupted by signal %d", static_cast<int>(g_signal));
    }

    auto end_time = std::chrono::system_clock::now();
    const auto &summary = fetcher.GetSummary();
    if (!options.post) {
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(end_time - start_time).count();
        log->Info(kLogNoddFetch, "This run completed at %s with an elapsed time of %lld seconds "
            "(%u candidates, %u existing, %u missing, %u written, %llu bytes)",
            FormatTime(end_time, "%Y-%m-%d %H:%M:%S").c_str(), static_cast<long long>(elapsed),
            summary.candidates, summary.existing, summary.missing, summary.written,
            static_cast<unsigned long long>(summary.bytes));
    }
    return status.IsOK() ? 0 : 1;
}
