// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include <glog/logging.h>
#include <glog/vlog_is_on.h>

#include <boost/algorithm/string/predicate.hpp>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/config.h"
#include "util/logging.h"

namespace vshred {

static bool logging_initialized = false;

static std::mutex logging_mutex;

// Maps sys_log_level to glog's minloglevel.
static std::optional<int> parse_log_level(const std::string& level) {
    static const char* const kLevels[] = {"INFO", "WARNING", "ERROR", "FATAL"};
    for (int i = 0; i < 4; ++i) {
        if (boost::iequals(level, kLevels[i])) {
            return i;
        }
    }
    return std::nullopt;
}

bool init_glog(const char* basename, bool install_signal_handler) {
    std::lock_guard<std::mutex> logging_lock(logging_mutex);

    if (logging_initialized) {
        return true;
    }

    auto min_level = parse_log_level(config::sys_log_level);
    if (!min_level.has_value()) {
        std::cerr << "sys_log_level needs to be INFO, WARNING, ERROR, FATAL, got " << config::sys_log_level
                  << std::endl;
        return false;
    }

    if (install_signal_handler) {
        google::InstallFailureSignalHandler();
    }

    FLAGS_log_dir = config::sys_log_dir;
    FLAGS_minloglevel = *min_level;
    // only FATAL goes to stderr
    FLAGS_stderrthreshold = google::GLOG_FATAL;
    // buffer INFO only, flushed at least every 30 seconds
    FLAGS_logbuflevel = google::GLOG_INFO;
    FLAGS_logbufsecs = 30;
    FLAGS_max_log_size = config::sys_log_max_size_mb;
    FLAGS_stop_logging_if_full_disk = true;

    // VLOG stays off except for the configured modules, e.g. variant_schema=2.
    FLAGS_v = -1;
    for (const auto& module : config::sys_log_verbose_modules) {
        google::SetVLOGLevel(module.c_str(), config::sys_log_verbose_level);
    }

    google::InitGoogleLogging(basename);
    logging_initialized = true;
    return true;
}

void shutdown_logging() {
    std::lock_guard<std::mutex> logging_lock(logging_mutex);
    if (!logging_initialized) {
        return;
    }
    google::ShutdownGoogleLogging();
    logging_initialized = false;
}

} // namespace vshred
