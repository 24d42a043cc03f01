// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log_options.hpp"

#include <map>
#include <string>

#include <absl/strings/ascii.h>
#include <magic_enum.hpp>

namespace silkdsn::cmd::common {

//! Maps "critical", "error", ... "trace" to the log levels, kNone is not selectable
static std::map<std::string, log::Level> verbosity_names() {
    std::map<std::string, log::Level> names;
    for (const auto& [level, name] : magic_enum::enum_entries<log::Level>()) {
        if (level == log::Level::kNone) continue;
        names.emplace(absl::AsciiStrToLower(name.substr(1)), level);
    }
    return names;
}

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Most verbose level printed")
        ->transform(CLI::CheckedTransformer(verbosity_names(), CLI::ignore_case))
        ->default_str("info");
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Print to standard output instead of standard error");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Print log lines without colors");
    log_opts.add_flag_callback(
        "--log.local-time", [&log_settings]() { log_settings.log_utc = false; }, "Print timestamps in the local time zone instead of UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prefix log lines with the thread id");
    log_opts.add_option("--log.file", log_settings.log_file, "Also append log lines to this file");
}

}  // namespace silkdsn::cmd::common
