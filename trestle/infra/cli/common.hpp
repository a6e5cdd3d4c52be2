// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include <trestle/infra/common/log.hpp>

namespace trestle::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up option for an optional JSON configuration file, checked to exist when given
void add_option_config_file(CLI::App& cli, std::optional<std::filesystem::path>& config_file);

//! \brief Set up an option holding a duration expressed in milliseconds
void add_option_millis(CLI::App& cli, const std::string& name, std::chrono::milliseconds& value,
                       const std::string& description);

}  // namespace trestle::cmd::common
