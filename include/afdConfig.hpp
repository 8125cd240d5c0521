// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <algorithm>
#include <cstdint>
#include <string>

#include "fmt/core.h"

namespace afd_sim {

// Enum for verbosity levels
enum class VerbosityLevel { Normal = 0, Verbose = 1, MoreVerbose = 2, MostVerbose = 3 };

// common config fields (populated from cli options or via API)
struct afdConfig {
    std::string workflow = "afd";
    std::string command = "simulate";
    std::string scenario_yaml;
    int64_t batch_size = 1;
    int64_t seq_len = 1;
    std::string output_filepath = "";
    VerbosityLevel verbosity = VerbosityLevel::Normal;

    void setVerbosityLevel(int vlvl) {
        vlvl = std::clamp(vlvl, 0, 3);
        verbosity = VerbosityLevel(vlvl);
    };
    std::string to_string() const {
        std::string repr;
        repr += fmt::format("Config {{");
        repr += fmt::format("\n  verbosity       = {}", std::string(uint32_t(verbosity), 'v'));
        repr += fmt::format("\n  workflow        = {}", workflow);
        repr += fmt::format("\n  command         = {}", command);
        repr += fmt::format("\n  scenario_yaml   = \"{}\"", scenario_yaml);
        repr += "\n";
        repr += fmt::format("\n  batch_size      = {}", batch_size);
        repr += fmt::format("\n  seq_len         = {}", seq_len);
        repr += "\n";
        repr += fmt::format("\n  output_filepath = \"{}\"", output_filepath);
        repr += "\n}";
        return repr;
    }
};

}  // namespace afd_sim
