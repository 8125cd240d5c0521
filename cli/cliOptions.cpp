// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#include "cliOptions.hpp"

#include <boost/program_options/option.hpp>
#include <boost/program_options/positional_options.hpp>
#include <iostream>

#include "afdConfig.hpp"
#include "afdReport.hpp"
#include "afdUtil.hpp"
#include "boost/program_options/options_description.hpp"
#include "boost/program_options/parsers.hpp"
#include "boost/program_options/variables_map.hpp"
#include "fmt/core.h"

namespace po = boost::program_options;

namespace afd_sim {

namespace {
void printUsage(const po::options_description &desc) {
    fmt::print("usage: afd_sim_cli <workflow> <command> <scenario.yaml> --batch N --seq N [options]\n\n");
    fmt::print("workflows:\n");
    for (const auto &[name, workflow] : getWorkflows()) {
        fmt::print("  {:<10} {:<10} {}\n", name, workflow.command, workflow.help_text);
    }
    fmt::print("\n");
    desc.print(std::cout);
}
}  // namespace

bool parse_options(afd_sim::afdConfig& afd_config, int argc, char** argv) {
    try {
        // Declare the supported options
        po::options_description desc("Allowed options");
        // clang-format off
        desc.add_options()
            ("help,h",   "show help message")
            ("batch,b",  po::value<int64_t>()->required(),                         "Batch size")
            ("seq,s",    po::value<int64_t>()->required(),                         "Sequence length")
            ("output,o", po::value<std::string>()->default_value(""),              "Optional path to dump the raw result as JSON")
            ("verbose,v", po::value<int>()->default_value(0)->implicit_value(1),   "Enable verbose output");
        // clang-format on

        po::options_description hidden("Positional arguments");
        // clang-format off
        hidden.add_options()
            ("workflow", po::value<std::string>(), "Workflow name")
            ("command",  po::value<std::string>(), "Workflow command")
            ("scenario", po::value<std::string>(), "Path to scenario YAML");
        // clang-format on

        po::positional_options_description positional;
        positional.add("workflow", 1).add("command", 1).add("scenario", 1);

        po::options_description all_options;
        all_options.add(desc).add(hidden);

        po::variables_map vm;
        po::store(
            po::command_line_parser(argc, argv).options(all_options).positional(positional).run(), vm);

        if (vm.count("help")) {
            printUsage(desc);
            return false;
        }

        // Check if all required options are provided
        po::notify(vm);

        if (not vm.count("workflow") or not vm.count("command") or not vm.count("scenario")) {
            log_error("Expected <workflow> <command> <scenario.yaml> positional arguments");
            printUsage(desc);
            return false;
        }

        std::string workflow_name = vm["workflow"].as<std::string>();
        std::string command = vm["command"].as<std::string>();
        auto workflow = findWorkflow(workflow_name);
        if (not workflow.has_value()) {
            log_error("Unknown workflow '{}'", workflow_name);
            printUsage(desc);
            return false;
        }
        if (workflow->command != command) {
            log_error("Workflow '{}' has no command '{}' (expected '{}')", workflow_name, command, workflow->command);
            return false;
        }

        // Calculate verbosity level
        afd_config.setVerbosityLevel(vm["verbose"].as<int>());
        if (afd_config.verbosity > afd_sim::VerbosityLevel::Normal) {
            fmt::print("  Verbosity enabled at level: {}\n", static_cast<int>(afd_config.verbosity));
        }

        // populate afdConfig
        afd_config.workflow = workflow_name;
        afd_config.command = command;
        afd_config.scenario_yaml = vm["scenario"].as<std::string>();
        afd_config.batch_size = vm["batch"].as<int64_t>();
        afd_config.seq_len = vm["seq"].as<int64_t>();
        afd_config.output_filepath = vm["output"].as<std::string>();

    } catch (const po::error& e) {
        log_error("{}", e.what());
        return false;
    }
    return true;
}

}  // namespace afd_sim
