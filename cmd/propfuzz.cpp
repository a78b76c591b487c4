// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <propfuzz/compiler/solc_output.hpp>
#include <propfuzz/core/hex.hpp>
#include <propfuzz/core/log_level_map.hpp>
#include <propfuzz/execution/evmc_executor.hpp>
#include <propfuzz/fuzz/campaign_config.hpp>
#include <propfuzz/fuzz/fuzz_loop.hpp>

#include <CLI/CLI.hpp>

#include <evmc/evmc.h>
#include <evmc/helpers.h>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <map>
#include <string>

using namespace propfuzz;

namespace fs = std::filesystem;

namespace
{
    struct arguments
    {
        fs::path input;
        CampaignConfig campaign{};
        evmc_revision revision = EVMC_CANCUN;
        quill::LogLevel log_level = quill::LogLevel::Info;
    };

    arguments parse_args(int const argc, char **const argv)
    {
        auto app = CLI::App("Property-based invariant fuzzer for EVM bytecode");
        auto args = arguments{};

        app.add_option(
               "-i,--input",
               args.input,
               "Output of `solc --combined-json bin,abi` for the contracts "
               "under test")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option(
            "--seed",
            args.campaign.seed,
            "Seed to use for reproducible fuzzing (random by default)");

        app.add_option(
            "-n,--max-iterations",
            args.campaign.max_iterations,
            "Stop after this many iterations (unbounded by default)");

        app.add_option(
               "--progress-interval",
               args.campaign.progress_interval,
               "Iterations between progress lines (default 100000)")
            ->check(CLI::PositiveNumber);

        app.add_flag(
            "--fail-on-revert,!--no-fail-on-revert",
            args.campaign.fail_on_revert,
            "Report a reverting call to the target as a crash (default on)");

        auto const rev_map = std::map<std::string, evmc_revision>{
            {"BYZANTIUM", EVMC_BYZANTIUM},
            {"CONSTANTINOPLE", EVMC_CONSTANTINOPLE},
            {"PETERSBURG", EVMC_PETERSBURG},
            {"ISTANBUL", EVMC_ISTANBUL},
            {"BERLIN", EVMC_BERLIN},
            {"LONDON", EVMC_LONDON},
            {"PARIS", EVMC_PARIS},
            {"SHANGHAI", EVMC_SHANGHAI},
            {"CANCUN", EVMC_CANCUN},
            {"PRAGUE", EVMC_PRAGUE},
            {"LATEST", EVMC_LATEST_STABLE_REVISION}};
        app.add_option(
               "--revision",
               args.revision,
               std::format(
                   "Set EVM revision (default: {})",
                   evmc_revision_to_string(args.revision)))
            ->transform(CLI::CheckedTransformer(rev_map, CLI::ignore_case))
            ->option_text("TEXT");

        app.add_option("--log_level", args.log_level, "level of logging")
            ->transform(
                CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

        try {
            app.parse(argc, argv);
        }
        catch (CLI::ParseError const &e) {
            std::exit(app.exit(e));
        }

        args.campaign.set_random_seed_if_default();
        return args;
    }
}

int main(int const argc, char **const argv)
{
    auto const args = parse_args(argc, argv);

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(args.log_level);

    LOG_INFO(
        "Fuzzing @ {} with seed {}",
        evmc_revision_to_string(args.revision),
        args.campaign.seed);

    auto const output = load_solc_output(args.input);
    if (output.has_error()) {
        LOG_ERROR(
            "could not read {}: {}",
            args.input.string(),
            output.error().message().c_str());
        quill::flush();
        return EXIT_FAILURE;
    }

    EvmcExecutor executor{args.revision};
    FuzzLoop loop{executor, args.campaign};

    if (auto const res = loop.setup(output.value()); res.has_error()) {
        LOG_ERROR("setup failed: {}", res.error().message().c_str());
        quill::flush();
        return EXIT_FAILURE;
    }

    auto const report = loop.run();
    if (report.has_error()) {
        LOG_ERROR(
            "campaign aborted after {} iterations: {}",
            loop.iterations(),
            report.error().message().c_str());
        quill::flush();
        return EXIT_FAILURE;
    }
    quill::flush();

    auto const &[iterations, crash] = report.value();
    if (!crash.has_value()) {
        std::cout << std::format(
            "No crash found after {} iterations (seed {})\n",
            iterations,
            args.campaign.seed);
        return EXIT_SUCCESS;
    }
    std::cout << std::format(
        "Crash found after {} iterations!\n"
        "Crashing input: {}\n"
        "  function: {}\n"
        "  reason: {} ({})\n"
        "  seed: {}\n",
        iterations,
        to_hex(crash->calldata),
        crash->function,
        to_string(crash->kind),
        evmc_status_code_to_string(crash->status_code),
        args.campaign.seed);
    return EXIT_SUCCESS;
}
