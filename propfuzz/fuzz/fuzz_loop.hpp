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

#pragma once

#include <propfuzz/abi/calldata_generator.hpp>
#include <propfuzz/abi/selector.hpp>
#include <propfuzz/compiler/solc_output.hpp>
#include <propfuzz/core/byte_string.hpp>
#include <propfuzz/core/config.hpp>
#include <propfuzz/core/random.hpp>
#include <propfuzz/core/result.hpp>
#include <propfuzz/execution/address.hpp>
#include <propfuzz/execution/executor.hpp>
#include <propfuzz/fuzz/campaign_config.hpp>

#include <evmc/evmc.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

PROPFUZZ_NAMESPACE_BEGIN

enum class CampaignState
{
    Compiling,
    Deployed,
    Running,
    Reported,
};

enum class CrashKind
{
    TargetFault, // the target call halted abnormally
    TargetRevert, // the target call reverted, with fail_on_revert
    InvariantBroken, // the invariant returned false
    InvariantCheckAborted, // the invariant call itself reverted or faulted
};

std::string_view to_string(CrashKind);

struct Crash
{
    CrashKind kind;
    std::string function;
    byte_string calldata;
    evmc_status_code status_code;
};

struct CampaignReport
{
    uint64_t iterations;
    std::optional<Crash> crash;
};

/// Drives one invariant campaign against an `Executor`: deploy the checker,
/// run its setup, locate the target, then alternate random target calls
/// with invariant checks until the invariant breaks or the bound is hit.
class FuzzLoop
{
    Executor &executor_;
    CampaignConfig const config_;
    random_engine_t engine_;
    CampaignState state_{CampaignState::Compiling};
    std::optional<CalldataGenerator> generator_{};
    Selector const invariant_selector_;
    Address checker_address_{};
    Address target_address_{};
    uint64_t iterations_{0};

    Result<std::optional<Crash>> check_invariant();

public:
    FuzzLoop(Executor &, CampaignConfig);

    /// Compiling -> Deployed
    Result<void> setup(SolcOutput const &);

    /// One iteration; a crash moves the campaign to Reported
    Result<std::optional<Crash>> step();

    /// Steps until a crash or the iteration bound
    Result<CampaignReport> run();

    CampaignState state() const
    {
        return state_;
    }

    uint64_t iterations() const
    {
        return iterations_;
    }

    Address const &target_address() const
    {
        return target_address_;
    }

    Address const &checker_address() const
    {
        return checker_address_;
    }
};

PROPFUZZ_NAMESPACE_END
