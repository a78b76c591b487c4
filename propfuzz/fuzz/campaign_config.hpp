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

#include <propfuzz/core/config.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

PROPFUZZ_NAMESPACE_BEGIN

inline constexpr auto TARGET_CONTRACT = "InvariantBreaker";
inline constexpr auto CHECKER_CONTRACT = "InvariantTest";

inline constexpr auto SETUP_SIGNATURE = "setUp()";
// returns the address of the contract under test
inline constexpr auto TARGET_GETTER_SIGNATURE = "inv()";
inline constexpr auto INVARIANT_SIGNATURE = "invariant_neverFalse()";

inline constexpr uint64_t DEFAULT_PROGRESS_INTERVAL = 100'000;

struct CampaignConfig
{
    static constexpr uint64_t default_seed =
        std::numeric_limits<uint64_t>::max();

    std::string target_contract = TARGET_CONTRACT;
    std::string checker_contract = CHECKER_CONTRACT;
    std::string setup_signature = SETUP_SIGNATURE;
    std::string target_getter_signature = TARGET_GETTER_SIGNATURE;
    std::string invariant_signature = INVARIANT_SIGNATURE;
    uint64_t progress_interval = DEFAULT_PROGRESS_INTERVAL;
    std::optional<uint64_t> max_iterations = std::nullopt;
    // a reverting target call counts as a crash
    bool fail_on_revert = true;
    uint64_t seed = default_seed;

    void set_random_seed_if_default();
};

PROPFUZZ_NAMESPACE_END
