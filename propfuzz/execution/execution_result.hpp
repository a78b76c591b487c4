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

#include <propfuzz/core/byte_string.hpp>
#include <propfuzz/core/config.hpp>
#include <propfuzz/execution/address.hpp>
#include <propfuzz/execution/log.hpp>

#include <evmc/evmc.h>

#include <cstdint>
#include <optional>
#include <vector>

PROPFUZZ_NAMESPACE_BEGIN

enum class ExecutionStatus
{
    Success,
    Revert,
    Fault, // any abnormal halt: invalid opcode, out of gas, bad jump ...
};

inline constexpr ExecutionStatus
classify_status(evmc_status_code const status_code)
{
    switch (status_code) {
    case EVMC_SUCCESS:
        return ExecutionStatus::Success;
    case EVMC_REVERT:
        return ExecutionStatus::Revert;
    default:
        return ExecutionStatus::Fault;
    }
}

struct ExecutionResult
{
    ExecutionStatus status{ExecutionStatus::Fault};
    evmc_status_code status_code{EVMC_INTERNAL_ERROR};
    int64_t gas_used{0};
    byte_string output{};
    std::vector<Log> logs{};
    std::optional<Address> create_address{};
};

PROPFUZZ_NAMESPACE_END
