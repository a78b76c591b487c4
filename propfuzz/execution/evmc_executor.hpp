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
#include <propfuzz/execution/execution_result.hpp>
#include <propfuzz/execution/executor.hpp>
#include <propfuzz/execution/state/world_state.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>

PROPFUZZ_NAMESPACE_BEGIN

/// `Executor` backed by evmone through EVMC, over an in-memory world
class EvmcExecutor final : public Executor
{
    evmc::VM vm_;
    WorldState world_{};
    evmc_revision const rev_;
    evmc_tx_context tx_context_{};

    ExecutionResult transact(evmc_message const &);

public:
    // sender of every transaction; funded at construction
    static constexpr Address DEPLOYER{0xf022de91d001};

    static constexpr int64_t GAS_LIMIT = std::numeric_limits<int64_t>::max();

    explicit EvmcExecutor(evmc_revision = EVMC_CANCUN);

    ExecutionResult deploy(byte_string_view creation_code) override;

    ExecutionResult
    call(Address const &, byte_string_view calldata) override;

    size_t code_size(Address const &) override;

    evmc_revision revision() const
    {
        return rev_;
    }
};

PROPFUZZ_NAMESPACE_END
