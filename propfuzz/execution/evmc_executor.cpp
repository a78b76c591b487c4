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

#include <propfuzz/core/byte_string.hpp>
#include <propfuzz/core/bytes.hpp>
#include <propfuzz/core/bytes_fmt.hpp>
#include <propfuzz/core/config.hpp>
#include <propfuzz/core/hex.hpp>
#include <propfuzz/core/int.hpp>
#include <propfuzz/execution/address.hpp>
#include <propfuzz/execution/address_fmt.hpp>
#include <propfuzz/execution/evmc_executor.hpp>
#include <propfuzz/execution/evmc_host.hpp>
#include <propfuzz/execution/execution_result.hpp>
#include <propfuzz/execution/state/state.hpp>
#include <propfuzz/execution/state/world_state.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>
#include <evmc/helpers.h>
#include <evmone/evmone.h>

#include <intx/intx.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>

PROPFUZZ_NAMESPACE_BEGIN

EvmcExecutor::EvmcExecutor(evmc_revision const rev)
    : vm_{evmc_create_evmone()}
    , rev_{rev}
{
    // large, but small enough that no value transfer can overflow uint256
    world_.fund(DEPLOYER, std::numeric_limits<uint256_t>::max() / 2);

    tx_context_.tx_origin = DEPLOYER;
    tx_context_.block_number = 1;
    tx_context_.block_timestamp = 1;
    tx_context_.block_gas_limit = GAS_LIMIT;
    tx_context_.chain_id = to_bytes(uint256_t{1});
}

ExecutionResult EvmcExecutor::transact(evmc_message const &msg)
{
    State state{world_};
    EvmcHost host{vm_, state, tx_context_, rev_};

    // EIP-2929
    state.access_account(msg.sender);
    if (msg.kind == EVMC_CALL) {
        state.access_account(msg.recipient);
        state.set_nonce(msg.sender, state.get_nonce(msg.sender) + 1);
    }

    auto const result = host.call(msg);

    state.destruct_suicides(rev_);
    if (rev_ >= EVMC_SPURIOUS_DRAGON) {
        state.destruct_touched_dead();
    }

    ExecutionResult res{
        .status = classify_status(result.status_code),
        .status_code = result.status_code,
        .gas_used = 0,
        .output = byte_string{result.output_data, result.output_size},
        .logs = state.logs(),
        .create_address = std::nullopt};

    world_.commit(state);

    auto gas_used = msg.gas - result.gas_left;
    auto const refund_limit = gas_used / (rev_ >= EVMC_LONDON ? 5 : 2);
    gas_used -= std::clamp(result.gas_refund, int64_t{0}, refund_limit);
    res.gas_used = gas_used;

    if (msg.kind == EVMC_CREATE && res.status == ExecutionStatus::Success) {
        res.create_address = result.create_address;
    }

    if (res.status == ExecutionStatus::Success) {
        for (size_t i = 0; i < res.logs.size(); ++i) {
            auto const &log = res.logs[i];
            LOG_DEBUG(
                "log#{} from {}: {} topics, data {}",
                i,
                log.address,
                log.topics.size(),
                to_hex(log.data));
            for (size_t j = 0; j < log.topics.size(); ++j) {
                LOG_DEBUG("  topic{}: {}", j, log.topics[j]);
            }
        }
    }
    else {
        LOG_DEBUG(
            "transaction from {} ended with {} after {} gas",
            msg.sender,
            evmc_status_code_to_string(result.status_code),
            res.gas_used);
    }

    return res;
}

ExecutionResult EvmcExecutor::deploy(byte_string_view const creation_code)
{
    evmc_message msg{};
    msg.kind = EVMC_CREATE;
    msg.gas = GAS_LIMIT;
    msg.sender = DEPLOYER;
    msg.input_data = creation_code.data();
    msg.input_size = creation_code.size();
    return transact(msg);
}

ExecutionResult
EvmcExecutor::call(Address const &address, byte_string_view const calldata)
{
    evmc_message msg{};
    msg.kind = EVMC_CALL;
    msg.gas = GAS_LIMIT;
    msg.recipient = address;
    msg.sender = DEPLOYER;
    msg.input_data = calldata.data();
    msg.input_size = calldata.size();
    msg.code_address = address;
    return transact(msg);
}

size_t EvmcExecutor::code_size(Address const &address)
{
    auto const account = world_.read_account(address);
    if (!account.has_value()) {
        return 0;
    }
    return world_.read_code(account->code_hash)->size();
}

PROPFUZZ_NAMESPACE_END
