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

#include <propfuzz/core/assert.h>
#include <propfuzz/core/byte_string.hpp>
#include <propfuzz/core/bytes.hpp>
#include <propfuzz/core/config.hpp>
#include <propfuzz/core/int.hpp>
#include <propfuzz/core/keccak.hpp>
#include <propfuzz/core/likely.h>
#include <propfuzz/execution/address.hpp>
#include <propfuzz/execution/create_contract_address.hpp>
#include <propfuzz/execution/evm.hpp>
#include <propfuzz/execution/evmc_host.hpp>
#include <propfuzz/execution/state/state.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>

PROPFUZZ_ANONYMOUS_NAMESPACE_BEGIN

// per byte of deployed code, YP (113)
constexpr int64_t CODE_DEPOSIT_GAS = 200;

uint256_t message_value(evmc_message const &msg)
{
    return intx::be::load<uint256_t>(msg.value);
}

bool can_afford(State const &state, evmc_message const &msg)
{
    return intx::be::load<uint256_t>(state.get_balance(msg.sender)) >=
           message_value(msg);
}

void move_value(State &state, evmc_message const &msg, Address const &to)
{
    auto const value = message_value(msg);
    state.subtract_from_balance(msg.sender, value);
    state.add_to_balance(to, value);
}

// Closes the frame opened for `result`; a frame that did not succeed
// keeps no refund, and only a revert hands back its remaining gas
evmc::Result close_frame(State &state, evmc::Result result)
{
    if (result.status_code == EVMC_SUCCESS) {
        state.pop_accept();
        return result;
    }
    state.pop_reject();
    result.gas_refund = 0;
    if (result.status_code != EVMC_REVERT) {
        result.gas_left = 0;
    }
    return result;
}

Address new_contract_address(State const &state, evmc_message const &msg)
{
    if (msg.kind == EVMC_CREATE) {
        // YP (85), with the nonce before the increment
        return create_contract_address(
            msg.sender, state.get_nonce(msg.sender));
    }
    return create2_contract_address(
        msg.sender,
        msg.create2_salt,
        keccak256({msg.input_data, msg.input_size}));
}

PROPFUZZ_ANONYMOUS_NAMESPACE_END

PROPFUZZ_NAMESPACE_BEGIN

evmc_status_code check_deployed_code(
    byte_string_view const code, size_t const max_code_size,
    evmc_revision const rev) noexcept
{
    // EIP-3541
    if (rev >= EVMC_LONDON && !code.empty() && code.front() == 0xef) {
        return EVMC_CONTRACT_VALIDATION_FAILURE;
    }
    // EIP-170
    if (rev >= EVMC_SPURIOUS_DRAGON && code.size() > max_code_size) {
        return EVMC_OUT_OF_GAS;
    }
    return EVMC_SUCCESS;
}

evmc::Result create(
    EvmcHost &host, State &state, evmc_message const &msg,
    size_t const max_code_size) noexcept
{
    PROPFUZZ_ASSERT(msg.kind == EVMC_CREATE || msg.kind == EVMC_CREATE2);

    auto const rev = host.revision();
    if (PROPFUZZ_UNLIKELY(!can_afford(state, msg))) {
        return evmc::Result{EVMC_INSUFFICIENT_BALANCE, msg.gas};
    }
    auto const sender_nonce = state.get_nonce(msg.sender);
    if (sender_nonce == std::numeric_limits<uint64_t>::max()) {
        return evmc::Result{EVMC_ARGUMENT_OUT_OF_RANGE, msg.gas};
    }

    auto const address = new_contract_address(state, msg);
    state.set_nonce(msg.sender, sender_nonce + 1);
    state.access_account(address);

    // EIP-684: the address must not hold code or a used nonce
    if (state.get_nonce(address) != 0 ||
        state.get_code_hash(address) != NULL_HASH) {
        return evmc::Result{EVMC_INVALID_INSTRUCTION};
    }

    state.push();
    state.create_contract(address);
    if (rev >= EVMC_SPURIOUS_DRAGON) {
        state.set_nonce(address, 1); // EIP-161
    }
    move_value(state, msg, address);

    // initcode runs as a plain call to the new account without calldata
    evmc_message init_msg = msg;
    init_msg.kind = EVMC_CALL;
    init_msg.flags = 0;
    init_msg.recipient = address;
    init_msg.code_address = address;
    init_msg.input_data = nullptr;
    init_msg.input_size = 0;
    init_msg.create2_salt = {};

    auto result = host.vm().execute(
        host, rev, init_msg, msg.input_data, msg.input_size);
    if (result.status_code != EVMC_SUCCESS) {
        return close_frame(state, std::move(result));
    }

    byte_string_view const code{result.output_data, result.output_size};
    if (auto const status = check_deployed_code(code, max_code_size, rev);
        status != EVMC_SUCCESS) {
        return close_frame(state, evmc::Result{status});
    }
    auto const deposit =
        CODE_DEPOSIT_GAS * static_cast<int64_t>(result.output_size);
    if (result.gas_left < deposit) {
        // EIP-2
        return close_frame(state, evmc::Result{EVMC_OUT_OF_GAS});
    }

    state.set_code(address, code);
    result.gas_left -= deposit;
    result.create_address = address;
    return close_frame(state, std::move(result));
}

evmc::Result
call(EvmcHost &host, State &state, evmc_message const &msg) noexcept
{
    PROPFUZZ_ASSERT(
        msg.kind == EVMC_CALL || msg.kind == EVMC_CALLCODE ||
        msg.kind == EVMC_DELEGATECALL);

    state.push();

    // a delegate call moves no value; a static one cannot carry any
    if (msg.kind != EVMC_DELEGATECALL) {
        if (PROPFUZZ_UNLIKELY(!can_afford(state, msg))) {
            state.pop_reject();
            return evmc::Result{EVMC_INSUFFICIENT_BALANCE, msg.gas};
        }
        if (!(msg.flags & EVMC_STATIC)) {
            move_value(state, msg, msg.recipient);
        }
        else if (msg.kind == EVMC_CALL) {
            state.touch(msg.recipient); // EIP-161
        }
    }

    // an account without code succeeds immediately
    auto const code = state.get_code(msg.code_address);
    return close_frame(
        state,
        host.vm().execute(
            host, host.revision(), msg, code->data(), code->size()));
}

PROPFUZZ_NAMESPACE_END
