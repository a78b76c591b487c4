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
#include <propfuzz/core/config.hpp>
#include <propfuzz/execution/address.hpp>
#include <propfuzz/execution/evm.hpp>
#include <propfuzz/execution/evmc_host.hpp>
#include <propfuzz/execution/log.hpp>
#include <propfuzz/execution/state/state.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <cstddef>
#include <cstdint>

PROPFUZZ_NAMESPACE_BEGIN

EvmcHost::EvmcHost(
    evmc::VM &vm, State &state, evmc_tx_context const &tx_context,
    evmc_revision const rev, size_t const max_code_size) noexcept
    : vm_{vm}
    , state_{state}
    , tx_context_{tx_context}
    , rev_{rev}
    , max_code_size_{max_code_size}
{
}

bool EvmcHost::account_exists(Address const &address) const noexcept
{
    if (rev_ < EVMC_SPURIOUS_DRAGON) {
        return state_.account_exists(address);
    }
    return !state_.account_is_dead(address);
}

bytes32_t EvmcHost::get_storage(
    Address const &address, bytes32_t const &key) const noexcept
{
    return state_.get_storage(address, key);
}

evmc_storage_status EvmcHost::set_storage(
    Address const &address, bytes32_t const &key,
    bytes32_t const &value) noexcept
{
    return state_.set_storage(address, key, value);
}

evmc::uint256be EvmcHost::get_balance(Address const &address) const noexcept
{
    return state_.get_balance(address);
}

size_t EvmcHost::get_code_size(Address const &address) const noexcept
{
    return state_.get_code_size(address);
}

bytes32_t EvmcHost::get_code_hash(Address const &address) const noexcept
{
    if (state_.account_is_dead(address)) {
        return bytes32_t{};
    }
    return state_.get_code_hash(address);
}

size_t EvmcHost::copy_code(
    Address const &address, size_t const offset, uint8_t *const data,
    size_t const size) const noexcept
{
    return state_.copy_code(address, offset, data, size);
}

bool EvmcHost::selfdestruct(
    Address const &address, Address const &beneficiary) noexcept
{
    return state_.selfdestruct(address, beneficiary, rev_);
}

evmc::Result EvmcHost::call(evmc_message const &msg) noexcept
{
    if (msg.kind == EVMC_CREATE || msg.kind == EVMC_CREATE2) {
        auto result = ::propfuzz::create(*this, state_, msg, max_code_size_);

        // EIP-211
        if (result.status_code != EVMC_REVERT) {
            result = evmc::Result{
                result.status_code,
                result.gas_left,
                result.gas_refund,
                result.create_address};
        }
        return result;
    }
    return ::propfuzz::call(*this, state_, msg);
}

evmc_tx_context EvmcHost::get_tx_context() const noexcept
{
    return tx_context_;
}

// no chain history
bytes32_t EvmcHost::get_block_hash(int64_t) const noexcept
{
    return bytes32_t{};
}

void EvmcHost::emit_log(
    Address const &address, uint8_t const *const data, size_t const data_size,
    bytes32_t const topics[], size_t const num_topics) noexcept
{
    state_.store_log(Log{
        .data = byte_string{data, data_size},
        .topics = {topics, topics + num_topics},
        .address = address});
}

evmc_access_status EvmcHost::access_account(Address const &address) noexcept
{
    return state_.access_account(address);
}

evmc_access_status EvmcHost::access_storage(
    Address const &address, bytes32_t const &key) noexcept
{
    return state_.access_storage(address, key);
}

bytes32_t EvmcHost::get_transient_storage(
    Address const &address, bytes32_t const &key) const noexcept
{
    return state_.get_transient_storage(address, key);
}

void EvmcHost::set_transient_storage(
    Address const &address, bytes32_t const &key,
    bytes32_t const &value) noexcept
{
    state_.set_transient_storage(address, key, value);
}

PROPFUZZ_NAMESPACE_END
