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

#include <propfuzz/core/bytes.hpp>
#include <propfuzz/core/config.hpp>
#include <propfuzz/execution/address.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <cstddef>
#include <cstdint>

PROPFUZZ_NAMESPACE_BEGIN

class State;

// EIP-170
inline constexpr size_t MAX_CODE_SIZE_EIP170 = 24 * 1024;

/// `evmc::Host` over a transaction `State`. Nested calls and creates are
/// executed through the same VM.
class EvmcHost final : public evmc::Host
{
    evmc::VM &vm_;
    State &state_;
    evmc_tx_context const &tx_context_;
    evmc_revision const rev_;
    size_t const max_code_size_;

public:
    EvmcHost(
        evmc::VM &, State &, evmc_tx_context const &, evmc_revision,
        size_t max_code_size = MAX_CODE_SIZE_EIP170) noexcept;

    evmc::VM &vm() noexcept
    {
        return vm_;
    }

    evmc_revision revision() const noexcept
    {
        return rev_;
    }

    bool account_exists(Address const &) const noexcept override;

    bytes32_t
    get_storage(Address const &, bytes32_t const &key) const noexcept override;

    evmc_storage_status set_storage(
        Address const &, bytes32_t const &key,
        bytes32_t const &value) noexcept override;

    evmc::uint256be get_balance(Address const &) const noexcept override;

    size_t get_code_size(Address const &) const noexcept override;

    bytes32_t get_code_hash(Address const &) const noexcept override;

    size_t copy_code(
        Address const &, size_t offset, uint8_t *data,
        size_t size) const noexcept override;

    bool selfdestruct(
        Address const &, Address const &beneficiary) noexcept override;

    evmc::Result call(evmc_message const &) noexcept override;

    evmc_tx_context get_tx_context() const noexcept override;

    bytes32_t get_block_hash(int64_t) const noexcept override;

    void emit_log(
        Address const &, uint8_t const *data, size_t data_size,
        bytes32_t const topics[], size_t num_topics) noexcept override;

    evmc_access_status access_account(Address const &) noexcept override;

    evmc_access_status
    access_storage(Address const &, bytes32_t const &key) noexcept override;

    bytes32_t get_transient_storage(
        Address const &, bytes32_t const &key) const noexcept override;

    void set_transient_storage(
        Address const &, bytes32_t const &key,
        bytes32_t const &value) noexcept override;
};

PROPFUZZ_NAMESPACE_END
