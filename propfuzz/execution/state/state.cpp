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
#include <propfuzz/execution/address.hpp>
#include <propfuzz/execution/log.hpp>
#include <propfuzz/execution/state/account.hpp>
#include <propfuzz/execution/state/code.hpp>
#include <propfuzz/execution/state/state.hpp>
#include <propfuzz/execution/state/world_state.hpp>

#include <evmc/evmc.h>

#include <intx/intx.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>

PROPFUZZ_NAMESPACE_BEGIN

evmc_storage_status storage_status(
    bytes32_t const &original, bytes32_t const &current,
    bytes32_t const &value)
{
    static constexpr bytes32_t zero{};

    if (current == value) {
        return EVMC_STORAGE_ASSIGNED;
    }
    // first write to the slot in this transaction
    if (original == current) {
        if (original == zero) {
            return EVMC_STORAGE_ADDED;
        }
        return value == zero ? EVMC_STORAGE_DELETED : EVMC_STORAGE_MODIFIED;
    }
    if (original == zero) {
        return value == zero ? EVMC_STORAGE_ADDED_DELETED
                             : EVMC_STORAGE_ASSIGNED;
    }
    if (current == zero) {
        return value == original ? EVMC_STORAGE_DELETED_RESTORED
                                 : EVMC_STORAGE_DELETED_ADDED;
    }
    if (value == zero) {
        return EVMC_STORAGE_MODIFIED_DELETED;
    }
    return value == original ? EVMC_STORAGE_MODIFIED_RESTORED
                             : EVMC_STORAGE_ASSIGNED;
}

State::State(WorldState const &world)
    : world_{world}
{
}

void State::push()
{
    for_each_journal([](auto &journal) { journal.checkpoint(); });
    log_checkpoints_.push_back(logs_.size());
}

void State::pop_accept()
{
    PROPFUZZ_ASSERT(depth() > 0);
    for_each_journal([](auto &journal) { journal.accept(); });
    log_checkpoints_.pop_back();
}

void State::pop_reject()
{
    PROPFUZZ_ASSERT(depth() > 0);
    for_each_journal([](auto &journal) { journal.revert(); });
    logs_.resize(log_checkpoints_.back());
    log_checkpoints_.pop_back();
}

std::optional<Account> State::read_account(Address const &address) const
{
    if (auto const *const account = accounts_.find(address)) {
        return *account;
    }
    return world_.read_account(address);
}

bool State::account_exists(Address const &address) const
{
    return read_account(address).has_value();
}

bool State::account_is_dead(Address const &address) const
{
    return is_dead(read_account(address));
}

uint64_t State::get_nonce(Address const &address) const
{
    auto const account = read_account(address);
    return account.has_value() ? account->nonce : 0;
}

bytes32_t State::get_balance(Address const &address) const
{
    auto const account = read_account(address);
    if (!account.has_value()) {
        return {};
    }
    return intx::be::store<bytes32_t>(account->balance);
}

bytes32_t State::get_code_hash(Address const &address) const
{
    auto const account = read_account(address);
    return account.has_value() ? account->code_hash : NULL_HASH;
}

bytes32_t
State::original_storage(Address const &address, bytes32_t const &key) const
{
    // storage of an account created in this transaction starts empty
    if (created_.contains(address)) {
        return {};
    }
    return world_.read_storage(address, key);
}

bytes32_t
State::get_storage(Address const &address, bytes32_t const &key) const
{
    if (auto const *const value = storage_.find({address, key})) {
        return *value;
    }
    if (!account_exists(address)) {
        return {};
    }
    return original_storage(address, key);
}

bytes32_t State::get_transient_storage(
    Address const &address, bytes32_t const &key) const
{
    auto const *const value = transient_storage_.find({address, key});
    return value ? *value : bytes32_t{};
}

void State::set_nonce(Address const &address, uint64_t const nonce)
{
    update_account(address, [nonce](Account &account) {
        account.nonce = nonce;
    });
}

void State::add_to_balance(Address const &address, uint256_t const &delta)
{
    update_account(address, [&delta](Account &account) {
        PROPFUZZ_ASSERT(
            std::numeric_limits<uint256_t>::max() - delta >= account.balance,
            "balance overflow");
        account.balance += delta;
    });
    touch(address);
}

void State::subtract_from_balance(
    Address const &address, uint256_t const &delta)
{
    update_account(address, [&delta](Account &account) {
        PROPFUZZ_ASSERT(delta <= account.balance);
        account.balance -= delta;
    });
    touch(address);
}

evmc_storage_status State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    PROPFUZZ_ASSERT(account_exists(address));
    auto const status = storage_status(
        original_storage(address, key), get_storage(address, key), value);
    storage_.put({address, key}, value);
    return status;
}

void State::set_transient_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    transient_storage_.put({address, key}, value);
}

void State::touch(Address const &address)
{
    touched_.insert(address, true);
}

evmc_access_status State::access_account(Address const &address)
{
    return warm_accounts_.insert(address, true) ? EVMC_ACCESS_COLD
                                                : EVMC_ACCESS_WARM;
}

evmc_access_status
State::access_storage(Address const &address, bytes32_t const &key)
{
    return warm_slots_.insert({address, key}, true) ? EVMC_ACCESS_COLD
                                                    : EVMC_ACCESS_WARM;
}

bool State::selfdestruct(
    Address const &address, Address const &beneficiary,
    evmc_revision const rev)
{
    auto const account = read_account(address);
    PROPFUZZ_ASSERT(account.has_value());

    if (rev < EVMC_CANCUN || address != beneficiary ||
        created_.contains(address)) {
        add_to_balance(beneficiary, account->balance);
        // a self-beneficiary burns the balance
        update_account(address, [](Account &a) { a.balance = 0; });
    }

    return destructed_.insert(address, true);
}

void State::destruct_suicides(evmc_revision const rev)
{
    PROPFUZZ_ASSERT(depth() == 0);

    for (auto const &[address, _] : destructed_) {
        if (rev < EVMC_CANCUN || created_.contains(address)) {
            accounts_.put(address, std::nullopt);
        }
    }
}

void State::destruct_touched_dead()
{
    PROPFUZZ_ASSERT(depth() == 0);

    for (auto const &[address, _] : touched_) {
        if (account_is_dead(address)) {
            accounts_.put(address, std::nullopt);
        }
    }
}

SharedCode State::read_code(bytes32_t const &code_hash) const
{
    if (auto const it = code_.find(code_hash); it != code_.end()) {
        return it->second;
    }
    return world_.read_code(code_hash);
}

SharedCode State::get_code(Address const &address) const
{
    return read_code(get_code_hash(address));
}

size_t State::get_code_size(Address const &address) const
{
    return get_code(address)->size();
}

size_t State::copy_code(
    Address const &address, size_t const offset, uint8_t *const buffer,
    size_t const buffer_size) const
{
    auto const code = get_code(address);
    if (offset >= code->size()) {
        return 0;
    }
    auto const n = std::min(code->size() - offset, buffer_size);
    std::copy_n(code->data() + offset, n, buffer);
    return n;
}

void State::set_code(Address const &address, byte_string_view const code)
{
    if (!account_exists(address)) {
        return;
    }
    auto const code_hash = to_bytes(keccak256(code));
    code_.try_emplace(code_hash, make_shared_code(code));
    update_account(address, [&code_hash](Account &account) {
        account.code_hash = code_hash;
    });
}

void State::create_contract(Address const &address)
{
    // EIP-684; a pre-funded address keeps its balance
    PROPFUZZ_ASSERT(get_nonce(address) == 0);
    PROPFUZZ_ASSERT(get_code_hash(address) == NULL_HASH);
    update_account(address, [](Account &) {});
    created_.insert(address, true);
}

void State::store_log(Log const &log)
{
    logs_.push_back(log);
}

PROPFUZZ_NAMESPACE_END
