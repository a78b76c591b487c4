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
#include <propfuzz/core/bytes.hpp>
#include <propfuzz/core/config.hpp>
#include <propfuzz/core/int.hpp>
#include <propfuzz/execution/address.hpp>
#include <propfuzz/execution/log.hpp>
#include <propfuzz/execution/state/account.hpp>
#include <propfuzz/execution/state/code.hpp>
#include <propfuzz/execution/state/journaled_map.hpp>

#include <evmc/evmc.h>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

PROPFUZZ_NAMESPACE_BEGIN

struct StorageKey
{
    Address address;
    bytes32_t key;

    friend bool operator==(StorageKey const &, StorageKey const &) = default;
};

static_assert(sizeof(StorageKey) == 52);

PROPFUZZ_NAMESPACE_END

template <>
struct ankerl::unordered_dense::hash<propfuzz::StorageKey>
{
    using is_avalanching = void;

    uint64_t operator()(propfuzz::StorageKey const &k) const noexcept
    {
        return detail::wyhash::hash(&k, sizeof(k));
    }
};

PROPFUZZ_NAMESPACE_BEGIN

class WorldState;

/// Overlay of the world for the duration of one transaction. Every call
/// frame brackets its changes with `push` and then `pop_accept` or
/// `pop_reject`; nothing reaches the world until `WorldState::commit`.
class State
{
    WorldState const &world_;

    // std::nullopt marks an account removed in this transaction
    JournaledMap<Address, std::optional<Account>> accounts_{};
    JournaledMap<StorageKey, bytes32_t> storage_{};
    JournaledMap<StorageKey, bytes32_t> transient_storage_{};

    // address sets; the mapped value is unused
    JournaledMap<Address, bool> created_{};
    JournaledMap<Address, bool> destructed_{};
    JournaledMap<Address, bool> touched_{};
    JournaledMap<Address, bool> warm_accounts_{};
    JournaledMap<StorageKey, bool> warm_slots_{};

    std::vector<Log> logs_{};
    std::vector<size_t> log_checkpoints_{};

    ankerl::unordered_dense::map<bytes32_t, SharedCode> code_{};

    template <typename F>
    void for_each_journal(F &&f)
    {
        f(accounts_);
        f(storage_);
        f(transient_storage_);
        f(created_);
        f(destructed_);
        f(touched_);
        f(warm_accounts_);
        f(warm_slots_);
    }

    template <typename F>
    void update_account(Address const &address, F &&f)
    {
        auto account = read_account(address).value_or(Account{});
        f(account);
        accounts_.put(address, account);
    }

    bytes32_t original_storage(Address const &, bytes32_t const &key) const;

public:
    explicit State(WorldState const &);

    State(State &&) = delete;
    State(State const &) = delete;
    State &operator=(State &&) = delete;
    State &operator=(State const &) = delete;

    void push();

    void pop_accept();

    void pop_reject();

    // number of open frames
    size_t depth() const
    {
        return log_checkpoints_.size();
    }

    std::optional<Account> read_account(Address const &) const;

    bool account_exists(Address const &) const;

    bool account_is_dead(Address const &) const;

    uint64_t get_nonce(Address const &) const;

    bytes32_t get_balance(Address const &) const;

    bytes32_t get_code_hash(Address const &) const;

    bytes32_t get_storage(Address const &, bytes32_t const &key) const;

    bytes32_t
    get_transient_storage(Address const &, bytes32_t const &key) const;

    void set_nonce(Address const &, uint64_t nonce);

    void add_to_balance(Address const &, uint256_t const &delta);

    void subtract_from_balance(Address const &, uint256_t const &delta);

    evmc_storage_status
    set_storage(Address const &, bytes32_t const &key, bytes32_t const &value);

    void set_transient_storage(
        Address const &, bytes32_t const &key, bytes32_t const &value);

    void touch(Address const &);

    evmc_access_status access_account(Address const &);

    evmc_access_status access_storage(Address const &, bytes32_t const &key);

    // EIP-6780 from Cancun on: only accounts created in this transaction
    // are removed, everything else only loses its balance
    bool selfdestruct(
        Address const &, Address const &beneficiary, evmc_revision);

    // YP (87)
    void destruct_suicides(evmc_revision);

    // YP (88)
    void destruct_touched_dead();

    SharedCode read_code(bytes32_t const &code_hash) const;

    SharedCode get_code(Address const &) const;

    size_t get_code_size(Address const &) const;

    size_t copy_code(
        Address const &, size_t offset, uint8_t *buffer,
        size_t buffer_size) const;

    void set_code(Address const &, byte_string_view code);

    void create_contract(Address const &);

    std::vector<Log> const &logs() const
    {
        return logs_;
    }

    void store_log(Log const &);

    JournaledMap<Address, std::optional<Account>> const &accounts() const
    {
        return accounts_;
    }

    JournaledMap<StorageKey, bytes32_t> const &storage() const
    {
        return storage_;
    }

    bool created(Address const &address) const
    {
        return created_.contains(address);
    }

    ankerl::unordered_dense::map<bytes32_t, SharedCode> const &code() const
    {
        return code_;
    }
};

// EIP-2200 status of an SSTORE, from the value at transaction start, the
// current value and the new value
evmc_storage_status storage_status(
    bytes32_t const &original, bytes32_t const &current,
    bytes32_t const &value);

PROPFUZZ_NAMESPACE_END
