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
#include <propfuzz/core/int.hpp>
#include <propfuzz/execution/address.hpp>
#include <propfuzz/execution/state/account.hpp>
#include <propfuzz/execution/state/code.hpp>

#include <ankerl/unordered_dense.h>

#include <optional>

PROPFUZZ_NAMESPACE_BEGIN

class State;

/// Committed accounts, storage and code. Transactions run against a `State`
/// overlay and are folded in by `commit`.
class WorldState
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::map<K, V>;

    Map<Address, Account> accounts_{};
    Map<Address, Map<bytes32_t, bytes32_t>> storage_{};
    Map<bytes32_t, SharedCode> code_{};

public:
    WorldState();

    WorldState(WorldState &&) = delete;
    WorldState(WorldState const &) = delete;
    WorldState &operator=(WorldState &&) = delete;
    WorldState &operator=(WorldState const &) = delete;

    std::optional<Account> read_account(Address const &) const;

    bytes32_t read_storage(Address const &, bytes32_t const &key) const;

    SharedCode read_code(bytes32_t const &code_hash) const;

    // genesis allocation; `balance` is added to an existing account
    void fund(Address const &, uint256_t const &balance);

    void commit(State const &);
};

PROPFUZZ_NAMESPACE_END
