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
#include <propfuzz/execution/address.hpp>
#include <propfuzz/execution/state/account.hpp>
#include <propfuzz/execution/state/code.hpp>
#include <propfuzz/execution/state/state.hpp>
#include <propfuzz/execution/state/world_state.hpp>

#include <optional>

PROPFUZZ_NAMESPACE_BEGIN

WorldState::WorldState()
{
    code_.emplace(NULL_HASH, make_shared_code({}));
}

std::optional<Account> WorldState::read_account(Address const &address) const
{
    if (auto const it = accounts_.find(address); it != accounts_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bytes32_t
WorldState::read_storage(Address const &address, bytes32_t const &key) const
{
    auto const it = storage_.find(address);
    if (it == storage_.end()) {
        return {};
    }
    auto const it2 = it->second.find(key);
    if (it2 == it->second.end()) {
        return {};
    }
    return it2->second;
}

SharedCode WorldState::read_code(bytes32_t const &code_hash) const
{
    auto const it = code_.find(code_hash);
    PROPFUZZ_ASSERT(it != code_.end(), "unknown code hash");
    return it->second;
}

void WorldState::fund(Address const &address, uint256_t const &balance)
{
    accounts_[address].balance += balance;
}

void WorldState::commit(State const &state)
{
    PROPFUZZ_ASSERT(state.depth() == 0);

    for (auto const &[hash, code] : state.code()) {
        code_.try_emplace(hash, code);
    }

    for (auto const &[address, account] : state.accounts()) {
        if (!account.has_value()) {
            accounts_.erase(address);
            storage_.erase(address);
            continue;
        }
        accounts_.insert_or_assign(address, account.value());
        if (state.created(address)) {
            storage_.erase(address);
        }
    }

    for (auto const &[slot, value] : state.storage()) {
        // slots of removed accounts are dropped with them
        if (!accounts_.contains(slot.address)) {
            continue;
        }
        if (value == bytes32_t{}) {
            if (auto const it = storage_.find(slot.address);
                it != storage_.end()) {
                it->second.erase(slot.key);
            }
        }
        else {
            storage_[slot.address].insert_or_assign(slot.key, value);
        }
    }
}

PROPFUZZ_NAMESPACE_END
