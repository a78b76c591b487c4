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
#include <propfuzz/core/int.hpp>
#include <propfuzz/core/keccak.hpp>
#include <propfuzz/execution/address.hpp>
#include <propfuzz/execution/log.hpp>
#include <propfuzz/execution/state/journaled_map.hpp>
#include <propfuzz/execution/state/state.hpp>
#include <propfuzz/execution/state/world_state.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

using namespace propfuzz;
using namespace evmc::literals;

namespace
{
    constexpr auto a = 0x5353535353535353535353535353535353535353_address;
    constexpr auto b = 0xbebebebebebebebebebebebebebebebebebebebe_address;
    constexpr auto key1 =
        0x00000000000000000000000000000000000000000000000000000000cafebabe_bytes32;
    constexpr auto value1 =
        0x0000000000000000000000000000000000000000000000000000000000000003_bytes32;
    constexpr auto value2 =
        0x0000000000000000000000000000000000000000000000000000000000000007_bytes32;

    uint256_t balance_of(State &state, Address const &address)
    {
        return intx::be::load<uint256_t>(state.get_balance(address));
    }
}

TEST(State, pop_reject_restores_previous_version)
{
    WorldState world;
    world.fund(a, 100);
    State state{world};

    state.push();
    state.subtract_from_balance(a, 40);
    state.add_to_balance(b, 40);
    state.set_storage(a, key1, value1);
    EXPECT_EQ(balance_of(state, a), 60);
    EXPECT_EQ(state.get_storage(a, key1), value1);
    state.pop_reject();

    EXPECT_EQ(balance_of(state, a), 100);
    EXPECT_FALSE(state.account_exists(b));
    EXPECT_EQ(state.get_storage(a, key1), bytes32_t{});
}

TEST(State, nested_accept_then_reject)
{
    WorldState world;
    world.fund(a, 100);
    State state{world};

    state.push();
    state.set_storage(a, key1, value1);
    state.push();
    state.set_storage(a, key1, value2);
    state.pop_accept();
    EXPECT_EQ(state.get_storage(a, key1), value2);
    state.pop_reject();
    EXPECT_EQ(state.get_storage(a, key1), bytes32_t{});
}

TEST(State, storage_status)
{
    WorldState world;
    world.fund(a, 1);
    {
        State state{world};
        EXPECT_EQ(state.set_storage(a, key1, value1), EVMC_STORAGE_ADDED);
        EXPECT_EQ(state.set_storage(a, key1, value2), EVMC_STORAGE_ASSIGNED);
        EXPECT_EQ(
            state.set_storage(a, key1, bytes32_t{}),
            EVMC_STORAGE_ADDED_DELETED);
        world.commit(state);
    }
    {
        State state{world};
        EXPECT_EQ(state.get_storage(a, key1), bytes32_t{});
        state.set_storage(a, key1, value1);
        world.commit(state);
    }
    {
        State state{world};
        EXPECT_EQ(state.get_storage(a, key1), value1);
        EXPECT_EQ(state.set_storage(a, key1, value2), EVMC_STORAGE_MODIFIED);
        EXPECT_EQ(
            state.set_storage(a, key1, value1),
            EVMC_STORAGE_MODIFIED_RESTORED);
        EXPECT_EQ(
            state.set_storage(a, key1, bytes32_t{}), EVMC_STORAGE_DELETED);
        EXPECT_EQ(
            state.set_storage(a, key1, value1),
            EVMC_STORAGE_DELETED_RESTORED);
    }
}

TEST(State, commit)
{
    WorldState world;
    unsigned char const code[] = {0x60, 0x00};
    {
        State state{world};
        state.create_contract(a);
        state.set_nonce(a, 1);
        state.set_code(a, to_byte_string_view(code));
        state.set_storage(a, key1, value1);
        world.commit(state);
    }
    auto const account = world.read_account(a);
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->nonce, 1u);
    EXPECT_EQ(account->code_hash, to_bytes(keccak256(code)));
    EXPECT_EQ(world.read_code(account->code_hash)->size(), 2u);
    EXPECT_EQ(world.read_storage(a, key1), value1);
}

TEST(State, transient_storage_is_per_transaction)
{
    WorldState world;
    world.fund(a, 1);
    {
        State state{world};
        state.set_transient_storage(a, key1, value1);
        EXPECT_EQ(state.get_transient_storage(a, key1), value1);
        world.commit(state);
    }
    State state{world};
    EXPECT_EQ(state.get_transient_storage(a, key1), bytes32_t{});
}

TEST(State, access_status)
{
    WorldState world;
    State state{world};
    EXPECT_EQ(state.access_account(a), EVMC_ACCESS_COLD);
    EXPECT_EQ(state.access_account(a), EVMC_ACCESS_WARM);
    EXPECT_EQ(state.access_storage(a, key1), EVMC_ACCESS_COLD);
    EXPECT_EQ(state.access_storage(a, key1), EVMC_ACCESS_WARM);
}

TEST(State, logs_follow_frames)
{
    WorldState world;
    State state{world};
    state.push();
    state.store_log(Log{.data = {0x01}, .topics = {}, .address = a});
    state.push();
    state.store_log(Log{.data = {0x02}, .topics = {}, .address = b});
    state.pop_reject();
    state.pop_accept();
    ASSERT_EQ(state.logs().size(), 1u);
    EXPECT_EQ(state.logs()[0].address, a);
}

TEST(State, selfdestruct_cancun)
{
    WorldState world;
    world.fund(a, 10);
    world.fund(b, 0);
    {
        // existing account only loses its balance
        State state{world};
        EXPECT_TRUE(state.selfdestruct(a, b, EVMC_CANCUN));
        state.destruct_suicides(EVMC_CANCUN);
        world.commit(state);
        EXPECT_TRUE(world.read_account(a).has_value());
        EXPECT_EQ(world.read_account(b)->balance, 10);
    }
    {
        // created in the same transaction, removed
        constexpr auto c = 0xc0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0_address;
        State state{world};
        state.create_contract(c);
        state.set_nonce(c, 1);
        state.set_storage(c, key1, value1);
        EXPECT_TRUE(state.selfdestruct(c, b, EVMC_CANCUN));
        EXPECT_FALSE(state.selfdestruct(c, b, EVMC_CANCUN));
        state.destruct_suicides(EVMC_CANCUN);
        world.commit(state);
        EXPECT_FALSE(world.read_account(c).has_value());
        EXPECT_EQ(world.read_storage(c, key1), bytes32_t{});
    }
}

TEST(State, selfdestruct_before_cancun_clears_storage)
{
    WorldState world;
    world.fund(a, 10);
    {
        State state{world};
        state.set_storage(a, key1, value1);
        world.commit(state);
    }
    ASSERT_EQ(world.read_storage(a, key1), value1);
    {
        State state{world};
        EXPECT_TRUE(state.selfdestruct(a, b, EVMC_SHANGHAI));
        state.destruct_suicides(EVMC_SHANGHAI);
        world.commit(state);
    }
    EXPECT_FALSE(world.read_account(a).has_value());
    EXPECT_EQ(world.read_storage(a, key1), bytes32_t{});
    EXPECT_EQ(world.read_account(b)->balance, 10);
}

TEST(State, rejected_create_leaves_nothing)
{
    constexpr auto c = 0xc0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0_address;
    WorldState world;
    world.fund(c, 5);
    State state{world};
    state.push();
    state.create_contract(c);
    state.set_nonce(c, 1);
    state.set_storage(c, key1, value1);
    EXPECT_EQ(state.get_nonce(c), 1u);
    state.pop_reject();

    EXPECT_EQ(state.get_nonce(c), 0u);
    EXPECT_EQ(balance_of(state, c), 5);
    EXPECT_EQ(state.get_storage(c, key1), bytes32_t{});
    world.commit(state);
    EXPECT_EQ(world.read_account(c)->nonce, 0u);
}

TEST(State, touched_dead_accounts_are_removed)
{
    WorldState world;
    State state{world};
    state.push();
    state.add_to_balance(b, 0);
    state.pop_accept();
    EXPECT_TRUE(state.account_exists(b));
    state.destruct_touched_dead();
    world.commit(state);
    EXPECT_FALSE(world.read_account(b).has_value());
}

TEST(JournaledMap, revert_restores_checkpoint)
{
    JournaledMap<int, int> map;
    map.put(1, 10); // no open checkpoint, kept for good
    map.checkpoint();
    map.put(1, 11);
    map.put(2, 20);
    map.checkpoint();
    map.put(2, 21);
    EXPECT_TRUE(map.insert(3, 30));
    EXPECT_FALSE(map.insert(3, 31));
    map.accept();
    EXPECT_EQ(*map.find(2), 21);
    EXPECT_EQ(*map.find(3), 30);
    map.revert();

    EXPECT_EQ(map.depth(), 0u);
    EXPECT_EQ(map.size(), 1u);
    EXPECT_EQ(*map.find(1), 10);
    EXPECT_EQ(map.find(2), nullptr);
    EXPECT_FALSE(map.contains(3));
}

TEST(StorageStatus, transitions)
{
    constexpr bytes32_t zero{};
    // clean slots
    EXPECT_EQ(storage_status(zero, zero, value1), EVMC_STORAGE_ADDED);
    EXPECT_EQ(storage_status(value1, value1, zero), EVMC_STORAGE_DELETED);
    EXPECT_EQ(storage_status(value1, value1, value2), EVMC_STORAGE_MODIFIED);
    EXPECT_EQ(storage_status(value1, value1, value1), EVMC_STORAGE_ASSIGNED);
    // dirty slots
    EXPECT_EQ(
        storage_status(value1, zero, value2), EVMC_STORAGE_DELETED_ADDED);
    EXPECT_EQ(
        storage_status(value1, value2, zero), EVMC_STORAGE_MODIFIED_DELETED);
    EXPECT_EQ(storage_status(zero, value2, value1), EVMC_STORAGE_ASSIGNED);
}
