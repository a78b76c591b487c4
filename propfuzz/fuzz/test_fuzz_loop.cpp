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

#include <propfuzz/abi/abi_error.hpp>
#include <propfuzz/abi/selector.hpp>
#include <propfuzz/compiler/solc_output.hpp>
#include <propfuzz/core/byte_string.hpp>
#include <propfuzz/execution/address.hpp>
#include <propfuzz/execution/execution_result.hpp>
#include <propfuzz/execution/executor.hpp>
#include <propfuzz/fuzz/campaign_config.hpp>
#include <propfuzz/fuzz/fuzz_error.hpp>
#include <propfuzz/fuzz/fuzz_loop.hpp>

#include <evmc/evmc.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

using namespace propfuzz;

namespace
{
    constexpr Address checker{0xc0ffee};
    constexpr Address target{0xbeef};

    ExecutionResult returning(evmc_status_code const sc, byte_string out = {})
    {
        return ExecutionResult{
            .status = classify_status(sc),
            .status_code = sc,
            .gas_used = 21'000,
            .output = std::move(out),
            .logs = {},
            .create_address = std::nullopt};
    }

    byte_string bool_word(bool const b)
    {
        byte_string word(32, 0);
        word[31] = b ? 1 : 0;
        return word;
    }

    byte_string address_word(Address const &a)
    {
        byte_string word(12, 0);
        word.append(a.bytes, sizeof(a.bytes));
        return word;
    }

    bool has_selector(byte_string_view const data, char const *const sig)
    {
        auto const s = function_selector(sig);
        return data.size() >= 4 && std::equal(s.begin(), s.end(), data.begin());
    }

    // Plays the checker and the target: the invariant holds until the target
    // has been called `break_after` times
    struct ScriptedExecutor final : Executor
    {
        bool deploy_ok{true};
        evmc_status_code set_up_status{EVMC_SUCCESS};
        byte_string getter_output{address_word(target)};
        size_t target_code_size{100};
        evmc_status_code target_status{EVMC_SUCCESS};
        evmc_status_code invariant_status{EVMC_SUCCESS};
        std::optional<byte_string> invariant_output{};
        uint64_t break_after{UINT64_MAX};

        std::vector<byte_string> target_calls{};
        uint64_t invariant_calls{0};

        ExecutionResult deploy(byte_string_view) override
        {
            if (!deploy_ok) {
                return returning(EVMC_REVERT);
            }
            auto res = returning(EVMC_SUCCESS);
            res.create_address = checker;
            return res;
        }

        ExecutionResult
        call(Address const &to, byte_string_view const calldata) override
        {
            if (to == target) {
                target_calls.emplace_back(calldata);
                return returning(target_status);
            }
            EXPECT_EQ(to, checker);
            if (has_selector(calldata, "setUp()")) {
                return returning(set_up_status);
            }
            if (has_selector(calldata, "inv()")) {
                return returning(EVMC_SUCCESS, getter_output);
            }
            EXPECT_TRUE(has_selector(calldata, "invariant_neverFalse()"));
            ++invariant_calls;
            if (invariant_status != EVMC_SUCCESS) {
                return returning(invariant_status);
            }
            if (invariant_output.has_value()) {
                return returning(EVMC_SUCCESS, invariant_output.value());
            }
            return returning(
                EVMC_SUCCESS, bool_word(target_calls.size() < break_after));
        }

        size_t code_size(Address const &a) override
        {
            return a == target ? target_code_size : 0;
        }
    };

    AbiFunction fn(char const *const name, std::vector<AbiParam> inputs = {})
    {
        return AbiFunction{.name = name, .inputs = std::move(inputs)};
    }

    SolcOutput make_output(std::vector<AbiFunction> target_functions)
    {
        SolcOutput out;
        out.contracts["src/invariant.sol:InvariantTest"] = CompiledContract{
            .name = "src/invariant.sol:InvariantTest",
            .functions =
                {fn("setUp"), fn("inv"), fn("invariant_neverFalse")},
            .bytecode = {0x60, 0x80}};
        out.contracts["src/invariant.sol:InvariantBreaker"] = CompiledContract{
            .name = "src/invariant.sol:InvariantBreaker",
            .functions = std::move(target_functions),
            .bytecode = {0x60, 0x80}};
        return out;
    }

    SolcOutput breaker_output()
    {
        return make_output(
            {fn("flag0"),
             fn("set0", {{.name = "val", .type = "uint256"}}),
             fn("set1", {{.name = "val", .type = "uint256"}}),
             fn("send", {{.name = "to", .type = "address"}})});
    }

    CampaignConfig config_with_seed(uint64_t const seed)
    {
        CampaignConfig config;
        config.seed = seed;
        return config;
    }
}

TEST(FuzzLoop, setup_locates_target)
{
    ScriptedExecutor exec;
    FuzzLoop loop{exec, config_with_seed(1)};
    EXPECT_EQ(loop.state(), CampaignState::Compiling);
    ASSERT_FALSE(loop.setup(breaker_output()).has_error());
    EXPECT_EQ(loop.state(), CampaignState::Deployed);
    EXPECT_EQ(loop.checker_address(), checker);
    EXPECT_EQ(loop.target_address(), target);
    EXPECT_EQ(loop.iterations(), 0u);
}

TEST(FuzzLoop, finds_broken_invariant)
{
    ScriptedExecutor exec;
    exec.break_after = 5;
    FuzzLoop loop{exec, config_with_seed(7)};
    ASSERT_FALSE(loop.setup(breaker_output()).has_error());

    auto const report = loop.run();
    ASSERT_FALSE(report.has_error());
    EXPECT_EQ(report.value().iterations, 5u);
    ASSERT_TRUE(report.value().crash.has_value());
    auto const &crash = report.value().crash.value();
    EXPECT_EQ(crash.kind, CrashKind::InvariantBroken);
    // the reported input is the target call that broke the invariant
    ASSERT_EQ(exec.target_calls.size(), 5u);
    EXPECT_EQ(crash.calldata, exec.target_calls.back());
    EXPECT_TRUE(has_selector(crash.calldata, crash.function.c_str()));
    EXPECT_EQ(exec.invariant_calls, 5u);
    EXPECT_EQ(loop.state(), CampaignState::Reported);
}

TEST(FuzzLoop, calldata_is_selector_and_head_words)
{
    ScriptedExecutor exec;
    exec.break_after = 64;
    FuzzLoop loop{exec, config_with_seed(3)};
    ASSERT_FALSE(loop.setup(breaker_output()).has_error());
    ASSERT_FALSE(loop.run().has_error());

    for (auto const &data : exec.target_calls) {
        if (has_selector(data, "flag0()")) {
            EXPECT_EQ(data.size(), 4u);
        }
        else {
            EXPECT_TRUE(
                has_selector(data, "set0(uint256)") ||
                has_selector(data, "set1(uint256)") ||
                has_selector(data, "send(address)"));
            EXPECT_EQ(data.size(), 36u);
        }
    }
}

TEST(FuzzLoop, step_by_step)
{
    ScriptedExecutor exec;
    exec.break_after = 2;
    FuzzLoop loop{exec, config_with_seed(5)};
    ASSERT_FALSE(loop.setup(breaker_output()).has_error());

    auto first = loop.step();
    ASSERT_FALSE(first.has_error());
    EXPECT_FALSE(first.value().has_value());
    EXPECT_EQ(loop.state(), CampaignState::Running);

    auto second = loop.step();
    ASSERT_FALSE(second.has_error());
    ASSERT_TRUE(second.value().has_value());
    EXPECT_EQ(loop.iterations(), 2u);
    EXPECT_EQ(loop.state(), CampaignState::Reported);
}

TEST(FuzzLoop, iteration_bound)
{
    ScriptedExecutor exec;
    auto config = config_with_seed(2);
    config.max_iterations = 50;
    FuzzLoop loop{exec, config};
    ASSERT_FALSE(loop.setup(breaker_output()).has_error());

    auto const report = loop.run();
    ASSERT_FALSE(report.has_error());
    EXPECT_EQ(report.value().iterations, 50u);
    EXPECT_FALSE(report.value().crash.has_value());
    EXPECT_EQ(exec.target_calls.size(), 50u);
    EXPECT_EQ(exec.invariant_calls, 50u);
}

TEST(FuzzLoop, same_seed_same_campaign)
{
    ScriptedExecutor a;
    ScriptedExecutor b;
    a.break_after = b.break_after = 40;
    FuzzLoop loop_a{a, config_with_seed(1234)};
    FuzzLoop loop_b{b, config_with_seed(1234)};
    ASSERT_FALSE(loop_a.setup(breaker_output()).has_error());
    ASSERT_FALSE(loop_b.setup(breaker_output()).has_error());

    auto const ra = loop_a.run();
    auto const rb = loop_b.run();
    ASSERT_FALSE(ra.has_error());
    ASSERT_FALSE(rb.has_error());
    EXPECT_EQ(a.target_calls, b.target_calls);
    EXPECT_EQ(ra.value().crash->calldata, rb.value().crash->calldata);
}

TEST(FuzzLoop, revert_is_a_crash_by_default)
{
    ScriptedExecutor exec;
    exec.target_status = EVMC_REVERT;
    FuzzLoop loop{exec, config_with_seed(1)};
    ASSERT_FALSE(loop.setup(breaker_output()).has_error());

    auto const report = loop.run();
    ASSERT_FALSE(report.has_error());
    ASSERT_TRUE(report.value().crash.has_value());
    EXPECT_EQ(report.value().crash->kind, CrashKind::TargetRevert);
    EXPECT_EQ(report.value().crash->status_code, EVMC_REVERT);
    EXPECT_EQ(report.value().iterations, 1u);
    EXPECT_EQ(exec.invariant_calls, 0u);
}

TEST(FuzzLoop, revert_tolerated)
{
    ScriptedExecutor exec;
    exec.target_status = EVMC_REVERT;
    auto config = config_with_seed(1);
    config.fail_on_revert = false;
    config.max_iterations = 10;
    FuzzLoop loop{exec, config};
    ASSERT_FALSE(loop.setup(breaker_output()).has_error());

    auto const report = loop.run();
    ASSERT_FALSE(report.has_error());
    EXPECT_FALSE(report.value().crash.has_value());
    EXPECT_EQ(exec.invariant_calls, 10u);
}

TEST(FuzzLoop, fault_is_a_crash)
{
    ScriptedExecutor exec;
    exec.target_status = EVMC_INVALID_INSTRUCTION;
    auto config = config_with_seed(1);
    config.fail_on_revert = false;
    FuzzLoop loop{exec, config};
    ASSERT_FALSE(loop.setup(breaker_output()).has_error());

    auto const report = loop.run();
    ASSERT_FALSE(report.has_error());
    ASSERT_TRUE(report.value().crash.has_value());
    EXPECT_EQ(report.value().crash->kind, CrashKind::TargetFault);
    EXPECT_EQ(report.value().crash->status_code, EVMC_INVALID_INSTRUCTION);
}

TEST(FuzzLoop, invariant_check_aborted)
{
    ScriptedExecutor exec;
    exec.invariant_status = EVMC_REVERT;
    FuzzLoop loop{exec, config_with_seed(1)};
    ASSERT_FALSE(loop.setup(breaker_output()).has_error());

    auto const report = loop.run();
    ASSERT_FALSE(report.has_error());
    ASSERT_TRUE(report.value().crash.has_value());
    EXPECT_EQ(report.value().crash->kind, CrashKind::InvariantCheckAborted);
    EXPECT_EQ(report.value().crash->calldata, exec.target_calls.back());
}

TEST(FuzzLoop, invariant_encoding_violation)
{
    for (auto const &bad :
         {byte_string(31, 0),
          byte_string(64, 0),
          byte_string{},
          [] {
              auto w = bool_word(true);
              w[31] = 2;
              return w;
          }(),
          [] {
              auto w = bool_word(true);
              w[0] = 1;
              return w;
          }()}) {
        ScriptedExecutor exec;
        exec.invariant_output = bad;
        FuzzLoop loop{exec, config_with_seed(1)};
        ASSERT_FALSE(loop.setup(breaker_output()).has_error());
        auto const report = loop.run();
        ASSERT_TRUE(report.has_error());
        EXPECT_EQ(
            report.assume_error(), FuzzError::InvariantEncodingViolation);
    }
}

TEST(FuzzLoop, missing_contract)
{
    ScriptedExecutor exec;
    auto config = config_with_seed(1);
    config.target_contract = "Nope";
    FuzzLoop loop{exec, config};
    auto const res = loop.setup(breaker_output());
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), FuzzError::ContractNotFound);
    EXPECT_EQ(loop.state(), CampaignState::Compiling);

    FuzzLoop empty{exec, config_with_seed(1)};
    auto const none = empty.setup(SolcOutput{});
    ASSERT_TRUE(none.has_error());
    EXPECT_EQ(none.assume_error(), FuzzError::ContractNotFound);
}

TEST(FuzzLoop, unsupported_target_interface)
{
    ScriptedExecutor exec;
    {
        FuzzLoop loop{exec, config_with_seed(1)};
        auto const res = loop.setup(
            make_output({fn("f", {{.name = "x", .type = "uint24"}})}));
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), AbiError::UnsupportedTypeKind);
    }
    {
        FuzzLoop loop{exec, config_with_seed(1)};
        auto const res = loop.setup(
            make_output({fn("g", {{.name = "d", .type = "bytes"}})}));
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), AbiError::UnsupportedTypeKind);
    }
    {
        FuzzLoop loop{exec, config_with_seed(1)};
        auto const res = loop.setup(make_output({}));
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), AbiError::EmptyInterface);
    }
}

TEST(FuzzLoop, setup_failures)
{
    auto const expect_setup_failed = [](ScriptedExecutor &exec) {
        FuzzLoop loop{exec, config_with_seed(1)};
        auto const res = loop.setup(breaker_output());
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), FuzzError::SetupFailed);
        EXPECT_TRUE(exec.target_calls.empty());
    };

    ScriptedExecutor deploy_fails;
    deploy_fails.deploy_ok = false;
    expect_setup_failed(deploy_fails);

    ScriptedExecutor set_up_reverts;
    set_up_reverts.set_up_status = EVMC_REVERT;
    expect_setup_failed(set_up_reverts);

    ScriptedExecutor short_getter;
    short_getter.getter_output = byte_string(20, 0xbe);
    expect_setup_failed(short_getter);

    ScriptedExecutor no_code;
    no_code.target_code_size = 0;
    expect_setup_failed(no_code);
}
