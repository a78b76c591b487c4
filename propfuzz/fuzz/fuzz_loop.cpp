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
#include <propfuzz/abi/abi_type.hpp>
#include <propfuzz/abi/calldata_generator.hpp>
#include <propfuzz/abi/function_spec.hpp>
#include <propfuzz/abi/selector.hpp>
#include <propfuzz/compiler/solc_output.hpp>
#include <propfuzz/core/assert.h>
#include <propfuzz/core/byte_string.hpp>
#include <propfuzz/core/config.hpp>
#include <propfuzz/core/hex.hpp>
#include <propfuzz/core/result.hpp>
#include <propfuzz/execution/address.hpp>
#include <propfuzz/execution/address_fmt.hpp>
#include <propfuzz/execution/execution_result.hpp>
#include <propfuzz/execution/executor.hpp>
#include <propfuzz/fuzz/campaign_config.hpp>
#include <propfuzz/fuzz/fuzz_error.hpp>
#include <propfuzz/fuzz/fuzz_loop.hpp>

#include <evmc/evmc.h>
#include <evmc/helpers.h>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string_view>
#include <utility>

PROPFUZZ_ANONYMOUS_NAMESPACE_BEGIN

byte_string selector_calldata(Selector const &selector)
{
    return byte_string{selector.begin(), selector.end()};
}

PROPFUZZ_ANONYMOUS_NAMESPACE_END

PROPFUZZ_NAMESPACE_BEGIN

std::string_view to_string(CrashKind const kind)
{
    switch (kind) {
    case CrashKind::TargetFault:
        return "target call halted";
    case CrashKind::TargetRevert:
        return "target call reverted";
    case CrashKind::InvariantBroken:
        return "invariant returned false";
    case CrashKind::InvariantCheckAborted:
        return "invariant check did not return";
    }
    PROPFUZZ_ABORT("unknown crash kind");
}

FuzzLoop::FuzzLoop(Executor &executor, CampaignConfig config)
    : executor_{executor}
    , config_{std::move(config)}
    , engine_{config_.seed}
    , invariant_selector_{function_selector(config_.invariant_signature)}
{
    PROPFUZZ_ASSERT(config_.progress_interval > 0);
}

Result<void> FuzzLoop::setup(SolcOutput const &output)
{
    PROPFUZZ_ASSERT(state_ == CampaignState::Compiling);

    auto const *const checker =
        find_contract(output, config_.checker_contract);
    if (checker == nullptr) {
        LOG_ERROR("contract {} not found", config_.checker_contract);
        return FuzzError::ContractNotFound;
    }
    auto const *const target = find_contract(output, config_.target_contract);
    if (target == nullptr) {
        LOG_ERROR("contract {} not found", config_.target_contract);
        return FuzzError::ContractNotFound;
    }

    BOOST_OUTCOME_TRY(auto specs, build_function_specs(target->functions));
    if (specs.empty()) {
        LOG_ERROR("{} has no functions to call", target->name);
        return AbiError::EmptyInterface;
    }
    for (auto const &spec : specs) {
        for (auto const &param : spec.params) {
            if (!is_encodable(param)) {
                LOG_ERROR(
                    "cannot generate values of type {} for {}",
                    to_string(param),
                    spec.signature);
                return AbiError::UnsupportedTypeKind;
            }
        }
    }
    generator_.emplace(std::move(specs));

    auto const deployed = executor_.deploy(checker->bytecode);
    if (deployed.status != ExecutionStatus::Success ||
        !deployed.create_address.has_value()) {
        LOG_ERROR(
            "deploying {} failed with {}",
            checker->name,
            evmc_status_code_to_string(deployed.status_code));
        return FuzzError::SetupFailed;
    }
    checker_address_ = deployed.create_address.value();

    auto const set_up = executor_.call(
        checker_address_,
        selector_calldata(function_selector(config_.setup_signature)));
    if (set_up.status != ExecutionStatus::Success) {
        LOG_ERROR(
            "{} failed with {}",
            config_.setup_signature,
            evmc_status_code_to_string(set_up.status_code));
        return FuzzError::SetupFailed;
    }

    auto const getter = executor_.call(
        checker_address_,
        selector_calldata(function_selector(config_.target_getter_signature)));
    if (getter.status != ExecutionStatus::Success ||
        getter.output.size() < ABI_WORD_SIZE) {
        LOG_ERROR(
            "{} failed with {} returning {} bytes",
            config_.target_getter_signature,
            evmc_status_code_to_string(getter.status_code),
            getter.output.size());
        return FuzzError::SetupFailed;
    }
    // the address is the low order 20 bytes of the first word
    std::memcpy(
        target_address_.bytes,
        getter.output.data() + ABI_WORD_SIZE - sizeof(Address),
        sizeof(Address));
    if (executor_.code_size(target_address_) == 0) {
        LOG_ERROR("target {} has no code", target_address_);
        return FuzzError::SetupFailed;
    }

    LOG_INFO(
        "checker {} at {}, target {} at {} with {} functions",
        checker->name,
        checker_address_,
        target->name,
        target_address_,
        generator_->functions().size());
    state_ = CampaignState::Deployed;
    return outcome::success();
}

Result<std::optional<Crash>> FuzzLoop::check_invariant()
{
    auto const res =
        executor_.call(checker_address_, selector_calldata(invariant_selector_));
    if (res.status != ExecutionStatus::Success) {
        return std::make_optional(Crash{
            .kind = CrashKind::InvariantCheckAborted,
            .function = config_.invariant_signature,
            .calldata = {},
            .status_code = res.status_code});
    }

    // exactly one ABI encoded bool
    auto const &out = res.output;
    if (out.size() != ABI_WORD_SIZE ||
        !std::all_of(
            out.begin(),
            out.end() - 1,
            [](unsigned char const b) { return b == 0; }) ||
        out.back() > 1) {
        LOG_ERROR(
            "{} returned {}, expected an ABI encoded bool",
            config_.invariant_signature,
            to_hex(out));
        return FuzzError::InvariantEncodingViolation;
    }
    if (out.back() == 0) {
        return std::make_optional(Crash{
            .kind = CrashKind::InvariantBroken,
            .function = config_.invariant_signature,
            .calldata = {},
            .status_code = res.status_code});
    }
    return std::optional<Crash>{};
}

Result<std::optional<Crash>> FuzzLoop::step()
{
    PROPFUZZ_ASSERT(
        state_ == CampaignState::Deployed || state_ == CampaignState::Running);
    state_ = CampaignState::Running;

    ++iterations_;
    BOOST_OUTCOME_TRY(auto call, generator_->next(engine_));
    auto const res = executor_.call(target_address_, call.data);

    auto const crash_with = [&](CrashKind const kind,
                                evmc_status_code const status_code) {
        state_ = CampaignState::Reported;
        return std::make_optional(Crash{
            .kind = kind,
            .function = call.function->signature,
            .calldata = std::move(call.data),
            .status_code = status_code});
    };

    if (res.status == ExecutionStatus::Fault) {
        return crash_with(CrashKind::TargetFault, res.status_code);
    }
    if (res.status == ExecutionStatus::Revert && config_.fail_on_revert) {
        return crash_with(CrashKind::TargetRevert, res.status_code);
    }

    BOOST_OUTCOME_TRY(auto const verdict, check_invariant());
    if (verdict.has_value()) {
        // the reproducer is the target call, not the check
        return crash_with(verdict->kind, verdict->status_code);
    }

    if (iterations_ % config_.progress_interval == 0) {
        LOG_INFO("Tested {} iterations without a crash...", iterations_);
    }
    return std::optional<Crash>{};
}

Result<CampaignReport> FuzzLoop::run()
{
    while (!config_.max_iterations.has_value() ||
           iterations_ < config_.max_iterations.value()) {
        BOOST_OUTCOME_TRY(auto crash, step());
        if (crash.has_value()) {
            return CampaignReport{
                .iterations = iterations_, .crash = std::move(crash)};
        }
    }
    state_ = CampaignState::Reported;
    return CampaignReport{.iterations = iterations_, .crash = std::nullopt};
}

PROPFUZZ_NAMESPACE_END
