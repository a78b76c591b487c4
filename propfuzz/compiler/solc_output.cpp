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

#include <propfuzz/abi/function_spec.hpp>
#include <propfuzz/compiler/solc_error.hpp>
#include <propfuzz/compiler/solc_output.hpp>
#include <propfuzz/core/byte_string.hpp>
#include <propfuzz/core/config.hpp>
#include <propfuzz/core/result.hpp>

#include <evmc/hex.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <boost/outcome/try.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

PROPFUZZ_ANONYMOUS_NAMESPACE_BEGIN

Result<AbiParam> param_from_json(nlohmann::json const &j)
{
    if (!j.is_object()) {
        return SolcError::MalformedOutput;
    }
    AbiParam param;
    if (auto const it = j.find("name"); it != j.end() && it->is_string()) {
        param.name = it->get<std::string>();
    }
    // `type` is canonical (tuple, not struct names); `internalType` is
    // only a fallback for hand-written descriptions
    for (auto const *const key : {"type", "internalType"}) {
        if (auto const it = j.find(key); it != j.end() && it->is_string()) {
            param.type = it->get<std::string>();
            return param;
        }
    }
    return SolcError::MalformedOutput;
}

Result<std::vector<AbiFunction>> abi_from_json(nlohmann::json const &abi)
{
    if (abi.is_string()) {
        auto const inner = nlohmann::json::parse(
            abi.get<std::string>(), nullptr, /* allow_exceptions */ false);
        if (inner.is_discarded()) {
            return SolcError::MalformedOutput;
        }
        return abi_from_json(inner);
    }
    if (!abi.is_array()) {
        return SolcError::MalformedOutput;
    }

    std::vector<AbiFunction> functions;
    for (auto const &entry : abi) {
        if (!entry.is_object()) {
            return SolcError::MalformedOutput;
        }
        if (auto const it = entry.find("type");
            it != entry.end() && *it != "function") {
            continue;
        }
        auto const name = entry.find("name");
        if (name == entry.end() || !name->is_string()) {
            return SolcError::MalformedOutput;
        }
        AbiFunction function{.name = name->get<std::string>(), .inputs = {}};
        if (auto const inputs = entry.find("inputs"); inputs != entry.end()) {
            if (!inputs->is_array()) {
                return SolcError::MalformedOutput;
            }
            for (auto const &input : *inputs) {
                BOOST_OUTCOME_TRY(auto param, param_from_json(input));
                function.inputs.push_back(std::move(param));
            }
        }
        functions.push_back(std::move(function));
    }
    return functions;
}

PROPFUZZ_ANONYMOUS_NAMESPACE_END

PROPFUZZ_NAMESPACE_BEGIN

Result<SolcOutput> parse_solc_output(std::string_view const json)
{
    auto const j = nlohmann::json::parse(
        json, nullptr, /* allow_exceptions */ false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_ERROR("compiler output is not a JSON object");
        return SolcError::MalformedOutput;
    }
    auto const contracts = j.find("contracts");
    if (contracts == j.end() || !contracts->is_object()) {
        LOG_ERROR("compiler output has no `contracts` object");
        return SolcError::MalformedOutput;
    }

    SolcOutput output;
    for (auto const &[name, contract] : contracts->items()) {
        if (!contract.is_object()) {
            LOG_ERROR("contract {} is not an object", name);
            return SolcError::MalformedOutput;
        }
        auto const abi = contract.find("abi");
        auto const bin = contract.find("bin");
        if (abi == contract.end() || bin == contract.end() ||
            !bin->is_string()) {
            LOG_ERROR("contract {} lacks `abi` or `bin`", name);
            return SolcError::MalformedOutput;
        }

        auto functions = abi_from_json(*abi);
        if (functions.has_error()) {
            LOG_ERROR("contract {} has a malformed `abi`", name);
            return SolcError::MalformedOutput;
        }
        auto bytecode = evmc::from_hex(bin->get<std::string>());
        if (!bytecode.has_value()) {
            LOG_ERROR("contract {} has a malformed `bin`", name);
            return SolcError::InvalidBytecode;
        }

        output.contracts.emplace(
            name,
            CompiledContract{
                .name = name,
                .functions = std::move(functions).value(),
                .bytecode = std::move(bytecode).value()});
    }
    return output;
}

Result<SolcOutput> load_solc_output(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (!in) {
        LOG_ERROR("cannot open {}", path.string());
        return SolcError::UnreadableInput;
    }
    std::string const text{
        std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    return parse_solc_output(text);
}

CompiledContract const *
find_contract(SolcOutput const &output, std::string_view const name)
{
    if (auto const it = output.contracts.find(name);
        it != output.contracts.end()) {
        return &it->second;
    }
    CompiledContract const *match = nullptr;
    for (auto const &[key, contract] : output.contracts) {
        auto const colon = key.rfind(':');
        if (colon == std::string::npos ||
            std::string_view{key}.substr(colon + 1) != name) {
            continue;
        }
        if (match != nullptr) {
            LOG_WARNING(
                "{} is ambiguous: {} and {}; use the qualified name",
                name,
                match->name,
                key);
            return nullptr;
        }
        match = &contract;
    }
    return match;
}

PROPFUZZ_NAMESPACE_END
