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
#include <propfuzz/abi/function_spec.hpp>
#include <propfuzz/abi/selector.hpp>
#include <propfuzz/core/config.hpp>
#include <propfuzz/core/result.hpp>

#include <quill/Quill.h>

#include <string>
#include <vector>

PROPFUZZ_NAMESPACE_BEGIN

std::string canonical_signature(AbiFunction const &function)
{
    std::string sig = function.name;
    sig += '(';
    for (size_t i = 0; i < function.inputs.size(); ++i) {
        if (i > 0) {
            sig += ',';
        }
        sig += function.inputs[i].type;
    }
    sig += ')';
    return sig;
}

Result<std::vector<FunctionSpec>>
build_function_specs(std::vector<AbiFunction> const &functions)
{
    std::vector<FunctionSpec> specs;
    specs.reserve(functions.size());
    for (auto const &function : functions) {
        FunctionSpec spec{
            .selector = {},
            .params = {},
            .name = function.name,
            .signature = canonical_signature(function)};
        spec.selector = function_selector(spec.signature);
        spec.params.reserve(function.inputs.size());
        for (auto const &input : function.inputs) {
            auto kind = parse_abi_type(input.type);
            if (kind.has_error()) {
                LOG_ERROR(
                    "unsupported type `{}` for parameter `{}` of {}",
                    input.type,
                    input.name,
                    spec.signature);
                return AbiError::UnsupportedTypeKind;
            }
            spec.params.push_back(std::move(kind).value());
        }
        specs.push_back(std::move(spec));
    }
    return specs;
}

PROPFUZZ_NAMESPACE_END
