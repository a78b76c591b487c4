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

#include <propfuzz/abi/abi_error.hpp>
#include <propfuzz/abi/abi_type.hpp>
#include <propfuzz/abi/function_spec.hpp>
#include <propfuzz/core/byte_string.hpp>
#include <propfuzz/core/config.hpp>
#include <propfuzz/core/hex.hpp>
#include <propfuzz/core/random.hpp>
#include <propfuzz/core/result.hpp>

#include <boost/outcome/try.hpp>
#include <quill/Quill.h>

#include <utility>
#include <vector>

PROPFUZZ_NAMESPACE_BEGIN

struct Calldata
{
    FunctionSpec const *function;
    byte_string data;
};

/// Produces ABI-encoded calls against a fixed set of functions. Each call
/// picks one function uniformly at random and appends one random head word
/// per parameter to its selector, so the payload is always 4 + 32 * k bytes.
class CalldataGenerator
{
    std::vector<FunctionSpec> functions_;

public:
    explicit CalldataGenerator(std::vector<FunctionSpec> functions)
        : functions_{std::move(functions)}
    {
    }

    std::vector<FunctionSpec> const &functions() const
    {
        return functions_;
    }

    template <typename Engine>
    Result<Calldata> next(Engine &engine) const
    {
        if (functions_.empty()) {
            return AbiError::EmptyInterface;
        }

        auto const &function = uniform_sample(engine, functions_);

        byte_string data;
        data.reserve(function.selector.size() +
                     ABI_WORD_SIZE * function.params.size());
        data.append(function.selector.begin(), function.selector.end());
        for (auto const &param : function.params) {
            BOOST_OUTCOME_TRY(
                auto const word, random_encoded_value(param, engine));
            data += word;
        }

        LOG_DEBUG("calling {} with {}", function.name, to_hex(data));
        return Calldata{.function = &function, .data = std::move(data)};
    }
};

PROPFUZZ_NAMESPACE_END
