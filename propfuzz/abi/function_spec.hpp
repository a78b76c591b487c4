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

#include <propfuzz/abi/abi_type.hpp>
#include <propfuzz/abi/selector.hpp>
#include <propfuzz/core/config.hpp>
#include <propfuzz/core/result.hpp>

#include <string>
#include <vector>

PROPFUZZ_NAMESPACE_BEGIN

// Declared ABI parameter, as found in the compiler's interface description
struct AbiParam
{
    std::string name;
    std::string type;
};

struct AbiFunction
{
    std::string name;
    std::vector<AbiParam> inputs;
};

struct FunctionSpec
{
    Selector selector;
    std::vector<AbiValueKind> params;
    std::string name;
    std::string signature;
};

// name(type1,type2,...) built from the declared type names verbatim
std::string canonical_signature(AbiFunction const &);

// All-or-nothing: a single unsupported parameter type fails the whole build
Result<std::vector<FunctionSpec>>
build_function_specs(std::vector<AbiFunction> const &);

PROPFUZZ_NAMESPACE_END
