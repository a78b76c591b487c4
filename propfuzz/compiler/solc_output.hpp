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

#include <propfuzz/abi/function_spec.hpp>
#include <propfuzz/core/byte_string.hpp>
#include <propfuzz/core/config.hpp>
#include <propfuzz/core/result.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

PROPFUZZ_NAMESPACE_BEGIN

struct CompiledContract
{
    std::string name; // fully qualified, e.g. "contract/contract.sol:Name"
    std::vector<AbiFunction> functions;
    byte_string bytecode; // creation code
};

struct SolcOutput
{
    std::map<std::string, CompiledContract, std::less<>> contracts;
};

/**
 * Reads the output of `solc --combined-json bin,abi`. The `abi` member of a
 * contract may be a JSON array or, as older compilers emit it, a string
 * holding one. Only function entries are kept; constructors, events, errors
 * and fallback/receive entries are dropped.
 */
Result<SolcOutput> parse_solc_output(std::string_view json);

Result<SolcOutput> load_solc_output(std::filesystem::path const &);

/// Matches the fully qualified name first, then a single `path:name`
/// entry. Returns nullptr if nothing matches or a short name matches
/// contracts in more than one file.
CompiledContract const *
find_contract(SolcOutput const &, std::string_view name);

PROPFUZZ_NAMESPACE_END
