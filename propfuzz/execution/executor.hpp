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

#include <propfuzz/core/byte_string.hpp>
#include <propfuzz/core/config.hpp>
#include <propfuzz/execution/address.hpp>
#include <propfuzz/execution/execution_result.hpp>

#include <cstddef>

PROPFUZZ_NAMESPACE_BEGIN

/// The contract-execution environment a campaign runs against. Every call is
/// a committed top-level transaction from the same sender; a transaction
/// that does not succeed leaves no trace except the sender's nonce.
class Executor
{
public:
    virtual ~Executor() = default;

    virtual ExecutionResult deploy(byte_string_view creation_code) = 0;

    virtual ExecutionResult
    call(Address const &, byte_string_view calldata) = 0;

    // 0 for accounts without code
    virtual size_t code_size(Address const &) = 0;
};

PROPFUZZ_NAMESPACE_END
