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
#include <propfuzz/core/int.hpp>
#include <propfuzz/core/keccak.hpp>

#include <evmc/evmc.hpp>

#include <bit>
#include <cstddef>

PROPFUZZ_NAMESPACE_BEGIN

using bytes32_t = ::evmc::bytes32;

static_assert(sizeof(bytes32_t) == 32);
static_assert(alignof(bytes32_t) == 1);

/// Big-endian 32-byte word, the EVM's in-place encoding of a uint256
inline bytes32_t to_bytes(uint256_t const n) noexcept
{
    return intx::be::store<bytes32_t>(n);
}

constexpr bytes32_t to_bytes(hash256 const n) noexcept
{
    return std::bit_cast<bytes32_t>(n);
}

using namespace evmc::literals;

inline constexpr bytes32_t NULL_HASH{
    0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470_bytes32};

PROPFUZZ_NAMESPACE_END
