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
#include <propfuzz/core/byte_string.hpp>
#include <propfuzz/core/cases.hpp>
#include <propfuzz/core/config.hpp>
#include <propfuzz/core/result.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

PROPFUZZ_NAMESPACE_BEGIN

struct AbiValueKind;

// One alternative per Solidity ABI parameter type.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#types
namespace abi_kind
{
    struct Address
    {
    };

    struct Bytes
    {
    };

    struct Int
    {
        unsigned bits;
    };

    struct Uint
    {
        unsigned bits;
    };

    struct Bool
    {
    };

    struct String
    {
    };

    struct FixedBytes
    {
        unsigned length;
    };

    struct Array
    {
        std::shared_ptr<AbiValueKind const> element;
    };

    struct FixedArray
    {
        std::shared_ptr<AbiValueKind const> element;
        size_t length;
    };

    struct Tuple
    {
        std::vector<AbiValueKind> components;
    };
}

struct AbiValueKind
{
    using variant_t = std::variant<
        abi_kind::Address, abi_kind::Bytes, abi_kind::Int, abi_kind::Uint,
        abi_kind::Bool, abi_kind::String, abi_kind::Array,
        abi_kind::FixedBytes, abi_kind::FixedArray, abi_kind::Tuple>;

    variant_t kind;
};

bool operator==(AbiValueKind const &, AbiValueKind const &);

/// Static head words are 32 bytes
inline constexpr size_t ABI_WORD_SIZE = 32;

/// Parses a canonical ABI type name. Only the kinds the calldata generator
/// can produce a value for are accepted: `address`, `bytes` and `uintN` for
/// N in {8, 16, 32, 64, 128, 256}. Every other name, including valid
/// Solidity types, is `AbiError::UnsupportedTypeKind`.
Result<AbiValueKind> parse_abi_type(std::string_view type_name);

/// Whether `random_encoded_value` can produce a value of this kind
bool is_encodable(AbiValueKind const &) noexcept;

/// Canonical type name, e.g. "uint256" or "address[3]"
std::string to_string(AbiValueKind const &);

namespace detail
{
    // each draw fills up to eight bytes, most significant byte first
    template <typename Engine>
    void fill_random(Engine &engine, unsigned char *const out, size_t const n)
    {
        auto dist = std::uniform_int_distribution<uint64_t>();
        for (size_t i = 0; i < n; i += sizeof(uint64_t)) {
            uint64_t const r = dist(engine);
            size_t const m = std::min(sizeof(uint64_t), n - i);
            for (size_t j = 0; j < m; ++j) {
                out[i + j] = static_cast<unsigned char>(r >> (56 - 8 * j));
            }
        }
    }
}

/// Draws a uniformly random value of `kind` in its in-place encoding: a
/// 32-byte word with the value right-aligned and zero-padded on the left.
template <typename Engine>
Result<byte_string>
random_encoded_value(AbiValueKind const &kind, Engine &engine)
{
    return std::visit(
        Cases{
            [&](abi_kind::Uint const &u) -> Result<byte_string> {
                size_t const n = u.bits / 8;
                byte_string word(ABI_WORD_SIZE, 0);
                detail::fill_random(
                    engine, word.data() + ABI_WORD_SIZE - n, n);
                return word;
            },
            [&](abi_kind::Address const &) -> Result<byte_string> {
                byte_string word(ABI_WORD_SIZE, 0);
                detail::fill_random(engine, word.data() + 12, 20);
                return word;
            },
            [](auto const &) -> Result<byte_string> {
                return AbiError::UnsupportedTypeKind;
            }},
        kind.kind);
}

PROPFUZZ_NAMESPACE_END
