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

#include <propfuzz/core/assert.h>
#include <propfuzz/core/byte_string.hpp>
#include <propfuzz/core/config.hpp>
#include <propfuzz/core/int.hpp>
#include <propfuzz/execution/address.hpp>

#include <concepts>
#include <cstdint>

PROPFUZZ_NAMESPACE_BEGIN

// Only the subset of RLP needed to derive contract addresses
namespace rlp
{
    inline byte_string_view zeroless_view(byte_string_view const string_view)
    {
        auto b = string_view.begin();
        auto const e = string_view.end();
        while (b < e && *b == 0) {
            ++b;
        }
        return {b, e};
    }

    inline byte_string to_big_compact(std::unsigned_integral auto n)
    {
        n = intx::to_big_endian(n);
        return byte_string(
            zeroless_view({reinterpret_cast<unsigned char *>(&n), sizeof(n)}));
    }

    inline byte_string encode_string(byte_string_view const string_view)
    {
        byte_string result;
        auto const size = string_view.size();
        if (size == 1 && string_view[0] <= 0x7f) {
            result = string_view;
        }
        else if (size > 55) {
            auto const size_str = to_big_compact(size);
            PROPFUZZ_ASSERT(size_str.size() <= 8u);
            result.push_back(
                0xb7 + static_cast<unsigned char>(size_str.size()));
            result += size_str;
            result += string_view;
        }
        else {
            result.push_back(0x80 + static_cast<unsigned char>(size));
            result += string_view;
        }
        return result;
    }

    inline byte_string encode_unsigned(uint64_t const n)
    {
        return encode_string(to_big_compact(n));
    }

    inline byte_string encode_address(Address const &address)
    {
        return encode_string({address.bytes, sizeof(Address)});
    }

    template <std::convertible_to<byte_string>... Args>
    byte_string encode_list(Args const &...args)
    {
        size_t size = 0;
        ([&] { size += args.size(); }(), ...);
        byte_string result;
        if (size > 55) {
            auto const size_str = to_big_compact(size);
            PROPFUZZ_ASSERT(size_str.size() <= 8u);
            result += (0xf7 + static_cast<unsigned char>(size_str.size()));
            result += size_str;
        }
        else {
            result += (0xc0 + static_cast<unsigned char>(size));
        }
        ([&] { result += args; }(), ...);
        return result;
    }
}

PROPFUZZ_NAMESPACE_END
