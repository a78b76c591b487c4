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

#include <propfuzz/abi/selector.hpp>
#include <propfuzz/core/byte_string.hpp>
#include <propfuzz/core/config.hpp>
#include <propfuzz/core/keccak.hpp>

#include <string_view>

PROPFUZZ_NAMESPACE_BEGIN

Selector function_selector(std::string_view const signature)
{
    auto const h = keccak256(to_byte_string_view(signature));
    return {h.bytes[0], h.bytes[1], h.bytes[2], h.bytes[3]};
}

PROPFUZZ_NAMESPACE_END
