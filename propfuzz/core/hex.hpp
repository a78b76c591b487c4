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

#include <evmc/hex.hpp>

#include <string>

PROPFUZZ_NAMESPACE_BEGIN

/// 0x-prefixed lowercase hex; the form used for every byte string that ends
/// up in the log, so a logged payload can be replayed verbatim
inline std::string to_hex(byte_string_view const bytes)
{
    return "0x" + evmc::hex(bytes);
}

PROPFUZZ_NAMESPACE_END
