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

#include <memory>

PROPFUZZ_NAMESPACE_BEGIN

// Code is shared between the world and the transaction overlays, and must
// stay valid while a frame executing it calls into nested frames
using SharedCode = std::shared_ptr<byte_string const>;

inline SharedCode make_shared_code(byte_string_view const code)
{
    return std::make_shared<byte_string const>(code);
}

PROPFUZZ_NAMESPACE_END
