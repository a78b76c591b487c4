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

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <cstddef>

PROPFUZZ_NAMESPACE_BEGIN

class EvmcHost;
class State;

// EIP-3541 and EIP-170 checks on the code returned by initcode
evmc_status_code check_deployed_code(
    byte_string_view, size_t max_code_size, evmc_revision) noexcept;

evmc::Result create(
    EvmcHost &, State &, evmc_message const &, size_t max_code_size) noexcept;

evmc::Result call(EvmcHost &, State &, evmc_message const &) noexcept;

PROPFUZZ_NAMESPACE_END
