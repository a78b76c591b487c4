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

#include <propfuzz/core/config.hpp>
#include <propfuzz/fuzz/campaign_config.hpp>

#include <random>

PROPFUZZ_NAMESPACE_BEGIN

void CampaignConfig::set_random_seed_if_default()
{
    if (seed == default_seed) {
        seed = std::random_device()();
    }
}

PROPFUZZ_NAMESPACE_END
