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
#include <propfuzz/core/config.hpp>

#include <iterator>
#include <random>

PROPFUZZ_NAMESPACE_BEGIN

using random_engine_t = std::mt19937_64;

template <typename Engine, std::random_access_iterator Iterator>
auto const &uniform_sample(Engine &eng, Iterator begin, Iterator end)
{
    using diff_t = std::iterator_traits<Iterator>::difference_type;

    PROPFUZZ_DEBUG_ASSERT(begin != end);
    auto dist = std::uniform_int_distribution<diff_t>(0, end - begin - 1);
    return *(begin + dist(eng));
}

template <typename Engine, typename Container>
auto const &uniform_sample(Engine &eng, Container const &in)
    requires(std::random_access_iterator<typename Container::iterator>)
{
    return uniform_sample(eng, in.begin(), in.end());
}

PROPFUZZ_NAMESPACE_END
