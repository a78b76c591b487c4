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

#include <propfuzz/abi/abi_error.hpp>
#include <propfuzz/abi/calldata_generator.hpp>
#include <propfuzz/abi/function_spec.hpp>
#include <propfuzz/abi/selector.hpp>
#include <propfuzz/core/byte_string.hpp>
#include <propfuzz/core/random.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

using namespace propfuzz;

namespace
{
    CalldataGenerator make_generator(std::vector<AbiFunction> const &fns)
    {
        return CalldataGenerator{build_function_specs(fns).value()};
    }

    bool starts_with_selector(byte_string const &data, Selector const &s)
    {
        return data.size() >= 4 && std::equal(s.begin(), s.end(), data.begin());
    }
}

TEST(CalldataGenerator, empty_interface)
{
    CalldataGenerator const gen{std::vector<FunctionSpec>{}};
    random_engine_t engine{0};
    auto const res = gen.next(engine);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AbiError::EmptyInterface);
}

TEST(CalldataGenerator, zero_params)
{
    auto const gen = make_generator({{.name = "flip", .inputs = {}}});
    random_engine_t engine{0};
    auto const call = gen.next(engine).value();
    EXPECT_EQ(call.data.size(), 4u);
    EXPECT_TRUE(starts_with_selector(call.data, function_selector("flip()")));
    EXPECT_EQ(call.function->name, "flip");
}

TEST(CalldataGenerator, one_param)
{
    auto const gen = make_generator(
        {{.name = "set0", .inputs = {{.name = "v", .type = "uint8"}}}});
    random_engine_t engine{3};
    for (int i = 0; i < 16; ++i) {
        auto const call = gen.next(engine).value();
        ASSERT_EQ(call.data.size(), 36u);
        EXPECT_TRUE(
            starts_with_selector(call.data, function_selector("set0(uint8)")));
        EXPECT_EQ(call.data.substr(4, 31), byte_string(31, 0));
    }
}

TEST(CalldataGenerator, many_params)
{
    std::vector<AbiParam> params;
    for (int i = 0; i < 7; ++i) {
        params.push_back({.name = "p" + std::to_string(i), .type = "address"});
    }
    auto const gen = make_generator({{.name = "many", .inputs = params}});
    random_engine_t engine{5};
    auto const call = gen.next(engine).value();
    ASSERT_EQ(call.data.size(), 4u + 32u * 7u);
    for (size_t i = 0; i < 7; ++i) {
        EXPECT_EQ(call.data.substr(4 + 32 * i, 12), byte_string(12, 0));
    }
}

TEST(CalldataGenerator, uniform_choice_covers_all_functions)
{
    auto const gen = make_generator(
        {{.name = "a", .inputs = {}},
         {.name = "b", .inputs = {{.name = "x", .type = "uint256"}}},
         {.name = "c", .inputs = {{.name = "y", .type = "address"}}}});
    random_engine_t engine{11};
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto const call = gen.next(engine).value();
        EXPECT_EQ(
            call.data.size(), 4u + 32u * call.function->params.size());
        EXPECT_TRUE(starts_with_selector(call.data, call.function->selector));
        seen.insert(call.function->name);
    }
    EXPECT_EQ(seen, (std::set<std::string>{"a", "b", "c"}));
}

TEST(CalldataGenerator, reproducible_with_seed)
{
    auto const gen = make_generator(
        {{.name = "a", .inputs = {{.name = "x", .type = "uint64"}}},
         {.name = "b", .inputs = {{.name = "y", .type = "address"}}}});
    random_engine_t a{99};
    random_engine_t b{99};
    for (int i = 0; i < 32; ++i) {
        EXPECT_EQ(gen.next(a).value().data, gen.next(b).value().data);
    }
}

TEST(CalldataGenerator, unencodable_param)
{
    auto const gen = make_generator(
        {{.name = "store", .inputs = {{.name = "d", .type = "bytes"}}}});
    random_engine_t engine{0};
    auto const res = gen.next(engine);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AbiError::UnsupportedTypeKind);
}
