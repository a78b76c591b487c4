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
#include <propfuzz/abi/abi_type.hpp>
#include <propfuzz/core/basic_formatter.hpp>
#include <propfuzz/core/cases.hpp>
#include <propfuzz/core/config.hpp>
#include <propfuzz/core/result.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <variant>

PROPFUZZ_NAMESPACE_BEGIN

namespace abi_kind
{
    bool operator==(Address const &, Address const &)
    {
        return true;
    }

    bool operator==(Bytes const &, Bytes const &)
    {
        return true;
    }

    bool operator==(Int const &a, Int const &b)
    {
        return a.bits == b.bits;
    }

    bool operator==(Uint const &a, Uint const &b)
    {
        return a.bits == b.bits;
    }

    bool operator==(Bool const &, Bool const &)
    {
        return true;
    }

    bool operator==(String const &, String const &)
    {
        return true;
    }

    bool operator==(FixedBytes const &a, FixedBytes const &b)
    {
        return a.length == b.length;
    }

    bool operator==(Array const &a, Array const &b)
    {
        return *a.element == *b.element;
    }

    bool operator==(FixedArray const &a, FixedArray const &b)
    {
        return a.length == b.length && *a.element == *b.element;
    }

    bool operator==(Tuple const &a, Tuple const &b)
    {
        return std::ranges::equal(a.components, b.components);
    }
}

bool operator==(AbiValueKind const &a, AbiValueKind const &b)
{
    return a.kind == b.kind;
}

Result<AbiValueKind> parse_abi_type(std::string_view const type_name)
{
    using namespace abi_kind;

    if (type_name == "address") {
        return AbiValueKind{Address{}};
    }
    if (type_name == "bytes") {
        return AbiValueKind{Bytes{}};
    }
    for (unsigned const bits : {8u, 16u, 32u, 64u, 128u, 256u}) {
        if (type_name == fmt::format("uint{}", bits)) {
            return AbiValueKind{Uint{bits}};
        }
    }
    return AbiError::UnsupportedTypeKind;
}

bool is_encodable(AbiValueKind const &kind) noexcept
{
    return std::holds_alternative<abi_kind::Uint>(kind.kind) ||
           std::holds_alternative<abi_kind::Address>(kind.kind);
}

std::string to_string(AbiValueKind const &kind)
{
    using namespace abi_kind;

    return std::visit(
        Cases{
            [](Address const &) -> std::string { return "address"; },
            [](Bytes const &) -> std::string { return "bytes"; },
            [](Int const &i) { return fmt::format("int{}", i.bits); },
            [](Uint const &u) { return fmt::format("uint{}", u.bits); },
            [](Bool const &) -> std::string { return "bool"; },
            [](String const &) -> std::string { return "string"; },
            [](FixedBytes const &b) {
                return fmt::format("bytes{}", b.length);
            },
            [](Array const &a) { return to_string(*a.element) + "[]"; },
            [](FixedArray const &a) {
                return fmt::format("{}[{}]", to_string(*a.element), a.length);
            },
            [](Tuple const &t) {
                std::string s = "(";
                for (size_t i = 0; i < t.components.size(); ++i) {
                    if (i > 0) {
                        s += ',';
                    }
                    s += to_string(t.components[i]);
                }
                return s + ")";
            }},
        kind.kind);
}

PROPFUZZ_NAMESPACE_END
