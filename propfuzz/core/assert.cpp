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

#include <propfuzz/core/assert.h>

#include <cstdlib>
#include <iostream>
#ifndef __clang__
    #include <stacktrace>
#endif

extern char const *__progname;

extern "C" void propfuzz_assertion_failed(
    char const *const expr, char const *const function, char const *const file,
    long const line, char const *const msg)
{
#if __cpp_lib_stacktrace >= 202011L
    std::cerr << std::stacktrace::current() << std::endl;
#endif
    std::cerr << __progname << ": " << file << ':' << line << ": " << function
              << ": ";
    if (expr != nullptr) {
        std::cerr << "Assertion '" << expr << "' failed";
    }
    else {
        std::cerr << "Abort";
    }
    if (msg != nullptr) {
        std::cerr << ": " << msg;
    }
    std::cerr << std::endl;
    std::cerr << std::flush;
    std::abort();
}
