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

#include <cheatnet/core/config.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <string>
#include <string_view>

CHEATNET_NAMESPACE_BEGIN

/// Character traits for raw bytes; the standard only provides them for the
/// character types
struct byte_traits : std::char_traits<char>
{
    using char_type = unsigned char;

    static constexpr void assign(char_type &to, char_type const &from) noexcept
    {
        to = from;
    }

    static constexpr char_type *
    assign(char_type *const p, size_t const n, char_type const c)
    {
        std::fill_n(p, n, c);
        return p;
    }

    static constexpr bool eq(char_type const a, char_type const b) noexcept
    {
        return a == b;
    }

    static constexpr bool lt(char_type const a, char_type const b) noexcept
    {
        return a < b;
    }

    static constexpr char_type *
    move(char_type *const to, char_type const *const from, size_t const n)
    {
        if (to < from) {
            std::copy_n(from, n, to);
        }
        else {
            std::copy_backward(from, from + n, to + n);
        }
        return to;
    }

    static constexpr char_type *
    copy(char_type *const to, char_type const *const from, size_t const n)
    {
        std::copy_n(from, n, to);
        return to;
    }

    static constexpr int
    compare(char_type const *const a, char_type const *const b, size_t const n)
    {
        for (size_t i = 0; i < n; ++i) {
            if (a[i] != b[i]) {
                return a[i] < b[i] ? -1 : 1;
            }
        }
        return 0;
    }

    static constexpr size_t length(char_type const *p)
    {
        size_t n = 0;
        while (p[n] != 0) {
            ++n;
        }
        return n;
    }

    static constexpr char_type const *
    find(char_type const *const p, size_t const n, char_type const &c)
    {
        for (size_t i = 0; i < n; ++i) {
            if (p[i] == c) {
                return p + i;
            }
        }
        return nullptr;
    }
};

using byte_string = std::basic_string<unsigned char, byte_traits>;

template <size_t N>
using byte_string_fixed = std::array<unsigned char, N>;

using byte_string_view = std::basic_string_view<unsigned char, byte_traits>;

template <size_t N>
constexpr byte_string_view to_byte_string_view(unsigned char const (&a)[N])
{
    return {&a[0], N};
}

template <class T, size_t N>
constexpr byte_string_view to_byte_string_view(std::array<T, N> const &a)
{
    return {a.data(), N};
}

inline byte_string_view to_byte_string_view(std::string_view const s)
{
    return {reinterpret_cast<unsigned char const *>(s.data()), s.size()};
}

CHEATNET_NAMESPACE_END
