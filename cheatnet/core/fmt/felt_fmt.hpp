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

#include <cheatnet/core/basic_formatter.hpp>
#include <cheatnet/core/felt.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <intx/intx.hpp>

template <unsigned N>
struct quill::copy_loggable<intx::uint<N>> : std::true_type
{
};

// rendered in hex, like addresses and hashes on chain explorers
template <unsigned N>
struct fmt::formatter<intx::uint<N>> : public cheatnet::BasicFormatter
{
    template <typename FormatContext>
    auto format(intx::uint<N> const &value, FormatContext &ctx) const
    {
        fmt::format_to(ctx.out(), "0x{}", intx::hex(value));
        return ctx.out();
    }
};
