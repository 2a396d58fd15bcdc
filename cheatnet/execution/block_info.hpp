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
#include <cheatnet/core/felt.hpp>

#include <cstdint>
#include <variant>

CHEATNET_NAMESPACE_BEGIN

enum class BlockTag : uint8_t
{
    Latest = 0,
    Pending,
};

struct BlockHash
{
    Felt value{};

    friend bool operator==(BlockHash const &, BlockHash const &) = default;
};

/// Block a fork is pinned to: a number, a hash or a tag
using BlockId = std::variant<uint64_t, BlockHash, BlockTag>;

struct BlockInfo
{
    uint64_t block_number{2000};
    uint64_t block_timestamp{0};
    ContractAddress sequencer_address{0x1000};
    Felt chain_id{0x4e5f474f45524c49, 0x53}; // "SN_GOERLI"

    friend bool operator==(BlockInfo const &, BlockInfo const &) = default;
};

CHEATNET_NAMESPACE_END
