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

#include <cstdint>
#include <map>

CHEATNET_NAMESPACE_BEGIN

enum class Builtin : uint8_t
{
    Output = 0,
    Pedersen,
    RangeCheck,
    Ecdsa,
    Bitwise,
    EcOp,
    Keccak,
    Poseidon,
    SegmentArena,
};

char const *to_string(Builtin);

enum class SyscallKind : uint8_t
{
    CallContract = 0,
    EmitEvent,
    GetExecutionInfo,
    ReplaceClass,
    SendMessageToL1,
    StorageRead,
    StorageWrite,
};

char const *to_string(SyscallKind);

using SyscallCounts = std::map<SyscallKind, uint64_t>;

/// Raw counters of the Cairo VM for one or more entry point runs
struct VmResources
{
    uint64_t n_steps{0};
    uint64_t n_memory_holes{0};
    std::map<Builtin, uint64_t> builtin_counts{};

    uint64_t builtin(Builtin const b) const
    {
        auto const it = builtin_counts.find(b);
        return it == builtin_counts.end() ? 0 : it->second;
    }

    VmResources &operator+=(VmResources const &other)
    {
        n_steps += other.n_steps;
        n_memory_holes += other.n_memory_holes;
        for (auto const &[b, count] : other.builtin_counts) {
            builtin_counts[b] += count;
        }
        return *this;
    }

    friend bool operator==(VmResources const &, VmResources const &) = default;
};

CHEATNET_NAMESPACE_END
