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

#include <cheatnet/core/config.hpp>
#include <cheatnet/execution/resources/vm_resources.hpp>

CHEATNET_NAMESPACE_BEGIN

char const *to_string(Builtin const b)
{
    switch (b) {
    case Builtin::Output:
        return "output";
    case Builtin::Pedersen:
        return "pedersen";
    case Builtin::RangeCheck:
        return "range_check";
    case Builtin::Ecdsa:
        return "ecdsa";
    case Builtin::Bitwise:
        return "bitwise";
    case Builtin::EcOp:
        return "ec_op";
    case Builtin::Keccak:
        return "keccak";
    case Builtin::Poseidon:
        return "poseidon";
    case Builtin::SegmentArena:
        return "segment_arena";
    }
    return "unknown";
}

char const *to_string(SyscallKind const kind)
{
    switch (kind) {
    case SyscallKind::CallContract:
        return "CallContract";
    case SyscallKind::EmitEvent:
        return "EmitEvent";
    case SyscallKind::GetExecutionInfo:
        return "GetExecutionInfo";
    case SyscallKind::ReplaceClass:
        return "ReplaceClass";
    case SyscallKind::SendMessageToL1:
        return "SendMessageToL1";
    case SyscallKind::StorageRead:
        return "StorageRead";
    case SyscallKind::StorageWrite:
        return "StorageWrite";
    }
    return "Unknown";
}

CHEATNET_NAMESPACE_END
