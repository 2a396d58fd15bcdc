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
#include <cheatnet/execution/resources/fee_schedule.hpp>
#include <cheatnet/execution/resources/vm_resources.hpp>

#include <optional>
#include <string_view>

CHEATNET_ANONYMOUS_NAMESPACE_BEGIN

VmResources os_cost(uint64_t const n_steps, uint64_t const range_checks)
{
    VmResources r{.n_steps = n_steps};
    if (range_checks) {
        r.builtin_counts[Builtin::RangeCheck] = range_checks;
    }
    return r;
}

FeeSchedule make_v0_12_schedule()
{
    return FeeSchedule{
        .version = FeeVersion::V0_12,
        .step_weight = 1,
        .builtin_weights =
            {{Builtin::Output, 0},
             {Builtin::Pedersen, 32},
             {Builtin::RangeCheck, 16},
             {Builtin::Ecdsa, 2048},
             {Builtin::Bitwise, 64},
             {Builtin::EcOp, 1024},
             {Builtin::Keccak, 2048},
             {Builtin::Poseidon, 32},
             {Builtin::SegmentArena, 16}},
        .syscall_costs =
            {{SyscallKind::CallContract, os_cost(760, 20)},
             {SyscallKind::EmitEvent, os_cost(61, 1)},
             {SyscallKind::GetExecutionInfo, os_cost(59, 1)},
             {SyscallKind::ReplaceClass, os_cost(73, 0)},
             {SyscallKind::SendMessageToL1, os_cost(84, 1)},
             {SyscallKind::StorageRead, os_cost(44, 1)},
             {SyscallKind::StorageWrite, os_cost(46, 1)}},
        .base_costs =
            {{OperationKind::Declare, 0},
             {OperationKind::Call, 0},
             {OperationKind::Invoke, 0},
             {OperationKind::L1Handler, 0}},
        // 200 steps plus one entry point (600 steps) at 100 gas per step
        .deploy_cost = 8'000'000,
        .constructor_cost = 1'384'000,
    };
}

CHEATNET_ANONYMOUS_NAMESPACE_END

CHEATNET_NAMESPACE_BEGIN

char const *to_string(FeeVersion const version)
{
    switch (version) {
    case FeeVersion::V0_12:
        return "0.12";
    }
    return "unknown";
}

std::optional<FeeVersion> fee_version_from_string(std::string_view const s)
{
    if (s == "0.12") {
        return FeeVersion::V0_12;
    }
    return std::nullopt;
}

FeeSchedule const &fee_schedule(FeeVersion const version)
{
    static FeeSchedule const v0_12 = make_v0_12_schedule();

    switch (version) {
    case FeeVersion::V0_12:
        break;
    }
    return v0_12;
}

CHEATNET_NAMESPACE_END
