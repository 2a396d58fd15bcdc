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

#include <cheatnet/core/assert.h>
#include <cheatnet/core/config.hpp>
#include <cheatnet/execution/resources/fee_schedule.hpp>
#include <cheatnet/execution/resources/resource_accountant.hpp>
#include <cheatnet/execution/resources/vm_resources.hpp>

#include <algorithm>
#include <cstdint>

CHEATNET_NAMESPACE_BEGIN

VmResources with_syscall_costs(
    FeeSchedule const &schedule, VmResources const &vm,
    SyscallCounts const &syscalls)
{
    VmResources total = vm;
    for (auto const &[kind, count] : syscalls) {
        auto const it = schedule.syscall_costs.find(kind);
        if (it == schedule.syscall_costs.end()) {
            continue;
        }
        auto const &cost = it->second;
        total.n_steps += cost.n_steps * count;
        total.n_memory_holes += cost.n_memory_holes * count;
        for (auto const &[builtin, used] : cost.builtin_counts) {
            total.builtin_counts[builtin] += used * count;
        }
    }
    return total;
}

ResourceReport estimate_resources(
    FeeSchedule const &schedule, OperationKind const kind,
    VmResources const &vm, SyscallCounts const &syscalls)
{
    CHEATNET_ASSERT(kind != OperationKind::Deploy);

    auto const total = with_syscall_costs(schedule, vm, syscalls);

    uint64_t dominant = total.n_steps * schedule.step_weight;
    for (auto const &[builtin, used] : total.builtin_counts) {
        auto const it = schedule.builtin_weights.find(builtin);
        if (it != schedule.builtin_weights.end()) {
            dominant = std::max(dominant, used * it->second);
        }
    }

    uint64_t base = 0;
    if (auto const it = schedule.base_costs.find(kind);
        it != schedule.base_costs.end()) {
        base = it->second;
    }

    return ResourceReport{
        .gas_centi = dominant + base,
        .vm_resources = vm,
        .syscall_counts = syscalls};
}

ResourceReport estimate_deploy_resources(
    FeeSchedule const &schedule, bool const runs_constructor,
    VmResources const &vm, SyscallCounts const &syscalls)
{
    return ResourceReport{
        .gas_centi = schedule.deploy_cost +
                     (runs_constructor ? schedule.constructor_cost : 0),
        .vm_resources = vm,
        .syscall_counts = syscalls};
}

CHEATNET_NAMESPACE_END
