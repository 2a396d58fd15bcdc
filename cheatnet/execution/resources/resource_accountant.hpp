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
#include <cheatnet/execution/resources/fee_schedule.hpp>
#include <cheatnet/execution/resources/vm_resources.hpp>

#include <cstdint>

CHEATNET_NAMESPACE_BEGIN

struct ResourceReport
{
    /// Estimated gas in hundredths of a unit
    uint64_t gas_centi{0};
    VmResources vm_resources{};
    SyscallCounts syscall_counts{};

    double gas() const
    {
        return static_cast<double>(gas_centi) / 100.0;
    }

    friend bool operator==(ResourceReport const &, ResourceReport const &) =
        default;
};

/// Adds the operating system cost of every syscall to the VM counters
VmResources with_syscall_costs(
    FeeSchedule const &, VmResources const &, SyscallCounts const &);

/**
 * Gas of one top level operation: the most expensive weighted resource over
 * steps and builtins (syscall costs included), plus the base cost of the
 * operation kind. Integer arithmetic only, so equal inputs give bit for bit
 * equal estimates. Deploys are priced by estimate_deploy_resources.
 */
ResourceReport estimate_resources(
    FeeSchedule const &, OperationKind, VmResources const &,
    SyscallCounts const &);

/// Flat deploy price; the counters are reported but not weighted
ResourceReport estimate_deploy_resources(
    FeeSchedule const &, bool runs_constructor, VmResources const &,
    SyscallCounts const &);

CHEATNET_NAMESPACE_END
