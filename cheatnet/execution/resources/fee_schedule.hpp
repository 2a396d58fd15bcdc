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
#include <cheatnet/core/result.hpp>
#include <cheatnet/execution/resources/vm_resources.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string_view>

CHEATNET_NAMESPACE_BEGIN

enum class FeeVersion : uint8_t
{
    V0_12 = 0,
};

char const *to_string(FeeVersion);

std::optional<FeeVersion> fee_version_from_string(std::string_view);

enum class OperationKind : uint8_t
{
    Declare = 0,
    Deploy,
    Call,
    Invoke,
    L1Handler,
};

/// Weights are hundredths of a gas unit per resource unit
struct FeeSchedule
{
    FeeVersion version;
    uint64_t step_weight;
    std::map<Builtin, uint64_t> builtin_weights;
    /// Operating system cost added per issued syscall
    std::map<SyscallKind, VmResources> syscall_costs;
    std::map<OperationKind, uint64_t> base_costs;
    /// Deploys are charged flat amounts instead of weighted resources: the
    /// deploy cost, plus the constructor cost when the class has one
    uint64_t deploy_cost;
    uint64_t constructor_cost;
};

FeeSchedule const &fee_schedule(FeeVersion = FeeVersion::V0_12);

CHEATNET_NAMESPACE_END
