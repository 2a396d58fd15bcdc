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

CHEATNET_NAMESPACE_BEGIN

/**
 * Deterministic address of a deployment: starknet_keccak over the prefix
 * "STARKNET_CONTRACT_ADDRESS", deployer, salt, class hash and the hash of the
 * constructor calldata, reduced below 2^251 - 256.
 */
ContractAddress calculate_contract_address(
    Felt const &salt, ClassHash const &, Calldata const &constructor_calldata,
    ContractAddress const &deployer);

CHEATNET_NAMESPACE_END
