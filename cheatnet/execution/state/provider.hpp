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
#include <cheatnet/core/result.hpp>
#include <cheatnet/execution/block_info.hpp>
#include <cheatnet/execution/contract/compiled_class.hpp>

#include <cstdint>
#include <optional>
#include <string>

CHEATNET_NAMESPACE_BEGIN

struct DeclareTransaction
{
    std::string sierra{};
    /// Network compiled class hash of the matching CASM
    ClassHash compiled_class_hash{};
    ContractAddress sender_address{};
    /// Fee token amount; the provider estimates one when unset
    std::optional<Felt> max_fee{};
    Nonce nonce{};
};

enum class FinalityStatus : uint8_t
{
    Received = 0,
    Rejected,
    AcceptedOnL2,
    AcceptedOnL1,
};

enum class ExecutionStatus : uint8_t
{
    Succeeded = 0,
    Reverted,
};

struct TransactionStatus
{
    FinalityStatus finality{FinalityStatus::Received};
    std::optional<ExecutionStatus> execution{};
    std::string revert_reason{};
};

/**
 * Network facing collaborator. Reads return ProviderError::ContractNotFound
 * or ProviderError::ClassHashNotFound when the entity does not exist at the
 * requested block; any other error is a failure of the request itself.
 */
struct Provider
{
    virtual ~Provider() = default;

    virtual Result<Felt> get_storage_at(
        ContractAddress const &, StorageKey const &, BlockId const &) = 0;

    virtual Result<Nonce>
    get_nonce(ContractAddress const &, BlockId const &) = 0;

    virtual Result<ClassHash>
    get_class_hash_at(ContractAddress const &, BlockId const &) = 0;

    virtual Result<CompiledClass>
    get_compiled_class(ClassHash const &, BlockId const &) = 0;

    virtual Result<BlockInfo> get_block_info(BlockId const &) = 0;

    /// Returns the transaction hash
    virtual Result<Felt> add_declare_transaction(DeclareTransaction const &) = 0;

    /// TransactionHashNotFound until the node has received the transaction
    virtual Result<TransactionStatus>
    get_transaction_status(Felt const &transaction_hash) = 0;

    /// Error data the node attached to the last failed request
    virtual std::string last_error_data() const
    {
        return {};
    }
};

CHEATNET_NAMESPACE_END
