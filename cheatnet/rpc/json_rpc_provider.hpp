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
#include <cheatnet/execution/state/provider.hpp>
#include <cheatnet/execution/state/provider_error.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>

CHEATNET_NAMESPACE_BEGIN

/// Carries one request body to the node and returns the reply body
struct RpcTransport
{
    virtual ~RpcTransport() = default;

    virtual Result<std::string> post(std::string const &body) = 0;
};

/// ProviderError for a node error code; unknown codes give Unknown
ProviderError provider_error_from_code(int64_t code);

/**
 * Starknet JSON-RPC client. Node errors come back as their ProviderError,
 * transport failures as RequestFailed and replies that do not parse as
 * MalformedResponse. The `data` member of the last node error is kept for
 * last_error_data(). A declare without a max fee is priced with
 * starknet_estimateFee plus a tenth.
 */
class JsonRpcProvider final : public Provider
{
    RpcTransport &transport_;
    uint64_t next_id_{0};
    std::string last_error_data_{};

    /// Stores the `result` member of the reply in `result`
    Result<void>
    request(char const *method, nlohmann::json params, nlohmann::json &result);

    Result<Felt> estimate_declare_fee(nlohmann::json const &declare_transaction);

public:
    explicit JsonRpcProvider(RpcTransport &);

    Result<Felt> get_storage_at(
        ContractAddress const &, StorageKey const &, BlockId const &) override;

    Result<Nonce> get_nonce(ContractAddress const &, BlockId const &) override;

    Result<ClassHash>
    get_class_hash_at(ContractAddress const &, BlockId const &) override;

    Result<CompiledClass>
    get_compiled_class(ClassHash const &, BlockId const &) override;

    Result<BlockInfo> get_block_info(BlockId const &) override;

    Result<Felt> add_declare_transaction(DeclareTransaction const &) override;

    Result<TransactionStatus>
    get_transaction_status(Felt const &transaction_hash) override;

    std::string last_error_data() const override
    {
        return last_error_data_;
    }
};

CHEATNET_NAMESPACE_END
