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
#include <cheatnet/core/felt.hpp>
#include <cheatnet/core/result.hpp>
#include <cheatnet/execution/block_info.hpp>
#include <cheatnet/execution/contract/compiled_class.hpp>
#include <cheatnet/execution/state/provider.hpp>
#include <cheatnet/execution/state/provider_error.hpp>
#include <cheatnet/rpc/json_rpc_provider.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <string>
#include <utility>
#include <type_traits>
#include <variant>

CHEATNET_ANONYMOUS_NAMESPACE_BEGIN

using nlohmann::json;

// 2^128 + 2, version of a declare v2 sent for estimation only
constexpr Felt QUERY_VERSION_2{2, 0, 1, 0};

json to_rpc(Felt const &value)
{
    return to_hex(value);
}

json to_rpc(BlockId const &block_id)
{
    return std::visit(
        [](auto const &id) -> json {
            using T = std::decay_t<decltype(id)>;
            if constexpr (std::is_same_v<T, uint64_t>) {
                return {{"block_number", id}};
            }
            else if constexpr (std::is_same_v<T, BlockHash>) {
                return {{"block_hash", to_hex(id.value)}};
            }
            else {
                return id == BlockTag::Latest ? "latest" : "pending";
            }
        },
        block_id);
}

Result<Felt> felt_field(json const &j)
{
    if (!j.is_string()) {
        return ProviderError::MalformedResponse;
    }
    auto res = felt_from_hex(j.get<std::string>());
    if (res.has_error()) {
        return ProviderError::MalformedResponse;
    }
    return res.value();
}

Result<Felt> felt_field(json const &j, char const *const key)
{
    if (!j.is_object() || !j.contains(key)) {
        return ProviderError::MalformedResponse;
    }
    return felt_field(j[key]);
}

Result<FinalityStatus> finality_status(json const &j)
{
    if (!j.is_string()) {
        return ProviderError::MalformedResponse;
    }
    auto const status = j.get<std::string>();
    if (status == "RECEIVED") {
        return FinalityStatus::Received;
    }
    if (status == "REJECTED") {
        return FinalityStatus::Rejected;
    }
    if (status == "ACCEPTED_ON_L2") {
        return FinalityStatus::AcceptedOnL2;
    }
    if (status == "ACCEPTED_ON_L1") {
        return FinalityStatus::AcceptedOnL1;
    }
    return ProviderError::MalformedResponse;
}

CHEATNET_ANONYMOUS_NAMESPACE_END

CHEATNET_NAMESPACE_BEGIN

ProviderError provider_error_from_code(int64_t const code)
{
    switch (code) {
    case 1:
        return ProviderError::FailedToReceiveTransaction;
    case 20:
        return ProviderError::ContractNotFound;
    case 24:
        return ProviderError::BlockNotFound;
    case 27:
        return ProviderError::InvalidTransactionIndex;
    case 28:
        return ProviderError::ClassHashNotFound;
    case 29:
        return ProviderError::TransactionHashNotFound;
    case 40:
        return ProviderError::ContractError;
    case 41:
        return ProviderError::TransactionExecutionError;
    case 51:
        return ProviderError::ClassAlreadyDeclared;
    case 52:
        return ProviderError::InvalidTransactionNonce;
    case 53:
        return ProviderError::InsufficientMaxFee;
    case 54:
        return ProviderError::InsufficientAccountBalance;
    case 55:
        return ProviderError::ValidationFailure;
    case 56:
        return ProviderError::CompilationFailed;
    case 57:
        return ProviderError::ContractClassSizeIsTooLarge;
    case 58:
        return ProviderError::NonAccount;
    case 59:
        return ProviderError::DuplicateTx;
    case 60:
        return ProviderError::CompiledClassHashMismatch;
    case 61:
        return ProviderError::UnsupportedTxVersion;
    case 62:
        return ProviderError::UnsupportedContractClassVersion;
    default:
        return ProviderError::Unknown;
    }
}

JsonRpcProvider::JsonRpcProvider(RpcTransport &transport)
    : transport_{transport}
{
}

Result<void> JsonRpcProvider::request(
    char const *const method, json params, json &result)
{
    last_error_data_.clear();
    json const body = {
        {"jsonrpc", "2.0"},
        {"id", next_id_++},
        {"method", method},
        {"params", std::move(params)}};

    auto const reply = transport_.post(body.dump());
    if (reply.has_error()) {
        LOG_WARNING(
            "{} request failed: {}", method, reply.error().message().c_str());
        return ProviderError::RequestFailed;
    }

    auto j = json::parse(reply.value(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return ProviderError::MalformedResponse;
    }
    if (auto const error = j.find("error"); error != j.end()) {
        if (!error->is_object() || !error->contains("code") ||
            !(*error)["code"].is_number_integer()) {
            return ProviderError::MalformedResponse;
        }
        auto const code = (*error)["code"].get<int64_t>();
        if (auto const data = error->find("data"); data != error->end()) {
            last_error_data_ =
                data->is_string() ? data->get<std::string>() : data->dump();
        }
        LOG_DEBUG(
            "{} returned error code {} {}", method, code, last_error_data_);
        return provider_error_from_code(code);
    }
    auto const it = j.find("result");
    if (it == j.end()) {
        return ProviderError::MalformedResponse;
    }
    result = std::move(*it);
    return outcome::success();
}

Result<Felt> JsonRpcProvider::get_storage_at(
    ContractAddress const &address, StorageKey const &key,
    BlockId const &block_id)
{
    json result;
    BOOST_OUTCOME_TRY(request(
        "starknet_getStorageAt",
        {{"contract_address", to_rpc(address)},
         {"key", to_rpc(key)},
         {"block_id", to_rpc(block_id)}},
        result));
    return felt_field(result);
}

Result<Nonce> JsonRpcProvider::get_nonce(
    ContractAddress const &address, BlockId const &block_id)
{
    json result;
    BOOST_OUTCOME_TRY(request(
        "starknet_getNonce",
        {{"block_id", to_rpc(block_id)},
         {"contract_address", to_rpc(address)}},
        result));
    return felt_field(result);
}

Result<ClassHash> JsonRpcProvider::get_class_hash_at(
    ContractAddress const &address, BlockId const &block_id)
{
    json result;
    BOOST_OUTCOME_TRY(request(
        "starknet_getClassHashAt",
        {{"block_id", to_rpc(block_id)},
         {"contract_address", to_rpc(address)}},
        result));
    return felt_field(result);
}

Result<CompiledClass> JsonRpcProvider::get_compiled_class(
    ClassHash const &class_hash, BlockId const &block_id)
{
    json result;
    BOOST_OUTCOME_TRY(request(
        "starknet_getCompiledCasm",
        {{"class_hash", to_rpc(class_hash)},
         {"block_id", to_rpc(block_id)}},
        result));
    auto cls = parse_compiled_class(result.dump());
    if (cls.has_error()) {
        LOG_WARNING(
            "compiled class {} does not parse: {}",
            to_hex(class_hash),
            cls.error().message().c_str());
        return ProviderError::MalformedResponse;
    }
    return std::move(cls).value();
}

Result<BlockInfo> JsonRpcProvider::get_block_info(BlockId const &block_id)
{
    json block;
    BOOST_OUTCOME_TRY(request(
        "starknet_getBlockWithTxHashes",
        {{"block_id", to_rpc(block_id)}},
        block));
    if (!block.is_object() || !block.contains("timestamp") ||
        !block["timestamp"].is_number_unsigned()) {
        return ProviderError::MalformedResponse;
    }

    BlockInfo info;
    // pending blocks have no number yet
    if (block.contains("block_number")) {
        if (!block["block_number"].is_number_unsigned()) {
            return ProviderError::MalformedResponse;
        }
        info.block_number = block["block_number"].get<uint64_t>();
    }
    info.block_timestamp = block["timestamp"].get<uint64_t>();
    BOOST_OUTCOME_TRY(
        info.sequencer_address, felt_field(block, "sequencer_address"));

    json chain_id;
    BOOST_OUTCOME_TRY(request("starknet_chainId", json::array(), chain_id));
    BOOST_OUTCOME_TRY(info.chain_id, felt_field(chain_id));
    return info;
}

Result<Felt>
JsonRpcProvider::estimate_declare_fee(json const &declare_transaction)
{
    json query = declare_transaction;
    query["version"] = to_rpc(QUERY_VERSION_2);
    query["max_fee"] = to_rpc(Felt{0});

    json result;
    BOOST_OUTCOME_TRY(request(
        "starknet_estimateFee",
        {{"request", json::array({std::move(query)})},
         {"simulation_flags", json::array()},
         {"block_id", "pending"}},
        result));
    if (!result.is_array() || result.size() != 1) {
        return ProviderError::MalformedResponse;
    }
    BOOST_OUTCOME_TRY(
        auto const overall_fee, felt_field(result[0], "overall_fee"));
    auto const max_fee = overall_fee + overall_fee / 10;
    LOG_DEBUG(
        "estimated declare fee {}, max fee {}",
        to_hex(overall_fee),
        to_hex(max_fee));
    return max_fee;
}

Result<Felt>
JsonRpcProvider::add_declare_transaction(DeclareTransaction const &tx)
{
    auto contract_class = json::parse(tx.sierra, nullptr, false);
    if (contract_class.is_discarded()) {
        return ProviderError::CompilationFailed;
    }
    json declare_transaction = {
        {"type", "DECLARE"},
        {"version", "0x2"},
        {"contract_class", std::move(contract_class)},
        {"compiled_class_hash", to_rpc(tx.compiled_class_hash)},
        {"sender_address", to_rpc(tx.sender_address)},
        {"nonce", to_rpc(tx.nonce)},
        {"signature", json::array()}};

    Felt max_fee{};
    if (tx.max_fee.has_value()) {
        max_fee = *tx.max_fee;
    }
    else {
        BOOST_OUTCOME_TRY(max_fee, estimate_declare_fee(declare_transaction));
    }
    declare_transaction["max_fee"] = to_rpc(max_fee);

    json result;
    BOOST_OUTCOME_TRY(request(
        "starknet_addDeclareTransaction",
        {{"declare_transaction", std::move(declare_transaction)}},
        result));
    return felt_field(result, "transaction_hash");
}

Result<TransactionStatus>
JsonRpcProvider::get_transaction_status(Felt const &transaction_hash)
{
    json result;
    BOOST_OUTCOME_TRY(request(
        "starknet_getTransactionStatus",
        {{"transaction_hash", to_rpc(transaction_hash)}},
        result));
    if (!result.is_object() || !result.contains("finality_status")) {
        return ProviderError::MalformedResponse;
    }

    TransactionStatus status;
    BOOST_OUTCOME_TRY(
        status.finality, finality_status(result["finality_status"]));
    if (auto const it = result.find("execution_status"); it != result.end()) {
        if (*it == "SUCCEEDED") {
            status.execution = ExecutionStatus::Succeeded;
        }
        else if (*it == "REVERTED") {
            status.execution = ExecutionStatus::Reverted;
        }
        else {
            return ProviderError::MalformedResponse;
        }
    }
    if (auto const it = result.find("failure_reason");
        it != result.end() && it->is_string()) {
        status.revert_reason = it->get<std::string>();
    }
    return status;
}

CHEATNET_NAMESPACE_END
