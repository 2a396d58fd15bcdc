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

#include <cheatnet/core/felt.hpp>
#include <cheatnet/core/result.hpp>
#include <cheatnet/execution/block_info.hpp>
#include <cheatnet/execution/state/provider.hpp>
#include <cheatnet/execution/state/provider_error.hpp>
#include <cheatnet/rpc/json_rpc_provider.hpp>

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <deque>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace cheatnet;
using nlohmann::json;

namespace
{
    class FakeTransport final : public RpcTransport
    {
    public:
        std::deque<std::string> replies{};
        std::vector<json> bodies{};

        void reply_result(json result)
        {
            replies.push_back(
                json{{"jsonrpc", "2.0"}, {"id", 0}, {"result", std::move(result)}}
                    .dump());
        }

        void reply_error(int64_t const code, json data = nullptr)
        {
            json error{{"code", code}, {"message", "node says no"}};
            if (!data.is_null()) {
                error["data"] = std::move(data);
            }
            replies.push_back(
                json{{"jsonrpc", "2.0"}, {"id", 0}, {"error", std::move(error)}}
                    .dump());
        }

        Result<std::string> post(std::string const &body) override
        {
            bodies.push_back(json::parse(body));
            if (replies.empty()) {
                return outcome_e::errc::connection_refused;
            }
            auto reply = std::move(replies.front());
            replies.pop_front();
            return reply;
        }
    };

    struct JsonRpcProviderTest : public testing::Test
    {
        FakeTransport transport{};
        JsonRpcProvider provider{transport};
    };
}

TEST(JsonRpcErrorCodes, mapping)
{
    std::vector<std::pair<int64_t, ProviderError>> const table = {
        {1, ProviderError::FailedToReceiveTransaction},
        {20, ProviderError::ContractNotFound},
        {24, ProviderError::BlockNotFound},
        {27, ProviderError::InvalidTransactionIndex},
        {28, ProviderError::ClassHashNotFound},
        {29, ProviderError::TransactionHashNotFound},
        {40, ProviderError::ContractError},
        {41, ProviderError::TransactionExecutionError},
        {51, ProviderError::ClassAlreadyDeclared},
        {52, ProviderError::InvalidTransactionNonce},
        {53, ProviderError::InsufficientMaxFee},
        {54, ProviderError::InsufficientAccountBalance},
        {55, ProviderError::ValidationFailure},
        {56, ProviderError::CompilationFailed},
        {57, ProviderError::ContractClassSizeIsTooLarge},
        {58, ProviderError::NonAccount},
        {59, ProviderError::DuplicateTx},
        {60, ProviderError::CompiledClassHashMismatch},
        {61, ProviderError::UnsupportedTxVersion},
        {62, ProviderError::UnsupportedContractClassVersion},
        {0, ProviderError::Unknown},
        {-32601, ProviderError::Unknown},
    };
    for (auto const &[code, kind] : table) {
        EXPECT_EQ(provider_error_from_code(code), kind) << code;
    }
}

TEST_F(JsonRpcProviderTest, get_storage_at)
{
    transport.reply_result("0x2a");

    auto const res =
        provider.get_storage_at(Felt{0xc0}, Felt{0x1}, BlockId{uint64_t{312646}});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), Felt{42});

    ASSERT_EQ(transport.bodies.size(), 1u);
    auto const &body = transport.bodies[0];
    EXPECT_EQ(body["jsonrpc"], "2.0");
    EXPECT_EQ(body["method"], "starknet_getStorageAt");
    EXPECT_EQ(body["params"]["contract_address"], "0xc0");
    EXPECT_EQ(body["params"]["key"], "0x1");
    EXPECT_EQ(body["params"]["block_id"], (json{{"block_number", 312646}}));
}

TEST_F(JsonRpcProviderTest, block_ids)
{
    transport.reply_result("0x0");
    transport.reply_result("0x0");
    transport.reply_result("0x0");
    ASSERT_TRUE(provider.get_nonce(Felt{1}, BlockId{BlockTag::Latest}).has_value());
    ASSERT_TRUE(
        provider.get_nonce(Felt{1}, BlockId{BlockTag::Pending}).has_value());
    ASSERT_TRUE(
        provider.get_nonce(Felt{1}, BlockId{BlockHash{Felt{0xb10c}}})
            .has_value());

    EXPECT_EQ(transport.bodies[0]["method"], "starknet_getNonce");
    EXPECT_EQ(transport.bodies[0]["params"]["block_id"], "latest");
    EXPECT_EQ(transport.bodies[1]["params"]["block_id"], "pending");
    EXPECT_EQ(
        transport.bodies[2]["params"]["block_id"],
        (json{{"block_hash", "0xb10c"}}));
    EXPECT_NE(transport.bodies[0]["id"], transport.bodies[1]["id"]);
}

TEST_F(JsonRpcProviderTest, node_errors)
{
    transport.reply_error(20);
    auto const res = provider.get_class_hash_at(Felt{0xdead}, BlockTag::Latest);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ProviderError::ContractNotFound);
    EXPECT_EQ(transport.bodies[0]["method"], "starknet_getClassHashAt");

    transport.reply_error(-32000);
    EXPECT_EQ(
        provider.get_class_hash_at(Felt{1}, BlockTag::Latest).error(),
        ProviderError::Unknown);
}

TEST_F(JsonRpcProviderTest, transport_failure)
{
    auto const res = provider.get_storage_at(Felt{1}, Felt{2}, BlockTag::Latest);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ProviderError::RequestFailed);
}

TEST_F(JsonRpcProviderTest, malformed_replies)
{
    transport.replies.push_back("not json");
    transport.replies.push_back("[]");
    transport.replies.push_back(R"({"jsonrpc": "2.0", "id": 0})");
    transport.replies.push_back(R"({"error": "oops"})");
    transport.reply_result(42);
    transport.reply_result("0xnothex");

    for (int i = 0; i < 6; ++i) {
        auto const res =
            provider.get_storage_at(Felt{1}, Felt{2}, BlockTag::Latest);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), ProviderError::MalformedResponse);
    }
}

TEST_F(JsonRpcProviderTest, get_compiled_class)
{
    transport.reply_result(json::parse(R"({
        "compiler_version": "2.4.0",
        "bytecode": ["0x1", "0x2"],
        "entry_points_by_type": {
            "EXTERNAL": [{"selector": "0x5", "offset": 0, "builtins": []}],
            "L1_HANDLER": [],
            "CONSTRUCTOR": []
        }
    })"));
    auto const cls = provider.get_compiled_class(Felt{0xc1a55}, BlockTag::Latest);
    ASSERT_TRUE(cls.has_value());
    EXPECT_EQ(cls.value().bytecode, (std::vector<Felt>{Felt{1}, Felt{2}}));
    ASSERT_EQ(cls.value().external.size(), 1u);
    EXPECT_EQ(transport.bodies[0]["method"], "starknet_getCompiledCasm");
    EXPECT_EQ(transport.bodies[0]["params"]["class_hash"], "0xc1a55");

    transport.reply_result(json{{"bytecode", "nope"}});
    EXPECT_EQ(
        provider.get_compiled_class(Felt{0xc1a55}, BlockTag::Latest).error(),
        ProviderError::MalformedResponse);
}

TEST_F(JsonRpcProviderTest, get_block_info)
{
    transport.reply_result(
        {{"block_number", 312646},
         {"timestamp", 1700000000},
         {"sequencer_address", "0x1176a1bd84444c89232ec27754698e5d2e7e1a7f1539f12027f28b23ec9f3d8"},
         {"transactions", json::array()}});
    transport.reply_result("0x534e5f4d41494e");

    auto const info = provider.get_block_info(uint64_t{312646});
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info.value().block_number, 312646u);
    EXPECT_EQ(info.value().block_timestamp, 1700000000u);
    EXPECT_EQ(
        info.value().sequencer_address,
        felt_from_hex(
            "0x1176a1bd84444c89232ec27754698e5d2e7e1a7f1539f12027f28b23ec9f3d8")
            .value());
    EXPECT_EQ(info.value().chain_id, felt_from_short_string("SN_MAIN").value());
    ASSERT_EQ(transport.bodies.size(), 2u);
    EXPECT_EQ(transport.bodies[0]["method"], "starknet_getBlockWithTxHashes");
    EXPECT_EQ(transport.bodies[1]["method"], "starknet_chainId");
    EXPECT_TRUE(transport.bodies[1]["params"].is_array());
}

TEST_F(JsonRpcProviderTest, pending_block_has_no_number)
{
    transport.reply_result(
        {{"timestamp", 5}, {"sequencer_address", "0x1"}, {"parent_hash", "0x2"}});
    transport.reply_result("0x1");

    auto const info = provider.get_block_info(BlockTag::Pending);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info.value().block_number, BlockInfo{}.block_number);
    EXPECT_EQ(info.value().block_timestamp, 5u);

    transport.reply_result({{"block_number", 1}});
    EXPECT_EQ(
        provider.get_block_info(BlockTag::Latest).error(),
        ProviderError::MalformedResponse);
}

TEST_F(JsonRpcProviderTest, add_declare_transaction)
{
    transport.reply_result(
        {{"transaction_hash", "0xdec1a4e"}, {"class_hash", "0xc1a55"}});

    auto const res = provider.add_declare_transaction(DeclareTransaction{
        .sierra = R"({"sierra_program": ["0x1"]})",
        .compiled_class_hash = Felt{0xca5},
        .sender_address = Felt{0x5e4d},
        .max_fee = Felt{1000},
        .nonce = Felt{3}});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), Felt{0xdec1a4e});

    auto const &tx = transport.bodies[0]["params"]["declare_transaction"];
    EXPECT_EQ(transport.bodies[0]["method"], "starknet_addDeclareTransaction");
    EXPECT_EQ(tx["type"], "DECLARE");
    EXPECT_EQ(tx["version"], "0x2");
    EXPECT_EQ(tx["contract_class"]["sierra_program"][0], "0x1");
    EXPECT_EQ(tx["compiled_class_hash"], "0xca5");
    EXPECT_EQ(tx["sender_address"], "0x5e4d");
    EXPECT_EQ(tx["max_fee"], "0x3e8");
    EXPECT_EQ(tx["nonce"], "0x3");
    EXPECT_TRUE(tx["signature"].empty());

    auto const invalid =
        provider.add_declare_transaction(DeclareTransaction{.sierra = "{"});
    ASSERT_TRUE(invalid.has_error());
    EXPECT_EQ(invalid.error(), ProviderError::CompilationFailed);
    EXPECT_EQ(transport.bodies.size(), 1u);

    transport.reply_error(51);
    EXPECT_EQ(
        provider
            .add_declare_transaction(DeclareTransaction{.sierra = "{}"})
            .error(),
        ProviderError::ClassAlreadyDeclared);
}

TEST_F(JsonRpcProviderTest, declare_without_max_fee_is_estimated_first)
{
    transport.reply_result(json::array(
        {{{"gas_consumed", "0x10"},
          {"gas_price", "0x4"},
          {"overall_fee", "0x64"}}}));
    transport.reply_result({{"transaction_hash", "0xdec1a4e"}});

    auto const res = provider.add_declare_transaction(DeclareTransaction{
        .sierra = R"({"sierra_program": []})",
        .compiled_class_hash = Felt{0xca5},
        .sender_address = Felt{0x5e4d},
        .nonce = Felt{3}});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), Felt{0xdec1a4e});
    ASSERT_EQ(transport.bodies.size(), 2u);

    auto const &estimate = transport.bodies[0];
    EXPECT_EQ(estimate["method"], "starknet_estimateFee");
    EXPECT_EQ(estimate["params"]["block_id"], "pending");
    EXPECT_TRUE(estimate["params"]["simulation_flags"].empty());
    ASSERT_EQ(estimate["params"]["request"].size(), 1u);
    auto const &query = estimate["params"]["request"][0];
    EXPECT_EQ(query["version"], "0x100000000000000000000000000000002");
    EXPECT_EQ(query["max_fee"], "0x0");
    EXPECT_EQ(query["compiled_class_hash"], "0xca5");
    EXPECT_EQ(query["nonce"], "0x3");

    auto const &tx = transport.bodies[1]["params"]["declare_transaction"];
    EXPECT_EQ(transport.bodies[1]["method"], "starknet_addDeclareTransaction");
    EXPECT_EQ(tx["version"], "0x2");
    EXPECT_EQ(tx["max_fee"], "0x6e");
}

TEST_F(JsonRpcProviderTest, failed_estimate_submits_nothing)
{
    transport.reply_error(41, "Entry point not found");
    auto const res =
        provider.add_declare_transaction(DeclareTransaction{.sierra = "{}"});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ProviderError::TransactionExecutionError);
    EXPECT_EQ(transport.bodies.size(), 1u);

    transport.reply_result(json::array());
    EXPECT_EQ(
        provider.add_declare_transaction(DeclareTransaction{.sierra = "{}"})
            .error(),
        ProviderError::MalformedResponse);
    EXPECT_EQ(transport.bodies.size(), 2u);
}

TEST_F(JsonRpcProviderTest, node_error_data)
{
    EXPECT_TRUE(provider.last_error_data().empty());

    transport.reply_error(55, "invalid signature");
    EXPECT_EQ(
        provider.get_nonce(Felt{1}, BlockTag::Latest).error(),
        ProviderError::ValidationFailure);
    EXPECT_EQ(provider.last_error_data(), "invalid signature");

    transport.reply_error(40, {{"revert_error", "boom"}});
    EXPECT_EQ(
        provider.get_nonce(Felt{1}, BlockTag::Latest).error(),
        ProviderError::ContractError);
    EXPECT_EQ(provider.last_error_data(), R"({"revert_error":"boom"})");

    transport.reply_result("0x0");
    ASSERT_TRUE(provider.get_nonce(Felt{1}, BlockTag::Latest).has_value());
    EXPECT_TRUE(provider.last_error_data().empty());

    transport.reply_error(20);
    EXPECT_EQ(
        provider.get_nonce(Felt{1}, BlockTag::Latest).error(),
        ProviderError::ContractNotFound);
    EXPECT_TRUE(provider.last_error_data().empty());
}

TEST_F(JsonRpcProviderTest, get_transaction_status)
{
    transport.reply_result(
        {{"finality_status", "ACCEPTED_ON_L2"},
         {"execution_status", "SUCCEEDED"}});
    transport.reply_result(
        {{"finality_status", "ACCEPTED_ON_L1"},
         {"execution_status", "REVERTED"},
         {"failure_reason", "Insufficient balance"}});
    transport.reply_result({{"finality_status", "REJECTED"}});
    transport.reply_result({{"finality_status", "LOST"}});

    auto const accepted = provider.get_transaction_status(Felt{1});
    ASSERT_TRUE(accepted.has_value());
    EXPECT_EQ(accepted.value().finality, FinalityStatus::AcceptedOnL2);
    EXPECT_EQ(accepted.value().execution, ExecutionStatus::Succeeded);
    EXPECT_EQ(transport.bodies[0]["method"], "starknet_getTransactionStatus");
    EXPECT_EQ(transport.bodies[0]["params"]["transaction_hash"], "0x1");

    auto const reverted = provider.get_transaction_status(Felt{1});
    ASSERT_TRUE(reverted.has_value());
    EXPECT_EQ(reverted.value().execution, ExecutionStatus::Reverted);
    EXPECT_EQ(reverted.value().revert_reason, "Insufficient balance");

    auto const rejected = provider.get_transaction_status(Felt{1});
    ASSERT_TRUE(rejected.has_value());
    EXPECT_EQ(rejected.value().finality, FinalityStatus::Rejected);
    EXPECT_FALSE(rejected.value().execution.has_value());

    EXPECT_EQ(
        provider.get_transaction_status(Felt{1}).error(),
        ProviderError::MalformedResponse);
}
