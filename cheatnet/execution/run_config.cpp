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
#include <cheatnet/execution/resources/fee_schedule.hpp>
#include <cheatnet/execution/run_config.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

CHEATNET_ANONYMOUS_NAMESPACE_BEGIN

using nlohmann::json;

// values accepted for "log_level"
constexpr std::pair<std::string_view, quill::LogLevel> log_level_names[] = {
    {"trace", quill::LogLevel::TraceL1},
    {"debug", quill::LogLevel::Debug},
    {"info", quill::LogLevel::Info},
    {"warning", quill::LogLevel::Warning},
    {"error", quill::LogLevel::Error},
    {"critical", quill::LogLevel::Critical},
    {"off", quill::LogLevel::None}};

std::optional<quill::LogLevel> log_level_from_name(std::string_view const name)
{
    for (auto const &[level_name, level] : log_level_names) {
        if (level_name == name) {
            return level;
        }
    }
    return std::nullopt;
}

Result<Felt> read_hex(json const &j)
{
    if (!j.is_string()) {
        return ConfigError::InvalidField;
    }
    auto res = felt_from_hex(j.get<std::string>());
    if (res.has_error()) {
        return ConfigError::InvalidFelt;
    }
    return res.value();
}

Result<uint64_t> read_u64(json const &j)
{
    if (!j.is_number_unsigned()) {
        return ConfigError::InvalidField;
    }
    return j.get<uint64_t>();
}

Result<BlockId> read_block_id(json const &j)
{
    if (j.is_number_unsigned()) {
        return BlockId{j.get<uint64_t>()};
    }
    if (j.is_string()) {
        auto const tag = j.get<std::string>();
        if (tag == "latest") {
            return BlockId{BlockTag::Latest};
        }
        if (tag == "pending") {
            return BlockId{BlockTag::Pending};
        }
        return ConfigError::InvalidBlockId;
    }
    if (j.is_object() && j.size() == 1 && j.contains("hash")) {
        BOOST_OUTCOME_TRY(auto const hash, read_hex(j["hash"]));
        return BlockId{BlockHash{hash}};
    }
    return ConfigError::InvalidBlockId;
}

Result<void> read_block_info(json const &j, BlockInfo &info)
{
    if (!j.is_object()) {
        return ConfigError::InvalidField;
    }
    if (j.contains("block_number")) {
        BOOST_OUTCOME_TRY(info.block_number, read_u64(j["block_number"]));
    }
    if (j.contains("block_timestamp")) {
        BOOST_OUTCOME_TRY(info.block_timestamp, read_u64(j["block_timestamp"]));
    }
    if (j.contains("sequencer_address")) {
        BOOST_OUTCOME_TRY(
            info.sequencer_address, read_hex(j["sequencer_address"]));
    }
    if (j.contains("chain_id")) {
        if (!j["chain_id"].is_string()) {
            return ConfigError::InvalidField;
        }
        auto chain_id =
            felt_from_short_string(j["chain_id"].get<std::string>());
        if (chain_id.has_error()) {
            return ConfigError::InvalidFelt;
        }
        info.chain_id = chain_id.value();
    }
    return outcome::success();
}

CHEATNET_ANONYMOUS_NAMESPACE_END

CHEATNET_NAMESPACE_BEGIN

Result<RunConfig> parse_run_config(std::string_view const text)
{
    auto const j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return ConfigError::InvalidJson;
    }

    RunConfig config;
    if (j.contains("fork")) {
        auto const &fork = j["fork"];
        if (!fork.is_object() || !fork.contains("url") ||
            !fork["url"].is_string()) {
            return ConfigError::InvalidField;
        }
        ForkConfig fork_config{.url = fork["url"].get<std::string>()};
        if (fork.contains("block_id")) {
            BOOST_OUTCOME_TRY(
                fork_config.block_id, read_block_id(fork["block_id"]));
        }
        config.fork = std::move(fork_config);
    }
    if (j.contains("block_info")) {
        BOOST_OUTCOME_TRY(read_block_info(j["block_info"], config.block_info));
    }
    if (j.contains("max_fee")) {
        BOOST_OUTCOME_TRY(auto const max_fee, read_u64(j["max_fee"]));
        config.max_fee = max_fee;
    }
    if (j.contains("fee_version")) {
        auto const &version = j["fee_version"];
        if (!version.is_string()) {
            return ConfigError::InvalidField;
        }
        auto const fee_version =
            fee_version_from_string(version.get<std::string>());
        if (!fee_version.has_value()) {
            return ConfigError::UnknownFeeVersion;
        }
        config.fee_version = *fee_version;
    }
    if (j.contains("log_level")) {
        auto const &level = j["log_level"];
        if (!level.is_string()) {
            return ConfigError::InvalidField;
        }
        auto const log_level = log_level_from_name(level.get<std::string>());
        if (!log_level.has_value()) {
            return ConfigError::UnknownLogLevel;
        }
        config.log_level = *log_level;
    }
    return config;
}

Result<RunConfig> load_run_config(std::filesystem::path const &path)
{
    std::ifstream ifile(path.c_str());
    if (!ifile) {
        LOG_WARNING("run config {} is not readable", path.string());
        return ConfigError::FileNotReadable;
    }
    std::ostringstream contents;
    contents << ifile.rdbuf();
    return parse_run_config(contents.str());
}

CHEATNET_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<cheatnet::ConfigError>::mapping> const &
quick_status_code_from_enum<cheatnet::ConfigError>::value_mappings()
{
    using cheatnet::ConfigError;

    static std::initializer_list<mapping> const v = {
        {ConfigError::Success, "success", {errc::success}},
        {ConfigError::FileNotReadable, "failed to read run config", {}},
        {ConfigError::InvalidJson, "run config is not a JSON object", {}},
        {ConfigError::InvalidField, "run config field has the wrong type", {}},
        {ConfigError::InvalidFelt, "run config holds a malformed felt", {}},
        {ConfigError::InvalidBlockId, "invalid fork block id", {}},
        {ConfigError::UnknownLogLevel, "unknown log level", {}},
        {ConfigError::UnknownFeeVersion, "unknown fee schedule version", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
