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
#include <cheatnet/execution/block_info.hpp>
#include <cheatnet/execution/resources/fee_schedule.hpp>

#include <quill/LogLevel.h>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

CHEATNET_NAMESPACE_BEGIN

struct ForkConfig
{
    std::string url{};
    BlockId block_id{BlockTag::Latest};

    friend bool operator==(ForkConfig const &, ForkConfig const &) = default;
};

struct RunConfig
{
    std::optional<ForkConfig> fork{};
    BlockInfo block_info{};
    /// Hundredths of a gas unit
    std::optional<uint64_t> max_fee{};
    FeeVersion fee_version{FeeVersion::V0_12};
    quill::LogLevel log_level{quill::LogLevel::Info};
};

enum class ConfigError
{
    Success = 0,
    FileNotReadable,
    InvalidJson,
    InvalidField,
    InvalidFelt,
    InvalidBlockId,
    UnknownLogLevel,
    UnknownFeeVersion,
};

/**
 * Parses a run configuration:
 *
 *   {
 *     "fork": {"url": "...", "block_id": "latest" | 123 | {"hash": "0x.."}},
 *     "block_info": {"block_number": 1, "block_timestamp": 2,
 *                    "sequencer_address": "0x..", "chain_id": "SN_MAIN"},
 *     "max_fee": 1000,
 *     "fee_version": "0.12",
 *     "log_level": "info"
 *   }
 *
 * Every key is optional. Felts are hex strings except `chain_id`, which is a
 * short string.
 */
Result<RunConfig> parse_run_config(std::string_view json);

Result<RunConfig> load_run_config(std::filesystem::path const &);

CHEATNET_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<cheatnet::ConfigError>
    : quick_status_code_from_enum_defaults<cheatnet::ConfigError>
{
    static constexpr auto const domain_name = "Config Error";
    static constexpr auto const domain_uuid =
        "5e0b8a27-c3d4-4f61-9a8e-b27d6c1f4e93";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
