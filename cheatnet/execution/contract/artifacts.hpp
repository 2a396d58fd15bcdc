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

#include <ankerl/unordered_dense.h>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

CHEATNET_NAMESPACE_BEGIN

struct ContractArtifacts
{
    std::string sierra{};
    std::string casm{};
};

struct ArtifactProvider
{
    virtual ~ArtifactProvider() = default;

    virtual std::optional<ContractArtifacts>
    lookup(std::string_view contract_name) const = 0;
};

class ArtifactMap final : public ArtifactProvider
{
    ankerl::unordered_dense::map<std::string, ContractArtifacts> contracts_{};

public:
    /// Keeps an existing entry of the same name; returns whether it inserted
    bool insert(std::string const &contract_name, ContractArtifacts);

    /// Adds the names of `other` this map lacks
    void merge(ArtifactMap other);

    size_t size() const
    {
        return contracts_.size();
    }

    std::optional<ContractArtifacts>
    lookup(std::string_view contract_name) const override;
};

/// A `<target>.starknet_artifacts.json` file emitted by the build tool
struct ArtifactsFile
{
    std::filesystem::path path{};
    std::optional<std::string> test_type{};
};

enum class ArtifactsError
{
    Success = 0,
    FileNotReadable,
    InvalidJson,
    MissingField,
    MissingCasm,
};

/// Loads one artifacts file; artifact paths are relative to its directory
Result<ArtifactMap> load_artifacts_file(std::filesystem::path const &);

/**
 * Merges several artifacts files. The base file is the first one with test
 * type "integration", or the first file if none has it. Entries of the base
 * file win on name conflicts; the other files only add names it lacks.
 */
Result<ArtifactMap> load_starknet_artifacts(std::vector<ArtifactsFile> const &);

CHEATNET_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<cheatnet::ArtifactsError>
    : quick_status_code_from_enum_defaults<cheatnet::ArtifactsError>
{
    static constexpr auto const domain_name = "Artifacts Error";
    static constexpr auto const domain_uuid =
        "91d3c7a4-05e8-4b2f-8c6d-3f7a2e1b9d50";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
