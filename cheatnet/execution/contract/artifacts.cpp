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
#include <cheatnet/core/result.hpp>
#include <cheatnet/execution/contract/artifacts.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

CHEATNET_ANONYMOUS_NAMESPACE_BEGIN

constexpr std::string_view INTEGRATION_TEST_TYPE = "integration";

std::optional<std::string> read_file(std::filesystem::path const &path)
{
    std::ifstream ifile(path.c_str());
    if (!ifile) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << ifile.rdbuf();
    return std::move(contents).str();
}

CHEATNET_ANONYMOUS_NAMESPACE_END

CHEATNET_NAMESPACE_BEGIN

bool ArtifactMap::insert(
    std::string const &contract_name, ContractArtifacts artifacts)
{
    return contracts_.try_emplace(contract_name, std::move(artifacts)).second;
}

void ArtifactMap::merge(ArtifactMap other)
{
    for (auto &[name, artifacts] : other.contracts_) {
        contracts_.try_emplace(name, std::move(artifacts));
    }
}

std::optional<ContractArtifacts>
ArtifactMap::lookup(std::string_view const contract_name) const
{
    auto const it = contracts_.find(std::string{contract_name});
    if (it == contracts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<ArtifactMap> load_artifacts_file(std::filesystem::path const &path)
{
    auto const text = read_file(path);
    if (!text.has_value()) {
        LOG_WARNING("artifacts file {} is missing", path.string());
        return ArtifactsError::FileNotReadable;
    }
    auto const j = nlohmann::json::parse(*text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return ArtifactsError::InvalidJson;
    }
    auto const contracts = j.find("contracts");
    if (contracts == j.end() || !contracts->is_array()) {
        return ArtifactsError::MissingField;
    }

    auto const base_path = path.parent_path();
    ArtifactMap map;
    for (auto const &contract : *contracts) {
        auto const name = contract.find("contract_name");
        auto const paths = contract.find("artifacts");
        if (name == contract.end() || !name->is_string() ||
            paths == contract.end() || !paths->is_object()) {
            return ArtifactsError::MissingField;
        }
        auto const sierra_path = paths->find("sierra");
        if (sierra_path == paths->end() || !sierra_path->is_string()) {
            return ArtifactsError::MissingField;
        }
        auto const casm_path = paths->find("casm");
        if (casm_path == paths->end() || !casm_path->is_string()) {
            return ArtifactsError::MissingCasm;
        }

        auto sierra = read_file(base_path / sierra_path->get<std::string>());
        auto casm = read_file(base_path / casm_path->get<std::string>());
        if (!sierra.has_value() || !casm.has_value()) {
            return ArtifactsError::FileNotReadable;
        }
        map.insert(
            name->get<std::string>(),
            ContractArtifacts{
                .sierra = std::move(sierra).value(),
                .casm = std::move(casm).value()});
    }
    LOG_DEBUG("loaded {} contracts from {}", map.size(), path.string());
    return map;
}

Result<ArtifactMap>
load_starknet_artifacts(std::vector<ArtifactsFile> const &files)
{
    if (files.empty()) {
        return ArtifactMap{};
    }
    auto base = std::find_if(
        files.begin(), files.end(), [](ArtifactsFile const &file) {
            return file.test_type == INTEGRATION_TEST_TYPE;
        });
    if (base == files.end()) {
        base = files.begin();
    }

    BOOST_OUTCOME_TRY(auto merged, load_artifacts_file(base->path));
    for (auto it = files.begin(); it != files.end(); ++it) {
        if (it == base) {
            continue;
        }
        BOOST_OUTCOME_TRY(auto other, load_artifacts_file(it->path));
        merged.merge(std::move(other));
    }
    return merged;
}

CHEATNET_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<cheatnet::ArtifactsError>::mapping> const &
quick_status_code_from_enum<cheatnet::ArtifactsError>::value_mappings()
{
    using cheatnet::ArtifactsError;

    static std::initializer_list<mapping> const v = {
        {ArtifactsError::Success, "success", {errc::success}},
        {ArtifactsError::FileNotReadable, "failed to read artifacts file", {}},
        {ArtifactsError::InvalidJson,
         "failed to parse artifacts file, make sure sierra code generation is "
         "enabled in Scarb.toml",
         {}},
        {ArtifactsError::MissingField, "artifacts file is missing a field", {}},
        {ArtifactsError::MissingCasm,
         "artifacts file has no casm path, make sure casm code generation is "
         "enabled in Scarb.toml",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
