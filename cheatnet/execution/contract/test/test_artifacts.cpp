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

#include <cheatnet/execution/contract/artifacts.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace cheatnet;

namespace
{
    void write_file(std::filesystem::path const &path, std::string const &text)
    {
        std::ofstream ofile(path.c_str());
        ofile << text;
    }

    struct ArtifactsTest : public ::testing::Test
    {
        std::filesystem::path dir;

        void SetUp() override
        {
            dir = std::filesystem::temp_directory_path() /
                  ("cheatnet_artifacts_" +
                   std::string{::testing::UnitTest::GetInstance()
                                   ->current_test_info()
                                   ->name()});
            std::filesystem::remove_all(dir);
            std::filesystem::create_directories(dir);
        }

        void TearDown() override
        {
            std::filesystem::remove_all(dir);
        }

        /// Writes an artifacts file naming `contracts`, each with sierra and
        /// casm files whose contents are prefixed with `tag`
        std::filesystem::path write_target(
            std::string const &target, std::vector<std::string> const &contracts,
            std::string const &tag)
        {
            std::string entries;
            for (auto const &name : contracts) {
                auto const sierra = target + "_" + name + ".contract_class.json";
                auto const casm =
                    target + "_" + name + ".compiled_contract_class.json";
                write_file(dir / sierra, tag + " sierra " + name);
                write_file(dir / casm, tag + " casm " + name);
                if (!entries.empty()) {
                    entries += ",";
                }
                entries += R"({"id": "x", "package_name": "pkg", "contract_name": ")" +
                           name + R"(", "module_path": "pkg::)" + name +
                           R"(", "artifacts": {"sierra": ")" + sierra +
                           R"(", "casm": ")" + casm + R"("}})";
            }
            auto const path = dir / (target + ".test.starknet_artifacts.json");
            write_file(
                path, R"({"version": 1, "contracts": [)" + entries + "]}");
            return path;
        }
    };
}

TEST_F(ArtifactsTest, load_file)
{
    auto const path = write_target("pkg", {"HelloStarknet", "Token"}, "a");
    auto const map = load_artifacts_file(path);
    ASSERT_FALSE(map.has_error());
    EXPECT_EQ(map.value().size(), 2);

    auto const hello = map.value().lookup("HelloStarknet");
    ASSERT_TRUE(hello.has_value());
    EXPECT_EQ(hello->sierra, "a sierra HelloStarknet");
    EXPECT_EQ(hello->casm, "a casm HelloStarknet");
    EXPECT_FALSE(map.value().lookup("Missing").has_value());
}

TEST_F(ArtifactsTest, load_errors)
{
    EXPECT_EQ(
        load_artifacts_file(dir / "missing.json").error(),
        ArtifactsError::FileNotReadable);

    write_file(dir / "bad.json", "{ not json");
    EXPECT_EQ(
        load_artifacts_file(dir / "bad.json").error(),
        ArtifactsError::InvalidJson);

    write_file(dir / "no_contracts.json", R"({"version": 1})");
    EXPECT_EQ(
        load_artifacts_file(dir / "no_contracts.json").error(),
        ArtifactsError::MissingField);

    write_file(dir / "sierra.json", "{}");
    write_file(
        dir / "no_casm.json",
        R"({"version": 1, "contracts": [{"contract_name": "A",
            "artifacts": {"sierra": "sierra.json"}}]})");
    EXPECT_EQ(
        load_artifacts_file(dir / "no_casm.json").error(),
        ArtifactsError::MissingCasm);

    write_file(
        dir / "dangling.json",
        R"({"version": 1, "contracts": [{"contract_name": "A",
            "artifacts": {"sierra": "sierra.json", "casm": "gone.json"}}]})");
    EXPECT_EQ(
        load_artifacts_file(dir / "dangling.json").error(),
        ArtifactsError::FileNotReadable);
}

TEST_F(ArtifactsTest, base_file_wins)
{
    auto const unit = write_target("unit", {"Shared", "OnlyUnit"}, "unit");
    auto const integration =
        write_target("integration", {"Shared", "OnlyIntegration"}, "integration");

    auto const map = load_starknet_artifacts(
        {ArtifactsFile{.path = unit, .test_type = "unit"},
         ArtifactsFile{.path = integration, .test_type = "integration"}});
    ASSERT_FALSE(map.has_error());
    EXPECT_EQ(map.value().size(), 3);
    EXPECT_EQ(
        map.value().lookup("Shared")->sierra, "integration sierra Shared");
    EXPECT_EQ(map.value().lookup("OnlyUnit")->casm, "unit casm OnlyUnit");
    EXPECT_TRUE(map.value().lookup("OnlyIntegration").has_value());
}

TEST_F(ArtifactsTest, first_file_is_base_without_integration)
{
    auto const first = write_target("first", {"Shared"}, "first");
    auto const second = write_target("second", {"Shared", "Extra"}, "second");

    auto const map = load_starknet_artifacts(
        {ArtifactsFile{.path = first}, ArtifactsFile{.path = second}});
    ASSERT_FALSE(map.has_error());
    EXPECT_EQ(map.value().lookup("Shared")->sierra, "first sierra Shared");
    EXPECT_EQ(map.value().lookup("Extra")->sierra, "second sierra Extra");
}

TEST_F(ArtifactsTest, empty_file_list)
{
    auto const map = load_starknet_artifacts({});
    ASSERT_FALSE(map.has_error());
    EXPECT_EQ(map.value().size(), 0);
}

TEST(ArtifactMap, insert_keeps_existing)
{
    ArtifactMap map;
    EXPECT_TRUE(map.insert("A", ContractArtifacts{.sierra = "1", .casm = "1"}));
    EXPECT_FALSE(map.insert("A", ContractArtifacts{.sierra = "2", .casm = "2"}));
    EXPECT_EQ(map.lookup("A")->sierra, "1");
}
