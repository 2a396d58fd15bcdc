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

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

CHEATNET_NAMESPACE_BEGIN

enum class EntryPointType : uint8_t
{
    External = 0,
    L1Handler,
    Constructor,
};

char const *to_string(EntryPointType);

struct EntryPoint
{
    EntryPointSelector selector{};
    uint64_t offset{0};
    std::vector<std::string> builtins{};

    friend bool operator==(EntryPoint const &, EntryPoint const &) = default;
};

/// CASM class as emitted by the sierra to casm compiler
struct CompiledClass
{
    std::string compiler_version{};
    std::vector<Felt> bytecode{};
    std::vector<EntryPoint> external{};
    std::vector<EntryPoint> l1_handler{};
    std::vector<EntryPoint> constructor{};

    std::vector<EntryPoint> const &entry_points(EntryPointType) const;

    EntryPoint const *
    find_entry_point(EntryPointType, EntryPointSelector const &) const;

    bool has_constructor() const
    {
        return !constructor.empty();
    }

    friend bool
    operator==(CompiledClass const &, CompiledClass const &) = default;
};

enum class ClassError
{
    Success = 0,
    InvalidJson,
    MissingField,
    InvalidFelt,
    InvalidEntryPoint,
    MultipleConstructors,
};

Result<CompiledClass> parse_compiled_class(std::string_view casm_json);

/// Checks that a sierra artifact is well formed enough to be declared
Result<void> validate_sierra_class(std::string_view sierra_json);

/**
 * Local identity of a compiled class.
 *
 * Every component (version tag, entry points of each type in the order
 * external, l1 handler, constructor, then the bytecode) is written as 32 byte
 * big endian words, each list prefixed by its length, and the result is
 * hashed with starknet_keccak. Equal classes always hash equal and any change
 * of bytecode or entry points changes the hash. This is not the network's
 * compiled class hash and is never sent to a node.
 */
ClassHash compute_class_hash(CompiledClass const &);

/// Network compiled class hash (Poseidon over the CASM layout), computed by
/// the Cairo toolchain that also hosts the execution engine
struct CompiledClassHasher
{
    virtual ~CompiledClassHasher() = default;

    virtual Result<ClassHash> compiled_class_hash(std::string_view casm_json) = 0;
};

CHEATNET_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<cheatnet::ClassError>
    : quick_status_code_from_enum_defaults<cheatnet::ClassError>
{
    static constexpr auto const domain_name = "Class Error";
    static constexpr auto const domain_uuid =
        "c4b1e6f2-3a47-4f0e-b2d8-5e9a71c0d3a6";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
