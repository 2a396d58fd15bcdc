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

#include <cheatnet/core/byte_string.hpp>
#include <cheatnet/core/config.hpp>
#include <cheatnet/core/felt.hpp>
#include <cheatnet/core/result.hpp>
#include <cheatnet/execution/contract/compiled_class.hpp>

#include <nlohmann/json.hpp>

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

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

CHEATNET_ANONYMOUS_NAMESPACE_BEGIN

using json = nlohmann::json;

Result<Felt> felt_field(json const &j)
{
    if (!j.is_string()) {
        return ClassError::InvalidFelt;
    }
    auto const res = felt_from_hex(j.get_ref<std::string const &>());
    if (res.has_error()) {
        return ClassError::InvalidFelt;
    }
    return res.value();
}

Result<std::vector<EntryPoint>> parse_entry_points(json const &j)
{
    if (!j.is_array()) {
        return ClassError::InvalidEntryPoint;
    }
    std::vector<EntryPoint> entry_points;
    entry_points.reserve(j.size());
    for (auto const &item : j) {
        if (!item.is_object()) {
            return ClassError::InvalidEntryPoint;
        }
        auto const selector = item.find("selector");
        auto const offset = item.find("offset");
        if (selector == item.end() || offset == item.end() ||
            !offset->is_number_unsigned()) {
            return ClassError::InvalidEntryPoint;
        }
        EntryPoint ep;
        BOOST_OUTCOME_TRY(ep.selector, felt_field(*selector));
        ep.offset = offset->get<uint64_t>();
        if (auto const builtins = item.find("builtins");
            builtins != item.end()) {
            if (!builtins->is_array()) {
                return ClassError::InvalidEntryPoint;
            }
            for (auto const &b : *builtins) {
                if (!b.is_string()) {
                    return ClassError::InvalidEntryPoint;
                }
                ep.builtins.push_back(b.get<std::string>());
            }
        }
        entry_points.push_back(std::move(ep));
    }
    return entry_points;
}

void append_word(byte_string &out, Felt const &word)
{
    auto const be = to_big_endian(word);
    out.append(be.data(), be.size());
}

void append_entry_points(byte_string &out, std::vector<EntryPoint> const &eps)
{
    append_word(out, Felt{eps.size()});
    for (auto const &ep : eps) {
        append_word(out, ep.selector);
        append_word(out, Felt{ep.offset});
        append_word(out, Felt{ep.builtins.size()});
        for (auto const &b : ep.builtins) {
            // builtin names are short ascii identifiers
            append_word(out, felt_from_short_string(b).value_or(Felt{0}));
        }
    }
}

CHEATNET_ANONYMOUS_NAMESPACE_END

CHEATNET_NAMESPACE_BEGIN

char const *to_string(EntryPointType const type)
{
    switch (type) {
    case EntryPointType::External:
        return "EXTERNAL";
    case EntryPointType::L1Handler:
        return "L1_HANDLER";
    case EntryPointType::Constructor:
        return "CONSTRUCTOR";
    }
    return "UNKNOWN";
}

std::vector<EntryPoint> const &
CompiledClass::entry_points(EntryPointType const type) const
{
    switch (type) {
    case EntryPointType::L1Handler:
        return l1_handler;
    case EntryPointType::Constructor:
        return constructor;
    case EntryPointType::External:
        break;
    }
    return external;
}

EntryPoint const *CompiledClass::find_entry_point(
    EntryPointType const type, EntryPointSelector const &selector) const
{
    for (auto const &ep : entry_points(type)) {
        if (ep.selector == selector) {
            return &ep;
        }
    }
    return nullptr;
}

Result<CompiledClass> parse_compiled_class(std::string_view const casm_json)
{
    auto const j = json::parse(casm_json, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return ClassError::InvalidJson;
    }

    auto const bytecode = j.find("bytecode");
    auto const by_type = j.find("entry_points_by_type");
    if (bytecode == j.end() || !bytecode->is_array() || by_type == j.end() ||
        !by_type->is_object()) {
        return ClassError::MissingField;
    }

    CompiledClass cls;
    if (auto const v = j.find("compiler_version");
        v != j.end() && v->is_string()) {
        cls.compiler_version = v->get<std::string>();
    }
    cls.bytecode.reserve(bytecode->size());
    for (auto const &word : *bytecode) {
        BOOST_OUTCOME_TRY(auto const felt, felt_field(word));
        cls.bytecode.push_back(felt);
    }

    auto const section = [&](char const *const name) -> json const & {
        static json const empty = json::array();
        auto const it = by_type->find(name);
        return it == by_type->end() ? empty : *it;
    };
    BOOST_OUTCOME_TRY(cls.external, parse_entry_points(section("EXTERNAL")));
    BOOST_OUTCOME_TRY(
        cls.l1_handler, parse_entry_points(section("L1_HANDLER")));
    BOOST_OUTCOME_TRY(
        cls.constructor, parse_entry_points(section("CONSTRUCTOR")));
    if (cls.constructor.size() > 1) {
        return ClassError::MultipleConstructors;
    }
    return cls;
}

Result<void> validate_sierra_class(std::string_view const sierra_json)
{
    auto const j = json::parse(sierra_json, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return ClassError::InvalidJson;
    }
    auto const program = j.find("sierra_program");
    if (program == j.end() || !program->is_array()) {
        return ClassError::MissingField;
    }
    return outcome::success();
}

ClassHash compute_class_hash(CompiledClass const &cls)
{
    byte_string buf;
    buf.reserve(32 * (cls.bytecode.size() + 8));
    append_word(buf, felt_from_short_string("COMPILED_CLASS_V1").value());
    append_entry_points(buf, cls.external);
    append_entry_points(buf, cls.l1_handler);
    append_entry_points(buf, cls.constructor);
    append_word(buf, Felt{cls.bytecode.size()});
    for (auto const &word : cls.bytecode) {
        append_word(buf, word);
    }
    return starknet_keccak(buf);
}

CHEATNET_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<cheatnet::ClassError>::mapping> const &
quick_status_code_from_enum<cheatnet::ClassError>::value_mappings()
{
    using cheatnet::ClassError;

    static std::initializer_list<mapping> const v = {
        {ClassError::Success, "success", {errc::success}},
        {ClassError::InvalidJson, "contract class is not valid json", {}},
        {ClassError::MissingField, "contract class is missing a field", {}},
        {ClassError::InvalidFelt, "contract class holds an invalid felt", {}},
        {ClassError::InvalidEntryPoint, "malformed entry point", {}},
        {ClassError::MultipleConstructors,
         "contract class declares more than one constructor",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
