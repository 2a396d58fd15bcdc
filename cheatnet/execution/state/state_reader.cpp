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
#include <cheatnet/execution/contract/compiled_class.hpp>
#include <cheatnet/execution/state/state_reader.hpp>

#include <memory>
#include <optional>
#include <utility>

CHEATNET_NAMESPACE_BEGIN

void DictStateReader::insert_storage(
    ContractAddress const &address, StorageKey const &key, Felt const &value)
{
    storage_.insert_or_assign(StorageSlot{address, key}, value);
}

void DictStateReader::insert_nonce(
    ContractAddress const &address, Nonce const &nonce)
{
    nonces_.insert_or_assign(address, nonce);
}

void DictStateReader::insert_contract(
    ContractAddress const &address, ClassHash const &class_hash)
{
    class_hashes_.insert_or_assign(address, class_hash);
}

void DictStateReader::insert_class(
    ClassHash const &class_hash, CompiledClass cls)
{
    classes_.insert_or_assign(
        class_hash, std::make_shared<CompiledClass const>(std::move(cls)));
}

Result<std::optional<Felt>> DictStateReader::read_storage(
    ContractAddress const &address, StorageKey const &key)
{
    auto const it = storage_.find(StorageSlot{address, key});
    if (it == storage_.end()) {
        return std::optional<Felt>{};
    }
    return std::optional<Felt>{it->second};
}

Result<std::optional<Nonce>>
DictStateReader::read_nonce(ContractAddress const &address)
{
    auto const it = nonces_.find(address);
    if (it == nonces_.end()) {
        return std::optional<Nonce>{};
    }
    return std::optional<Nonce>{it->second};
}

Result<std::optional<ClassHash>>
DictStateReader::read_class_hash_at(ContractAddress const &address)
{
    auto const it = class_hashes_.find(address);
    if (it == class_hashes_.end()) {
        return std::optional<ClassHash>{};
    }
    return std::optional<ClassHash>{it->second};
}

Result<std::shared_ptr<CompiledClass const>>
DictStateReader::read_class(ClassHash const &class_hash)
{
    auto const it = classes_.find(class_hash);
    if (it == classes_.end()) {
        return std::shared_ptr<CompiledClass const>{};
    }
    return it->second;
}

CHEATNET_NAMESPACE_END
