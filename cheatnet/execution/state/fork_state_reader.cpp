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
#include <cheatnet/core/fmt/felt_fmt.hpp> // NOLINT
#include <cheatnet/core/result.hpp>
#include <cheatnet/execution/block_info.hpp>
#include <cheatnet/execution/contract/compiled_class.hpp>
#include <cheatnet/execution/state/fork_state_reader.hpp>
#include <cheatnet/execution/state/provider.hpp>
#include <cheatnet/execution/state/provider_error.hpp>

#include <quill/Quill.h>

#include <memory>
#include <optional>
#include <utility>

CHEATNET_NAMESPACE_BEGIN

ForkStateReader::ForkStateReader(Provider &provider, BlockId block_id)
    : provider_{provider}
    , block_id_{std::move(block_id)}
{
}

Result<BlockInfo> ForkStateReader::read_block_info()
{
    if (block_info_.has_value()) {
        return block_info_.value();
    }
    ++requests_;
    BOOST_OUTCOME_TRY(auto const info, provider_.get_block_info(block_id_));
    LOG_DEBUG(
        "fork block {} timestamp {}", info.block_number, info.block_timestamp);
    block_info_ = info;
    return info;
}

Result<std::optional<Felt>> ForkStateReader::read_storage(
    ContractAddress const &address, StorageKey const &key)
{
    StorageSlot const slot{address, key};
    if (auto const it = storage_.find(slot); it != storage_.end()) {
        return it->second;
    }
    ++requests_;
    auto res = provider_.get_storage_at(address, key, block_id_);
    std::optional<Felt> value;
    if (res.has_value()) {
        value = res.value();
    }
    else if (res.error() != ProviderError::ContractNotFound) {
        LOG_WARNING(
            "fork storage read {} {} failed: {}",
            address,
            key,
            res.error().message().c_str());
        return std::move(res).error();
    }
    LOG_DEBUG("fork storage {} {} fetched", address, key);
    storage_.emplace(slot, value);
    return value;
}

Result<std::optional<Nonce>>
ForkStateReader::read_nonce(ContractAddress const &address)
{
    if (auto const it = nonces_.find(address); it != nonces_.end()) {
        return it->second;
    }
    ++requests_;
    auto res = provider_.get_nonce(address, block_id_);
    std::optional<Nonce> value;
    if (res.has_value()) {
        value = res.value();
    }
    else if (res.error() != ProviderError::ContractNotFound) {
        LOG_WARNING(
            "fork nonce read {} failed: {}",
            address,
            res.error().message().c_str());
        return std::move(res).error();
    }
    LOG_DEBUG("fork nonce {} fetched", address);
    nonces_.emplace(address, value);
    return value;
}

Result<std::optional<ClassHash>>
ForkStateReader::read_class_hash_at(ContractAddress const &address)
{
    if (auto const it = class_hashes_.find(address); it != class_hashes_.end()) {
        return it->second;
    }
    ++requests_;
    auto res = provider_.get_class_hash_at(address, block_id_);
    std::optional<ClassHash> value;
    if (res.has_value()) {
        value = res.value();
    }
    else if (res.error() != ProviderError::ContractNotFound) {
        LOG_WARNING(
            "fork class hash read {} failed: {}",
            address,
            res.error().message().c_str());
        return std::move(res).error();
    }
    LOG_DEBUG("fork class hash at {} fetched", address);
    class_hashes_.emplace(address, value);
    return value;
}

Result<std::shared_ptr<CompiledClass const>>
ForkStateReader::read_class(ClassHash const &class_hash)
{
    if (auto const it = classes_.find(class_hash); it != classes_.end()) {
        return it->second;
    }
    ++requests_;
    auto res = provider_.get_compiled_class(class_hash, block_id_);
    std::shared_ptr<CompiledClass const> value;
    if (res.has_value()) {
        value = std::make_shared<CompiledClass const>(std::move(res).value());
    }
    else if (res.error() != ProviderError::ClassHashNotFound) {
        LOG_WARNING(
            "fork class read {} failed: {}",
            class_hash,
            res.error().message().c_str());
        return std::move(res).error();
    }
    LOG_DEBUG("fork class {} fetched", class_hash);
    classes_.emplace(class_hash, value);
    return value;
}

CHEATNET_NAMESPACE_END
