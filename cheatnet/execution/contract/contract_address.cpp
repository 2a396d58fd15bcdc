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
#include <cheatnet/execution/contract/contract_address.hpp>

CHEATNET_ANONYMOUS_NAMESPACE_BEGIN

void append_word(byte_string &out, Felt const &word)
{
    auto const be = to_big_endian(word);
    out.append(be.data(), be.size());
}

Felt hash_calldata(Calldata const &calldata)
{
    byte_string buf;
    buf.reserve(32 * (calldata.size() + 1));
    for (auto const &word : calldata) {
        append_word(buf, word);
    }
    append_word(buf, Felt{calldata.size()});
    return starknet_keccak(buf);
}

CHEATNET_ANONYMOUS_NAMESPACE_END

CHEATNET_NAMESPACE_BEGIN

ContractAddress calculate_contract_address(
    Felt const &salt, ClassHash const &class_hash,
    Calldata const &constructor_calldata, ContractAddress const &deployer)
{
    byte_string buf;
    buf.reserve(32 * 5);
    append_word(buf, felt_from_short_string("STARKNET_CONTRACT_ADDRESS").value());
    append_word(buf, deployer);
    append_word(buf, salt);
    append_word(buf, class_hash);
    append_word(buf, hash_calldata(constructor_calldata));
    return starknet_keccak(buf) % ADDRESS_BOUND;
}

CHEATNET_NAMESPACE_END
