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

#include <cheatnet/core/byte_string.hpp>
#include <cheatnet/core/config.hpp>
#include <cheatnet/core/int.hpp>
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

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

CHEATNET_NAMESPACE_BEGIN

/// Element of the Stark field, always kept below FELT_PRIME
using Felt = uint256_t;

using ContractAddress = Felt;
using ClassHash = Felt;
using StorageKey = Felt;
using Nonce = Felt;
using EntryPointSelector = Felt;
using Calldata = std::vector<Felt>;

// 2^251 + 17 * 2^192 + 1
inline constexpr Felt FELT_PRIME{1, 0, 0, 0x0800000000000011};

// 2^250 - 1
inline constexpr Felt MASK_250{
    0xffffffffffffffff,
    0xffffffffffffffff,
    0xffffffffffffffff,
    0x03ffffffffffffff};

// 2^251 - 256, upper bound of the contract address space
inline constexpr Felt ADDRESS_BOUND{
    0xffffffffffffff00,
    0xffffffffffffffff,
    0xffffffffffffffff,
    0x07ffffffffffffff};

enum class FeltError
{
    Success = 0,
    Empty,
    InvalidDigit,
    OutOfRange,
    ShortStringTooLong,
    NonAsciiShortString,
};

Result<Felt> felt_from_hex(std::string_view);

Result<Felt> felt_from_dec(std::string_view);

/// Packs up to 31 ASCII characters big-endian into one felt
Result<Felt> felt_from_short_string(std::string_view);

/// Inverse of felt_from_short_string; non-printable bytes are kept as-is
std::string short_string_from_felt(Felt const &);

std::string to_hex(Felt const &);

byte_string_fixed<32> to_big_endian(Felt const &);

/// keccak-256 truncated to the low 250 bits
Felt starknet_keccak(byte_string_view);

Felt selector_from_name(std::string_view);

struct FeltHash
{
    using is_avalanching = void;

    uint64_t operator()(Felt const &f) const noexcept
    {
        return ankerl::unordered_dense::detail::wyhash::hash(&f, sizeof(f));
    }
};

CHEATNET_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<cheatnet::FeltError>
    : quick_status_code_from_enum_defaults<cheatnet::FeltError>
{
    static constexpr auto const domain_name = "Felt Error";
    static constexpr auto const domain_uuid =
        "6a0d2f0e-8f5b-4c61-9d1e-27c1a0e3b9f4";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
