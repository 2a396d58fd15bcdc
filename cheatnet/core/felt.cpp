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
#include <cheatnet/core/int.hpp>
#include <cheatnet/core/keccak.hpp>
#include <cheatnet/core/likely.h>
#include <cheatnet/core/result.hpp>

#include <intx/intx.hpp>

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

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

CHEATNET_ANONYMOUS_NAMESPACE_BEGIN

int hex_digit(char const c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

CHEATNET_ANONYMOUS_NAMESPACE_END

CHEATNET_NAMESPACE_BEGIN

Result<Felt> felt_from_hex(std::string_view s)
{
    if (s.starts_with("0x") || s.starts_with("0X")) {
        s.remove_prefix(2);
    }
    if (CHEATNET_UNLIKELY(s.empty())) {
        return FeltError::Empty;
    }
    Felt value{0};
    for (char const c : s) {
        int const digit = hex_digit(c);
        if (CHEATNET_UNLIKELY(digit < 0)) {
            return FeltError::InvalidDigit;
        }
        if (CHEATNET_UNLIKELY(value > (UINT256_MAX >> 4))) {
            return FeltError::OutOfRange;
        }
        value = (value << 4) | Felt{static_cast<uint64_t>(digit)};
    }
    if (CHEATNET_UNLIKELY(value >= FELT_PRIME)) {
        return FeltError::OutOfRange;
    }
    return value;
}

Result<Felt> felt_from_dec(std::string_view const s)
{
    if (CHEATNET_UNLIKELY(s.empty())) {
        return FeltError::Empty;
    }
    Felt value{0};
    for (char const c : s) {
        if (CHEATNET_UNLIKELY(c < '0' || c > '9')) {
            return FeltError::InvalidDigit;
        }
        value = value * Felt{10} + Felt{static_cast<uint64_t>(c - '0')};
        if (CHEATNET_UNLIKELY(value >= FELT_PRIME)) {
            return FeltError::OutOfRange;
        }
    }
    return value;
}

Result<Felt> felt_from_short_string(std::string_view const s)
{
    if (CHEATNET_UNLIKELY(s.size() > 31)) {
        return FeltError::ShortStringTooLong;
    }
    Felt value{0};
    for (char const c : s) {
        auto const byte = static_cast<unsigned char>(c);
        if (CHEATNET_UNLIKELY(byte > 0x7f)) {
            return FeltError::NonAsciiShortString;
        }
        value = (value << 8) | Felt{byte};
    }
    return value;
}

std::string short_string_from_felt(Felt const &f)
{
    auto const bytes = to_big_endian(f);
    size_t i = 0;
    while (i < bytes.size() && bytes[i] == 0) {
        ++i;
    }
    return std::string{
        reinterpret_cast<char const *>(bytes.data() + i), bytes.size() - i};
}

std::string to_hex(Felt const &f)
{
    return "0x" + intx::hex(f);
}

byte_string_fixed<32> to_big_endian(Felt const &f)
{
    byte_string_fixed<32> out;
    intx::be::unsafe::store(out.data(), f);
    return out;
}

Felt starknet_keccak(byte_string_view const data)
{
    auto const h = keccak256(data);
    return intx::be::unsafe::load<Felt>(h.bytes) & MASK_250;
}

Felt selector_from_name(std::string_view const name)
{
    return starknet_keccak(to_byte_string_view(name));
}

CHEATNET_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<cheatnet::FeltError>::mapping> const &
quick_status_code_from_enum<cheatnet::FeltError>::value_mappings()
{
    using cheatnet::FeltError;

    static std::initializer_list<mapping> const v = {
        {FeltError::Success, "success", {errc::success}},
        {FeltError::Empty, "empty felt literal", {}},
        {FeltError::InvalidDigit, "invalid digit in felt literal", {}},
        {FeltError::OutOfRange, "felt literal out of field range", {}},
        {FeltError::ShortStringTooLong,
         "short string longer than 31 characters",
         {}},
        {FeltError::NonAsciiShortString,
         "short string contains non-ascii characters",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
