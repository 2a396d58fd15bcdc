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
#include <cheatnet/core/felt.hpp>

#include <gtest/gtest.h>

#include <intx/intx.hpp>

#include <string>

using namespace cheatnet;
using namespace intx;

TEST(Felt, from_hex)
{
    EXPECT_EQ(felt_from_hex("0x0").value(), Felt{0});
    EXPECT_EQ(felt_from_hex("0x7b").value(), Felt{123});
    EXPECT_EQ(felt_from_hex("7B").value(), Felt{123});
    EXPECT_EQ(
        felt_from_hex("0x0000000000000000000000000000000000000000000000000001")
            .value(),
        Felt{1});

    EXPECT_EQ(felt_from_hex("0x").error(), FeltError::Empty);
    EXPECT_EQ(felt_from_hex("0x12g4").error(), FeltError::InvalidDigit);
    EXPECT_EQ(
        felt_from_hex(
            "0x800000000000011000000000000000000000000000000000000000000000001")
            .error(),
        FeltError::OutOfRange);
    EXPECT_EQ(
        felt_from_hex(
            "0x800000000000011000000000000000000000000000000000000000000000000")
            .value(),
        FELT_PRIME - 1);
    EXPECT_EQ(
        felt_from_hex("0x1"
                      "0000000000000000000000000000000000000000000000000000000"
                      "000000000")
            .error(),
        FeltError::OutOfRange);
}

TEST(Felt, from_dec)
{
    EXPECT_EQ(felt_from_dec("123").value(), Felt{123});
    EXPECT_EQ(felt_from_dec("").error(), FeltError::Empty);
    EXPECT_EQ(felt_from_dec("-1").error(), FeltError::InvalidDigit);
}

TEST(Felt, to_hex)
{
    EXPECT_EQ(to_hex(Felt{0}), "0x0");
    EXPECT_EQ(to_hex(Felt{0xabc}), "0xabc");
    EXPECT_EQ(
        to_hex(FELT_PRIME),
        "0x800000000000011000000000000000000000000000000000000000000000001");
}

TEST(Felt, short_string)
{
    EXPECT_EQ(felt_from_short_string("").value(), Felt{0});
    EXPECT_EQ(felt_from_short_string("A").value(), Felt{0x41});
    EXPECT_EQ(felt_from_short_string("SN_GOERLI").value(), 0x534e5f474f45524c49_u256);
    EXPECT_EQ(
        felt_from_short_string(std::string(32, 'a')).error(),
        FeltError::ShortStringTooLong);
    EXPECT_EQ(
        felt_from_short_string("\xc3\xa9").error(),
        FeltError::NonAsciiShortString);

    EXPECT_EQ(short_string_from_felt(0x534e5f474f45524c49_u256), "SN_GOERLI");
    EXPECT_EQ(short_string_from_felt(Felt{0}), "");
}

TEST(Felt, selector_from_name)
{
    EXPECT_EQ(
        selector_from_name("transfer"),
        0x83afd3f4caedc6eebf44246fe54e38c95e3179a5ec9ea81740eca5b482d12e_u256);
    EXPECT_EQ(
        selector_from_name("balanceOf"),
        0x2e4263afad30923c891518314c3c95dbe830a16874e8abc5777a9a20b54c76e_u256);
    EXPECT_EQ(
        selector_from_name("increase_balance"),
        0x362398bec32bc0ebb411203221a35a0301193a96f317ebe5e40be9f60d15320_u256);
    EXPECT_LE(selector_from_name("increase_balance"), MASK_250);
}

TEST(Felt, hash_is_stable)
{
    FeltHash const h{};
    EXPECT_EQ(h(Felt{42}), h(Felt{42}));
    EXPECT_NE(h(Felt{42}), h(Felt{43}));
}

TEST(ByteString, raw_byte_operations)
{
    auto const word = to_big_endian(Felt{0x0102});
    byte_string buf;
    buf.append(word.data(), word.size());
    buf.append(word.data(), word.size());
    ASSERT_EQ(buf.size(), 64);
    EXPECT_EQ(buf[30], 0x01);
    EXPECT_EQ(buf[31], 0x02);
    EXPECT_EQ(buf.find(static_cast<unsigned char>(0x01)), 30);

    byte_string_view const view = buf;
    EXPECT_EQ(view.substr(0, 32), view.substr(32));
    EXPECT_LT(view.substr(0, 31), view.substr(1, 31));

    buf.insert(buf.begin(), static_cast<unsigned char>(0xff));
    ASSERT_EQ(buf.size(), 65);
    EXPECT_EQ(buf.front(), 0xff);
    EXPECT_EQ(buf[32], 0x02);
    EXPECT_EQ(starknet_keccak(byte_string_view{}), starknet_keccak(byte_string{}));
}
