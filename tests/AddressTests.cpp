/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "gpibio/address.hpp"

using namespace gpibio;

TEST(Address, ParsesPrimaryOnly) {
    auto address = Address::parse("GPIB0::1::INSTR");
    ASSERT_TRUE(address) << address.error.toString();
    EXPECT_EQ(address.value.board, 0);
    EXPECT_EQ(address.value.primary, 1);
    EXPECT_FALSE(address.value.secondary.has_value());
    EXPECT_EQ(address.value.sad(), 0);
}

TEST(Address, ParsesSecondaryAndAppliesOffset) {
    auto address = Address::parse("GPIB2::14::3::INSTR");
    ASSERT_TRUE(address);
    EXPECT_EQ(address.value.board, 2);
    EXPECT_EQ(address.value.pad(), 14);
    ASSERT_TRUE(address.value.secondary.has_value());
    EXPECT_EQ(*address.value.secondary, 3);
    EXPECT_EQ(address.value.sad(), 0x63);
}

TEST(Address, BoardIndexAndSuffixAreOptional) {
    auto address = Address::parse("gpib::22");
    ASSERT_TRUE(address);
    EXPECT_EQ(address.value.board, 0);
    EXPECT_EQ(address.value.primary, 22);
}

TEST(Address, FormatsAsVisaResource) {
    auto address = Address::parse("gpib1::5::instr");
    ASSERT_TRUE(address);
    EXPECT_EQ(address.value.visaString(), "GPIB1::5::INSTR");

    auto withSad = Address::make(0, 9, 4);
    ASSERT_TRUE(withSad);
    EXPECT_EQ(withSad.value.visaString(), "GPIB0::9::4::INSTR");
}

TEST(Address, RejectsMalformedResources) {
    for (const char* resource : {"", "GPIB0", "ASRL1::INSTR", "GPIBx::1::INSTR", "GPIB0::abc::INSTR",
                                 "GPIB0::1::2::3::INSTR", "GPIB0::-1::INSTR", "GPIB0::::INSTR"}) {
        auto address = Address::parse(resource);
        EXPECT_FALSE(address) << resource;
        EXPECT_EQ(address.error.kind, ErrorKind::InvalidAddress) << resource;
    }
}

TEST(Address, RejectsOutOfRangeAddresses) {
    auto parsed = Address::parse("GPIB0::31::INSTR");
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error.kind, ErrorKind::InvalidAddress);

    auto made = Address::make(0, 5, 31);
    ASSERT_FALSE(made);
    EXPECT_EQ(made.error.kind, ErrorKind::InvalidArgument);

    EXPECT_FALSE(Address::make(-1, 5));
    EXPECT_TRUE(Address::make(0, 30, 30));
}
