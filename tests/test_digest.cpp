// tests/test_digest.cpp
#include <string>

#include "gtest/gtest.h"

#include "../src/utils/Digest.hpp"

TEST(DigestTest, Sha256KnownVectors) {
    EXPECT_EQ(Digest::sha256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(Digest::sha256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestTest, BinaryInputIsHashedWhole) {
    const std::string with_nul("a\0b", 3);
    EXPECT_NE(Digest::sha256Hex(with_nul), Digest::sha256Hex("a"));
    EXPECT_EQ(Digest::sha256Hex(with_nul).size(), 64u);
}
