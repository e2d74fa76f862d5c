//
// Created by gregorian on 19/10/2026.
//

#include <gtest/gtest.h>
#include "insight/utils/hash_utils.h"

using namespace insight::utils;

TEST(HashUtilsTest, Sha256KnownVectors) {
    EXPECT_EQ(compute_sha256(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(compute_sha256("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashUtilsTest, Sha256IsLowercaseHex) {
    const auto hash = compute_sha256("insight");

    ASSERT_EQ(hash.size(), 64u);
    for (const char c : hash) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
    }
}

TEST(HashUtilsTest, Sha256IsDeterministic) {
    EXPECT_EQ(compute_sha256("db-n-plus-one:query-in-loop:src/api.ts:42"),
              compute_sha256("db-n-plus-one:query-in-loop:src/api.ts:42"));
    EXPECT_NE(compute_sha256("a"), compute_sha256("b"));
}
