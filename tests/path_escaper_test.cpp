/*
 * Part of the HTTPipe (HP) project.
 *
 * SPDX-FileCopyrightText: 2025 HTTPipe contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HTTPipe (HP). See LICENSE for details.
 */

#include "hp/internal/http_parser.hpp"
#include "hp/internal/utils.hpp"

#include <gtest/gtest.h>

using hp::internal::escape_path;
using hp::internal::escape_uri;
using hp::internal::encode_args;

TEST(PathEscaperTest, RootAndEmpty) {
    EXPECT_EQ(escape_path("/"), "/");
    EXPECT_EQ(escape_path(""), "/");
    EXPECT_EQ(escape_path("//"), "/");
}

TEST(PathEscaperTest, KeepsTrailingSlash) {
    EXPECT_EQ(escape_path("/a/b/"), "/a/b/");
    EXPECT_EQ(escape_path("/a/b"), "/a/b");
}

TEST(PathEscaperTest, EscapesEachSegment) {
    EXPECT_EQ(escape_path("a b/c"), "/a%20b/c");
    EXPECT_EQ(escape_path("/x y/z?w"), "/x%20y/z%3Fw");
    EXPECT_EQ(escape_path("/100%"), "/100%25");
    EXPECT_EQ(escape_path("/caf\xC3\xA9"), "/caf%C3%A9");
}

TEST(PathEscaperTest, CollapsesEmptySegments) {
    EXPECT_EQ(escape_path("//a//b"), "/a/b");
}

TEST(PathEscaperTest, UnreservedCharactersPassThrough) {
    EXPECT_EQ(escape_uri("AZaz09-._~"), "AZaz09-._~");
    EXPECT_EQ(escape_uri("a/b"), "a%2Fb");
    EXPECT_EQ(escape_uri("+&="), "%2B%26%3D");
}

TEST(QueryEncoderTest, KeepsOrderAndEscapes) {
    EXPECT_EQ(encode_args({{"x", "1"}, {"a b", "c&d"}}), "x=1&a%20b=c%26d");
    EXPECT_EQ(encode_args({}), "");
    EXPECT_EQ(encode_args({{"k", ""}}), "k=");
}
