/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include <gtest/gtest.h>

#include "ska/internal/http_parser.hpp"

using namespace ska::internal;

TEST(RequestLineTest, SplitsPathAndQuery)
{
    ska::HttpRequest r;
    ASSERT_TRUE(parse_request_line("GET /items?b=2&a=1 HTTP/1.1", r));
    EXPECT_EQ(r.method, "GET");
    EXPECT_EQ(r.path, "/items");
    EXPECT_EQ(r.query, "b=2&a=1");
    EXPECT_EQ(r.httpver, "HTTP/1.1");
}

TEST(RequestLineTest, RejectsMalformedLines)
{
    ska::HttpRequest r;
    EXPECT_FALSE(parse_request_line("GET /items", r));
    EXPECT_FALSE(parse_request_line("GET items HTTP/1.1", r));
    EXPECT_FALSE(parse_request_line("GET /items HTTP/2", r));
    EXPECT_FALSE(parse_request_line("GET /a HTTP/1.1 extra", r));
}

TEST(HeaderBlockTest, KeepsOrderAndRepeats)
{
    ska::HeaderList h;
    ASSERT_TRUE(parse_header_block("Host: x\r\nX-SKA-A:  1 \r\nx-ska-a: 2", h));
    ASSERT_EQ(h.size(), 3u);
    EXPECT_EQ(h[1].second, "1");
    EXPECT_EQ(hdr_ci(h, "HOST"), "x");
    EXPECT_EQ(hdr_ci_all(h, "X-SKA-A"), (std::vector<std::string>{"1", "2"}));
    EXPECT_EQ(hdr_ci(h, "Missing"), "");
}

TEST(HeaderBlockTest, RejectsFoldingAndBadNames)
{
    ska::HeaderList h;
    EXPECT_FALSE(parse_header_block("A: 1\r\n continued", h));
    EXPECT_FALSE(parse_header_block("Bad Name: 1", h));
    EXPECT_FALSE(parse_header_block(": 1", h));
    EXPECT_FALSE(parse_header_block("NoColon", h));
}

TEST(HeaderBlockTest, RejectsControlCharacters)
{
    ska::HeaderList h;
    EXPECT_FALSE(parse_header_block("X-SKA-A: 1\nx-ska-b:2\r\nHost: h", h));
    EXPECT_FALSE(parse_header_block("X-SKA-A: 1\r2", h));
    EXPECT_FALSE(parse_header_block(std::string("X-SKA-A: 1\0002", 12), h));
    EXPECT_FALSE(parse_header_block("X-\x7f" "A: 1", h));
    EXPECT_TRUE(parse_header_block("X-SKA-A: 1\t2", h));
    EXPECT_EQ(hdr_ci(h, "x-ska-a"), "1\t2");
}

TEST(QueryTest, DecodesAndKeepsRepeats)
{
    const QueryParams q = parse_query("a=1&b=x%20y&a=2&flag&&c=d+e");
    ASSERT_EQ(q.size(), 5u);
    EXPECT_EQ(q[0], (std::pair<std::string, std::string>{"a", "1"}));
    EXPECT_EQ(q[1].second, "x y");
    EXPECT_EQ(q[3], (std::pair<std::string, std::string>{"flag", ""}));
    EXPECT_EQ(q[4].second, "d e");
}

TEST(QueryTest, CanonicalFormIsSortedAndEncoded)
{
    EXPECT_EQ(canonical_query_sorted({{"b", "2"}, {"a", "x/y"}, {"a", "1"}}),
              "a=1&a=x%2Fy&b=2");
    EXPECT_EQ(canonical_query_sorted({}), "");
}

TEST(HeaderHelpersTest, SetHeaderReplacesEveryCopy)
{
    ska::HttpRequest r;
    r.headers = {{"x-a", "1"}, {"X-A", "2"}, {"Other", "3"}};
    ska::set_header(r, "X-A", "9");
    ASSERT_EQ(r.headers.size(), 2u);
    ASSERT_NE(ska::find_header(r, "x-a"), nullptr);
    EXPECT_EQ(*ska::find_header(r, "x-a"), "9");
    EXPECT_EQ(ska::find_header(r, "nope"), nullptr);
}
