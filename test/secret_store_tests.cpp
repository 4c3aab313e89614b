/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "ska/internal/secret_cache.hpp"
#include "ska/secret_store.hpp"
#include "ska/shared_key_stage.hpp"
#include "test_helpers.hpp"

namespace {

// hex of alice_secret()
const char* const kAliceHex = "3031323334353637383961626364656630313233343536373839616263646566";

} // namespace

TEST(SecretStoreTest, LoadsAccountsFromFile)
{
    ska_test::KeyFile f(std::string("# accounts\n\nalice ") + kAliceHex + "\n"
              "bob   00112233445566778899aabbccddeeff\n");
    ska::SecretStore store;
    ASSERT_TRUE(store.init_file(f.path()));
    EXPECT_EQ(store.file_entries(), 2u);

    const auto alice = store.lookup("alice");
    ASSERT_TRUE(alice.has_value());
    EXPECT_EQ(*alice, ska_test::alice_secret());
    EXPECT_FALSE(store.lookup("carol").has_value());
}

TEST(SecretStoreTest, RejectsWholeFileOnBadLine)
{
    ska::SecretStore store;
    {
        ska_test::KeyFile f(std::string("alice ") + kAliceHex + "\nbob nothex\n");
        EXPECT_FALSE(store.init_file(f.path()));
    }
    {
        ska_test::KeyFile f("alice 0011\n");  // too short
        EXPECT_FALSE(store.init_file(f.path()));
    }
    {
        ska_test::KeyFile f(std::string("al:ice ") + kAliceHex + "\n");
        EXPECT_FALSE(store.init_file(f.path()));
    }
    {
        ska_test::KeyFile f(std::string("alice ") + kAliceHex + " extra\n");
        EXPECT_FALSE(store.init_file(f.path()));
    }
    EXPECT_FALSE(store.lookup("alice").has_value());
}

TEST(SecretStoreTest, MissingFileFails)
{
    ska::SecretStore store;
    EXPECT_FALSE(store.init_file("/nonexistent/ska/keys.txt"));
}

TEST(SecretStoreTest, UninitialisedStoreKnowsNobody)
{
    ska::SecretStore store;
    EXPECT_FALSE(store.lookup("alice").has_value());
}

TEST(SecretStoreTest, ResolverAuthenticatesThroughStage)
{
    ska_test::KeyFile f(std::string("alice ") + kAliceHex + "\n");
    ska::SecretStore store;
    ASSERT_TRUE(store.init_file(f.path()));

    ska::SharedKeyStageConfig cfg;
    cfg.resolver = store.resolver();
    cfg.now = ska_test::clock_at(ska_test::fixed_now());
    ska::SharedKeyStage stage(cfg);

    ska::RequestContext ctx;
    const ska::HttpResponse resp = stage.handle(
        ska_test::sign_as(ska_test::make_request("GET", "/whoami"), "alice", ska_test::alice_secret()),
        ctx,
        [](const ska::HttpRequest&, ska::RequestContext&) { return ska::make_response(200, "OK", "{}"); });
    EXPECT_EQ(resp.status_code, 200);
    ASSERT_TRUE(ctx.identity.has_value());
    EXPECT_EQ(ctx.identity->account, "alice");
}

TEST(SecretCacheTest, RemembersKnownAndAbsentAccounts)
{
    using ska::internal::SecretCache;
    SecretCache cache(std::chrono::seconds(60), 16);

    std::string secret;
    EXPECT_EQ(cache.get("alice", secret), SecretCache::Hit::Miss);
    EXPECT_EQ(cache.get("carol", secret), SecretCache::Hit::Miss);

    cache.put_known("alice", ska_test::alice_secret());
    cache.put_unknown("carol");

    EXPECT_EQ(cache.get("alice", secret), SecretCache::Hit::Known);
    EXPECT_EQ(secret, ska_test::alice_secret());

    secret.clear();
    EXPECT_EQ(cache.get("carol", secret), SecretCache::Hit::Unknown);
    EXPECT_TRUE(secret.empty());
    EXPECT_EQ(cache.size(), 2u);
}

TEST(SecretCacheTest, ZeroTtlExpiresImmediately)
{
    using ska::internal::SecretCache;
    SecretCache cache(std::chrono::seconds(0), 16);
    cache.put_unknown("carol");
    cache.put_known("alice", ska_test::alice_secret());

    std::string secret;
    EXPECT_EQ(cache.get("carol", secret), SecretCache::Hit::Miss);
    EXPECT_EQ(cache.get("alice", secret), SecretCache::Hit::Miss);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(SecretCacheTest, StaysWithinCapacity)
{
    using ska::internal::SecretCache;
    SecretCache cache(std::chrono::seconds(60), 4);
    for (int i = 0; i < 50; ++i) cache.put_unknown("acct" + std::to_string(i));
    EXPECT_LE(cache.size(), 4u);

    std::string secret;
    EXPECT_EQ(cache.get("acct49", secret), SecretCache::Hit::Unknown);

    cache.reset(std::chrono::seconds(60), 4);
    EXPECT_EQ(cache.size(), 0u);
}
