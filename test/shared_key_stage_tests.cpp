/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "ska/internal/utils.hpp"
#include "ska/shared_key_stage.hpp"
#include "test_helpers.hpp"

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::MockFunction;
using ::testing::Return;
using ::testing::Throw;

namespace {

ska::HttpResponse ok_response(const std::string& body = R"({"status":"OK"})")
{
    return ska::make_response(200, "OK", body);
}

std::string header_value(const ska::HttpResponse& r, const std::string& name)
{
    for (const auto& kv : r.headers) {
        if (kv.first == name) return kv.second;
    }
    return {};
}

} // namespace

class SharedKeyStageTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        cfg.resolver = ska_test::test_resolver();
        cfg.now = ska_test::clock_at(ska_test::fixed_now());
    }

    ska::HttpResponse run(const ska::HttpRequest& r)
    {
        ska::SharedKeyStage stage(cfg);
        return stage.handle(r, ctx, next.AsStdFunction());
    }

    ska::HttpRequest signed_get(const std::string& account = "alice",
                                const std::string& secret = ska_test::alice_secret())
    {
        return ska_test::sign_as(ska_test::make_request("GET", "/whoami", "x=1"), account, secret);
    }

    ska::SharedKeyStageConfig cfg;
    ska::RequestContext ctx;
    MockFunction<ska::HttpResponse(const ska::HttpRequest&, ska::RequestContext&)> next;
};

TEST_F(SharedKeyStageTest, ForwardsAuthenticatedRequestWithIdentity)
{
    EXPECT_CALL(next, Call(_, _)).WillOnce(Return(ok_response()));
    const ska::HttpResponse resp = run(signed_get());
    EXPECT_EQ(resp.status_code, 200);
    ASSERT_TRUE(ctx.identity.has_value());
    EXPECT_EQ(ctx.identity->account, "alice");
    EXPECT_TRUE(ska::has_claim(*ctx.identity, "name", "alice"));
}

TEST_F(SharedKeyStageTest, TamperedSignatureIs401AndNotForwarded)
{
    EXPECT_CALL(next, Call(_, _)).Times(0);
    const ska::HttpResponse resp = run(signed_get("alice", ska_test::bob_secret()));
    EXPECT_EQ(resp.status_code, 401);
    EXPECT_EQ(header_value(resp, "WWW-Authenticate"), "SharedKey");
    EXPECT_FALSE(ctx.identity.has_value());
}

TEST_F(SharedKeyStageTest, UnknownAccountIsIndistinguishableFromBadSignature)
{
    EXPECT_CALL(next, Call(_, _)).Times(0);
    const ska::HttpResponse unknown = run(signed_get("carol", ska_test::alice_secret()));
    const ska::HttpResponse bad_sig = run(signed_get("alice", ska_test::bob_secret()));

    EXPECT_EQ(unknown.status_code, 401);
    EXPECT_EQ(unknown.status_code, bad_sig.status_code);
    EXPECT_EQ(unknown.status_text, bad_sig.status_text);
    EXPECT_EQ(unknown.headers, bad_sig.headers);
    EXPECT_EQ(unknown.body, bad_sig.body);
}

TEST_F(SharedKeyStageTest, MalformedCredentialIs401)
{
    ska::HttpRequest r = signed_get();
    ska::set_header(r, "Authorization", "SharedKey alice");
    EXPECT_EQ(run(r).status_code, 401);
}

TEST_F(SharedKeyStageTest, SignatureShortByOneByteIs401)
{
    ska::HttpRequest r = signed_get();
    const std::string auth = *ska::find_header(r, "Authorization");
    const std::size_t colon = auth.find(':');
    std::string mac;
    ASSERT_TRUE(ska::internal::base64_decode_strict(auth.substr(colon + 1), mac));
    mac.pop_back();
    ska::set_header(r, "Authorization", auth.substr(0, colon + 1) + ska::internal::base64_encode(mac));

    EXPECT_CALL(next, Call(_, _)).Times(0);
    const ska::HttpResponse resp = run(r);
    EXPECT_EQ(resp.status_code, 401);
    EXPECT_EQ(header_value(resp, "WWW-Authenticate"), "SharedKey");
    EXPECT_FALSE(ctx.identity.has_value());
}

TEST_F(SharedKeyStageTest, SecondAuthorizationHeaderIs401)
{
    ska::HttpRequest r = signed_get();
    r.headers.emplace_back("Authorization", "SharedKey bob:" + std::string(43, 'A') + "=");

    EXPECT_CALL(next, Call(_, _)).Times(0);
    EXPECT_EQ(run(r).status_code, 401);
    EXPECT_FALSE(ctx.identity.has_value());
}

TEST_F(SharedKeyStageTest, ExpiredIs403ByDefault)
{
    cfg.now = ska_test::clock_at(ska_test::fixed_now() + 10min);
    const ska::HttpResponse resp = run(signed_get());
    EXPECT_EQ(resp.status_code, 403);
    EXPECT_THAT(resp.body, HasSubstr("request expired"));
    EXPECT_FALSE(ctx.identity.has_value());
}

TEST_F(SharedKeyStageTest, ExpiredStatusIsConfigurable)
{
    cfg.expired_status = 401;
    cfg.now = ska_test::clock_at(ska_test::fixed_now() + 10min);
    const ska::HttpResponse resp = run(signed_get());
    EXPECT_EQ(resp.status_code, 401);
    EXPECT_EQ(header_value(resp, "WWW-Authenticate"), "SharedKey");
}

TEST_F(SharedKeyStageTest, MaxAgeIsConfigurable)
{
    cfg.max_age = 60s;
    cfg.now = ska_test::clock_at(ska_test::fixed_now() + 61s);
    EXPECT_EQ(run(signed_get()).status_code, 403);
}

TEST_F(SharedKeyStageTest, MissingTimestampIs412NamingTheField)
{
    ska::HttpRequest r = ska_test::make_request("GET", "/whoami");
    r.headers.emplace_back("Authorization", "SharedKey alice:AAAA");
    const ska::HttpResponse resp = run(r);
    // credential shape is checked before the timestamp
    EXPECT_EQ(resp.status_code, 401);

    r = signed_get();
    r.headers.erase(std::remove_if(r.headers.begin(), r.headers.end(),
                                   [](const auto& kv){ return kv.first == "X-SKA-Date"; }),
                    r.headers.end());
    const ska::HttpResponse missing = run(r);
    EXPECT_EQ(missing.status_code, 412);
    EXPECT_THAT(missing.body, HasSubstr("missing required field: X-SKA-Date"));
}

TEST_F(SharedKeyStageTest, RedactedErrorsDropTheReason)
{
    cfg.redact_errors = true;
    ska::HttpRequest r = ska_test::make_request("GET", "/whoami");
    const ska::HttpResponse resp = run(r);
    EXPECT_EQ(resp.status_code, 412);
    EXPECT_EQ(resp.body, R"({"status":"ERROR"})");
}

TEST_F(SharedKeyStageTest, TransformerReceivesResourceAndReplacesIdentity)
{
    MockFunction<ska::Identity(const std::string&, const ska::Identity&)> transform;
    ska::Identity mapped;
    mapped.account = "alice";
    ska::add_claim(mapped, "role", "reader");
    EXPECT_CALL(transform, Call("/whoami?x=1", Field(&ska::Identity::account, "alice")))
        .WillOnce(Return(mapped));
    cfg.transformer = transform.AsStdFunction();

    EXPECT_CALL(next, Call(_, _)).WillOnce(Return(ok_response()));
    EXPECT_EQ(run(signed_get()).status_code, 200);
    ASSERT_TRUE(ctx.identity.has_value());
    EXPECT_TRUE(ska::has_claim(*ctx.identity, "role", "reader"));
    EXPECT_FALSE(ska::has_claim(*ctx.identity, "name", "alice"));
}

TEST_F(SharedKeyStageTest, TransformerIsNotCalledForRejectedRequests)
{
    MockFunction<ska::Identity(const std::string&, const ska::Identity&)> transform;
    EXPECT_CALL(transform, Call(_, _)).Times(0);
    cfg.transformer = transform.AsStdFunction();
    EXPECT_EQ(run(signed_get("carol", ska_test::alice_secret())).status_code, 401);
}

TEST_F(SharedKeyStageTest, TransformerFailureIs500)
{
    MockFunction<ska::Identity(const std::string&, const ska::Identity&)> transform;
    EXPECT_CALL(transform, Call(_, _)).WillOnce(Throw(ska::TransformError("claims service down")));
    cfg.transformer = transform.AsStdFunction();
    EXPECT_CALL(next, Call(_, _)).Times(0);

    const ska::HttpResponse resp = run(signed_get());
    EXPECT_EQ(resp.status_code, 500);
    EXPECT_FALSE(ctx.identity.has_value());
}

TEST_F(SharedKeyStageTest, ResolverFailureIs500)
{
    cfg.resolver = [](const std::string&) -> std::optional<std::string> {
        throw std::runtime_error("key service down");
    };
    EXPECT_CALL(next, Call(_, _)).Times(0);
    EXPECT_EQ(run(signed_get()).status_code, 500);
}

TEST_F(SharedKeyStageTest, CancelledRequestIsAbandoned)
{
    ctx.cancel.cancel();
    EXPECT_CALL(next, Call(_, _)).Times(0);
    const ska::HttpResponse resp = run(signed_get());
    EXPECT_EQ(resp.status_code, 499);
    EXPECT_FALSE(ctx.identity.has_value());
}

TEST_F(SharedKeyStageTest, CancelledDuringTransformLeavesNoIdentity)
{
    ska::CancellationToken token = ctx.cancel;
    cfg.transformer = [token](const std::string&, const ska::Identity& id) mutable {
        token.cancel();
        return id;
    };
    EXPECT_CALL(next, Call(_, _)).Times(0);
    EXPECT_EQ(run(signed_get()).status_code, 499);
    EXPECT_FALSE(ctx.identity.has_value());
}

TEST_F(SharedKeyStageTest, RejectsInvalidConfiguration)
{
    ska::SharedKeyStageConfig bad = cfg;
    bad.resolver = nullptr;
    EXPECT_THROW(ska::SharedKeyStage{bad}, std::invalid_argument);

    bad = cfg;
    bad.expired_status = 500;
    EXPECT_THROW(ska::SharedKeyStage{bad}, std::invalid_argument);

    bad = cfg;
    bad.max_age = -5s;
    EXPECT_THROW(ska::SharedKeyStage{bad}, std::invalid_argument);
}

TEST_F(SharedKeyStageTest, EmptyNextHandlerIsRejected)
{
    ska::SharedKeyStage stage(cfg);
    EXPECT_THROW(stage.handle(signed_get(), ctx, ska::Handler{}), std::invalid_argument);
}

TEST(SharedKeyStageConcurrencyTest, ConcurrentRequestsKeepTheirOwnIdentity)
{
    ska::SharedKeyStageConfig cfg;
    cfg.resolver = ska_test::test_resolver();
    cfg.now = ska_test::clock_at(ska_test::fixed_now());
    ska::Pipeline pipeline;
    pipeline.add(std::make_shared<ska::SharedKeyStage>(cfg));

    const ska::HttpRequest alice =
        ska_test::sign_as(ska_test::make_request("GET", "/whoami"), "alice", ska_test::alice_secret());
    const ska::HttpRequest bob =
        ska_test::sign_as(ska_test::make_request("GET", "/whoami"), "bob", ska_test::bob_secret());

    const ska::Handler terminal = [](const ska::HttpRequest&, ska::RequestContext& c) {
        return ska::make_response(200, "OK", c.identity ? c.identity->account : "");
    };

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        const bool is_alice = (t % 2) == 0;
        threads.emplace_back([&, is_alice]() {
            for (int i = 0; i < 200; ++i) {
                ska::RequestContext c;
                const ska::HttpResponse resp = pipeline.run(is_alice ? alice : bob, c, terminal);
                const char* want = is_alice ? "alice" : "bob";
                if (resp.status_code != 200 || resp.body != want ||
                    !c.identity || c.identity->account != want) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(mismatches.load(), 0);
}
