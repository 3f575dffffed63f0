#include <gtest/gtest.h>
#include "grant.hpp"
#include "test_support.hpp"

using namespace erebus;
using namespace erebus::testing;

TEST(GrantScopeTest, ExactAndWildcardEntries) {
    auto g = make_grant("alice", {{"room", TopicScope::Read}, {"*", TopicScope::Write}});

    EXPECT_EQ(g.scope_for("room"), TopicScope::Read);
    EXPECT_EQ(g.scope_for("lobby"), TopicScope::Write);

    // Every matching entry counts: "room" is readable exactly and writable through "*".
    EXPECT_TRUE(g.can_read("room"));
    EXPECT_TRUE(g.can_write("room"));
    EXPECT_FALSE(g.can_read("lobby"));
    EXPECT_TRUE(g.can_write("lobby"));
    EXPECT_TRUE(g.has_topic_access("anything"));
}

TEST(GrantScopeTest, NoMatchingEntry) {
    auto g = make_grant("alice", {{"room", TopicScope::ReadWrite}});
    EXPECT_FALSE(g.has_topic_access("lobby"));
    EXPECT_FALSE(g.can_read("lobby"));
    EXPECT_FALSE(g.can_write("lobby"));
}

TEST(GrantScopeTest, CuriousScope) {
    auto g = make_grant("eve", {{"room", TopicScope::Huh}});
    EXPECT_TRUE(g.is_curious("room"));
    EXPECT_FALSE(g.can_read("room"));
    EXPECT_TRUE(g.has_topic_access("room"));
}

TEST(GrantJsonTest, RoundTripsThroughAttachment) {
    auto g = make_grant("alice", {{"room", TopicScope::ReadWrite}});
    g.webhook_url = "https://hooks.example.com";
    auto back = Grant::parse(g.serialize());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->user_id, "alice");
    EXPECT_EQ(back->key_id.value_or(""), "key_1");
    EXPECT_EQ(back->webhook_url.value_or(""), "https://hooks.example.com");
    ASSERT_EQ(back->topics.size(), 1u);
    EXPECT_EQ(back->topics[0].scope, TopicScope::ReadWrite);
}

TEST(GrantJsonTest, SchemaValidation) {
    EXPECT_FALSE(Grant::parse("not json").has_value());
    EXPECT_FALSE(Grant::parse(R"({"project_id":"p"})").has_value());
    EXPECT_FALSE(Grant::parse(R"({"project_id":"p","channel":"c","userId":"u","issuedAt":1,"expiresAt":2,
                                 "topics":[{"topic":"t","scope":"admin"}]})").has_value());
    EXPECT_FALSE(Grant::parse(R"({"project_id":"p","channel":"c","userId":"","issuedAt":1,"expiresAt":2,
                                 "topics":[]})").has_value());
    EXPECT_TRUE(Grant::parse(R"({"project_id":"p","channel":"c","userId":"u","issuedAt":1,"expiresAt":2,
                                "topics":[{"topic":"t","scope":"huh?"}]})").has_value());
}

class GrantVerifierTest : public ::testing::Test {
protected:
    GrantIssuer issuer;
    GrantVerifier verifier{issuer.jwk()};
};

TEST_F(GrantVerifierTest, AcceptsValidToken) {
    ASSERT_TRUE(verifier.is_configured());
    auto token = issuer.token(make_grant("alice", {{"room", TopicScope::Read}}));
    auto grant = verifier.verify(token);
    ASSERT_TRUE(grant.has_value());
    EXPECT_EQ(grant->user_id, "alice");
    EXPECT_EQ(grant->project_id, "proj");
}

TEST_F(GrantVerifierTest, RejectsForeignSignature) {
    GrantIssuer other;
    EXPECT_FALSE(verifier.verify(other.token(make_grant("alice", {}))).has_value());
}

TEST_F(GrantVerifierTest, RejectsTamperedPayload) {
    auto token = issuer.token(make_grant("alice", {{"room", TopicScope::Read}}));
    auto forged = issuer.token(make_grant("mallory", {{"*", TopicScope::ReadWrite}}));

    // Swap in another payload while keeping the original signature.
    auto dot1 = token.find('.');
    auto dot2 = token.rfind('.');
    auto fdot1 = forged.find('.');
    auto fdot2 = forged.rfind('.');
    std::string spliced = token.substr(0, dot1) + forged.substr(fdot1, fdot2 - fdot1) + token.substr(dot2);
    EXPECT_FALSE(verifier.verify(spliced).has_value());
}

TEST_F(GrantVerifierTest, RejectsExpiredAndNotYetValid) {
    auto claims = make_grant("alice", {}).to_json();
    auto now = GrantIssuer::now_sec();

    claims["exp"] = now - 10;
    EXPECT_FALSE(verifier.verify(issuer.sign(claims), now).has_value());

    claims["exp"] = now + 10;
    claims["nbf"] = now + 60;
    EXPECT_FALSE(verifier.verify(issuer.sign(claims), now).has_value());

    claims.erase("nbf");
    EXPECT_TRUE(verifier.verify(issuer.sign(claims), now).has_value());
}

TEST_F(GrantVerifierTest, RejectsOtherAlgorithms) {
    auto claims = make_grant("alice", {}).to_json();
    EXPECT_FALSE(verifier.verify(issuer.sign(claims, "HS256")).has_value());
    EXPECT_FALSE(verifier.verify(issuer.sign(claims, "none")).has_value());
}

TEST_F(GrantVerifierTest, RejectsMalformedTokens) {
    EXPECT_FALSE(verifier.verify("").has_value());
    EXPECT_FALSE(verifier.verify("a.b").has_value());
    EXPECT_FALSE(verifier.verify("a.b.c.d").has_value());
    EXPECT_FALSE(verifier.verify("!!.??.**").has_value());
}

TEST(GrantVerifierConfigTest, UnusableKeyFailsClosed) {
    GrantVerifier none("");
    EXPECT_FALSE(none.is_configured());

    GrantVerifier wrong_curve(R"({"kty":"OKP","crv":"X25519","x":"AAAA"})");
    EXPECT_FALSE(wrong_curve.is_configured());

    GrantIssuer issuer;
    EXPECT_FALSE(none.verify(issuer.token(make_grant("alice", {}))).has_value());
}
