#include <gtest/gtest.h>

#include <cctv/network/auth/auth_challenge.h>

namespace cctv {
namespace network {
namespace auth {
namespace test {

TEST(AuthChallenge, digest_is_parsed)
{
    const auto challenge = AuthChallenge::parse(
        "Digest realm=\"IP Camera(21388)\", nonce=\"4e5449344d54\", qop=\"auth\", "
        "opaque=\"5ccc069c403ebaf9f0171e9517f40e41\", stale=\"FALSE\", algorithm=MD5");

    ASSERT_TRUE(challenge);
    ASSERT_TRUE(challenge->scheme == AuthChallenge::Scheme::digest);
    ASSERT_EQ("IP Camera(21388)", challenge->realm.get_value_or(QString()));
    ASSERT_EQ("4e5449344d54", challenge->nonce.get_value_or(QString()));
    ASSERT_EQ("5ccc069c403ebaf9f0171e9517f40e41", challenge->opaque.get_value_or(QString()));
    ASSERT_EQ("MD5", challenge->algorithm.get_value_or(QString()));
    ASSERT_TRUE(challenge->offersQopAuth());
    ASSERT_FALSE(challenge->isStale());
    ASSERT_TRUE(challenge->isValid());
}

TEST(AuthChallenge, comma_inside_quotes_does_not_split)
{
    const auto challenge = AuthChallenge::parse(
        "Digest realm=\"Cameras, Lobby\", nonce=\"abc\", qop=\"auth,auth-int\"");

    ASSERT_TRUE(challenge);
    ASSERT_EQ("Cameras, Lobby", challenge->realm.get_value_or(QString()));
    ASSERT_EQ("auth,auth-int", challenge->qop.get_value_or(QString()));
    ASSERT_TRUE(challenge->offersQopAuth());
}

TEST(AuthChallenge, digest_without_nonce_is_invalid)
{
    const auto challenge = AuthChallenge::parse("Digest realm=\"IP Camera\", nonce=\"\"");

    ASSERT_TRUE(challenge);
    ASSERT_FALSE(challenge->nonce);
    ASSERT_FALSE(challenge->isValid());
}

TEST(AuthChallenge, stale_flag)
{
    const auto challenge = AuthChallenge::parse(
        "Digest realm=\"r\", nonce=\"n2\", stale=true");

    ASSERT_TRUE(challenge);
    ASSERT_TRUE(challenge->isStale());
    ASSERT_FALSE(challenge->offersQopAuth());
}

TEST(AuthChallenge, basic_realm_defaults)
{
    const auto withRealm = AuthChallenge::parse("Basic realm=\"NVR\"");
    ASSERT_TRUE(withRealm);
    ASSERT_TRUE(withRealm->scheme == AuthChallenge::Scheme::basic);
    ASSERT_EQ("NVR", withRealm->realm.get_value_or(QString()));

    const auto withoutRealm = AuthChallenge::parse("basic");
    ASSERT_TRUE(withoutRealm);
    ASSERT_EQ("Camera", withoutRealm->realm.get_value_or(QString()));
    ASSERT_TRUE(withoutRealm->isValid());
}

TEST(AuthChallenge, unknown_schemes_are_ignored)
{
    ASSERT_FALSE(AuthChallenge::parse(""));
    ASSERT_FALSE(AuthChallenge::parse("   "));
    ASSERT_FALSE(AuthChallenge::parse("Bearer realm=\"api\""));
    ASSERT_FALSE(AuthChallenge::parse("NTLM"));
}

TEST(AuthChallenge, all_headers_of_response_are_parsed)
{
    http::Response response;
    response.statusCode = http::StatusCode::unauthorized;
    response.addHeader("WWW-Authenticate", "Digest realm=\"cam\", nonce=\"n1\"");
    response.addHeader("www-authenticate", "Basic realm=\"cam\"");
    response.addHeader("WWW-Authenticate", "Negotiate");

    const ChallengeSet challenges = parseChallenges(response);

    ASSERT_EQ(2U, challenges.size());
    ASSERT_TRUE(findChallenge(challenges, AuthChallenge::Scheme::digest));
    ASSERT_TRUE(findChallenge(challenges, AuthChallenge::Scheme::basic));
}

TEST(AuthChallenge, find_skips_invalid_challenges)
{
    ChallengeSet challenges;
    challenges.push_back(*AuthChallenge::parse("Digest realm=\"cam\""));
    challenges.push_back(*AuthChallenge::parse("Digest realm=\"cam\", nonce=\"good\""));

    const auto challenge = findChallenge(challenges, AuthChallenge::Scheme::digest);

    ASSERT_TRUE(challenge);
    ASSERT_EQ("good", challenge->nonce.get_value_or(QString()));
    ASSERT_FALSE(findChallenge(challenges, AuthChallenge::Scheme::basic));
}

//-------------------------------------------------------------------------------------------------

TEST(ChallengeParams, split_honors_quotes)
{
    const QStringList params = splitChallengeParams(
        "realm=\"a,b\", nonce=\"x\",,qop=auth");

    const QStringList expected{"realm=\"a,b\"", " nonce=\"x\"", "qop=auth"};
    ASSERT_EQ(expected, params);
}

TEST(ChallengeParams, split_honors_escaped_quote)
{
    const QStringList params = splitChallengeParams("realm=\"a\\\",b\", nonce=1");

    ASSERT_EQ(2, params.size());
    ASSERT_EQ("realm=\"a\\\",b\"", params[0]);
}

TEST(ChallengeParams, value_extraction)
{
    ASSERT_EQ("v", extractChallengeValue("\"v\"").get_value_or(QString()));
    ASSERT_EQ("v", extractChallengeValue("\\\"v\\\"").get_value_or(QString()));
    ASSERT_EQ("v", extractChallengeValue("x\"v\"y").get_value_or(QString()));
    ASSERT_EQ("MD5", extractChallengeValue("MD5, qop=auth").get_value_or(QString()));
    ASSERT_EQ("true", extractChallengeValue(" true;x").get_value_or(QString()));
}

TEST(ChallengeParams, empty_value_is_absent)
{
    ASSERT_FALSE(extractChallengeValue(""));
    ASSERT_FALSE(extractChallengeValue("\"\""));
    ASSERT_FALSE(extractChallengeValue(",rest"));
}

} // namespace test
} // namespace auth
} // namespace network
} // namespace cctv
