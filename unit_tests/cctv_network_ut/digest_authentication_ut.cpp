#include <gtest/gtest.h>

#include <cctv/network/auth/digest_authentication.h>

namespace cctv {
namespace network {
namespace auth {
namespace test {

class DigestAuthentication:
    public ::testing::Test
{
protected:
    void givenChallenge(const QString& header)
    {
        const auto challenge = AuthChallenge::parse(header);
        ASSERT_TRUE(challenge);
        m_challenge = *challenge;
    }

    void whenBuildAuthorization(const QByteArray& method, const QByteArray& uri)
    {
        m_authorization = buildDigestAuthorization(
            m_credential, m_challenge, method, uri, "0a4f113b");
    }

    void thenAuthorizationIs(const QByteArray& expected)
    {
        ASSERT_EQ(expected, m_authorization);
    }

    const Credential m_credential{"admin", "12345"};
    AuthChallenge m_challenge;
    QByteArray m_authorization;
};

TEST_F(DigestAuthentication, hashes)
{
    ASSERT_EQ("e235635aa306371021f31a8a964419b6", calculateHa1("admin", "IP Camera", "12345"));
    ASSERT_EQ("71998c64aea37ae77020c49c00f73fa8", calculateHa2("GET", "/"));
}

TEST_F(DigestAuthentication, response_without_qop)
{
    const QByteArray response = calculateDigestResponse(
        calculateHa1("admin", "IP Camera", "12345"),
        "abc123",
        kDigestNonceCount,
        QByteArray(),
        QByteArray(),
        calculateHa2("GET", "/"));

    ASSERT_EQ("669833847e4f10949abc186ac5a9ea41", response);
}

TEST_F(DigestAuthentication, response_with_qop_auth)
{
    const QByteArray response = calculateDigestResponse(
        "e235635aa306371021f31a8a964419b6",
        "abc123",
        "00000001",
        "0a4f113b",
        "auth",
        "71998c64aea37ae77020c49c00f73fa8");

    ASSERT_EQ("319c95995849ecc2b27cc67a62d5e4d9", response);
}

TEST_F(DigestAuthentication, authorization_without_qop)
{
    givenChallenge("Digest realm=\"IP Camera\", nonce=\"abc123\"");

    whenBuildAuthorization("GET", "/");

    thenAuthorizationIs(
        "Digest username=\"admin\", realm=\"IP Camera\", nonce=\"abc123\", uri=\"/\", "
        "response=\"669833847e4f10949abc186ac5a9ea41\"");
}

TEST_F(DigestAuthentication, authorization_with_qop_and_opaque)
{
    givenChallenge("Digest realm=\"IP Camera\", nonce=\"abc123\", qop=\"auth\", opaque=\"xyz\"");

    whenBuildAuthorization("GET", "/");

    thenAuthorizationIs(
        "Digest username=\"admin\", realm=\"IP Camera\", nonce=\"abc123\", uri=\"/\", "
        "qop=auth, nc=00000001, cnonce=\"0a4f113b\", "
        "response=\"319c95995849ecc2b27cc67a62d5e4d9\", opaque=\"xyz\"");
}

TEST_F(DigestAuthentication, rtsp_describe_uri_is_hashed)
{
    givenChallenge("Digest realm=\"IP Camera\", nonce=\"abc123\"");

    whenBuildAuthorization("DESCRIBE", "/Streaming/Channels/101");

    ASSERT_TRUE(m_authorization.contains("response=\"3015c5c0ac1dfca289acd34f102e7295\""));
    ASSERT_TRUE(m_authorization.contains("uri=\"/Streaming/Channels/101\""));
}

TEST_F(DigestAuthentication, cnonce_is_fresh_per_call)
{
    const QByteArray first = generateCnonce();
    const QByteArray second = generateCnonce();

    ASSERT_EQ(32, first.size());
    ASSERT_NE(first, second);
}

} // namespace test
} // namespace auth
} // namespace network
} // namespace cctv
