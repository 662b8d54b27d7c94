#include <gtest/gtest.h>

#include <cctv/network/auth/basic_authentication.h>
#include <cctv/network/auth/ws_security.h>

namespace cctv {
namespace network {
namespace auth {
namespace test {

namespace {

QByteArray sequentialNonce()
{
    QByteArray nonce;
    for (int i = 0; i < 16; ++i)
        nonce.append(static_cast<char>(i));
    return nonce;
}

} // namespace

TEST(WsSecurity, password_digest_is_deterministic)
{
    ASSERT_EQ(
        "uHCICafDsX6rwisaUua0lK0B4YU=",
        calculatePasswordDigest(sequentialNonce(), "2024-01-15T10:30:00Z", "12345"));
}

TEST(WsSecurity, security_header_carries_token_fields)
{
    const auto token = UsernameToken::create(
        Credential("admin", "12345"), sequentialNonce(), "2024-01-15T10:30:00Z");

    const QByteArray header = token.toSecurityHeader();

    ASSERT_TRUE(header.contains("<Username>admin</Username>"));
    ASSERT_TRUE(header.contains("#PasswordDigest\">uHCICafDsX6rwisaUua0lK0B4YU=</Password>"));
    ASSERT_TRUE(header.contains(">AAECAwQFBgcICQoLDA0ODw==</Nonce>"));
    ASSERT_TRUE(header.contains("<wsu:Created>2024-01-15T10:30:00Z</wsu:Created>"));
    ASSERT_FALSE(header.contains("12345"));
}

TEST(WsSecurity, username_is_escaped)
{
    const auto token = UsernameToken::create(
        Credential("a<b>&\"%1", "x"), sequentialNonce(), "2024-01-15T10:30:00Z");

    ASSERT_TRUE(token.toSecurityHeader().contains(
        "<Username>a&lt;b&gt;&amp;&quot;%1</Username>"));
}

TEST(WsSecurity, generated_tokens_differ)
{
    const Credential credential("admin", "12345");

    const auto first = UsernameToken::generate(credential);
    const auto second = UsernameToken::generate(credential);

    ASSERT_EQ(16, first.nonce.size());
    ASSERT_NE(first.nonce, second.nonce);
    ASSERT_TRUE(first.created.endsWith('Z'));
}

TEST(BasicAuthentication, header)
{
    ASSERT_EQ("Basic YWRtaW46MTIzNDU=", buildBasicAuthorization(Credential("admin", "12345")));
}

} // namespace test
} // namespace auth
} // namespace network
} // namespace cctv
