#include <gtest/gtest.h>

#include <cctv/network/auth/auth_session.h>

namespace cctv {
namespace network {
namespace auth {
namespace test {

namespace {

http::Response unauthorizedResponse(const QByteArray& challenge)
{
    http::Response response;
    response.statusCode = http::StatusCode::unauthorized;
    response.addHeader("WWW-Authenticate", challenge);
    return response;
}

} // namespace

TEST(AuthSession, anonymous_session_sends_nothing)
{
    const AuthSession session(AuthMethod::none, boost::none);

    const Authorization authorization = session.authorize("POST", "/onvif/device_service");

    ASSERT_TRUE(authorization.header.isEmpty());
    ASSERT_TRUE(authorization.soapSecurityHeader.isEmpty());
}

TEST(AuthSession, basic_is_sent_upfront)
{
    const AuthSession session(AuthMethod::basic, Credential("admin", "12345"));

    ASSERT_EQ("Basic YWRtaW46MTIzNDU=", session.authorize("GET", "/").header);
}

TEST(AuthSession, ws_security_goes_into_soap_header)
{
    const AuthSession session(AuthMethod::wsSecurity, Credential("admin", "12345"));

    const Authorization authorization = session.authorize("POST", "/onvif/media_service");

    ASSERT_TRUE(authorization.header.isEmpty());
    ASSERT_TRUE(authorization.soapSecurityHeader.contains("<Username>admin</Username>"));
}

TEST(AuthSession, digest_waits_for_challenge)
{
    AuthSession session(AuthMethod::digest, Credential("admin", "12345"));
    ASSERT_TRUE(session.authorize("GET", "/").header.isEmpty());

    ASSERT_TRUE(session.updateChallenge(
        unauthorizedResponse("Digest realm=\"IP Camera\", nonce=\"abc123\"")));

    ASSERT_EQ(
        "Digest username=\"admin\", realm=\"IP Camera\", nonce=\"abc123\", uri=\"/\", "
        "response=\"669833847e4f10949abc186ac5a9ea41\"",
        session.authorize("GET", "/").header);
}

TEST(AuthSession, same_challenge_is_not_worth_a_retry)
{
    AuthSession session(AuthMethod::digest, Credential("admin", "12345"));
    const auto response = unauthorizedResponse("Digest realm=\"IP Camera\", nonce=\"abc123\"");

    ASSERT_TRUE(session.updateChallenge(response));
    ASSERT_FALSE(session.updateChallenge(response));
    ASSERT_TRUE(session.updateChallenge(
        unauthorizedResponse("Digest realm=\"IP Camera\", nonce=\"other\"")));
}

TEST(AuthSession, challenge_is_ignored_by_other_methods)
{
    AuthSession session(AuthMethod::basic, Credential("admin", "12345"));

    ASSERT_FALSE(session.updateChallenge(
        unauthorizedResponse("Digest realm=\"IP Camera\", nonce=\"abc123\"")));
}

} // namespace test
} // namespace auth
} // namespace network
} // namespace cctv
