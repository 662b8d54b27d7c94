#include <algorithm>
#include <set>
#include <vector>

#include <gtest/gtest.h>

#include <QtCore/QRegularExpression>

#include <cctv/network/auth/auth_negotiator.h>
#include <cctv/network/auth/basic_authentication.h>
#include <cctv/network/auth/digest_authentication.h>
#include <cctv/network/auth/ws_security.h>

namespace cctv {
namespace network {
namespace auth {
namespace test {

namespace {

QString captured(const QByteArray& text, const QString& pattern)
{
    return QRegularExpression(pattern).match(QString::fromUtf8(text)).captured(1);
}

} // namespace

/**
 * Device protecting one request with a configurable set of schemes.
 */
class FakeAuthTarget:
    public AbstractAuthTarget
{
public:
    bool responding = true;
    bool soap = false;
    std::set<AuthMethod> acceptedMethods;
    bool offerBasicChallenge = false;
    bool offerDigestChallenge = false;
    bool renewNonceOnce = false;
    Credential validCredential{"admin", "12345"};
    std::vector<Authorization> requests;

    virtual QString name() const override { return "fake"; }
    virtual bool carriesSoap() const override { return soap; }
    virtual QByteArray requestMethod() const override { return "GET"; }
    virtual QByteArray requestUri() const override { return "/"; }

    virtual boost::optional<http::Response> send(const Authorization& authorization) override
    {
        requests.push_back(authorization);
        if (!responding)
            return boost::none;

        if (authorization.method == AuthMethod::digest && renewNonceOnce)
        {
            renewNonceOnce = false;
            m_nonce = "renewed";
            return makeResponse(http::StatusCode::unauthorized, /*stale*/ true);
        }

        if (isAuthorized(authorization))
            return makeResponse(http::StatusCode::ok, /*stale*/ false);
        return makeResponse(http::StatusCode::unauthorized, /*stale*/ false);
    }

    virtual bool isAccepted(const http::Response& response) const override
    {
        return response.isSuccess();
    }

    int requestCount(AuthMethod method) const
    {
        return (int) std::count_if(requests.begin(), requests.end(),
            [method](const Authorization& request) { return request.method == method; });
    }

private:
    bool isAuthorized(const Authorization& authorization) const
    {
        if (authorization.header.isEmpty() && authorization.soapSecurityHeader.isEmpty())
            return acceptedMethods.empty();

        if (!acceptedMethods.count(authorization.method))
            return false;

        switch (authorization.method)
        {
            case AuthMethod::basic:
                return authorization.header == buildBasicAuthorization(validCredential);

            case AuthMethod::digest:
            {
                AuthChallenge challenge;
                challenge.scheme = AuthChallenge::Scheme::digest;
                challenge.realm = QString("IP Camera");
                challenge.nonce = m_nonce;
                return authorization.header == buildDigestAuthorization(
                    validCredential, challenge, requestMethod(), requestUri());
            }

            case AuthMethod::wsSecurity:
            {
                const QByteArray& header = authorization.soapSecurityHeader;
                const QByteArray nonce =
                    QByteArray::fromBase64(captured(header, "<Nonce[^>]*>([^<]*)<").toLatin1());
                const QString created = captured(header, "<wsu:Created>([^<]*)<");
                return captured(header, "<Username>([^<]*)<") == validCredential.username()
                    && captured(header, "<Password[^>]*>([^<]*)<").toLatin1()
                        == calculatePasswordDigest(nonce, created, validCredential.password());
            }

            case AuthMethod::none:
                break;
        }
        return false;
    }

    http::Response makeResponse(int statusCode, bool stale) const
    {
        http::Response response;
        response.protocol = http::kHttpProtocol;
        response.statusCode = statusCode;
        response.reasonPhrase = statusCode == http::StatusCode::ok ? "OK" : "Unauthorized";
        if (statusCode != http::StatusCode::unauthorized)
            return response;

        if (offerDigestChallenge)
        {
            QByteArray challenge = "Digest realm=\"IP Camera\", nonce=\"" + m_nonce.toUtf8() + "\"";
            if (stale)
                challenge += ", stale=TRUE";
            response.addHeader("WWW-Authenticate", challenge);
        }
        if (offerBasicChallenge)
            response.addHeader("WWW-Authenticate", "Basic realm=\"IP Camera\"");
        return response;
    }

private:
    QString m_nonce = "abc123";
};

//-------------------------------------------------------------------------------------------------

class AuthNegotiator:
    public ::testing::Test
{
protected:
    void givenCredentials(std::vector<Credential> credentials)
    {
        m_credentials = std::move(credentials);
    }

    void whenNegotiate()
    {
        m_result = m_negotiator.negotiate(m_target, m_credentials);
    }

    void thenAcceptedWith(AuthMethod method, const boost::optional<Credential>& credential)
    {
        ASSERT_TRUE(m_result.success) << m_result.reason.toStdString();
        ASSERT_TRUE(m_result.serviceResponded);
        ASSERT_TRUE(m_result.method == method) << toString(m_result.method).toStdString();
        ASSERT_EQ((bool) credential, (bool) m_result.credential);
        if (credential)
            ASSERT_TRUE(*credential == *m_result.credential);
        ASSERT_TRUE(m_result.response);
    }

    void thenRejected()
    {
        ASSERT_FALSE(m_result.success);
        ASSERT_TRUE(m_result.serviceResponded);
        ASSERT_FALSE(m_result.reason.isEmpty());
    }

    FakeAuthTarget m_target;
    std::vector<Credential> m_credentials;
    NegotiationResult m_result;

private:
    auth::AuthNegotiator m_negotiator;
};

TEST_F(AuthNegotiator, open_service_needs_no_credentials)
{
    givenCredentials({Credential("admin", "12345")});

    whenNegotiate();

    thenAcceptedWith(AuthMethod::none, boost::none);
    ASSERT_EQ(1U, m_target.requests.size());
}

TEST_F(AuthNegotiator, credentials_are_tried_in_order)
{
    m_target.acceptedMethods = {AuthMethod::basic};
    m_target.offerBasicChallenge = true;
    givenCredentials({Credential("admin", "admin"), Credential("admin", "12345")});

    whenNegotiate();

    thenAcceptedWith(AuthMethod::basic, Credential("admin", "12345"));
}

TEST_F(AuthNegotiator, basic_is_skipped_when_only_digest_is_offered)
{
    m_target.acceptedMethods = {AuthMethod::digest};
    m_target.offerDigestChallenge = true;
    givenCredentials({Credential("admin", "12345")});

    whenNegotiate();

    thenAcceptedWith(AuthMethod::digest, Credential("admin", "12345"));
    ASSERT_EQ(0, m_target.requestCount(AuthMethod::basic));
}

TEST_F(AuthNegotiator, basic_is_tried_without_any_challenge)
{
    m_target.acceptedMethods = {AuthMethod::basic};
    givenCredentials({Credential("admin", "12345")});

    whenNegotiate();

    thenAcceptedWith(AuthMethod::basic, Credential("admin", "12345"));
}

TEST_F(AuthNegotiator, stale_nonce_is_retried_once)
{
    m_target.acceptedMethods = {AuthMethod::digest};
    m_target.offerDigestChallenge = true;
    m_target.renewNonceOnce = true;
    givenCredentials({Credential("admin", "12345")});

    whenNegotiate();

    thenAcceptedWith(AuthMethod::digest, Credential("admin", "12345"));
    ASSERT_EQ(2, m_target.requestCount(AuthMethod::digest));
}

TEST_F(AuthNegotiator, ws_security_is_used_for_soap_services)
{
    m_target.soap = true;
    m_target.acceptedMethods = {AuthMethod::wsSecurity};
    givenCredentials({Credential("admin", "wrong"), Credential("admin", "12345")});

    whenNegotiate();

    thenAcceptedWith(AuthMethod::wsSecurity, Credential("admin", "12345"));
}

TEST_F(AuthNegotiator, ws_security_is_not_sent_to_plain_services)
{
    m_target.acceptedMethods = {AuthMethod::wsSecurity};
    givenCredentials({Credential("admin", "12345")});

    whenNegotiate();

    thenRejected();
    ASSERT_EQ(0, m_target.requestCount(AuthMethod::wsSecurity));
}

TEST_F(AuthNegotiator, exhaustion_reports_last_rejection)
{
    m_target.acceptedMethods = {AuthMethod::digest};
    m_target.offerDigestChallenge = true;
    givenCredentials({Credential("admin", "wrong"), Credential("root", "wrong")});

    whenNegotiate();

    thenRejected();
    ASSERT_EQ("Digest authentication rejected (401 Unauthorized)", m_result.reason);
    ASSERT_FALSE(m_result.credential);
}

TEST_F(AuthNegotiator, protected_service_without_credentials_is_rejected)
{
    m_target.acceptedMethods = {AuthMethod::basic};
    m_target.offerBasicChallenge = true;

    whenNegotiate();

    thenRejected();
}

TEST_F(AuthNegotiator, silent_service)
{
    m_target.responding = false;
    givenCredentials({Credential("admin", "12345")});

    whenNegotiate();

    ASSERT_FALSE(m_result.success);
    ASSERT_FALSE(m_result.serviceResponded);
    ASSERT_EQ(1U, m_target.requests.size());
}

} // namespace test
} // namespace auth
} // namespace network
} // namespace cctv
