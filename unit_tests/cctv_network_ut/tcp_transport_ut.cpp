#include <chrono>
#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include <QtCore/QElapsedTimer>
#include <QtNetwork/QHostAddress>
#include <QtNetwork/QTcpServer>

#include <cctv/network/http/transport.h>

#include "test_support/test_tcp_server.h"

namespace cctv {
namespace network {
namespace http {
namespace test {

using network::test::TestTcpServer;

class TcpTransport:
    public ::testing::Test
{
protected:
    void givenServer(
        std::vector<QByteArray> responseParts,
        TestTcpServer::Completion completion = TestTcpServer::Completion::keepConnectionOpen)
    {
        m_server = std::make_unique<TestTcpServer>(std::move(responseParts), completion);
        ASSERT_TRUE(m_server->start());
        m_port = m_server->port();
    }

    void givenNothingListens()
    {
        QTcpServer server;
        ASSERT_TRUE(server.listen(QHostAddress::LocalHost, 0));
        m_port = server.serverPort();
    }

    void givenTimeout(std::chrono::milliseconds timeout)
    {
        m_timeout = timeout;
    }

    void whenSendOnvifRequest()
    {
        Request request;
        request.method = "POST";
        request.uri = "/onvif/device_service";
        request.setHeader("Content-Type", "application/soap+xml; charset=utf-8");
        request.body = "<s:Envelope/>";
        whenSend("http", request);
    }

    void whenSendDescribe()
    {
        Request request;
        request.method = "DESCRIBE";
        request.uri = QString("rtsp://127.0.0.1:%1/Streaming/Channels/101").arg(m_port).toUtf8();
        request.protocol = kRtspProtocol;
        request.setHeader("CSeq", "1");
        whenSend("rtsp", request);
    }

    void thenResponseIs(int statusCode, const QByteArray& body)
    {
        ASSERT_TRUE(static_cast<bool>(m_response));
        ASSERT_EQ(statusCode, m_response->statusCode);
        ASSERT_EQ(body, m_response->body);
    }

    void thenNoResponse()
    {
        ASSERT_FALSE(static_cast<bool>(m_response));
    }

    void andResponseDidNotWaitForTimeout()
    {
        ASSERT_LT(m_elapsedMs, m_timeout.count() / 2);
    }

    std::unique_ptr<TestTcpServer> m_server;
    std::chrono::milliseconds m_timeout{5000};
    qint64 m_elapsedMs = 0;

private:
    void whenSend(const QString& scheme, const Request& request)
    {
        QUrl url;
        url.setScheme(scheme);
        url.setHost("127.0.0.1");
        url.setPort(m_port);

        http::TcpTransport transport(m_timeout);
        QElapsedTimer timer;
        timer.start();
        m_response = transport.send(url, request);
        m_elapsedMs = timer.elapsed();
    }

    quint16 m_port = 0;
    boost::optional<Response> m_response;
};

TEST_F(TcpTransport, default_ports)
{
    ASSERT_EQ(80, http::TcpTransport::defaultPort("http"));
    ASSERT_EQ(443, http::TcpTransport::defaultPort("https"));
    ASSERT_EQ(554, http::TcpTransport::defaultPort("rtsp"));
}

TEST_F(TcpTransport, request_is_sent_serialized)
{
    givenServer({"HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n"});

    whenSendOnvifRequest();

    thenResponseIs(StatusCode::ok, QByteArray());
    const QByteArray received = m_server->receivedRequest();
    ASSERT_TRUE(received.startsWith("POST /onvif/device_service HTTP/1.1\r\n"));
    ASSERT_TRUE(received.contains("Content-Length: 13\r\n"));
}

TEST_F(TcpTransport, content_length_body_ends_response_on_open_connection)
{
    givenServer({
        "HTTP/1.1 200 OK\r\nContent-Length: 13\r\n\r\n<s:Env",
        "elope/>"});

    whenSendOnvifRequest();

    thenResponseIs(StatusCode::ok, "<s:Envelope/>");
    andResponseDidNotWaitForTimeout();
}

TEST_F(TcpTransport, chunked_body_is_decoded)
{
    givenServer({
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n",
        "6\r\n<s:Env\r\n",
        "7\r\nelope/>\r\n0\r\n\r\n"});

    whenSendOnvifRequest();

    thenResponseIs(StatusCode::ok, "<s:Envelope/>");
    andResponseDidNotWaitForTimeout();
}

TEST_F(TcpTransport, chunked_fault_with_content_length_uses_chunks)
{
    givenServer({
        "HTTP/1.1 400 Bad Request\r\n"
        "Transfer-Encoding: chunked\r\nContent-Length: 100\r\n\r\n"
        "9\r\n<s:Fault>\r\n0\r\n\r\n"});

    whenSendOnvifRequest();

    thenResponseIs(StatusCode::badRequest, "<s:Fault>");
}

TEST_F(TcpTransport, truncated_chunked_body_is_not_a_response)
{
    givenServer(
        {"HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nff\r\n<s:Envelope"},
        TestTcpServer::Completion::closeConnection);

    whenSendOnvifRequest();

    thenNoResponse();
}

TEST_F(TcpTransport, body_without_length_ends_with_connection)
{
    givenServer(
        {"HTTP/1.0 200 OK\r\nContent-Type: text/xml\r\n\r\n<s:Envelope/>"},
        TestTcpServer::Completion::closeConnection);

    whenSendOnvifRequest();

    thenResponseIs(StatusCode::ok, "<s:Envelope/>");
    andResponseDidNotWaitForTimeout();
}

TEST_F(TcpTransport, rtsp_response_without_body_ends_after_head)
{
    givenServer({
        "RTSP/1.0 401 Unauthorized\r\n"
        "CSeq: 1\r\n"
        "WWW-Authenticate: Basic realm=\"IP Camera\"\r\n\r\n"});

    whenSendDescribe();

    thenResponseIs(StatusCode::unauthorized, QByteArray());
    andResponseDidNotWaitForTimeout();
    ASSERT_TRUE(m_server->receivedRequest().startsWith("DESCRIBE rtsp://127.0.0.1:"));
}

TEST_F(TcpTransport, rtsp_sdp_body_is_read_by_content_length)
{
    givenServer({
        "RTSP/1.0 200 OK\r\nCSeq: 1\r\nContent-Type: application/sdp\r\n"
        "Content-Length: 5\r\n\r\nv=0\r\n"});

    whenSendDescribe();

    thenResponseIs(StatusCode::ok, "v=0\r\n");
    andResponseDidNotWaitForTimeout();
}

TEST_F(TcpTransport, silent_server_gives_no_response_after_timeout)
{
    givenTimeout(std::chrono::milliseconds(500));
    givenServer({});

    whenSendOnvifRequest();

    thenNoResponse();
    ASSERT_GE(m_elapsedMs, 400);
    ASSERT_LT(m_elapsedMs, 3000);
}

TEST_F(TcpTransport, garbage_response_is_not_a_response)
{
    givenServer({"SSH-2.0-OpenSSH_7.4\r\n\r\n"});

    whenSendOnvifRequest();

    thenNoResponse();
}

TEST_F(TcpTransport, refused_connection_gives_no_response)
{
    givenNothingListens();

    whenSendOnvifRequest();

    thenNoResponse();
    andResponseDidNotWaitForTimeout();
}

} // namespace test
} // namespace http
} // namespace network
} // namespace cctv
