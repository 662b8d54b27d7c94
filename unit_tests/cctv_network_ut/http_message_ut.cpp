#include <gtest/gtest.h>

#include <cctv/network/http/message.h>

namespace cctv {
namespace network {
namespace http {
namespace test {

TEST(HttpResponse, rtsp_head_is_parsed)
{
    const auto response = Response::parseHead(
        "RTSP/1.0 401 Unauthorized\r\n"
        "CSeq: 2\r\n"
        "WWW-Authenticate: Digest realm=\"IP Camera\", nonce=\"abc\"\r\n"
        "www-authenticate: Basic realm=\"IP Camera\"\r\n"
        "\r\n");

    ASSERT_TRUE(response);
    ASSERT_EQ("RTSP/1.0", response->protocol);
    ASSERT_EQ(StatusCode::unauthorized, response->statusCode);
    ASSERT_EQ("Unauthorized", response->reasonPhrase);
    ASSERT_EQ("2", response->header("cseq").get_value_or(QByteArray()));
    ASSERT_EQ(2, response->headerValues("WWW-Authenticate").size());
    ASSERT_FALSE(response->isSuccess());
}

TEST(HttpResponse, status_line_without_reason)
{
    const auto response = Response::parseHead("HTTP/1.0 200\r\n\r\n");

    ASSERT_TRUE(response);
    ASSERT_EQ(StatusCode::ok, response->statusCode);
    ASSERT_TRUE(response->reasonPhrase.isEmpty());
    ASSERT_TRUE(response->isSuccess());
}

TEST(HttpResponse, garbage_is_rejected)
{
    ASSERT_FALSE(Response::parseHead("SSH-2.0-OpenSSH_7.4\r\n"));
    ASSERT_FALSE(Response::parseHead("HTTP/1.1 abc OK\r\n\r\n"));
    ASSERT_FALSE(Response::parseHead(""));
}

TEST(HttpResponse, serialized_head_parses_back)
{
    Response response;
    response.protocol = kRtspProtocol;
    response.statusCode = StatusCode::notFound;
    response.reasonPhrase = "Not Found";
    response.setHeader("CSeq", "7");
    response.body = "v=0";

    const QByteArray serialized = response.serialize();
    const auto parsed = Response::parseHead(serialized.left(serialized.indexOf("\r\n\r\n") + 4));

    ASSERT_TRUE(parsed);
    ASSERT_EQ(StatusCode::notFound, parsed->statusCode);
    ASSERT_EQ("3", parsed->header("Content-Length").get_value_or(QByteArray()));
}

TEST(HttpRequest, serialization)
{
    Request request;
    request.method = "DESCRIBE";
    request.uri = "rtsp://10.0.0.2:554/live";
    request.protocol = kRtspProtocol;
    request.setHeader("CSeq", "1");
    request.setHeader("cseq", "2");

    ASSERT_EQ(
        "DESCRIBE rtsp://10.0.0.2:554/live RTSP/1.0\r\n"
        "CSeq: 2\r\n"
        "\r\n",
        request.serialize());
}

TEST(HttpRequest, body_gets_content_length)
{
    Request request;
    request.method = "POST";
    request.uri = "/onvif/device_service";
    request.body = "<s:Envelope/>";

    ASSERT_TRUE(request.serialize().endsWith("Content-Length: 13\r\n\r\n<s:Envelope/>"));
}

TEST(HttpResponse, chunked_transfer_encoding_is_detected)
{
    const auto chunked = Response::parseHead(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: Chunked\r\n\r\n");
    const auto plain = Response::parseHead("HTTP/1.1 200 OK\r\nContent-Length: 3\r\n\r\n");

    ASSERT_TRUE(chunked && plain);
    ASSERT_TRUE(chunked->isChunked());
    ASSERT_FALSE(plain->isChunked());
}

TEST(ChunkedBody, chunks_are_joined)
{
    QByteArray body;
    const auto state = decodeChunkedBody(
        "1a\r\n<?xml version=\"1.0\"?><Env>\r\n"
        "6;name=value\r\n</Env>\r\n"
        "0\r\n"
        "X-Trailer: 1\r\n\r\n",
        &body);

    ASSERT_TRUE(state == ChunkedBodyState::complete);
    ASSERT_EQ("<?xml version=\"1.0\"?><Env></Env>", body);
}

TEST(ChunkedBody, body_without_last_chunk_is_incomplete)
{
    QByteArray body;
    ASSERT_TRUE(decodeChunkedBody("", &body) == ChunkedBodyState::incomplete);
    ASSERT_TRUE(decodeChunkedBody("5\r\nab", &body) == ChunkedBodyState::incomplete);
    ASSERT_TRUE(decodeChunkedBody("5\r\nabcde\r\n", &body) == ChunkedBodyState::incomplete);
    ASSERT_TRUE(decodeChunkedBody("5\r\nabcde\r\n0", &body) == ChunkedBodyState::incomplete);
}

TEST(ChunkedBody, framing_errors_are_reported)
{
    QByteArray body;
    ASSERT_TRUE(decodeChunkedBody("xyz\r\nabc\r\n", &body) == ChunkedBodyState::malformed);
    ASSERT_TRUE(decodeChunkedBody("3\r\nabcdef\r\n0\r\n", &body)
        == ChunkedBodyState::malformed);
    ASSERT_TRUE(decodeChunkedBody("\r\n", &body) == ChunkedBodyState::malformed);
}

} // namespace test
} // namespace http
} // namespace network
} // namespace cctv
