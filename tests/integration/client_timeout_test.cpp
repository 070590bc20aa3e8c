#include <catch2/catch_test_macros.hpp>
#include <tether/http_client.hpp>
#include <fixtures/content_length_codec.hpp>
#include <fixtures/loopback_server.hpp>
#include <fixtures/run_sync.hpp>

using namespace tether;
using namespace std::chrono_literals;
using tether::test::loopback_server;
using tether::test::run_sync;

namespace {

http::client_error send_failure(http::http_client& client, boost::asio::io_context& io_context,
                                const std::string& url) {
    try {
        run_sync(io_context, client.send(client.create_request(http::method::GET, url)));
    } catch (const http::exchange_error& e) {
        return static_cast<http::client_error>(e.code().value());
    }
    FAIL("expected exchange_error");
    return http::client_error::malformed_response;
}

}

TEST_CASE("Client failures over loopback", "[client][timeout][integration]") {
    boost::asio::io_context io_context;
    http::http_client client(io_context,
                             std::make_shared<test::simple_request_encoder>(),
                             std::make_shared<test::content_length_parser>());

    SECTION("incomplete response header hits the idle timeout") {
        loopback_server server([](const std::string&) { return std::string{"HTTP/1.1 200 OK\r\n"}; });
        client.idle_timeout(50ms).timeout(5s);
        REQUIRE(send_failure(client, io_context, server.url("/")) == http::client_error::read_timeout);
        REQUIRE(client.pool_size() == 0);
    }

    SECTION("incomplete response header hits the exchange timeout") {
        loopback_server server([](const std::string&) { return std::string{"HTTP/1.1 200 OK\r\n"}; });
        client.idle_timeout(0ms).timeout(50ms);
        REQUIRE(send_failure(client, io_context, server.url("/")) == http::client_error::exchange_timeout);
    }

    SECTION("server hanging up mid header is a malformed response") {
        loopback_server server([](const std::string&) { return std::string{"HTTP/1.1 200 OK\r\n"}; });
        server.close_after_response = true;
        client.idle_timeout(2s);
        REQUIRE(send_failure(client, io_context, server.url("/")) == http::client_error::malformed_response);
    }

    SECTION("oversized response header") {
        loopback_server server([](const std::string&) {
            return loopback_server::ok_response("", "X-Padding: " + std::string(1024, 'x') + "\r\n");
        });
        client.max_response_header_size(256).idle_timeout(2s);
        REQUIRE(send_failure(client, io_context, server.url("/")) == http::client_error::response_header_too_large);
    }

    SECTION("refused connection reports the connect phase") {
        uint16_t port;
        {
            boost::asio::ip::tcp::acceptor acceptor(io_context, {boost::asio::ip::make_address("127.0.0.1"), 0});
            port = acceptor.local_endpoint().port();
        }
        try {
            run_sync(io_context, client.send(client.create_request(http::method::GET,
                                                                   "http://127.0.0.1:" + std::to_string(port) + "/")));
            FAIL("expected exchange_error");
        } catch (const http::exchange_error& e) {
            REQUIRE(e.phase() == http::exchange_phase::connect);
            REQUIRE(e.code() == boost::asio::error::connection_refused);
            REQUIRE_FALSE(e.retryable());
        }
    }
}
