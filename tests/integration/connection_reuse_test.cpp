#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <thread>
#include <vector>
#include <tether/http_client.hpp>
#include <fixtures/content_length_codec.hpp>
#include <fixtures/loopback_server.hpp>
#include <fixtures/run_sync.hpp>

using namespace tether;
using namespace std::chrono_literals;
using tether::test::loopback_server;
using tether::test::run_sync;

namespace {

struct loopback_client {
    boost::asio::io_context io_context;
    http::http_client client{io_context,
                             std::make_shared<test::simple_request_encoder>(),
                             std::make_shared<test::content_length_parser>()};

    loopback_client() {
        client.timeout(2s).idle_timeout(2s);
    }

    std::pair<int, http::reusable> get(const std::string& url) {
        auto exchange = run_sync(io_context, client.send(client.create_request(http::method::GET, url)));
        int status = exchange.status_code();
        auto decision = run_sync(io_context, exchange.finish());
        return {status, decision};
    }
};

template<typename Counter>
awaitable<void> send_and_finish(http::http_client& client, std::string url, Counter& completed) {
    auto exchange = co_await client.send(client.create_request(http::method::GET, url));
    co_await exchange.finish();
    ++completed;
}

}

TEST_CASE("Keep-alive connection reuse over loopback", "[client][pool][integration]") {
    loopback_server server([](const std::string& request) {
        return loopback_server::ok_response(request.substr(0, request.find("\r\n")));
    });
    loopback_client c;

    SECTION("sequential requests share one connection") {
        for (int i = 0; i < 3; ++i) {
            auto [status, decision] = c.get(server.url("/item/" + std::to_string(i)));
            REQUIRE(status == 200);
            REQUIRE(decision == http::reusable::reuse);
        }
        REQUIRE(server.accepted == 1);
        REQUIRE(server.requests == 3);
        REQUIRE(c.client.pool_size() == 1);
    }

    SECTION("response body is delivered") {
        auto exchange = run_sync(c.io_context, c.client.send(c.client.create_request(http::method::GET, server.url("/echo"))));
        REQUIRE(exchange.response().get_content() == "GET /echo HTTP/1.1");
        run_sync(c.io_context, exchange.finish());
    }

    SECTION("request body is sent") {
        auto request = c.client.create_request(http::method::POST, server.url("/upload"));
        request->set_content("payload", "text/plain");
        auto exchange = run_sync(c.io_context, c.client.send(request));
        REQUIRE(exchange.status_code() == 200);
        run_sync(c.io_context, exchange.finish());
        REQUIRE(c.get(server.url("/after")).second == http::reusable::reuse);
        REQUIRE(server.accepted == 1);
    }

    SECTION("abandoned exchange forces a new connection") {
        {
            auto exchange = run_sync(c.io_context, c.client.send(c.client.create_request(http::method::GET, server.url("/"))));
        }
        c.get(server.url("/"));
        REQUIRE(server.accepted == 2);
    }
}

TEST_CASE("Connection close over loopback", "[client][pool][integration]") {

    SECTION("server Connection: close prevents reuse") {
        loopback_server server([](const std::string&) {
            return loopback_server::ok_response("bye", "Connection: close\r\n");
        });
        loopback_client c;
        REQUIRE(c.get(server.url("/")).second == http::reusable::dont_reuse);
        REQUIRE(c.get(server.url("/")).second == http::reusable::dont_reuse);
        REQUIRE(server.accepted == 2);
        REQUIRE(c.client.pool_size() == 0);
    }

    SECTION("server closing an idle connection triggers a transparent retry") {
        loopback_server server([](const std::string&) { return loopback_server::ok_response("ok"); });
        server.close_after_response = true;
        loopback_client c;

        REQUIRE(c.get(server.url("/")).second == http::reusable::reuse);
        REQUIRE(c.client.pool_size() == 1);
        REQUIRE(server.wait_for_closed(1));

        auto [status, decision] = c.get(server.url("/"));
        REQUIRE(status == 200);
        REQUIRE(decision == http::reusable::reuse);
        REQUIRE(server.accepted == 2);
    }

    SECTION("server sending a timeout notice before closing an idle connection triggers a retry") {
        loopback_server server([](const std::string&) { return loopback_server::ok_response("ok"); },
                               "HTTP/1.1 408 Request Timeout\r\nConnection: close\r\nContent-Length: 0\r\n\r\n");
        server.close_after_response = true;
        loopback_client c;

        REQUIRE(c.get(server.url("/")).second == http::reusable::reuse);
        REQUIRE(server.wait_for_closed(1));

        auto [status, decision] = c.get(server.url("/"));
        REQUIRE(status == 200);
        REQUIRE(decision == http::reusable::reuse);
        REQUIRE(server.accepted == 2);
    }
}

TEST_CASE("Concurrent requests over loopback", "[client][pool][integration]") {
    loopback_server server([](const std::string&) { return loopback_server::ok_response("ok"); });
    loopback_client c;
    const int concurrent = 4;
    int completed = 0;

    for (int i = 0; i < concurrent; ++i) {
        co_spawn(c.io_context, send_and_finish(c.client, server.url("/"), completed), detached);
    }
    c.io_context.restart();
    c.io_context.run();

    REQUIRE(completed == concurrent);
    REQUIRE(c.client.get_pool().leased() == 0);
    REQUIRE(c.client.pool_size() == static_cast<size_t>(server.accepted.load()));

    // a second round only uses pooled connections
    auto before = server.accepted.load();
    c.get(server.url("/"));
    REQUIRE(server.accepted == before);
}

TEST_CASE("Concurrent requests on a multi-threaded io_context", "[client][pool][integration]") {
    loopback_server server([](const std::string&) { return loopback_server::ok_response("ok"); });
    loopback_client c;
    c.client.timeout(5s).idle_timeout(1s);
    const int total = 64;
    std::atomic<int> completed{0};

    for (int i = 0; i < total; ++i) {
        co_spawn(c.io_context, send_and_finish(c.client, server.url("/"), completed), detached);
    }

    c.io_context.restart();
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&c]() { c.io_context.run(); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(completed == total);
    REQUIRE(c.client.get_pool().leased() == 0);
    REQUIRE(c.client.pool_size() == static_cast<size_t>(server.accepted.load()));
}
