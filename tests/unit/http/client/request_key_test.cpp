#include <catch2/catch_test_macros.hpp>
#include <tether/http/client/request_key.hpp>
#include <unordered_set>

using namespace tether::http;

TEST_CASE("Request key from request", "[client][request_key][unit]") {

    SECTION("implicit port stays absent") {
        http_request req(method::GET, "http://example.com/path");
        auto key = request_key::from_request(req);
        REQUIRE(key.scheme() == "http");
        REQUIRE(key.host() == "example.com");
        REQUIRE_FALSE(key.port());
        REQUIRE_FALSE(key.is_secure());
    }

    SECTION("explicit port is kept") {
        http_request req(method::GET, "https://example.com:8443/");
        auto key = request_key::from_request(req);
        REQUIRE(key.is_secure());
        REQUIRE(key.port() == uint16_t{8443});
    }

    SECTION("path, query and method do not take part") {
        http_request a(method::GET, "http://example.com/a?x=1");
        http_request b(method::POST, "http://example.com/b");
        REQUIRE(request_key::from_request(a) == request_key::from_request(b));
    }
}

TEST_CASE("Request key equality and hashing", "[client][request_key][unit]") {

    SECTION("scheme and host compare case-insensitively") {
        request_key a("HTTP", "Example.com");
        request_key b("http", "example.COM");
        REQUIRE(a == b);
        REQUIRE(hash_value(a) == hash_value(b));
    }

    SECTION("explicit default port differs from implicit port") {
        request_key implicit("http", "example.com");
        request_key explicit_port("http", "example.com", 80);
        REQUIRE(implicit != explicit_port);
    }

    SECTION("scheme partitions keys") {
        REQUIRE(request_key("http", "example.com") != request_key("https", "example.com"));
    }

    SECTION("usable in unordered containers") {
        std::unordered_set<request_key> keys;
        keys.insert(request_key("http", "a.com"));
        keys.insert(request_key("http", "A.com"));
        keys.insert(request_key("http", "a.com", 8080));
        REQUIRE(keys.size() == 2);
    }
}

TEST_CASE("Request key formatting", "[client][request_key][unit]") {
    REQUIRE(request_key("http", "example.com").to_string() == "http://example.com");
    REQUIRE(request_key("https", "example.com", 8443).to_string() == "https://example.com:8443");
    REQUIRE(request_key("http", "::1", 8080).to_string() == "http://[::1]:8080");
}
