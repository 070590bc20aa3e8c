#include <catch2/catch_test_macros.hpp>
#include <tether/http/common/http_response.hpp>

using namespace tether::http;

TEST_CASE("HTTP Response status", "[http][response][unit]") {
    http_response res;

    SECTION("set_status with enum") {
        res.set_status(http_response::status::not_found);
        REQUIRE(res.get_status() == http_response::status::not_found);
        REQUIRE(res.get_status_code() == 404);
        REQUIRE_FALSE(res.is_ok());
    }

    SECTION("set_status with code") {
        res.set_status(uint16_t{201});
        REQUIRE(res.get_status() == http_response::status::created);
        REQUIRE(res.is_ok());
    }

    SECTION("redirect responses") {
        for (uint16_t code : {301, 302, 303, 307, 308}) {
            res.set_status(code);
            REQUIRE(res.is_redirect_response());
        }
        res.set_status(uint16_t{304});
        REQUIRE_FALSE(res.is_redirect_response());
    }

    SECTION("reason phrase") {
        res.set_reason_phrase("Not Found");
        REQUIRE(res.get_reason_phrase() == "Not Found");
    }
}

TEST_CASE("HTTP Response content", "[http][response][unit]") {
    http_response res;

    SECTION("empty by default") {
        REQUIRE(res.get_content().empty());
        REQUIRE(res.get_content_size() == 0);
    }

    SECTION("set and append content") {
        res.set_content("hello");
        res.append_content(" world");
        REQUIRE(res.get_content() == "hello world");
        REQUIRE(res.get_content_size() == 11);
    }
}
