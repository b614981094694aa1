#include <catch2/catch_test_macros.hpp>
#include "utils/HttpCommon.hpp"

using translate::parse_retry_after;

TEST_CASE("Retry-After delta seconds are parsed", "[translate][http]")
{
    REQUIRE(parse_retry_after("5") == 5.0);
    REQUIRE(parse_retry_after("  12 ") == 12.0);
    REQUIRE(parse_retry_after("0") == 0.0);
}

TEST_CASE("Retry-After values that are not delta seconds are ignored", "[translate][http]")
{
    REQUIRE(parse_retry_after("") == 0.0);
    REQUIRE(parse_retry_after("   ") == 0.0);
    REQUIRE(parse_retry_after("Wed, 21 Oct 2015 07:28:00 GMT") == 0.0);
    REQUIRE(parse_retry_after("-3") == 0.0);
    REQUIRE(parse_retry_after("1.5") == 0.0);
}

TEST_CASE("Retry-After is capped", "[translate][http]")
{
    REQUIRE(parse_retry_after("86400") == 600.0);
}

TEST_CASE("HttpResponse ok covers status and transport errors", "[translate][http]")
{
    translate::HttpResponse response;
    response.status_code = 200;
    REQUIRE(response.ok());
    response.error = "Couldn't connect to server";
    REQUIRE_FALSE(response.ok());
    response.error.clear();
    response.status_code = 503;
    REQUIRE_FALSE(response.ok());
}
