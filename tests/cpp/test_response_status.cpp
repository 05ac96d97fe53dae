#include <gtest/gtest.h>
#include "client/response_status.hpp"
#include "errors.hpp"

#include <string>
#include <vector>

using namespace imgen_core;

namespace {

std::vector<uint8_t> body_of(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

template <typename Error>
void expect_status_maps_to(int status) {
    const auto body = body_of(R"({"statusCode":)" + std::to_string(status) + R"(,"message":"nope"})");
    try {
        client::check_response(status, "application/json", body);
        FAIL() << "expected an error for status " << status;
    } catch (const Error& e) {
        EXPECT_EQ(e.status(), status);
        EXPECT_NE(std::string(e.what()).find("\"message\": \"nope\""), std::string::npos) << e.what();
    }
}

} // namespace

// --------------------------------------------------------------------------
// Success
// --------------------------------------------------------------------------
TEST(ResponseStatusTest, SuccessWithBodyPasses) {
    EXPECT_NO_THROW(client::check_response(200, "application/x-zip-compressed", body_of("PK")));
    EXPECT_NO_THROW(client::check_response(201, "", body_of("x")));
}

TEST(ResponseStatusTest, SuccessWithEmptyBodyFails) {
    EXPECT_THROW(client::check_response(200, "application/json", {}), TransportError);
}

// --------------------------------------------------------------------------
// Status mapping
// --------------------------------------------------------------------------
TEST(ResponseStatusTest, MapsKnownStatuses) {
    expect_status_maps_to<ApiError>(400);
    expect_status_maps_to<AuthError>(401);
    expect_status_maps_to<AuthError>(402);
    expect_status_maps_to<ConflictError>(409);
    expect_status_maps_to<RateLimitError>(429);
}

TEST(ResponseStatusTest, UnknownStatusIsGenericTransportError) {
    try {
        client::check_response(503, "text/plain", body_of("down"));
        FAIL() << "expected TransportError";
    } catch (const RateLimitError&) {
        FAIL() << "503 is not a rate limit";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.status(), 503);
        EXPECT_NE(std::string(e.what()).find("Unknown error (Status: 503)"), std::string::npos);
    }
}

// --------------------------------------------------------------------------
// Error body rendering
// --------------------------------------------------------------------------
TEST(ResponseStatusTest, JsonBodyIsIndented) {
    EXPECT_EQ(client::describe_error_body(body_of(R"({"a":1})")), "{\n  \"a\": 1\n}");
}

TEST(ResponseStatusTest, RawBodyQuoteIsBounded) {
    const std::string raw(2000, 'x');
    const std::string description = client::describe_error_body(body_of("<html>" + raw));

    EXPECT_EQ(description.rfind("Unable to parse error response. Raw content: <html>", 0), 0u);
    EXPECT_EQ(description.size(),
              std::string("Unable to parse error response. Raw content: ").size() + client::MAX_QUOTED_ERROR_BYTES);
}
