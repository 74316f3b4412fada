#include <doctest/doctest.h>
#include <strokevault/core/Error.hpp>

using namespace SV;

TEST_CASE("Error codes describe themselves") {
    SUBCASE("code labels are stable snake_case") {
        CHECK(errorCodeToString(Error::Code::InvalidHandle) == "invalid_handle");
        CHECK(errorCodeToString(Error::Code::EmptyHistory) == "empty_history");
        CHECK(errorCodeToString(Error::Code::RenderJobCancelled) == "render_job_cancelled");
        CHECK(errorCodeToString(Error::Code::CorruptSnapshotState) == "corrupt_snapshot_state");
        CHECK(errorCodeToString(Error::Code::DecodeFailed) == "decode_failed");
    }

    SUBCASE("describeError joins label and message") {
        Error error{Error::Code::InvalidHandle, "stroke 3v1 is gone"};
        CHECK(describeError(error) == "invalid_handle:stroke 3v1 is gone");
    }

    SUBCASE("an empty message gives only the label") {
        Error error{Error::Code::MalformedInput, ""};
        CHECK(describeError(error) == "malformed_input");
    }

    SUBCASE("invalidHandleError uses the shared code") {
        auto const error = invalidHandleError("x");
        CHECK(error.code == Error::Code::InvalidHandle);
        REQUIRE(error.message.has_value());
        CHECK(*error.message == "x");
    }
}
