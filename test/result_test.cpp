#include <catch2/catch_test_macros.hpp>
#include <glide/result.hpp>

namespace glide {

TEST_CASE("result formatting", "[result]") {
  Result ok = Result::ok();
  CHECK(ok);
  CHECK(ok.to_string() == "OK");

  Result bare = Result::error(ErrorCode::InvalidHandle);
  CHECK_FALSE(bare);
  CHECK(bare.code == ErrorCode::InvalidHandle);
  CHECK(bare.to_string() == "InvalidHandle");

  Result detailed =
      Result::error(ErrorCode::InvalidConfig, "radius must be positive");
  CHECK_FALSE(detailed);
  CHECK(detailed.to_string() ==
        "InvalidConfig. Reason: radius must be positive.");
}

TEST_CASE("error code names", "[result]") {
  CHECK(error_to_string(ErrorCode::Unknown) == "Unknown");
  CHECK(error_to_string(ErrorCode::InvalidShape) == "InvalidShape");
  CHECK(error_to_string(ErrorCode::TooManyBody) == "TooManyBody");
  CHECK(error_to_string(ErrorCode::QueryFail) == "QueryFail");
  CHECK(error_to_string(static_cast<ErrorCode>(99)) == "Unknown");
}

}  // namespace glide
