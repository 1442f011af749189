/**
 * @file test_result_dispatcher.cpp
 * @brief Tests for ResultDispatcher and numeric rendering.
 */

#include "isv/result_dispatcher.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using isv::DispatchError;
using isv::ResultDispatcher;
using isv_test::RecordingInteractions;

namespace {

std::vector<std::string> DispatchOne(const isv::InterpretOutcome& outcome,
                                     bool expect_ok = true) {
  RecordingInteractions listener;
  auto r = ResultDispatcher::Dispatch(outcome, listener);
  REQUIRE(r.has_value() == expect_ok);
  return listener.Events();
}

}  // namespace

TEST_CASE("Dispatch NoValue notifies void", "[dispatcher]") {
  REQUIRE(DispatchOne(isv::NoValue{}) == std::vector<std::string>{"void"});
}

TEST_CASE("Dispatch ObjectValue renders text as-is", "[dispatcher]") {
  REQUIRE(DispatchOne(isv::ObjectValue{"[1, 2]"}) ==
          std::vector<std::string>{"result:object:[1, 2]"});
}

TEST_CASE("Dispatch StringValue wraps in double quotes", "[dispatcher]") {
  REQUIRE(DispatchOne(isv::StringValue{"hi"}) ==
          std::vector<std::string>{"result:string:\"hi\""});
}

TEST_CASE("Dispatch CharValue wraps in single quotes", "[dispatcher]") {
  REQUIRE(DispatchOne(isv::CharValue{"c"}) ==
          std::vector<std::string>{"result:character:'c'"});
}

TEST_CASE("Dispatch CharValue keeps a multi-byte character whole", "[dispatcher]") {
  // U+00E9 and U+20AC
  REQUIRE(DispatchOne(isv::CharValue{"\xC3\xA9"}) ==
          std::vector<std::string>{"result:character:'\xC3\xA9'"});
  REQUIRE(DispatchOne(isv::CharValue{"\xE2\x82\xAC"}) ==
          std::vector<std::string>{"result:character:'\xE2\x82\xAC'"});
}

TEST_CASE("Dispatch NumberValue uses the number style", "[dispatcher]") {
  REQUIRE(DispatchOne(isv::NumberValue{int64_t{-42}}) ==
          std::vector<std::string>{"result:number:-42"});
  REQUIRE(DispatchOne(isv::NumberValue{2.5}) ==
          std::vector<std::string>{"result:number:2.5"});
}

TEST_CASE("Dispatch BooleanValue renders with the object style", "[dispatcher]") {
  REQUIRE(DispatchOne(isv::BooleanValue{true}) ==
          std::vector<std::string>{"result:object:true"});
  REQUIRE(DispatchOne(isv::BooleanValue{false}) ==
          std::vector<std::string>{"result:object:false"});
}

TEST_CASE("Dispatch ExceptionValue notifies the message", "[dispatcher]") {
  REQUIRE(DispatchOne(isv::ExceptionValue{"ArithmeticException: / by zero"}) ==
          std::vector<std::string>{"exception:ArithmeticException: / by zero"});
}

TEST_CASE("Dispatch Busy notifies void then reports busy", "[dispatcher]") {
  RecordingInteractions listener;
  auto r = ResultDispatcher::Dispatch(isv::Busy{}, listener);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == DispatchError::kWorkerBusy);
  REQUIRE(listener.Events() == std::vector<std::string>{"void"});
}

TEST_CASE("Dispatch UnexpectedFailure notifies void then reports a fault",
          "[dispatcher]") {
  RecordingInteractions listener;
  auto r = ResultDispatcher::Dispatch(isv::UnexpectedFailure{"oops"}, listener);
  REQUIRE(r.get_error() == DispatchError::kWorkerFault);
  REQUIRE(listener.Events() == std::vector<std::string>{"void"});
}

TEST_CASE("RenderNumber keeps a fraction on whole doubles", "[dispatcher]") {
  REQUIRE(isv::RenderNumber(isv::NumberValue{4.0}) == "4.0");
  REQUIRE(isv::RenderNumber(isv::NumberValue{-0.125}) == "-0.125");
  REQUIRE(isv::RenderNumber(isv::NumberValue{1e20}) == "1e+20");
  REQUIRE(isv::RenderNumber(isv::NumberValue{int64_t{0}}) == "0");
}

TEST_CASE("RenderNumber keeps every digit needed to reproduce the value",
          "[dispatcher]") {
  REQUIRE(isv::RenderNumber(isv::NumberValue{0.1 + 0.2}) == "0.30000000000000004");
  REQUIRE(isv::RenderNumber(isv::NumberValue{1.0000000000000002}) ==
          "1.0000000000000002");
  REQUIRE(isv::RenderNumber(isv::NumberValue{0.1}) == "0.1");
  REQUIRE(isv::RenderNumber(isv::NumberValue{1.0 / 3.0}) == "0.3333333333333333");
}
