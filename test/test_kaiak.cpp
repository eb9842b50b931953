#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <boost/json.hpp>
#include <string>

#include "kaiak/jsonrpc.hpp"

namespace json = boost::json;
namespace rpc = kaiak::jsonrpc;

TEST_CASE("request-validate") {
  auto req = rpc::request::make("kaiak/configure", std::nullopt, json::value(1));
  CHECK_NOTHROW(req.validate());

  SUBCASE("wrong version") {
    req.jsonrpc = "1.0";
    CHECK_THROWS_WITH_AS(
        req.validate(), "Invalid JSON-RPC version", rpc::rpc_error);
  }
  SUBCASE("empty method") {
    req.method.clear();
    CHECK_THROWS_WITH_AS(
        req.validate(), "Method name cannot be empty", rpc::rpc_error);
  }
  SUBCASE("reserved prefix") {
    req.method = "rpc.discover";
    try {
      req.validate();
      FAIL("expected rpc_error");
    } catch (const rpc::rpc_error& e) {
      CHECK(e.code() == rpc::error_codes::invalid_request);
      CHECK(
          std::string{e.what()} ==
          "Method names starting with 'rpc.' are reserved");
    }
  }
}

TEST_CASE("request-notification-has-no-id") {
  auto note = rpc::request::notification("exit");
  CHECK(note.is_notification());
  auto obj = rpc::to_json(note);
  CHECK_FALSE(obj.contains("id"));
  CHECK_FALSE(obj.contains("params"));
  CHECK(obj.at("jsonrpc") == "2.0");

  auto plain = rpc::to_json(rpc::notification::make("kaiak/stream/progress"));
  CHECK_FALSE(plain.contains("id"));
}

TEST_CASE("request-roundtrip-keeps-fields") {
  json::object params;
  params["session_id"] = "s-1";
  auto req = rpc::request::make("kaiak/delete_session", params, json::value("abc"));
  auto back = rpc::parse_request(json::value(rpc::to_json(req)));
  CHECK(back.jsonrpc == "2.0");
  CHECK(back.method == "kaiak/delete_session");
  REQUIRE(back.params);
  CHECK(*back.params == json::value(params));
  REQUIRE(back.id);
  CHECK(*back.id == "abc");
}

TEST_CASE("request-null-id-is-not-a-notification") {
  auto req = rpc::parse_request(
      json::parse(R"({"jsonrpc":"2.0","method":"m","id":null})"));
  CHECK_FALSE(req.is_notification());
  auto note = rpc::parse_request(json::parse(R"({"jsonrpc":"2.0","method":"m"})"));
  CHECK(note.is_notification());
}

TEST_CASE("request-parse-rejects-bad-shapes") {
  CHECK_THROWS_AS(rpc::parse_request(json::parse("[1,2]")), rpc::rpc_error);
  CHECK_THROWS_AS(
      rpc::parse_request(json::parse(R"({"jsonrpc":"2.0","id":1})")),
      rpc::rpc_error);
  CHECK_THROWS_AS(
      rpc::parse_request(json::parse(R"({"jsonrpc":"2.0","method":3})")),
      rpc::rpc_error);
}

TEST_CASE("response-success-serialization") {
  json::object result;
  result["x"] = 1;
  auto resp = rpc::response::success(result, json::value("r1"));
  CHECK_FALSE(resp.is_error());
  CHECK(
      json::value(rpc::to_json(resp)) ==
      json::parse(R"({"jsonrpc":"2.0","result":{"x":1},"id":"r1"})"));
}

TEST_CASE("response-error-constructors") {
  auto nf = rpc::response::method_not_found("foo/bar", json::value(5));
  CHECK(
      json::value(rpc::to_json(nf)) ==
      json::parse(
          R"({"jsonrpc":"2.0","error":{"code":-32601,"message":"Method not found","data":{"method":"foo/bar"}},"id":5})"));

  auto pe = rpc::response::parse_error();
  REQUIRE(pe.error);
  CHECK(pe.error->code == -32700);
  CHECK(pe.error->message == "Parse error");
  CHECK_FALSE(pe.id);

  auto ir = rpc::response::invalid_request(json::value(2));
  CHECK(ir.error->code == -32600);
  CHECK(ir.error->message == "Invalid Request");

  auto ip = rpc::response::invalid_params("missing session_id", json::value(3));
  CHECK(ip.error->code == -32602);
  CHECK(ip.error->message == "Invalid params: missing session_id");
  CHECK_FALSE(ip.error->data);

  auto ie = rpc::response::internal_error("boom", json::value(4));
  CHECK(ie.error->code == -32603);
  CHECK(ie.error->message == "Internal error: boom");

  auto obj = rpc::to_json(ie);
  CHECK_FALSE(obj.contains("result"));
  CHECK_FALSE(obj.at("error").as_object().contains("data"));
}

TEST_CASE("response-parse") {
  auto ok = rpc::parse_response(
      json::parse(R"({"jsonrpc":"2.0","result":null,"id":"a"})"));
  REQUIRE(ok.result);
  CHECK(ok.result->is_null());
  CHECK_FALSE(ok.is_error());

  auto err = rpc::parse_response(json::parse(
      R"({"jsonrpc":"2.0","error":{"code":-32003,"message":"gone","data":{"k":1}},"id":7})"));
  REQUIRE(err.error);
  CHECK(err.error->code == -32003);
  CHECK(err.error->message == "gone");
  REQUIRE(err.error->data);
  CHECK(err.error->data->as_object().at("k") == 1);
}

TEST_CASE("progress-notification") {
  auto note = rpc::notification::progress("tok", json::value(42));
  CHECK(note.method == "$/progress");
  REQUIRE(note.params);
  CHECK(
      *note.params == json::parse(R"({"token":"tok","value":42})"));
}

TEST_CASE("custom-error-object") {
  auto err = rpc::error_object::custom(-32050, "custom", json::value("d"));
  auto obj = rpc::to_json(err);
  CHECK(obj.at("code") == -32050);
  CHECK(obj.at("message") == "custom");
  CHECK(obj.at("data") == "d");
}

TEST_CASE("batch-shapes") {
  auto reqs = rpc::parse_batch(json::parse(
      R"([{"jsonrpc":"2.0","method":"a","id":1},{"jsonrpc":"2.0","method":"b"}])"));
  REQUIRE(reqs.size() == 2);
  CHECK(reqs[0].method == "a");
  CHECK(reqs[1].is_notification());
  CHECK(rpc::to_json(reqs).size() == 2);
  CHECK_THROWS_AS(rpc::parse_batch(json::parse("{}")), rpc::rpc_error);
}

TEST_CASE("parse-text-errors") {
  try {
    rpc::parse_text("{not json");
    FAIL("expected rpc_error");
  } catch (const rpc::rpc_error& e) {
    CHECK(e.code() == rpc::error_codes::parse_error);
  }
  CHECK(rpc::parse_text(R"({"a":1})").as_object().at("a") == 1);
}
