#include <catch2/catch.hpp>

#include "inference/inference_transport.h"

#include <nlohmann/json.hpp>

using namespace infergate;
using json = nlohmann::json;

TEST_CASE("ParseOpenAiReply reads chat and text choices", "[server_transport]") {
  auto chat = ParseOpenAiReply(
      json::parse(R"({"choices":[{"message":{"role":"assistant","content":"hi"},
                                  "finish_reason":"stop"}],
                      "usage":{"prompt_tokens":3,"completion_tokens":1}})"),
      true);
  REQUIRE(chat.ok);
  REQUIRE(chat.content == "hi");
  REQUIRE(chat.finish_reason == "stop");
  REQUIRE(chat.total_tokens == 4);

  auto text = ParseOpenAiReply(
      json::parse(R"({"choices":[{"text":"done","finish_reason":"length"}]})"),
      false);
  REQUIRE(text.ok);
  REQUIRE(text.content == "done");
  REQUIRE(text.finish_reason == "length");
}

TEST_CASE("ParseOpenAiReply tolerates mistyped fields", "[server_transport]") {
  auto null_message = ParseOpenAiReply(
      json::parse(R"({"choices":[{"message":null,"finish_reason":"stop"}]})"),
      true);
  REQUIRE(null_message.ok);
  REQUIRE(null_message.content.empty());

  auto string_message = ParseOpenAiReply(
      json::parse(R"({"choices":[{"message":"oops"}],
                      "usage":{"prompt_tokens":"7","completion_tokens":null}})"),
      true);
  REQUIRE(string_message.ok);
  REQUIRE(string_message.content.empty());
  REQUIRE(string_message.prompt_tokens == 0);
  REQUIRE(string_message.completion_tokens == 0);

  auto no_choices = ParseOpenAiReply(json::parse(R"({"choices":null})"), true);
  REQUIRE_FALSE(no_choices.ok);
  REQUIRE(no_choices.error == "reply has no choices");

  REQUIRE_FALSE(ParseOpenAiReply(json::array(), true).ok);
}
