#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "netapp/control_command.hpp"
#include "netapp/errors.hpp"

using namespace netapp;

TEST_CASE("Control command names", "[command]") {
  for (auto type : {ControlCmdType::SET_STATE, ControlCmdType::GET_STATE,
                    ControlCmdType::RESET_STATE}) {
    CHECK(control_cmd_type_from_string(to_string(type)) == type);
  }
  CHECK(to_string(ControlCmdType::SET_STATE) == "set_state");
  CHECK_THROWS_AS(control_cmd_type_from_string("SET_STATE"), CodecError);
}

TEST_CASE("Control command JSON", "[command]") {
  SECTION("fields on the wire") {
    ControlCommand cmd;
    cmd.type        = ControlCmdType::SET_STATE;
    cmd.clear_queue = true;
    cmd.data        = {{"h264", true}, {"fps", 30}};
    const nlohmann::json j = cmd;
    CHECK(j == nlohmann::json{{"cmd_type", "set_state"},
                              {"clear_queue", true},
                              {"data", {{"h264", true}, {"fps", 30}}}});
  }

  SECTION("parsed from a NetApp answer") {
    const auto j = nlohmann::json::parse(
        R"({"cmd_type": "reset_state", "clear_queue": false, "data": {"x": 1}})");
    const auto cmd = j.get<ControlCommand>();
    CHECK(cmd.type == ControlCmdType::RESET_STATE);
    CHECK_FALSE(cmd.clear_queue);
    CHECK(cmd.data == nlohmann::json{{"x", 1}});
  }

  SECTION("optional fields default") {
    const auto cmd = nlohmann::json{{"cmd_type", "get_state"}}.get<ControlCommand>();
    CHECK(cmd.type == ControlCmdType::GET_STATE);
    CHECK_FALSE(cmd.clear_queue);
    CHECK(cmd.data == nlohmann::json::object());
  }

  SECTION("unknown command") {
    const nlohmann::json j{{"cmd_type", "explode"}};
    CHECK_THROWS_AS(j.get<ControlCommand>(), CodecError);
  }

  SECTION("missing command") {
    const nlohmann::json j{{"clear_queue", true}};
    CHECK_THROWS_AS(j.get<ControlCommand>(), CodecError);
  }

  SECTION("wrong field types") {
    CHECK_THROWS_AS(nlohmann::json({{"cmd_type", 3}}).get<ControlCommand>(),
                    CodecError);
    CHECK_THROWS_AS(
        nlohmann::json({{"cmd_type", "get_state"}, {"clear_queue", "yes"}})
            .get<ControlCommand>(),
        CodecError);
    CHECK_THROWS_AS(nlohmann::json::array({1, 2}).get<ControlCommand>(),
                    CodecError);
  }
}
