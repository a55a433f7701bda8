#include "netapp/control_command.hpp"

#include "netapp/errors.hpp"

namespace netapp {

std::string to_string(ControlCmdType type) {
  switch (type) {
    case ControlCmdType::SET_STATE:
      return "set_state";
    case ControlCmdType::GET_STATE:
      return "get_state";
    case ControlCmdType::RESET_STATE:
      return "reset_state";
  }
  throw std::invalid_argument("Invalid control command type");
}

ControlCmdType control_cmd_type_from_string(const std::string& name) {
  if (name == "set_state") {
    return ControlCmdType::SET_STATE;
  } else if (name == "get_state") {
    return ControlCmdType::GET_STATE;
  } else if (name == "reset_state") {
    return ControlCmdType::RESET_STATE;
  }
  throw CodecError("Unknown control command '" + name + "'");
}

void to_json(nlohmann::json& j, const ControlCommand& cmd) {
  j = nlohmann::json{{"cmd_type", to_string(cmd.type)},
                     {"clear_queue", cmd.clear_queue},
                     {"data", cmd.data}};
}

void from_json(const nlohmann::json& j, ControlCommand& cmd) {
  try {
    cmd.type = control_cmd_type_from_string(j.at("cmd_type").get<std::string>());
    cmd.clear_queue = j.value("clear_queue", false);
    cmd.data        = j.value("data", nlohmann::json::object());
  } catch (const nlohmann::json::exception& ex) {
    throw CodecError(std::string("Malformed control command: ") + ex.what());
  }
}

std::ostream& operator<<(std::ostream& os, const ControlCommand& cmd) {
  os << to_string(cmd.type) << (cmd.clear_queue ? " (clear queue) " : " ")
     << cmd.data.dump();
  return os;
}

}  // namespace netapp
