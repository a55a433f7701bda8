#ifndef CONTROL_COMMAND_HPP_E8VKD2RA
#define CONTROL_COMMAND_HPP_E8VKD2RA

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace netapp {

/// Channel control commands are sent on
constexpr const char* COMMAND_CHANNEL = "command";
/// Channel the NetApp answers successful commands on
constexpr const char* COMMAND_RESULT_CHANNEL = "control_cmd_result";
/// Channel the NetApp reports failed commands on
constexpr const char* COMMAND_ERROR_CHANNEL = "control_cmd_error";

enum class ControlCmdType { SET_STATE, GET_STATE, RESET_STATE };

std::string to_string(ControlCmdType type);

/**
 * @throws CodecError for unknown command names
 */
ControlCmdType control_cmd_type_from_string(const std::string& name);

/**
 * @brief   Command that changes or queries the state of the NetApp. Travels as
 * JSON `{"cmd_type": ..., "clear_queue": ..., "data": ...}`.
 */
struct ControlCommand {
  ControlCmdType type = ControlCmdType::GET_STATE;
  bool clear_queue    = false;  ///< drop frames the NetApp has not processed yet
  nlohmann::json data = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const ControlCommand& cmd);

/**
 * @throws CodecError if a field is missing or has the wrong type
 */
void from_json(const nlohmann::json& j, ControlCommand& cmd);

std::ostream& operator<<(std::ostream& os, const ControlCommand& cmd);

}  // namespace netapp

#endif /* end of include guard: CONTROL_COMMAND_HPP_E8VKD2RA */
