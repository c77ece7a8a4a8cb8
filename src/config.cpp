/**
 * @file config.cpp
 * @brief Board configuration implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "capulin/config.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>

#include "log.hpp"

namespace capulin
{

void MapConfigSource::set(const std::string& section, const std::string& key,
                          const std::string& value)
{
  values_[std::make_pair(section, key)] = value;
}

const std::string* MapConfigSource::find(const std::string& section,
                                         const std::string& key) const
{
  auto it = values_.find(std::make_pair(section, key));
  return it == values_.end() ? nullptr : &it->second;
}

int MapConfigSource::read_int(const std::string& section, const std::string& key,
                              int default_value) const
{
  const std::string* value = find(section, key);
  if (value == nullptr || value->empty())
  {
    return default_value;
  }

  errno = 0;
  char* end = nullptr;
  const long parsed = std::strtol(value->c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX)
  {
    CAPULIN_LOG(LWarn, "[%s] %s: '%s' is not an integer, using %d", section.c_str(),
                key.c_str(), value->c_str(), default_value);
    return default_value;
  }
  return static_cast<int>(parsed);
}

bool MapConfigSource::read_bool(const std::string& section, const std::string& key,
                                bool default_value) const
{
  const std::string* value = find(section, key);
  if (value == nullptr)
  {
    return default_value;
  }
  if (*value == "true" || *value == "yes" || *value == "1")
  {
    return true;
  }
  if (*value == "false" || *value == "no" || *value == "0")
  {
    return false;
  }
  return default_value;
}

std::string MapConfigSource::read_string(const std::string& section, const std::string& key,
                                         const std::string& default_value) const
{
  const std::string* value = find(section, key);
  return value == nullptr ? default_value : *value;
}

ControlBoardConfig load_control_board_config(const ConfigSource& source)
{
  ControlBoardConfig config;

  config.simulation_data_source =
      source.read_string("Hardware", "Simulation Data Source File Path", "");

  config.encoder1_delta_trigger =
      source.read_int("Hardware", "Encoder 1 Delta Count Trigger", config.encoder1_delta_trigger);
  config.encoder2_delta_trigger =
      source.read_int("Hardware", "Encoder 2 Delta Count Trigger", config.encoder2_delta_trigger);

  return config;
}

void load_control_board_extended_config(const ConfigSource& source, int chassis, int slot,
                                        ControlBoardConfig& config)
{
  const std::string section =
      "Control Board in Chassis " + std::to_string(chassis) + " Slot " + std::to_string(slot);

  config.position_tracking_mode =
      source.read_string(section, "Position Tracking Mode", "Send Clock Markers");

  config.audible_alarm_controller = source.read_bool(section, "Audible Alarm Module", false);

  config.audible_alarm_output_channel =
      source.read_int(section, "Audible Alarm Output Channel", 0);

  config.audible_alarm_pulse_duration =
      source.read_string(section, "Audible Alarm Pulse Duration", "1");
}

CutterBoardConfig load_cutter_board_config(const ConfigSource& source)
{
  CutterBoardConfig config;
  config.simulation_data_source =
      source.read_string("Hardware", "Simulation Data Source File Path", "");
  return config;
}

ControlPacketIds command_echo_packet_ids()
{
  ControlPacketIds ids;
  ids.status = static_cast<uint8_t>(ControlCommand::GET_STATUS);
  ids.inspect = static_cast<uint8_t>(ControlCommand::GET_INSPECT_PACKET);
  ids.monitor = static_cast<uint8_t>(ControlCommand::GET_MONITOR_PACKET);
  ids.chassis_slot = static_cast<uint8_t>(ControlCommand::GET_CHASSIS_SLOT_ADDRESS);
  ids.all_encoders = static_cast<uint8_t>(ControlCommand::GET_ALL_ENCODER_VALUES);
  return ids;
}

uint16_t parse_position_tracking_mode(const std::string& mode)
{
  if (mode == "Send Clock Markers")
  {
    return FLAG_SEND_CLOCK_MARKERS;
  }
  if (mode == "Send TDC Markers")
  {
    return FLAG_SEND_TDC;
  }
  CAPULIN_LOG(LWarn, "Unknown position tracking mode '%s'", mode.c_str());
  return 0;
}

}  // namespace capulin
