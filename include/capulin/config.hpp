/**
 * @file config.hpp
 * @brief Board configuration
 *
 * The application owns the configuration store. Boards read their tuning
 * values through ConfigSource by section and key.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>

#include "capulin/protocol.hpp"

namespace capulin
{

/**
 * @brief Read-only key-value configuration store
 */
class ConfigSource
{
 public:
  virtual ~ConfigSource() = default;

  virtual int read_int(const std::string& section, const std::string& key,
                       int default_value) const = 0;

  virtual bool read_bool(const std::string& section, const std::string& key,
                         bool default_value) const = 0;

  virtual std::string read_string(const std::string& section, const std::string& key,
                                  const std::string& default_value) const = 0;
};

/**
 * @brief In-memory configuration store
 *
 * Values are kept as strings. Integers parse as decimal; booleans accept
 * "true"/"false", "yes"/"no" and "1"/"0". Unparseable values yield the default.
 */
class MapConfigSource : public ConfigSource
{
 public:
  void set(const std::string& section, const std::string& key, const std::string& value);

  int read_int(const std::string& section, const std::string& key,
               int default_value) const override;

  bool read_bool(const std::string& section, const std::string& key,
                 bool default_value) const override;

  std::string read_string(const std::string& section, const std::string& key,
                          const std::string& default_value) const override;

 private:
  const std::string* find(const std::string& section, const std::string& key) const;

  std::map<std::pair<std::string, std::string>, std::string> values_;
};

/**
 * @brief Reply packet types of the inspection control board
 *
 * Replies carry their own type byte, which is configurable per protocol
 * version independently of the request command codes.
 *
 * @warning The defaults are NOT the numbering of the current board firmware.
 * That firmware tags each reply with the code of the command that requested
 * it (inspect 1, monitor 3, status 12, address 16, all encoders 19), so with
 * these defaults its inspect packets would be read as monitor packets. Use
 * command_echo_packet_ids() when talking to that firmware.
 */
struct ControlPacketIds
{
  uint8_t status = 0x03;
  uint8_t inspect = 0x0C;
  uint8_t monitor = 0x01;
  uint8_t chassis_slot = 0x10;
  uint8_t all_encoders = 0x13;
};

/**
 * @brief Reply types for firmware that echoes the request command code
 */
ControlPacketIds command_echo_packet_ids();

/**
 * @brief Tuning values of the inspection control board
 */
struct ControlBoardConfig
{
  /// Encoder counts each axis moves before the board sends an inspect packet
  int encoder1_delta_trigger = 83;
  int encoder2_delta_trigger = 83;

  std::string simulation_data_source;

  /// "Send Clock Markers" or "Send TDC Markers"
  std::string position_tracking_mode = "Send Clock Markers";

  bool audible_alarm_controller = false;
  int audible_alarm_output_channel = 0;
  std::string audible_alarm_pulse_duration = "1";

  /// Monitor packets are requested on every Nth call to get_monitor_packet
  int monitor_request_interval = 50;

  ControlPacketIds packet_ids;
  size_t status_payload_size = STATUS_PACKET_SIZE;
  size_t address_payload_size = ADDRESS_PACKET_SIZE;
};

/**
 * @brief Reply packet types of the notch cutter board
 */
struct CutterPacketIds
{
  uint8_t status = 0x0C;
  uint8_t data = 0x05;
};

/**
 * @brief Tuning values of the notch cutter board
 */
struct CutterBoardConfig
{
  std::string simulation_data_source;
  CutterPacketIds packet_ids;
  size_t status_payload_size = STATUS_PACKET_SIZE;
  size_t data_payload_size = CUTTER_DATA_PACKET_SIZE;
};

/**
 * @brief Load base settings from the "Hardware" section
 */
ControlBoardConfig load_control_board_config(const ConfigSource& source);

/**
 * @brief Load settings tagged with the board's chassis and slot address
 *
 * These can only be read once the address has been retrieved from the board.
 * Section name: "Control Board in Chassis <chassis> Slot <slot>".
 */
void load_control_board_extended_config(const ConfigSource& source, int chassis, int slot,
                                        ControlBoardConfig& config);

CutterBoardConfig load_cutter_board_config(const ConfigSource& source);

/**
 * @brief Map a position tracking mode name to control flag bits
 *
 * @return FLAG_SEND_CLOCK_MARKERS, FLAG_SEND_TDC, or 0 for unknown names
 */
uint16_t parse_position_tracking_mode(const std::string& mode);

}  // namespace capulin
