/**
 * @file control_board.hpp
 * @brief Inspection control board facade
 *
 * The control board tracks the two encoders of the inspection head and the
 * process control inputs (on pipe, head down, TDC), and drives the alarm and
 * marker outputs.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include "capulin/board.hpp"
#include "capulin/config.hpp"

namespace capulin
{

namespace internal
{
class ControlSimulator;
}

/**
 * @brief Direction of encoder travel between two inspect packets
 */
enum class Direction : uint8_t
{
  INCREASING,
  DECREASING,
};

/**
 * @brief Decoded inspect packet
 *
 * Published as a whole after each decode, so readers never see a half
 * updated record.
 */
struct InspectState
{
  uint16_t packet_count = 0;
  int32_t encoder1 = 0;
  int32_t encoder2 = 0;
  int32_t prev_encoder1 = 0;  ///< encoder1 of the previous inspect packet
  int32_t prev_encoder2 = 0;
  Direction encoder1_direction = Direction::DECREASING;
  Direction encoder2_direction = Direction::DECREASING;

  uint8_t process_control_flags = 0;  ///< Raw byte, active high
  uint8_t port_e = 0xFF;              ///< Raw byte, active low

  bool on_pipe = false;
  bool head1_down = false;
  bool head2_down = false;
  bool tdc = false;
  bool unused3 = false;
};

/**
 * @brief Encoder positions latched at the inspection events
 *
 * A value of INT32_MAX means the reply has not arrived yet.
 */
struct EncoderValues
{
  int32_t on_pipe = INT32_MAX;
  int32_t off_pipe = INT32_MAX;
  int32_t head1_down = INT32_MAX;
  int32_t head1_up = INT32_MAX;
  int32_t head2_down = INT32_MAX;
  int32_t head2_up = INT32_MAX;

  void set_all_to_max();

  /** @brief true once every value has been filled by a reply */
  bool complete() const;
};

/** @brief Raw I/O status snapshot, for display only */
using MonitorPacket = std::array<uint8_t, MONITOR_PACKET_SIZE>;

/**
 * @brief Inspection control board
 */
class ControlBoard : public Board
{
 public:
  /**
   * @param name     Name used in diagnostics
   * @param index    Index of the board in the application's board list
   * @param settings Address from discovery and simulate flag
   * @param config   Values from load_control_board_config()
   */
  ControlBoard(std::string name, int index, SessionSettings settings,
               ControlBoardConfig config = ControlBoardConfig());

  ~ControlBoard() override;

  /**
   * @brief Send the settings that depend on the chassis and slot address
   *
   * Loads the extended configuration, then sends the control flags and the
   * encoder delta triggers. Call once the board is ready.
   */
  void initialize(const ConfigSource& source);

  /**
   * @brief Set or clear FLAG_TRACK_PULSES_ENABLED and resend the control flags
   */
  void set_track_pulses_enabled(bool enabled);

  uint16_t control_flags() const
  {
    return control_flags_;
  }

  /** @brief Send control_flags() to the board */
  bool send_control_flags();

  /** @brief Send the configured encoder delta triggers */
  bool set_encoders_delta_trigger();

  /* ===== Requests ===== */

  /**
   * @brief Force the board to send an inspect packet
   *
   * The board normally sends inspect packets on its own as the encoders move.
   */
  bool request_inspect_packet();

  /**
   * @brief Get the last monitor packet
   *
   * If request_packet is true, a fresh packet is requested every
   * monitor_request_interval + 1 calls. The reply is processed later by
   * process_one_data_packet(), so a caller polling this sees it on a later
   * call. The contents are advisory.
   */
  MonitorPacket get_monitor_packet(bool request_packet);

  /**
   * @brief Request the latched encoder values
   *
   * Resets encoder_values() to INT32_MAX until the reply is processed.
   */
  bool request_all_encoder_values();

  /**
   * @brief Request status from the board and wait for the reply
   *
   * @return true if the reply was decoded
   */
  bool request_status();

  /**
   * @brief Send a request and process packets until its reply arrives
   *
   * @param cmd        Request command
   * @param reply_type Packet type of the reply
   * @return First payload byte of the reply, or -1 if none arrived
   */
  int get_remote_data(ControlCommand cmd, uint8_t reply_type);

  /**
   * @brief Process available packets until an inspect packet is decoded
   *
   * @return true if an inspect packet was decoded
   */
  bool process_data_packets_until_inspect_packet();

  /* ===== Commands ===== */

  bool start_inspect();
  bool stop_inspect();
  bool start_monitor();
  bool stop_monitor();
  bool zero_encoder_counts();
  bool reset_track_counters();

  bool pulse_output(uint8_t which);
  bool turn_on_output(uint8_t which);
  bool turn_off_output(uint8_t which);

  bool pulse_audible_alarm();
  bool turn_on_audible_alarm();
  bool turn_off_audible_alarm();

  bool is_audible_alarm_controller() const
  {
    return config_.audible_alarm_controller;
  }

  /**
   * @brief Upload new firmware through an external installer
   */
  bool install_new_firmware(FirmwareInstaller& installer);

  /**
   * @brief Advance the simulated board one step; no-op on real hardware
   */
  void drive_simulation();

  /* ===== Decoded state ===== */

  /** @brief Last decoded inspect packet */
  InspectState inspect_state() const;

  /** @brief Set each time an inspect packet is decoded */
  bool new_inspect_packet_ready() const
  {
    return new_inspect_packet_ready_.load();
  }

  void set_new_inspect_packet_ready(bool value)
  {
    new_inspect_packet_ready_.store(value);
  }

  /**
   * @brief Clear the new-packet flag and return its previous value
   *
   * A packet decoded between two calls is never lost.
   */
  bool take_new_inspect_packet()
  {
    return new_inspect_packet_ready_.exchange(false);
  }

  EncoderValues encoder_values() const;

  /** @brief Payload of the last status reply */
  std::vector<uint8_t> status() const;

  /** @brief Chassis switch setting, -1 until retrieved */
  int chassis() const
  {
    return chassis_.load();
  }

  /** @brief Slot switch setting, -1 until retrieved */
  int slot() const
  {
    return slot_.load();
  }

  const ControlBoardConfig& config() const
  {
    return config_;
  }

 protected:
  std::unique_ptr<ByteStream> create_simulator() override;

  /**
   * @brief Retrieve the chassis and slot address
   */
  void on_connected() override;

 private:
  void register_packets();

  void decode_status(const uint8_t* payload, size_t len);
  void decode_address(const uint8_t* payload, size_t len);
  void decode_inspect(const uint8_t* payload, size_t len);
  void decode_monitor(const uint8_t* payload, size_t len);
  void decode_all_encoders(const uint8_t* payload, size_t len);

  bool send(ControlCommand cmd, std::initializer_list<uint8_t> params = {});

  ControlBoardConfig config_;
  uint16_t control_flags_;
  int monitor_request_timer_;

  std::atomic<int> chassis_;
  std::atomic<int> slot_;
  std::atomic<int> reply_byte_;  ///< First byte of the last status or address reply
  std::atomic<bool> new_inspect_packet_ready_;

  std::shared_ptr<const InspectState> inspect_;
  std::shared_ptr<const MonitorPacket> monitor_;
  std::shared_ptr<const EncoderValues> encoder_values_;
  std::shared_ptr<const std::vector<uint8_t>> status_;

  std::atomic<internal::ControlSimulator*> simulator_;
};

}  // namespace capulin
