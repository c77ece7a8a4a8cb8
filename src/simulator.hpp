/**
 * @file simulator.hpp
 * @brief In-process board simulators (internal)
 *
 * Stand in for the socket in simulate mode. Each write() is taken as one
 * command frame; replies are queued as complete packets for read().
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

#include "capulin/config.hpp"
#include "capulin/protocol.hpp"
#include "capulin/stream.hpp"

namespace capulin
{
namespace internal
{

/**
 * @brief ByteStream backed by a reply queue
 */
class BoardSimulator : public ByteStream
{
 public:
  /**
   * @param greeting Line sent to the host on connect, without terminator
   */
  explicit BoardSimulator(const std::string& greeting);

  ~BoardSimulator() override = default;

  BoardSimulator(const BoardSimulator&) = delete;
  BoardSimulator& operator=(const BoardSimulator&) = delete;

  int available() override;
  int read(uint8_t* buf, size_t len) override;
  int write(const uint8_t* data, size_t len) override;
  bool set_receive_timeout(int timeout_ms) override;
  void shutdown_output() override;
  void shutdown_input() override;
  void close() override;

 protected:
  /**
   * @brief React to one command frame written by the host
   *
   * Called without the queue lock held.
   *
   * @param frame [CMD][PARAM...]
   * @param len   Frame length, at least 1
   */
  virtual void handle_command(const uint8_t* frame, size_t len) = 0;

  /**
   * @brief Queue a complete packet for the host
   */
  void queue_packet(uint8_t type, const uint8_t* payload, size_t len);

 private:
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<uint8_t> out_;
  int timeout_ms_;
  bool input_open_;
  bool output_open_;
};

/**
 * @brief Simulated inspection control board
 *
 * Answers status, address, inspect, monitor and all-encoder requests. While
 * inspecting, every drive() call advances both encoders by their delta
 * triggers and sends an inspect packet.
 */
class ControlSimulator : public BoardSimulator
{
 public:
  /**
   * @param config  Reply packet types and payload sizes of the host side
   * @param chassis Simulated chassis switch setting (0..15)
   * @param slot    Simulated slot switch setting (0..15)
   */
  ControlSimulator(const ControlBoardConfig& config, int chassis, int slot);

  /**
   * @brief Advance the simulated machine by one step
   */
  void drive();

  uint16_t control_flags() const;
  int last_command() const;

 protected:
  void handle_command(const uint8_t* frame, size_t len) override;

 private:
  void send_inspect_packet();
  void send_monitor_packet();
  void send_all_encoders_packet();

  ControlPacketIds ids_;
  size_t status_size_;
  size_t address_size_;
  int chassis_;
  int slot_;

  mutable std::mutex state_mutex_;
  bool inspecting_;
  bool monitoring_;
  uint16_t packet_count_;
  int32_t encoder1_;
  int32_t encoder2_;
  int encoder1_delta_trigger_;
  int encoder2_delta_trigger_;
  uint16_t control_flags_;
  uint32_t outputs_;  ///< Bit per output channel, set while on
  int last_command_;

  /// Positions latched when the simulated tube passes each event
  int32_t on_pipe_position_;
  int32_t head1_down_position_;
  int32_t head2_down_position_;
};

/**
 * @brief Simulated notch cutter board
 *
 * While in cut mode, every drive() call deepens the cut by one count until
 * the target depth is reached.
 */
class CutterSimulator : public BoardSimulator
{
 public:
  explicit CutterSimulator(const CutterBoardConfig& config);

  void drive();

 protected:
  void handle_command(const uint8_t* frame, size_t len) override;

 private:
  void send_data_packet();

  CutterPacketIds ids_;
  size_t status_size_;
  size_t data_size_;

  std::mutex state_mutex_;
  bool cutting_;
  uint16_t sequence_;
  int32_t depth_;
  int32_t target_depth_;
};

}  // namespace internal
}  // namespace capulin
