/**
 * @file board.hpp
 * @brief Capulin board base class
 *
 * Shared engine for every board model: transport session, packet dispatch,
 * command transmission and the connection thread.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "capulin/dispatcher.hpp"
#include "capulin/protocol.hpp"
#include "capulin/session.hpp"
#include "capulin/stream.hpp"

namespace capulin
{

/**
 * @brief Board specific command codes used during a firmware upload
 */
struct FirmwareInstallSettings
{
  uint8_t load_firmware_cmd;
  uint8_t no_action;
  uint8_t error;
  uint8_t send_data_cmd;
  uint8_t data_cmd;
  uint8_t exit_cmd;
};

/**
 * @brief Uploads a firmware image over a board's session
 *
 * Implemented by the application; boards only pass their command codes and
 * image name through.
 */
class FirmwareInstaller
{
 public:
  virtual ~FirmwareInstaller() = default;

  /**
   * @param board_type Board model name used in messages
   * @param image_name Firmware image file name
   * @param settings   Command codes of this board model
   * @param session    Ready session to the board
   * @return true if the image was installed
   */
  virtual bool install(const std::string& board_type, const std::string& image_name,
                       const FirmwareInstallSettings& settings, TransportSession& session) = 0;
};

/**
 * @brief Base class of the board facades
 *
 * Example usage:
 * @code
 * SessionSettings settings;
 * settings.address = "169.254.56.11";  // from roll call
 *
 * ControlBoard board("Control Board", 0, settings, config);
 * board.start();  // connects on its own thread
 *
 * if (board.wait_for_setup(std::chrono::seconds(5)) && board.is_ready())
 * {
 *   board.initialize();
 *   board.start_inspect();
 *
 *   // Polling loop, usually driven by a timer
 *   while (running)
 *   {
 *     board.process_one_data_packet(true, 5);
 *     auto state = board.inspect_state();
 *   }
 * }
 * board.shut_down();
 * @endcode
 */
class Board
{
 public:
  /**
   * @brief Construct an unconnected board
   *
   * @param name     Name used in diagnostics
   * @param index    Index of the board in the application's board list
   * @param settings Address from discovery, simulate flag, runtime packet size
   */
  Board(std::string name, int index, SessionSettings settings);

  virtual ~Board();

  Board(const Board&) = delete;
  Board& operator=(const Board&) = delete;

  /**
   * @brief Connect on a dedicated thread
   *
   * The thread connects once and then stays alive until shut_down(), since it
   * owns the socket.
   */
  void start();

  /**
   * @brief Connect on the calling thread
   *
   * @return true if the board is ready
   */
  bool connect();

  /**
   * @brief Block until connecting has finished, successfully or not
   */
  bool wait_for_setup(std::chrono::milliseconds timeout);

  bool is_ready() const
  {
    return session_.is_ready();
  }

  /**
   * @brief Process a single packet from the board if one is available
   *
   * Should be called often. If wait_for_packet is true, waits for up to
   * timeout_ticks * 10 ms for a packet to arrive.
   *
   * @return Payload bytes consumed, 0 if bytes were read but no packet was
   *         decoded, -1 if no packet is available
   */
  int process_one_data_packet(bool wait_for_packet, int timeout_ticks);

  /**
   * @brief Read one runtime data packet if a full one is waiting
   *
   * @return true if a packet was read into runtime_packet()
   */
  bool prepare_data();

  const std::vector<uint8_t>& runtime_packet() const
  {
    return runtime_buffer_;
  }

  /**
   * @brief Transmit a command frame
   *
   * No reply is awaited; a reply arrives later as a normal packet.
   *
   * @return false if the session is not ready, the write failed, or too many
   *         parameters were given
   */
  bool send_command(uint8_t cmd, std::initializer_list<uint8_t> params = {});

  bool send_command(uint8_t cmd, const uint8_t* params, size_t count);

  /**
   * @brief Stop the connection thread and close the session
   *
   * Safe to call more than once.
   */
  void shut_down();

  const std::string& name() const
  {
    return session_.name();
  }

  int index() const
  {
    return index_;
  }

  const ResyncState& resync_state() const
  {
    return session_.resync_state();
  }

  TransportSession& session()
  {
    return session_;
  }

  PacketDispatcher& dispatcher()
  {
    return dispatcher_;
  }

 protected:
  /**
   * @brief Create the simulated stream used in simulate mode
   */
  virtual std::unique_ptr<ByteStream> create_simulator() = 0;

  /**
   * @brief Called on the connecting thread once the session is ready
   *
   * Runs before threads waiting in wait_for_setup() are released.
   */
  virtual void on_connected()
  {
  }

  /**
   * @brief Send a request and process packets until its reply is decoded
   *
   * Gives up after PAYLOAD_WAIT_TICKS ticks, even if other packets keep
   * arriving, or as soon as no packet is available.
   *
   * @param cmd        Request command code
   * @param reply_type Packet type of the reply
   * @return true if the reply was decoded
   */
  bool request_reply(uint8_t cmd, uint8_t reply_type);

  TransportSession session_;
  PacketDispatcher dispatcher_;

 private:
  /**
   * @brief Body of the connection thread
   */
  void run();

  int index_;

  std::thread thread_;
  std::mutex run_mutex_;
  std::condition_variable run_cv_;
  bool stop_requested_;

  std::vector<uint8_t> runtime_buffer_;
};

}  // namespace capulin
