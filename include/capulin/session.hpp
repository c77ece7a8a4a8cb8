/**
 * @file session.hpp
 * @brief Transport session to one board
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "capulin/protocol.hpp"
#include "capulin/stream.hpp"

namespace capulin
{

/**
 * @brief Connection state of a session
 */
enum class SessionState : uint8_t
{
  UNCONNECTED,
  CONNECTING,
  READY,
  FAILED,
};

/**
 * @brief Framing recovery bookkeeping
 *
 * Mutated only by the resynchronizer. The counter accumulates over the
 * lifetime of the session.
 */
struct ResyncState
{
  bool resynced = false;  ///< A 0xAA byte was consumed by the last resync
  int resync_count = 0;   ///< Resync attempts, successful or not
  uint8_t packet_type_at_last_corruption = 0;  ///< Last good packet type before the error
};

/**
 * @brief Values handed in by discovery and configuration
 */
struct SessionSettings
{
  std::string address;  ///< Resolved board address, empty if discovery failed
  uint16_t port = BOARD_PORT;
  bool simulate = false;  ///< Use the in-process simulator instead of a socket
  size_t runtime_packet_size = RUNTIME_PACKET_SIZE;
};

/**
 * @brief Owns the stream to one board and its connection lifecycle
 *
 * connect() is called once from a dedicated thread. Other threads wait on
 * wait_for_setup() or poll is_ready() and then use the read/write primitives.
 * The connect hook owns the stream until setup has finished.
 * The session has no receive loop of its own.
 */
class TransportSession
{
 public:
  /**
   * @brief Factory for the simulated stream used in simulate mode
   */
  using StreamFactory = std::function<std::unique_ptr<ByteStream>()>;

  /**
   * @brief Hook run after the session is ready but before waiters are released
   */
  using SetupFn = std::function<void()>;

  /**
   * @brief Construct an unconnected session
   *
   * @param name      Name used in diagnostics
   * @param settings  Address, port and simulate flag
   * @param simulator Creates the simulated stream when settings.simulate is set
   */
  TransportSession(std::string name, SessionSettings settings, StreamFactory simulator = nullptr);

  ~TransportSession();

  TransportSession(const TransportSession&) = delete;
  TransportSession& operator=(const TransportSession&) = delete;

  /**
   * @brief Open the stream, read the greeting and mark the session ready
   *
   * Failures are logged and leave the session in FAILED state; nothing is
   * thrown. All threads blocked in wait_for_setup() are released once the
   * session reaches READY or FAILED.
   *
   * @param on_ready Optional hook run after READY, before waiters are released
   * @return true if the session is ready
   */
  bool connect(const SetupFn& on_ready = nullptr);

  /**
   * @brief Block until connect() has finished, successfully or not
   *
   * @param timeout Maximum time to wait
   * @return true if setup completed within the timeout
   */
  bool wait_for_setup(std::chrono::milliseconds timeout);

  bool setup_complete() const;

  /**
   * @brief true once connect() has finished successfully
   *
   * Stays false while the connect hook is still running, so other threads
   * never share the stream with it.
   */
  bool is_ready() const
  {
    return state_.load() == SessionState::READY && setup_published_.load();
  }

  /**
   * @brief true while the stream can be used for I/O
   *
   * Already true inside the connect hook, before is_ready().
   */
  bool is_open() const
  {
    return state_.load() == SessionState::READY;
  }

  SessionState state() const
  {
    return state_.load();
  }

  ErrorCode last_error() const
  {
    return last_error_.load();
  }

  /** @brief Greeting line received on connect */
  std::string greeting() const;

  const std::string& name() const
  {
    return name_;
  }

  const SessionSettings& settings() const
  {
    return settings_;
  }

  /**
   * @brief Bytes readable without blocking
   *
   * @return Byte count, or -1 if the session is not ready
   */
  int available();

  /**
   * @brief Read up to len bytes, blocking at most the receive timeout
   *
   * A stream error marks the session FAILED.
   *
   * @return Bytes read, 0 on timeout, -1 on error or if not ready
   */
  int read(uint8_t* buf, size_t len);

  /**
   * @brief Write a buffer in one operation
   *
   * A stream error marks the session FAILED.
   *
   * @return true if all bytes were written
   */
  bool send(const uint8_t* data, size_t len);

  /**
   * @brief Mark the session FAILED after an I/O error
   */
  void fail(ErrorCode code);

  ResyncState& resync_state()
  {
    return resync_;
  }

  const ResyncState& resync_state() const
  {
    return resync_;
  }

  /**
   * @brief Close the stream
   *
   * Closes the output side, the input side and then the handle. The text
   * greeting reader shares the input side. Safe to call more than once or on
   * a session that never connected.
   */
  void shut_down();

  /**
   * @brief Stream in use, nullptr before connect
   *
   * Exposed for pass-through collaborators such as firmware installers.
   */
  ByteStream* stream()
  {
    return is_open() ? stream_.get() : nullptr;
  }

 private:
  /**
   * @brief Read one text line, stripping the line terminator
   */
  bool read_line(std::string& line);

  void finish_setup(SessionState state, ErrorCode error);

  std::string name_;
  SessionSettings settings_;
  StreamFactory simulator_;

  std::unique_ptr<ByteStream> stream_;
  std::atomic<SessionState> state_;
  std::atomic<ErrorCode> last_error_;
  std::atomic<bool> setup_published_;  ///< finish_setup() has run

  mutable std::mutex mutex_;
  std::condition_variable setup_cv_;
  bool setup_complete_;
  bool closed_;
  std::string greeting_;

  ResyncState resync_;
};

}  // namespace capulin
