/**
 * @file stream.hpp
 * @brief Byte stream abstraction used by the transport session
 *
 * A board is reached either through a TCP socket or through an in-process
 * simulator. Both implement this interface, and the session depends only on
 * it.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace capulin
{

/**
 * @brief Bidirectional byte stream to a board
 *
 * Reads block for at most the receive timeout. Writes are synchronous and
 * either send the whole buffer or fail.
 */
class ByteStream
{
 public:
  virtual ~ByteStream() = default;

  /**
   * @brief Number of bytes that can be read without blocking
   *
   * @return Byte count, or -1 if the stream is closed or broken
   */
  virtual int available() = 0;

  /**
   * @brief Read up to len bytes
   *
   * Blocks until at least one byte arrives or the receive timeout elapses.
   *
   * @param buf Destination buffer
   * @param len Maximum number of bytes to read
   * @return Number of bytes read, 0 on timeout, -1 on error or end of stream
   */
  virtual int read(uint8_t* buf, size_t len) = 0;

  /**
   * @brief Write len bytes
   *
   * @param data Source buffer
   * @param len  Number of bytes to write
   * @return Number of bytes written, -1 on error
   */
  virtual int write(const uint8_t* data, size_t len) = 0;

  /**
   * @brief Bound the time a read may block
   *
   * @param timeout_ms Timeout in milliseconds
   * @return true on success
   */
  virtual bool set_receive_timeout(int timeout_ms) = 0;

  /** @brief Close the write side. No-op if already closed. */
  virtual void shutdown_output() = 0;

  /** @brief Close the read side. No-op if already closed. */
  virtual void shutdown_input() = 0;

  /** @brief Release the underlying handle. No-op if already closed. */
  virtual void close() = 0;
};

}  // namespace capulin
