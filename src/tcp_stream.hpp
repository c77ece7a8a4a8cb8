/**
 * @file tcp_stream.hpp
 * @brief TCP socket implementation of ByteStream (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "capulin/protocol.hpp"
#include "capulin/stream.hpp"

namespace capulin
{
namespace internal
{

/**
 * @brief Client socket connected to a board
 */
class TcpStream : public ByteStream
{
 public:
  /**
   * @brief Take ownership of a connected socket
   *
   * @param sock Connected socket file descriptor
   */
  explicit TcpStream(int sock);

  ~TcpStream() override;

  TcpStream(const TcpStream&) = delete;
  TcpStream& operator=(const TcpStream&) = delete;

  int available() override;
  int read(uint8_t* buf, size_t len) override;
  int write(const uint8_t* data, size_t len) override;
  bool set_receive_timeout(int timeout_ms) override;
  void shutdown_output() override;
  void shutdown_input() override;
  void close() override;

 private:
  int sock_;
  bool output_open_;
  bool input_open_;
};

/**
 * @brief Connect to a board over TCP
 *
 * @param host  IPv4 address or host name
 * @param port  TCP port
 * @param error Set to the failure reason when nullptr is returned
 * @return Connected stream, or nullptr on failure
 */
std::unique_ptr<ByteStream> open_tcp_stream(const std::string& host, uint16_t port,
                                            ErrorCode& error);

}  // namespace internal
}  // namespace capulin
