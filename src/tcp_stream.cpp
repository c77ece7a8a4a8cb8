/**
 * @file tcp_stream.cpp
 * @brief TCP socket implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "tcp_stream.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "log.hpp"

namespace capulin
{
namespace internal
{

TcpStream::TcpStream(int sock) : sock_(sock), output_open_(true), input_open_(true)
{
}

TcpStream::~TcpStream()
{
  close();
}

int TcpStream::available()
{
  if (sock_ < 0 || !input_open_)
  {
    return -1;
  }

  int count = 0;
  if (ioctl(sock_, FIONREAD, &count) < 0)
  {
    CAPULIN_LOG(LError, "FIONREAD failed: %s", strerror(errno));
    return -1;
  }
  return count;
}

int TcpStream::read(uint8_t* buf, size_t len)
{
  if (sock_ < 0 || !input_open_)
  {
    return -1;
  }

  const ssize_t rd = recv(sock_, buf, len, 0);
  if (rd > 0)
  {
    return static_cast<int>(rd);
  }
  if (rd == 0)
  {
    // Peer closed the connection
    return -1;
  }
  if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
  {
    return 0;
  }
  CAPULIN_LOG(LError, "Socket read failed: %s", strerror(errno));
  return -1;
}

int TcpStream::write(const uint8_t* data, size_t len)
{
  if (sock_ < 0 || !output_open_)
  {
    return -1;
  }

  size_t sent = 0;
  while (sent < len)
  {
    const ssize_t wr = send(sock_, data + sent, len - sent, MSG_NOSIGNAL);
    if (wr < 0)
    {
      if (errno == EINTR)
      {
        continue;
      }
      CAPULIN_LOG(LError, "Socket write failed: %s", strerror(errno));
      return -1;
    }
    sent += static_cast<size_t>(wr);
  }
  return static_cast<int>(sent);
}

bool TcpStream::set_receive_timeout(int timeout_ms)
{
  if (sock_ < 0)
  {
    return false;
  }

  struct timeval timeout;
  timeout.tv_sec = timeout_ms / 1000;
  timeout.tv_usec = (timeout_ms % 1000) * 1000;
  if (setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0)
  {
    CAPULIN_LOG(LError, "Failed to set receive timeout: %s", strerror(errno));
    return false;
  }
  return true;
}

void TcpStream::shutdown_output()
{
  if (sock_ < 0 || !output_open_)
  {
    return;
  }
  output_open_ = false;
  shutdown(sock_, SHUT_WR);
}

void TcpStream::shutdown_input()
{
  if (sock_ < 0 || !input_open_)
  {
    return;
  }
  input_open_ = false;
  shutdown(sock_, SHUT_RD);
}

void TcpStream::close()
{
  if (sock_ < 0)
  {
    return;
  }
  output_open_ = false;
  input_open_ = false;
  ::close(sock_);
  sock_ = -1;
}

std::unique_ptr<ByteStream> open_tcp_stream(const std::string& host, uint16_t port,
                                            ErrorCode& error)
{
  struct addrinfo hints = {};
  hints.ai_family = AF_INET;  // boards only speak IPv4
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  const std::string service = std::to_string(port);
  struct addrinfo* board_addr = nullptr;
  int status = getaddrinfo(host.c_str(), service.c_str(), &hints, &board_addr);
  if (status != 0)
  {
    CAPULIN_LOG(LError, "Failed to get addr info for %s: %s", host.c_str(), gai_strerror(status));
    error = ErrorCode::SOCKET_ERROR;
    return nullptr;
  }

  int sock = socket(board_addr->ai_family, board_addr->ai_socktype, board_addr->ai_protocol);
  if (sock < 0)
  {
    CAPULIN_LOG(LError, "Failed to create socket: %s", strerror(errno));
    freeaddrinfo(board_addr);
    error = ErrorCode::SOCKET_ERROR;
    return nullptr;
  }

  status = connect(sock, board_addr->ai_addr, board_addr->ai_addrlen);
  freeaddrinfo(board_addr);
  if (status < 0)
  {
    CAPULIN_LOG(LError, "Failed to connect to %s:%u: %s", host.c_str(), port, strerror(errno));
    ::close(sock);
    error = ErrorCode::CONNECT_FAILED;
    return nullptr;
  }

  // Commands are a few bytes each and must not wait for coalescing
  int state = 1;
  setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &state, sizeof(state));

  error = ErrorCode::OK;
  return std::unique_ptr<ByteStream>(new TcpStream(sock));
}

}  // namespace internal
}  // namespace capulin
