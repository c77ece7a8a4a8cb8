/**
 * @file session.cpp
 * @brief Transport session implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "capulin/session.hpp"

#include <utility>

#include "log.hpp"
#include "tcp_stream.hpp"

namespace capulin
{

const char* error_message(ErrorCode code)
{
  switch (code)
  {
#define ERR(name, val, msg) \
  case ErrorCode::name:     \
    return msg;
#include "capulin/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

TransportSession::TransportSession(std::string name, SessionSettings settings,
                                   StreamFactory simulator)
    : name_(std::move(name)),
      settings_(std::move(settings)),
      simulator_(std::move(simulator)),
      stream_(),
      state_(SessionState::UNCONNECTED),
      last_error_(ErrorCode::OK),
      setup_published_(false),
      setup_complete_(false),
      closed_(false),
      greeting_()
{
}

TransportSession::~TransportSession()
{
  shut_down();
}

bool TransportSession::connect(const SetupFn& on_ready)
{
  SessionState expected = SessionState::UNCONNECTED;
  if (!state_.compare_exchange_strong(expected, SessionState::CONNECTING))
  {
    CAPULIN_LOG(LWarn, "%s: connect called more than once", name_.c_str());
    return is_ready();
  }

  if (settings_.address.empty())
  {
    CAPULIN_LOG(LError, "%s never responded to roll call and cannot be contacted.",
                name_.c_str());
    finish_setup(SessionState::FAILED, ErrorCode::NO_ADDRESS);
    return false;
  }

  CAPULIN_LOG(LInfo, "Opening connection with %s...", name_.c_str());
  CAPULIN_LOG(LInfo, "%s IP Address: %s", name_.c_str(), settings_.address.c_str());

  std::unique_ptr<ByteStream> stream;
  ErrorCode error = ErrorCode::OK;
  if (!settings_.simulate)
  {
    stream = internal::open_tcp_stream(settings_.address, settings_.port, error);
  }
  else if (simulator_)
  {
    stream = simulator_();
    error = stream ? ErrorCode::OK : ErrorCode::STREAM_ERROR;
  }
  else
  {
    error = ErrorCode::STREAM_ERROR;
  }

  if (!stream)
  {
    CAPULIN_LOG(LError, "%s - Error: 238", error_message(error));
    CAPULIN_LOG(LError, "Couldn't get I/O for %s", settings_.address.c_str());
    finish_setup(SessionState::FAILED, error);
    return false;
  }

  // Bound every read so a silent board cannot hang the polling thread
  if (!stream->set_receive_timeout(RECEIVE_TIMEOUT_MS))
  {
    CAPULIN_LOG(LError, "%s - Error: 238", error_message(ErrorCode::STREAM_ERROR));
    CAPULIN_LOG(LError, "Couldn't get I/O for %s", settings_.address.c_str());
    stream->close();
    finish_setup(SessionState::FAILED, ErrorCode::STREAM_ERROR);
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = std::move(stream);
  }

  std::string greeting;
  if (read_line(greeting))
  {
    CAPULIN_LOG(LInfo, "%s says %s", settings_.address.c_str(), greeting.c_str());
    std::lock_guard<std::mutex> lock(mutex_);
    greeting_ = greeting;
  }
  else
  {
    // A missing greeting is reported but does not prevent use of the board
    CAPULIN_LOG(LError, "%s - Error: 248", error_message(ErrorCode::NO_GREETING));
  }

  state_.store(SessionState::READY);

  if (on_ready)
  {
    on_ready();
  }

  finish_setup(state_.load(), last_error_.load());
  return is_ready();
}

void TransportSession::finish_setup(SessionState state, ErrorCode error)
{
  last_error_.store(error);
  state_.store(state);
  setup_published_.store(true);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    setup_complete_ = true;
  }
  setup_cv_.notify_all();  // wake up all threads waiting for the connection
}

bool TransportSession::wait_for_setup(std::chrono::milliseconds timeout)
{
  std::unique_lock<std::mutex> lock(mutex_);
  return setup_cv_.wait_for(lock, timeout, [this] { return setup_complete_; });
}

bool TransportSession::setup_complete() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return setup_complete_;
}

std::string TransportSession::greeting() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return greeting_;
}

bool TransportSession::read_line(std::string& line)
{
  line.clear();
  while (line.size() < MAX_GREETING_LENGTH)
  {
    uint8_t c = 0;
    const int rd = stream_->read(&c, 1);
    if (rd <= 0)
    {
      return false;
    }
    if (c == '\n')
    {
      return true;
    }
    if (c != '\r')
    {
      line.push_back(static_cast<char>(c));
    }
  }
  return true;
}

int TransportSession::available()
{
  if (!is_open())
  {
    return -1;
  }

  const int count = stream_->available();
  if (count < 0)
  {
    fail(ErrorCode::READ_ERROR);
  }
  return count;
}

int TransportSession::read(uint8_t* buf, size_t len)
{
  if (!is_open())
  {
    return -1;
  }

  const int rd = stream_->read(buf, len);
  if (rd < 0)
  {
    fail(ErrorCode::READ_ERROR);
  }
  return rd;
}

bool TransportSession::send(const uint8_t* data, size_t len)
{
  if (!is_open())
  {
    CAPULIN_LOG(LDebug, "%s: dropping %zu byte command, %s", name_.c_str(), len,
                error_message(ErrorCode::NOT_CONNECTED));
    return false;
  }

  const int wr = stream_->write(data, len);
  if (wr < 0 || static_cast<size_t>(wr) != len)
  {
    fail(ErrorCode::WRITE_ERROR);
    return false;
  }
  return true;
}

void TransportSession::fail(ErrorCode code)
{
  CAPULIN_LOG(LError, "%s: %s", name_.c_str(), error_message(code));
  last_error_.store(code);
  state_.store(SessionState::FAILED);
}

void TransportSession::shut_down()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (!stream_ || closed_)
  {
    return;
  }
  closed_ = true;

  // Close order matters to the boards: output first, then input, then socket
  stream_->shutdown_output();
  stream_->shutdown_input();
  stream_->close();

  if (state_.load() == SessionState::READY)
  {
    state_.store(SessionState::UNCONNECTED);
  }
}

}  // namespace capulin
