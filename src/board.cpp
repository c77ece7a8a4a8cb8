/**
 * @file board.cpp
 * @brief Capulin board base implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "capulin/board.hpp"

#include <chrono>
#include <utility>

#include "frame.hpp"
#include "log.hpp"

namespace capulin
{

Board::Board(std::string name, int index, SessionSettings settings)
    : session_(std::move(name), std::move(settings), [this] { return create_simulator(); }),
      dispatcher_(session_),
      index_(index),
      thread_(),
      run_mutex_(),
      run_cv_(),
      stop_requested_(false),
      runtime_buffer_()
{
}

Board::~Board()
{
  shut_down();
}

void Board::start()
{
  std::lock_guard<std::mutex> lock(run_mutex_);
  if (thread_.joinable() || stop_requested_)
  {
    return;
  }
  thread_ = std::thread(&Board::run, this);
}

void Board::run()
{
  connect();

  // The socket belongs to this thread's lifetime, so idle until shut down
  std::unique_lock<std::mutex> lock(run_mutex_);
  run_cv_.wait(lock, [this] { return stop_requested_; });
}

bool Board::connect()
{
  return session_.connect([this] { on_connected(); });
}

bool Board::wait_for_setup(std::chrono::milliseconds timeout)
{
  return session_.wait_for_setup(timeout);
}

int Board::process_one_data_packet(bool wait_for_packet, int timeout_ticks)
{
  return dispatcher_.process_one(wait_for_packet, timeout_ticks);
}

bool Board::prepare_data()
{
  const size_t size = session_.settings().runtime_packet_size;
  const int avail = session_.available();
  if (avail < 0 || static_cast<size_t>(avail) < size)
  {
    return false;
  }

  runtime_buffer_.resize(size);
  size_t got = 0;
  while (got < size)
  {
    const int rd = session_.read(runtime_buffer_.data() + got, size - got);
    if (rd <= 0)
    {
      CAPULIN_LOG(LError, "%s: runtime packet read failed - Error: 672", name().c_str());
      return false;
    }
    got += static_cast<size_t>(rd);
  }
  return true;
}

bool Board::send_command(uint8_t cmd, std::initializer_list<uint8_t> params)
{
  return send_command(cmd, params.begin(), params.size());
}

bool Board::send_command(uint8_t cmd, const uint8_t* params, size_t count)
{
  std::vector<uint8_t> frame;
  if (!internal::encode_command(cmd, params, count, frame))
  {
    CAPULIN_LOG(LError, "%s: command %u %s", name().c_str(), cmd,
                error_message(ErrorCode::BAD_COMMAND));
    return false;
  }
  return session_.send(frame.data(), frame.size());
}

bool Board::request_reply(uint8_t cmd, uint8_t reply_type)
{
  if (!send_command(cmd))
  {
    return false;
  }

  // Other packets keep arriving while the board is inspecting, so the wait is
  // bounded by time rather than by silence
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(PAYLOAD_WAIT_TICKS * POLL_TICK_MS);
  while (std::chrono::steady_clock::now() < deadline)
  {
    const int rd = dispatcher_.process_one(true, PAYLOAD_WAIT_TICKS);
    if (rd == PacketDispatcher::NO_PACKET)
    {
      break;
    }
    if (rd > 0 && dispatcher_.last_packet_type() == reply_type)
    {
      return true;
    }
  }

  CAPULIN_LOG(LWarn, "%s: no reply to command %u", name().c_str(), cmd);
  return false;
}

void Board::shut_down()
{
  {
    std::lock_guard<std::mutex> lock(run_mutex_);
    stop_requested_ = true;
  }
  run_cv_.notify_all();

  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
  {
    thread_.join();
  }

  session_.shut_down();
}

}  // namespace capulin
