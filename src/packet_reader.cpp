/**
 * @file packet_reader.cpp
 * @brief Packet header reader implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "packet_reader.hpp"

#include <chrono>
#include <thread>

#include "frame.hpp"
#include "resync.hpp"

namespace capulin
{
namespace internal
{

namespace
{

void sleep_tick()
{
  std::this_thread::sleep_for(std::chrono::milliseconds(POLL_TICK_MS));
}

}  // namespace

bool wait_for_bytes(TransportSession& session, size_t count, int timeout_ticks)
{
  const int needed = static_cast<int>(count);
  int ticks = 0;
  int avail = session.available();
  while (avail >= 0 && avail < needed && ticks++ < timeout_ticks)
  {
    sleep_tick();
    avail = session.available();
  }
  return avail >= needed;
}

int read_header(TransportSession& session, bool wait, int timeout_ticks,
                uint8_t last_packet_type, uint8_t& packet_type)
{
  if (!session.is_open())
  {
    return HEADER_NONE;
  }

  ResyncState& state = session.resync_state();

  // After a resync the 0xAA byte is already gone from the stream
  const size_t first = state.resynced ? 1 : 0;
  if (!wait_for_bytes(session, HEADER_SIZE - first, wait ? timeout_ticks : 0))
  {
    return HEADER_NONE;
  }

  state.resynced = false;
  size_t position = first;

  for (; position < MAGIC_SIZE; ++position)
  {
    uint8_t byte = 0;
    if (session.read(&byte, 1) <= 0)
    {
      return HEADER_MISS;
    }
    if (!is_magic(position, byte))
    {
      resync(session, last_packet_type);
      return HEADER_MISS;
    }
  }

  uint8_t type = 0;
  if (session.read(&type, 1) <= 0)
  {
    return HEADER_MISS;
  }

  packet_type = type;
  return HEADER_OK;
}

}  // namespace internal
}  // namespace capulin
