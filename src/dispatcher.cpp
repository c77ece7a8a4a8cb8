/**
 * @file dispatcher.cpp
 * @brief Packet type dispatch implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "capulin/dispatcher.hpp"

#include <utility>

#include "log.hpp"
#include "packet_reader.hpp"

namespace capulin
{

PacketDispatcher::PacketDispatcher(TransportSession& session, int payload_wait_ticks)
    : session_(session),
      table_(),
      buffer_(),
      packet_type_(0),
      target_decoded_(false),
      target_type_(0),
      payload_wait_ticks_(payload_wait_ticks)
{
}

void PacketDispatcher::register_packet(uint8_t type, size_t payload_size, DecodeFn decode)
{
  table_[type] = Entry{payload_size, std::move(decode)};
  if (buffer_.size() < payload_size)
  {
    buffer_.resize(payload_size);
  }
}

bool PacketDispatcher::set_payload_size(uint8_t type, size_t payload_size)
{
  auto it = table_.find(type);
  if (it == table_.end())
  {
    return false;
  }
  it->second.size = payload_size;
  if (buffer_.size() < payload_size)
  {
    buffer_.resize(payload_size);
  }
  return true;
}

size_t PacketDispatcher::payload_size(uint8_t type) const
{
  auto it = table_.find(type);
  return it == table_.end() ? 0 : it->second.size;
}

int PacketDispatcher::process_one(bool wait_for_packet, int timeout_ticks)
{
  uint8_t type = 0;
  const int header =
      internal::read_header(session_, wait_for_packet, timeout_ticks, packet_type_, type);
  if (header == internal::HEADER_NONE)
  {
    return NO_PACKET;
  }
  if (header == internal::HEADER_MISS)
  {
    return 0;
  }

  packet_type_ = type;

  auto it = table_.find(type);
  if (it == table_.end())
  {
    // Newer firmware may send packets this table does not know
    CAPULIN_LOG(LDebug, "%s: ignoring unknown packet type %u", session_.name().c_str(), type);
    return 0;
  }

  return read_payload(type, it->second);
}

int PacketDispatcher::read_payload(uint8_t type, const Entry& entry)
{
  if (entry.size == 0)
  {
    entry.decode(buffer_.data(), 0);
    if (type == target_type_)
    {
      target_decoded_ = true;
    }
    return 0;
  }

  if (!internal::wait_for_bytes(session_, entry.size, payload_wait_ticks_))
  {
    CAPULIN_LOG(LWarn, "%s: packet %u expects %zu payload bytes, only %d arrived",
                session_.name().c_str(), type, entry.size, session_.available());
    return 0;
  }

  size_t got = 0;
  while (got < entry.size)
  {
    const int rd = session_.read(buffer_.data() + got, entry.size - got);
    if (rd <= 0)
    {
      CAPULIN_LOG(LError, "%s: read of packet %u failed after %zu of %zu bytes - Error: 799",
                  session_.name().c_str(), type, got, entry.size);
      return 0;
    }
    got += static_cast<size_t>(rd);
  }

  entry.decode(buffer_.data(), entry.size);

  if (type == target_type_)
  {
    target_decoded_ = true;
  }

  return static_cast<int>(entry.size);
}

PacketDispatcher::Result PacketDispatcher::process_until_type(uint8_t target)
{
  target_type_ = target;
  target_decoded_ = false;

  while (!target_decoded_ && process_one(false, 0) != NO_PACKET)
  {
  }

  return target_decoded_ ? Result::DECODED : Result::NONE_AVAILABLE;
}

}  // namespace capulin
