/**
 * @file resync.cpp
 * @brief Stream resynchronization implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "resync.hpp"

#include "log.hpp"

namespace capulin
{
namespace internal
{

bool resync(TransportSession& session, uint8_t last_packet_type)
{
  ResyncState& state = session.resync_state();

  state.resynced = false;
  state.resync_count++;
  state.packet_type_at_last_corruption = last_packet_type;

  int discarded = 0;
  while (session.available() > 0)
  {
    uint8_t byte = 0;
    if (session.read(&byte, 1) <= 0)
    {
      break;
    }
    if (byte == MAGIC_0)
    {
      state.resynced = true;
      break;
    }
    discarded++;
  }

  CAPULIN_LOG(LDebug, "%s: resync #%d after packet %u, discarded %d bytes, %s",
              session.name().c_str(), state.resync_count, last_packet_type, discarded,
              state.resynced ? "found header" : "stream exhausted");

  return state.resynced;
}

}  // namespace internal
}  // namespace capulin
