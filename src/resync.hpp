/**
 * @file resync.hpp
 * @brief Stream resynchronization after framing errors (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>

#include "capulin/session.hpp"

namespace capulin
{
namespace internal
{

/**
 * @brief Discard bytes until the first magic byte or until the stream is empty
 *
 * If a 0xAA byte is found, it has been removed from the stream and
 * state.resynced is set so the next header read starts at the second magic
 * byte. Never blocks on an empty stream.
 *
 * When the byte just before a genuine header is itself 0xAA (usually a
 * checksum), that byte is taken as the header start and the following
 * packet is lost as well. This is rare and accepted.
 *
 * Every call counts as a resync event, successful or not, and records the
 * type of the last good packet as the one preceding the corruption.
 *
 * @param session          Ready session to read from
 * @param last_packet_type Type of the packet processed before the error
 * @return true if a 0xAA byte was found
 */
bool resync(TransportSession& session, uint8_t last_packet_type);

}  // namespace internal
}  // namespace capulin
