/**
 * @file packet_reader.hpp
 * @brief Timeout-bounded packet header reader (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "capulin/session.hpp"

namespace capulin
{
namespace internal
{

/** @brief No header available within the wait */
constexpr int HEADER_NONE = -1;

/** @brief Bytes were consumed but no valid header was found */
constexpr int HEADER_MISS = 0;

/** @brief A full header was read and packet_type is set */
constexpr int HEADER_OK = 1;

/**
 * @brief Read one packet header if available
 *
 * If wait is true, sleeps in POLL_TICK_MS steps until HEADER_SIZE bytes are
 * available or timeout_ticks elapse. Otherwise checks once.
 *
 * Magic bytes are read one at a time so an invalid byte cannot swallow the
 * start of a valid sequence that follows within three bytes. A mismatch at
 * any position resyncs the stream. If the previous call left the stream
 * resynced, the first magic byte has already been consumed and is not read
 * again.
 *
 * @param session          Ready session to read from
 * @param wait             Wait for bytes to arrive
 * @param timeout_ticks    Number of ticks to wait
 * @param last_packet_type Type of the last packet, recorded on resync
 * @param packet_type      Set to the packet type on HEADER_OK
 * @return HEADER_NONE, HEADER_MISS or HEADER_OK
 */
int read_header(TransportSession& session, bool wait, int timeout_ticks,
                uint8_t last_packet_type, uint8_t& packet_type);

/**
 * @brief Wait until count bytes are available
 *
 * @param session       Ready session
 * @param count         Number of bytes required
 * @param timeout_ticks Number of POLL_TICK_MS ticks to wait
 * @return true if the bytes are available
 */
bool wait_for_bytes(TransportSession& session, size_t count, int timeout_ticks);

}  // namespace internal
}  // namespace capulin
