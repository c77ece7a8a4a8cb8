/**
 * @file dispatcher.hpp
 * @brief Packet type dispatch
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <vector>

#include "capulin/protocol.hpp"
#include "capulin/session.hpp"

namespace capulin
{

/**
 * @brief Maps packet types to fixed payload sizes and decode routines
 *
 * Each board registers its packet table at construction. The table is data,
 * so a protocol version with different sizes only changes registrations.
 */
class PacketDispatcher
{
 public:
  /**
   * @brief Decode routine for one packet type
   *
   * The payload buffer is reused by the next call; decoders must copy what
   * they keep.
   *
   * @param payload Pointer to the payload bytes
   * @param len     Payload length (the registered size)
   */
  using DecodeFn = std::function<void(const uint8_t* payload, size_t len)>;

  /** @brief Result of process_until_type() */
  enum class Result
  {
    DECODED,         ///< The target packet type was decoded
    NONE_AVAILABLE,  ///< All available packets were processed without a match
  };

  /** @brief Returned by process_one() when no packet is available */
  static constexpr int NO_PACKET = -1;

  /**
   * @brief Construct a dispatcher reading from a session
   *
   * @param session            Session to read from
   * @param payload_wait_ticks Ticks to wait for a payload once its header is read
   */
  explicit PacketDispatcher(TransportSession& session,
                            int payload_wait_ticks = PAYLOAD_WAIT_TICKS);

  /**
   * @brief Register or replace a packet type
   *
   * @param type         Packet type byte
   * @param payload_size Fixed payload size in bytes
   * @param decode       Decode routine called with the full payload
   */
  void register_packet(uint8_t type, size_t payload_size, DecodeFn decode);

  /**
   * @brief Change the payload size of a registered type
   *
   * @return false if the type is not registered
   */
  bool set_payload_size(uint8_t type, size_t payload_size);

  /**
   * @brief Registered payload size of a type, 0 if unknown
   */
  size_t payload_size(uint8_t type) const;

  /**
   * @brief Process a single packet if one is available
   *
   * If wait_for_packet is true, waits up to timeout_ticks * POLL_TICK_MS for a
   * header to arrive.
   *
   * @return Number of payload bytes consumed (header and type byte excluded)
   *         when a packet was decoded; 0 if bytes were consumed but no packet
   *         was decoded (framing error, unknown type, or payload timeout);
   *         NO_PACKET if no packet was available.
   */
  int process_one(bool wait_for_packet, int timeout_ticks);

  /**
   * @brief Process packets until one of the target type is decoded
   *
   * Does not wait for new headers; stops as soon as the stream holds no
   * further packet.
   *
   * @param target Packet type to look for
   */
  Result process_until_type(uint8_t target);

  /** @brief Type of the last packet header read */
  uint8_t last_packet_type() const
  {
    return packet_type_;
  }

 private:
  struct Entry
  {
    size_t size;
    DecodeFn decode;
  };

  /**
   * @brief Wait for and decode the payload of a registered type
   */
  int read_payload(uint8_t type, const Entry& entry);

  TransportSession& session_;
  std::map<uint8_t, Entry> table_;
  std::vector<uint8_t> buffer_;  ///< Payload buffer, reused across calls
  uint8_t packet_type_;
  bool target_decoded_;
  uint8_t target_type_;
  int payload_wait_ticks_;
};

}  // namespace capulin
