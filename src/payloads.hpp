/**
 * @file payloads.hpp
 * @brief Fixed-size packet payload layouts (internal)
 *
 * All multi-byte fields are big-endian.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "capulin/protocol.hpp"

namespace capulin
{
namespace internal
{

/**
 * Inspect packet, INSPECT_PACKET_SIZE bytes:
 *
 * [COUNT_H][COUNT_L][ENC1 x4][ENC2 x4][CTRL_FLAGS][PORT_E]
 */
struct InspectPayload
{
  uint16_t packet_count;
  int32_t encoder1;
  int32_t encoder2;
  uint8_t process_control_flags;  ///< Active high
  uint8_t port_e;                 ///< Active low
};

/**
 * All encoder values packet, ALL_ENCODERS_PACKET_SIZE bytes: six signed
 * 32-bit positions latched at inspection events.
 */
struct AllEncodersPayload
{
  int32_t on_pipe;
  int32_t off_pipe;
  int32_t head1_down;
  int32_t head1_up;
  int32_t head2_down;
  int32_t head2_up;
};

/**
 * Cutter data packet, CUTTER_DATA_PACKET_SIZE bytes:
 *
 * [SEQ_H][SEQ_L][DEPTH x4][TARGET x4][STATUS]
 */
struct CutterDataPayload
{
  uint16_t sequence;
  int32_t depth;
  int32_t target_depth;
  uint8_t status;
};

InspectPayload decode_inspect(const uint8_t* data);
void encode_inspect(const InspectPayload& payload, std::vector<uint8_t>& out);

AllEncodersPayload decode_all_encoders(const uint8_t* data);
void encode_all_encoders(const AllEncodersPayload& payload, std::vector<uint8_t>& out);

CutterDataPayload decode_cutter_data(const uint8_t* data);
void encode_cutter_data(const CutterDataPayload& payload, std::vector<uint8_t>& out);

}  // namespace internal
}  // namespace capulin
