/**
 * @file payloads.cpp
 * @brief Packet payload layouts implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "payloads.hpp"

#include "frame.hpp"

namespace capulin
{
namespace internal
{

InspectPayload decode_inspect(const uint8_t* data)
{
  InspectPayload payload;
  payload.packet_count = decode_be16(&data[0]);
  payload.encoder1 = decode_be32(&data[2]);
  payload.encoder2 = decode_be32(&data[6]);
  payload.process_control_flags = data[10];
  payload.port_e = data[11];
  return payload;
}

void encode_inspect(const InspectPayload& payload, std::vector<uint8_t>& out)
{
  encode_be16(payload.packet_count, out);
  encode_be32(payload.encoder1, out);
  encode_be32(payload.encoder2, out);
  out.push_back(payload.process_control_flags);
  out.push_back(payload.port_e);
}

AllEncodersPayload decode_all_encoders(const uint8_t* data)
{
  AllEncodersPayload payload;
  payload.on_pipe = decode_be32(&data[0]);
  payload.off_pipe = decode_be32(&data[4]);
  payload.head1_down = decode_be32(&data[8]);
  payload.head1_up = decode_be32(&data[12]);
  payload.head2_down = decode_be32(&data[16]);
  payload.head2_up = decode_be32(&data[20]);
  return payload;
}

void encode_all_encoders(const AllEncodersPayload& payload, std::vector<uint8_t>& out)
{
  encode_be32(payload.on_pipe, out);
  encode_be32(payload.off_pipe, out);
  encode_be32(payload.head1_down, out);
  encode_be32(payload.head1_up, out);
  encode_be32(payload.head2_down, out);
  encode_be32(payload.head2_up, out);
}

CutterDataPayload decode_cutter_data(const uint8_t* data)
{
  CutterDataPayload payload;
  payload.sequence = decode_be16(&data[0]);
  payload.depth = decode_be32(&data[2]);
  payload.target_depth = decode_be32(&data[6]);
  payload.status = data[10];
  return payload;
}

void encode_cutter_data(const CutterDataPayload& payload, std::vector<uint8_t>& out)
{
  encode_be16(payload.sequence, out);
  encode_be32(payload.depth, out);
  encode_be32(payload.target_depth, out);
  out.push_back(payload.status);
}

}  // namespace internal
}  // namespace capulin
