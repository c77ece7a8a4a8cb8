/**
 * @file frame.hpp
 * @brief Frame encoding/decoding utilities (internal)
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
 * @brief Check one byte of the packet header
 *
 * @param position Index in the magic sequence (0..3)
 * @param byte     Received byte
 * @return true if byte is the expected magic byte at that position
 */
bool is_magic(size_t position, uint8_t byte);

/**
 * @brief Decode a big-endian signed 32-bit value
 *
 * @param data Pointer to 4 bytes
 */
int32_t decode_be32(const uint8_t* data);

/**
 * @brief Decode a big-endian unsigned 16-bit value
 *
 * @param data Pointer to 2 bytes
 */
uint16_t decode_be16(const uint8_t* data);

/**
 * @brief Append a big-endian 32-bit value, high byte first
 */
void encode_be32(int32_t value, std::vector<uint8_t>& out);

/**
 * @brief Append a big-endian 16-bit value, high byte first
 */
void encode_be16(uint16_t value, std::vector<uint8_t>& out);

/**
 * @brief Encode an outbound command frame
 *
 * Generates [CMD][PARAM...]
 *
 * @param cmd    Command code
 * @param params Parameter bytes (can be nullptr if count == 0)
 * @param count  Number of parameter bytes
 * @param out    Output buffer for encoded frame
 * @return true on success, false if count exceeds MAX_COMMAND_PARAMS
 */
bool encode_command(uint8_t cmd, const uint8_t* params, size_t count, std::vector<uint8_t>& out);

/**
 * @brief Encode a complete inbound packet
 *
 * Generates [0xAA][0x55][0xBB][0x66][TYPE][PAYLOAD...]. Used by the board
 * simulators.
 *
 * @param type    Packet type
 * @param payload Payload bytes (can be nullptr if len == 0)
 * @param len     Payload length
 * @param out     Output buffer, appended to
 */
void encode_packet(uint8_t type, const uint8_t* payload, size_t len, std::vector<uint8_t>& out);

}  // namespace internal
}  // namespace capulin
