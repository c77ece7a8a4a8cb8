/**
 * @file frame.cpp
 * @brief Frame encoding/decoding implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "frame.hpp"

namespace capulin
{
namespace internal
{

namespace
{

constexpr uint8_t MAGIC[MAGIC_SIZE] = {MAGIC_0, MAGIC_1, MAGIC_2, MAGIC_3};

}  // namespace

bool is_magic(size_t position, uint8_t byte)
{
  return position < MAGIC_SIZE && MAGIC[position] == byte;
}

int32_t decode_be32(const uint8_t* data)
{
  const uint32_t value = (static_cast<uint32_t>(data[0]) << 24) |
                         (static_cast<uint32_t>(data[1]) << 16) |
                         (static_cast<uint32_t>(data[2]) << 8) | static_cast<uint32_t>(data[3]);
  return static_cast<int32_t>(value);
}

uint16_t decode_be16(const uint8_t* data)
{
  return static_cast<uint16_t>((data[0] << 8) | data[1]);
}

void encode_be32(int32_t value, std::vector<uint8_t>& out)
{
  const uint32_t bits = static_cast<uint32_t>(value);
  out.push_back(static_cast<uint8_t>((bits >> 24) & 0xFF));
  out.push_back(static_cast<uint8_t>((bits >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((bits >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(bits & 0xFF));
}

void encode_be16(uint16_t value, std::vector<uint8_t>& out)
{
  out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(value & 0xFF));
}

bool encode_command(uint8_t cmd, const uint8_t* params, size_t count, std::vector<uint8_t>& out)
{
  if (count > MAX_COMMAND_PARAMS)
  {
    return false;
  }

  out.clear();
  out.reserve(1 + count);
  out.push_back(cmd);

  if (count > 0 && params != nullptr)
  {
    out.insert(out.end(), params, params + count);
  }

  return true;
}

void encode_packet(uint8_t type, const uint8_t* payload, size_t len, std::vector<uint8_t>& out)
{
  out.reserve(out.size() + HEADER_SIZE + len);
  out.insert(out.end(), MAGIC, MAGIC + MAGIC_SIZE);
  out.push_back(type);

  if (len > 0 && payload != nullptr)
  {
    out.insert(out.end(), payload, payload + len);
  }
}

}  // namespace internal
}  // namespace capulin
