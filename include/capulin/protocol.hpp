/**
 * @file protocol.hpp
 * @brief Capulin board protocol definitions
 *
 * Header-delimited binary packet protocol spoken by the Capulin control
 * boards over a persistent TCP connection.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace capulin
{

/* ========================================================================= */
/* Frame format constants                                                    */
/* ========================================================================= */

/**
 * @brief Packet header magic sequence
 *
 * Every packet sent by a board begins with these four bytes.
 */
constexpr uint8_t MAGIC_0 = 0xAA;
constexpr uint8_t MAGIC_1 = 0x55;
constexpr uint8_t MAGIC_2 = 0xBB;
constexpr uint8_t MAGIC_3 = 0x66;

/** @brief Number of magic bytes */
constexpr size_t MAGIC_SIZE = 4;

/** @brief Magic bytes plus the packet type byte */
constexpr size_t HEADER_SIZE = MAGIC_SIZE + 1;

/** @brief Maximum number of parameter bytes in an outbound command */
constexpr size_t MAX_COMMAND_PARAMS = 4;

/* ========================================================================= */
/* Frame structure                                                           */
/* ========================================================================= */

/**
 * Inbound packet format:
 *
 * [0xAA][0x55][0xBB][0x66][TYPE][PAYLOAD...]
 *
 * - MAGIC:   4 bytes (0xAA 0x55 0xBB 0x66)
 * - TYPE:    1 byte  (packet type, usually the id of the request it answers)
 * - PAYLOAD: N bytes (fixed size per packet type, big-endian fields)
 *
 * Outbound command format:
 *
 * [CMD][PARAM...]
 *
 * - CMD:   1 byte  (command code)
 * - PARAM: 0..4 bytes (multi-byte values high byte first)
 */

/* ========================================================================= */
/* Transport constants                                                       */
/* ========================================================================= */

/** @brief TCP port the boards listen on */
constexpr uint16_t BOARD_PORT = 23;

/** @brief Socket level receive timeout in milliseconds */
constexpr int RECEIVE_TIMEOUT_MS = 250;

/** @brief Polling tick used while waiting for bytes, in milliseconds */
constexpr int POLL_TICK_MS = 10;

/** @brief Number of ticks to wait for a full payload once a header is seen */
constexpr int PAYLOAD_WAIT_TICKS = 50;

/** @brief Maximum length of the greeting line sent on connect */
constexpr size_t MAX_GREETING_LENGTH = 256;

/** @brief Default size of runtime data packets */
constexpr size_t RUNTIME_PACKET_SIZE = 2048;

/* ========================================================================= */
/* Payload sizes                                                             */
/* ========================================================================= */

constexpr size_t MONITOR_PACKET_SIZE = 25;
constexpr size_t ALL_ENCODERS_PACKET_SIZE = 24;
constexpr size_t INSPECT_PACKET_SIZE = 12;

/**
 * @brief Status and address reply sizes
 *
 * The firmware documents these as provisional. Boards store them in their
 * packet table so a different protocol version can override them.
 */
constexpr size_t STATUS_PACKET_SIZE = 2;
constexpr size_t ADDRESS_PACKET_SIZE = 2;

constexpr size_t CUTTER_DATA_PACKET_SIZE = 11;

/* ========================================================================= */
/* Control board command codes                                               */
/* ========================================================================= */

/**
 * @brief Commands understood by the inspection control board
 *
 * These must match the values in the board firmware.
 */
enum class ControlCommand : uint8_t
{
  NO_ACTION = 0,
  GET_INSPECT_PACKET = 1,
  ZERO_ENCODERS = 2,
  GET_MONITOR_PACKET = 3,
  PULSE_OUTPUT = 4,
  TURN_ON_OUTPUT = 5,
  TURN_OFF_OUTPUT = 6,
  SET_ENCODERS_DELTA_TRIGGER = 7,
  START_INSPECT = 8,
  STOP_INSPECT = 9,
  START_MONITOR = 10,
  STOP_MONITOR = 11,
  GET_STATUS = 12,
  LOAD_FIRMWARE = 13,
  SEND_DATA = 14,
  DATA = 15,
  GET_CHASSIS_SLOT_ADDRESS = 16,
  SET_CONTROL_FLAGS = 17,
  RESET_TRACK_COUNTERS = 18,
  GET_ALL_ENCODER_VALUES = 19,

  ERROR = 125,
  DEBUG = 126,
  EXIT = 127,
};

/* ========================================================================= */
/* Cutter board command codes                                                */
/* ========================================================================= */

/**
 * @brief Commands understood by the notch cutter board
 */
enum class CutterCommand : uint8_t
{
  NO_ACTION = 0,
  CUT_MODE = 1,
  STOP_MODE = 2,
  ZERO_DEPTH = 3,
  ZERO_TARGET_DEPTH = 4,
  GET_DATA_PACKET = 5,
  GET_STATUS = 12,
  LOAD_FIRMWARE = 13,
  SEND_DATA = 14,
  DATA = 15,

  ERROR = 125,
  EXIT = 127,
};

/* ========================================================================= */
/* Control flags sent to the board                                           */
/* ========================================================================= */

/**
 * Only the lower 16 bits are used; the board stores them in an unsigned int.
 */

/** @brief Tracking pulse every o'clock position, reset pulse at every TDC */
constexpr uint16_t FLAG_SEND_CLOCK_MARKERS = 0x0001;

/** @brief Single pulse at every TDC detection */
constexpr uint16_t FLAG_SEND_TDC = 0x0002;

/** @brief Enables track sync pulses (track reset pulses are unaffected) */
constexpr uint16_t FLAG_TRACK_PULSES_ENABLED = 0x0004;

/* ========================================================================= */
/* Status byte masks in inspect packets                                      */
/* ========================================================================= */

/** Process control byte, active high */
constexpr uint8_t ON_PIPE_CTRL = 0x01;
constexpr uint8_t HEAD1_DOWN_CTRL = 0x02;
constexpr uint8_t HEAD2_DOWN_CTRL = 0x04;

/** Port E input byte, active low */
constexpr uint8_t TDC_MASK = 0x01;
constexpr uint8_t UNUSED3_MASK = 0x20;

/* ========================================================================= */
/* Error codes                                                               */
/* ========================================================================= */

/**
 * @brief Transport error codes
 *
 * Defined via errors.def so the C API shares the same values.
 */
enum class ErrorCode : uint8_t
{
#define ERR(name, val, msg) name = val,
#include "capulin/errors.def"
#undef ERR
};

/**
 * @brief Get the message for an error code
 *
 * @param code Error code
 * @return Static message string
 */
const char* error_message(ErrorCode code);

}  // namespace capulin
