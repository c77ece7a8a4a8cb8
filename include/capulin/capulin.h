/**
 * @file capulin.h
 * @brief Capulin control board C API
 *
 * C-compatible interface to the inspection control board driver.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Protocol constants                                                        */
  /* ========================================================================= */

  /** @brief TCP port the boards listen on */
#define CAPULIN_BOARD_PORT 23

  /** @brief Returned by capulin_control_process_one() when no packet is waiting */
#define CAPULIN_NO_PACKET (-1)

  /* ========================================================================= */
  /* Error codes                                                               */
  /* ========================================================================= */

  typedef enum
  {
#define ERR(name, val, msg) CAPULIN_ERR_##name = val,
#include "capulin/errors.def"
#undef ERR
  } capulin_error_t;

  /**
   * @brief Get error message string
   * @param err Error code
   * @return Error message (static string)
   */
  const char* capulin_strerror(capulin_error_t err);

  /* ========================================================================= */
  /* Control board handle                                                      */
  /* ========================================================================= */

  /** @brief Opaque handle to a control board */
  typedef struct CapulinControlBoard CapulinControlBoard;

  /** @brief Decoded inspect packet */
  typedef struct
  {
    uint16_t packet_count;
    int32_t encoder1;
    int32_t encoder2;
    int encoder1_increasing; /**< 1 if encoder1 grew since the previous packet */
    int encoder2_increasing;
    int on_pipe;
    int head1_down;
    int head2_down;
    int tdc;
  } capulin_inspect_t;

  /* ========================================================================= */
  /* Lifecycle functions                                                       */
  /* ========================================================================= */

  /**
   * @brief Create an unconnected control board
   *
   * @param name     Name used in diagnostics
   * @param address  Board address from discovery, NULL or "" if unknown
   * @param simulate Nonzero to talk to the in-process simulator
   * @return Board handle, or NULL on allocation failure
   */
  CapulinControlBoard* capulin_control_create(const char* name, const char* address,
                                              int simulate);

  /**
   * @brief Shut down and free the board
   * @param board Board handle (NULL-safe)
   */
  void capulin_control_destroy(CapulinControlBoard* board);

  /**
   * @brief Connect on a background thread
   */
  void capulin_control_start(CapulinControlBoard* board);

  /**
   * @brief Wait until connecting has finished
   *
   * @param board      Board handle
   * @param timeout_ms Maximum wait in milliseconds
   * @return CAPULIN_ERR_OK when ready, CAPULIN_ERR_TIMEOUT if still connecting,
   *         otherwise the connection error
   */
  capulin_error_t capulin_control_wait_ready(CapulinControlBoard* board, uint32_t timeout_ms);

  /**
   * @brief Check whether the board is ready
   * @return 1 if ready, 0 otherwise
   */
  int capulin_control_is_ready(const CapulinControlBoard* board);

  /**
   * @brief Close the connection; the handle stays valid until destroyed
   */
  void capulin_control_shut_down(CapulinControlBoard* board);

  /* ========================================================================= */
  /* Operation functions                                                       */
  /* ========================================================================= */

  /**
   * @brief Process one packet from the board
   *
   * @param board         Board handle
   * @param wait          Nonzero to wait for a packet
   * @param timeout_ticks Ticks of 10 ms to wait
   * @return Payload bytes consumed, 0 if nothing was decoded, or
   *         CAPULIN_NO_PACKET
   */
  int capulin_control_process_one(CapulinControlBoard* board, int wait, int timeout_ticks);

  /**
   * @brief Copy the last decoded inspect packet
   *
   * @param board Board handle
   * @param out   Destination
   * @return 1 if a new packet arrived since the previous call, 0 otherwise
   */
  int capulin_control_get_inspect(CapulinControlBoard* board, capulin_inspect_t* out);

  /**
   * @brief Get the current encoder counts
   */
  void capulin_control_get_encoders(const CapulinControlBoard* board, int32_t* encoder1,
                                    int32_t* encoder2);

  /** @return CAPULIN_ERR_OK, or CAPULIN_ERR_NOT_CONNECTED if the command was not sent */
  capulin_error_t capulin_control_start_inspect(CapulinControlBoard* board);

  capulin_error_t capulin_control_stop_inspect(CapulinControlBoard* board);

  /**
   * @brief Advance the simulated board one step; no-op on real hardware
   */
  void capulin_control_drive_simulation(CapulinControlBoard* board);

#ifdef __cplusplus
} /* extern "C" */
#endif
