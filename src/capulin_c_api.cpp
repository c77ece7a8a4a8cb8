/**
 * @file capulin_c_api.cpp
 * @brief Capulin control board C API implementation
 *
 * C wrapper for the C++ ControlBoard class.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <chrono>
#include <new>
#include <string>

#include "capulin/capulin.h"
#include "capulin/control_board.hpp"

using namespace capulin;

/* ========================================================================= */
/* Internal wrapper structure                                                */
/* ========================================================================= */

struct CapulinControlBoard
{
  ControlBoard* cpp_board;

  CapulinControlBoard(const char* name, const char* address, int simulate) : cpp_board(nullptr)
  {
    SessionSettings settings;
    settings.address = address ? address : "";
    settings.simulate = simulate != 0;

    cpp_board = new (std::nothrow)
        ControlBoard(name ? name : "Control Board", 0, settings, ControlBoardConfig());
  }

  ~CapulinControlBoard()
  {
    delete cpp_board;
  }
};

namespace
{

capulin_error_t to_c_error(ErrorCode code)
{
  return static_cast<capulin_error_t>(code);
}

capulin_error_t sent(bool ok)
{
  return ok ? CAPULIN_ERR_OK : CAPULIN_ERR_NOT_CONNECTED;
}

}  // namespace

/* ========================================================================= */
/* Error message strings                                                     */
/* ========================================================================= */

const char* capulin_strerror(capulin_error_t err)
{
  switch (err)
  {
#define ERR(name, val, msg) \
  case CAPULIN_ERR_##name:  \
    return msg;
#include "capulin/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

/* ========================================================================= */
/* Lifecycle functions                                                       */
/* ========================================================================= */

CapulinControlBoard* capulin_control_create(const char* name, const char* address,
                                            int simulate)
{
  CapulinControlBoard* board = new (std::nothrow) CapulinControlBoard(name, address, simulate);
  if (board == nullptr || board->cpp_board == nullptr)
  {
    delete board;
    return nullptr;
  }

  return board;
}

void capulin_control_destroy(CapulinControlBoard* board)
{
  delete board;
}

void capulin_control_start(CapulinControlBoard* board)
{
  if (board && board->cpp_board)
  {
    board->cpp_board->start();
  }
}

capulin_error_t capulin_control_wait_ready(CapulinControlBoard* board, uint32_t timeout_ms)
{
  if (!board || !board->cpp_board)
  {
    return CAPULIN_ERR_NOT_CONNECTED;
  }

  if (!board->cpp_board->wait_for_setup(std::chrono::milliseconds(timeout_ms)))
  {
    return CAPULIN_ERR_TIMEOUT;
  }
  if (board->cpp_board->is_ready())
  {
    return CAPULIN_ERR_OK;
  }

  const ErrorCode error = board->cpp_board->session().last_error();
  return error == ErrorCode::OK ? CAPULIN_ERR_NOT_CONNECTED : to_c_error(error);
}

int capulin_control_is_ready(const CapulinControlBoard* board)
{
  if (board && board->cpp_board)
  {
    return board->cpp_board->is_ready() ? 1 : 0;
  }
  return 0;
}

void capulin_control_shut_down(CapulinControlBoard* board)
{
  if (board && board->cpp_board)
  {
    board->cpp_board->shut_down();
  }
}

/* ========================================================================= */
/* Operation functions                                                       */
/* ========================================================================= */

int capulin_control_process_one(CapulinControlBoard* board, int wait, int timeout_ticks)
{
  if (board && board->cpp_board)
  {
    return board->cpp_board->process_one_data_packet(wait != 0, timeout_ticks);
  }
  return CAPULIN_NO_PACKET;
}

int capulin_control_get_inspect(CapulinControlBoard* board, capulin_inspect_t* out)
{
  if (!board || !board->cpp_board || !out)
  {
    return 0;
  }

  const bool fresh = board->cpp_board->take_new_inspect_packet();

  const InspectState state = board->cpp_board->inspect_state();
  out->packet_count = state.packet_count;
  out->encoder1 = state.encoder1;
  out->encoder2 = state.encoder2;
  out->encoder1_increasing = state.encoder1_direction == Direction::INCREASING ? 1 : 0;
  out->encoder2_increasing = state.encoder2_direction == Direction::INCREASING ? 1 : 0;
  out->on_pipe = state.on_pipe ? 1 : 0;
  out->head1_down = state.head1_down ? 1 : 0;
  out->head2_down = state.head2_down ? 1 : 0;
  out->tdc = state.tdc ? 1 : 0;

  return fresh ? 1 : 0;
}

void capulin_control_get_encoders(const CapulinControlBoard* board, int32_t* encoder1,
                                  int32_t* encoder2)
{
  if (!board || !board->cpp_board)
  {
    return;
  }

  const InspectState state = board->cpp_board->inspect_state();
  if (encoder1)
  {
    *encoder1 = state.encoder1;
  }
  if (encoder2)
  {
    *encoder2 = state.encoder2;
  }
}

capulin_error_t capulin_control_start_inspect(CapulinControlBoard* board)
{
  if (board && board->cpp_board)
  {
    return sent(board->cpp_board->start_inspect());
  }
  return CAPULIN_ERR_NOT_CONNECTED;
}

capulin_error_t capulin_control_stop_inspect(CapulinControlBoard* board)
{
  if (board && board->cpp_board)
  {
    return sent(board->cpp_board->stop_inspect());
  }
  return CAPULIN_ERR_NOT_CONNECTED;
}

void capulin_control_drive_simulation(CapulinControlBoard* board)
{
  if (board && board->cpp_board)
  {
    board->cpp_board->drive_simulation();
  }
}
