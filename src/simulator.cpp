/**
 * @file simulator.cpp
 * @brief In-process board simulators implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "simulator.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <initializer_list>
#include <vector>

#include "frame.hpp"
#include "log.hpp"
#include "payloads.hpp"

namespace capulin
{
namespace internal
{

/* ========================================================================= */
/* BoardSimulator                                                            */
/* ========================================================================= */

BoardSimulator::BoardSimulator(const std::string& greeting)
    : queue_mutex_(),
      queue_cv_(),
      out_(greeting.begin(), greeting.end()),
      timeout_ms_(RECEIVE_TIMEOUT_MS),
      input_open_(true),
      output_open_(true)
{
  out_.push_back('\r');
  out_.push_back('\n');
}

int BoardSimulator::available()
{
  std::lock_guard<std::mutex> lock(queue_mutex_);
  if (!input_open_)
  {
    return -1;
  }
  return static_cast<int>(out_.size());
}

int BoardSimulator::read(uint8_t* buf, size_t len)
{
  std::unique_lock<std::mutex> lock(queue_mutex_);
  queue_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms_),
                     [this] { return !out_.empty() || !input_open_; });
  if (!input_open_)
  {
    return -1;
  }

  const size_t n = std::min(len, out_.size());
  std::copy(out_.begin(), out_.begin() + static_cast<std::ptrdiff_t>(n), buf);
  out_.erase(out_.begin(), out_.begin() + static_cast<std::ptrdiff_t>(n));
  return static_cast<int>(n);
}

int BoardSimulator::write(const uint8_t* data, size_t len)
{
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!output_open_)
    {
      return -1;
    }
  }

  if (len > 0)
  {
    handle_command(data, len);
  }
  return static_cast<int>(len);
}

bool BoardSimulator::set_receive_timeout(int timeout_ms)
{
  std::lock_guard<std::mutex> lock(queue_mutex_);
  timeout_ms_ = timeout_ms;
  return true;
}

void BoardSimulator::shutdown_output()
{
  std::lock_guard<std::mutex> lock(queue_mutex_);
  output_open_ = false;
}

void BoardSimulator::shutdown_input()
{
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    input_open_ = false;
  }
  queue_cv_.notify_all();
}

void BoardSimulator::close()
{
  shutdown_output();
  shutdown_input();
}

void BoardSimulator::queue_packet(uint8_t type, const uint8_t* payload, size_t len)
{
  std::vector<uint8_t> packet;
  encode_packet(type, payload, len, packet);
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!input_open_)
    {
      return;
    }
    out_.insert(out_.end(), packet.begin(), packet.end());
  }
  queue_cv_.notify_all();
}

/* ========================================================================= */
/* ControlSimulator                                                          */
/* ========================================================================= */

namespace
{

/// Encoder travel, in delta triggers, before each simulated event
constexpr int32_t ON_PIPE_STEPS = 10;
constexpr int32_t HEAD1_DOWN_STEPS = 20;
constexpr int32_t HEAD2_DOWN_STEPS = 30;

/// A TDC pulse is reported on every Nth inspect packet
constexpr uint16_t TDC_INTERVAL = 4;

/// Depth reached by a fresh simulated cutter before the target is zeroed
constexpr int32_t DEFAULT_TARGET_DEPTH = 100;

}  // namespace

ControlSimulator::ControlSimulator(const ControlBoardConfig& config, int chassis, int slot)
    : BoardSimulator("Control Board Simulator"),
      ids_(config.packet_ids),
      status_size_(config.status_payload_size),
      address_size_(config.address_payload_size),
      chassis_(chassis),
      slot_(slot),
      state_mutex_(),
      inspecting_(false),
      monitoring_(false),
      packet_count_(0),
      encoder1_(0),
      encoder2_(0),
      encoder1_delta_trigger_(83),
      encoder2_delta_trigger_(83),
      control_flags_(0),
      outputs_(0),
      last_command_(-1),
      on_pipe_position_(INT32_MAX),
      head1_down_position_(INT32_MAX),
      head2_down_position_(INT32_MAX)
{
}

uint16_t ControlSimulator::control_flags() const
{
  std::lock_guard<std::mutex> lock(state_mutex_);
  return control_flags_;
}

int ControlSimulator::last_command() const
{
  std::lock_guard<std::mutex> lock(state_mutex_);
  return last_command_;
}

void ControlSimulator::handle_command(const uint8_t* frame, size_t len)
{
  std::lock_guard<std::mutex> lock(state_mutex_);
  last_command_ = frame[0];

  switch (static_cast<ControlCommand>(frame[0]))
  {
    case ControlCommand::GET_STATUS:
    {
      std::vector<uint8_t> payload(status_size_, 0);
      if (!payload.empty())
      {
        payload[0] =
            static_cast<uint8_t>((inspecting_ ? 0x01 : 0x00) | (monitoring_ ? 0x02 : 0x00));
      }
      queue_packet(ids_.status, payload.data(), payload.size());
      break;
    }
    case ControlCommand::GET_CHASSIS_SLOT_ADDRESS:
    {
      std::vector<uint8_t> payload(address_size_, 0);
      if (!payload.empty())
      {
        payload[0] = static_cast<uint8_t>(((chassis_ & 0x0F) << 4) | (slot_ & 0x0F));
      }
      queue_packet(ids_.chassis_slot, payload.data(), payload.size());
      break;
    }
    case ControlCommand::GET_INSPECT_PACKET:
      send_inspect_packet();
      break;
    case ControlCommand::GET_MONITOR_PACKET:
      send_monitor_packet();
      break;
    case ControlCommand::GET_ALL_ENCODER_VALUES:
      send_all_encoders_packet();
      break;
    case ControlCommand::ZERO_ENCODERS:
      encoder1_ = 0;
      encoder2_ = 0;
      break;
    case ControlCommand::START_INSPECT:
      inspecting_ = true;
      break;
    case ControlCommand::STOP_INSPECT:
      inspecting_ = false;
      break;
    case ControlCommand::START_MONITOR:
      monitoring_ = true;
      break;
    case ControlCommand::STOP_MONITOR:
      monitoring_ = false;
      break;
    case ControlCommand::TURN_ON_OUTPUT:
      if (len > 1 && frame[1] < 32)
      {
        outputs_ |= (1u << frame[1]);
      }
      break;
    case ControlCommand::TURN_OFF_OUTPUT:
    case ControlCommand::PULSE_OUTPUT:
      // A pulse is over before the next monitor packet could show it
      if (len > 1 && frame[1] < 32)
      {
        outputs_ &= ~(1u << frame[1]);
      }
      break;
    case ControlCommand::SET_ENCODERS_DELTA_TRIGGER:
      if (len >= 5)
      {
        encoder1_delta_trigger_ = (frame[1] << 8) | frame[2];
        encoder2_delta_trigger_ = (frame[3] << 8) | frame[4];
      }
      break;
    case ControlCommand::SET_CONTROL_FLAGS:
      if (len >= 3)
      {
        control_flags_ = static_cast<uint16_t>((frame[1] << 8) | frame[2]);
      }
      break;
    case ControlCommand::RESET_TRACK_COUNTERS:
      packet_count_ = 0;
      break;
    default:
      CAPULIN_LOG(LDebug, "Control simulator ignores command %u", frame[0]);
      break;
  }
}

void ControlSimulator::drive()
{
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (inspecting_)
  {
    encoder1_ += encoder1_delta_trigger_;
    encoder2_ += encoder2_delta_trigger_;

    if (on_pipe_position_ == INT32_MAX && encoder1_ >= ON_PIPE_STEPS * encoder1_delta_trigger_)
    {
      on_pipe_position_ = encoder1_;
    }
    if (head1_down_position_ == INT32_MAX &&
        encoder1_ >= HEAD1_DOWN_STEPS * encoder1_delta_trigger_)
    {
      head1_down_position_ = encoder1_;
    }
    if (head2_down_position_ == INT32_MAX &&
        encoder1_ >= HEAD2_DOWN_STEPS * encoder1_delta_trigger_)
    {
      head2_down_position_ = encoder1_;
    }

    send_inspect_packet();
  }
  if (monitoring_)
  {
    send_monitor_packet();
  }
}

void ControlSimulator::send_inspect_packet()
{
  InspectPayload inspect;
  inspect.packet_count = packet_count_++;
  inspect.encoder1 = encoder1_;
  inspect.encoder2 = encoder2_;

  inspect.process_control_flags = 0;
  if (on_pipe_position_ != INT32_MAX)
  {
    inspect.process_control_flags |= ON_PIPE_CTRL;
  }
  if (head1_down_position_ != INT32_MAX)
  {
    inspect.process_control_flags |= HEAD1_DOWN_CTRL;
  }
  if (head2_down_position_ != INT32_MAX)
  {
    inspect.process_control_flags |= HEAD2_DOWN_CTRL;
  }

  // Port E inputs are active low, all released except a periodic TDC
  inspect.port_e = 0xFF;
  if (inspect.packet_count % TDC_INTERVAL == 0)
  {
    inspect.port_e &= static_cast<uint8_t>(~TDC_MASK);
  }

  std::vector<uint8_t> payload;
  encode_inspect(inspect, payload);
  queue_packet(ids_.inspect, payload.data(), payload.size());
}

void ControlSimulator::send_monitor_packet()
{
  std::vector<uint8_t> payload;
  encode_be32(encoder1_, payload);
  encode_be32(encoder2_, payload);
  encode_be16(packet_count_, payload);
  encode_be16(control_flags_, payload);
  encode_be32(static_cast<int32_t>(outputs_), payload);
  payload.resize(MONITOR_PACKET_SIZE, 0);
  queue_packet(ids_.monitor, payload.data(), payload.size());
}

void ControlSimulator::send_all_encoders_packet()
{
  AllEncodersPayload values;
  values.on_pipe = on_pipe_position_;
  values.off_pipe = INT32_MAX;
  values.head1_down = head1_down_position_;
  values.head1_up = INT32_MAX;
  values.head2_down = head2_down_position_;
  values.head2_up = INT32_MAX;

  // Report what has been latched so far; unseen events read as zero
  for (int32_t* v : {&values.on_pipe, &values.off_pipe, &values.head1_down, &values.head1_up,
                     &values.head2_down, &values.head2_up})
  {
    if (*v == INT32_MAX)
    {
      *v = 0;
    }
  }

  std::vector<uint8_t> payload;
  encode_all_encoders(values, payload);
  queue_packet(ids_.all_encoders, payload.data(), payload.size());
}

/* ========================================================================= */
/* CutterSimulator                                                           */
/* ========================================================================= */

CutterSimulator::CutterSimulator(const CutterBoardConfig& config)
    : BoardSimulator("Notch Cutter Simulator"),
      ids_(config.packet_ids),
      status_size_(config.status_payload_size),
      data_size_(config.data_payload_size),
      state_mutex_(),
      cutting_(false),
      sequence_(0),
      depth_(0),
      target_depth_(DEFAULT_TARGET_DEPTH)
{
}

void CutterSimulator::handle_command(const uint8_t* frame, size_t len)
{
  (void)len;
  std::lock_guard<std::mutex> lock(state_mutex_);

  switch (static_cast<CutterCommand>(frame[0]))
  {
    case CutterCommand::CUT_MODE:
      cutting_ = true;
      break;
    case CutterCommand::STOP_MODE:
      cutting_ = false;
      break;
    case CutterCommand::ZERO_DEPTH:
      depth_ = 0;
      break;
    case CutterCommand::ZERO_TARGET_DEPTH:
      target_depth_ = 0;
      break;
    case CutterCommand::GET_DATA_PACKET:
      send_data_packet();
      break;
    case CutterCommand::GET_STATUS:
    {
      std::vector<uint8_t> payload(status_size_, 0);
      if (!payload.empty())
      {
        payload[0] = static_cast<uint8_t>(cutting_ ? 0x01 : 0x00);
      }
      queue_packet(ids_.status, payload.data(), payload.size());
      break;
    }
    default:
      CAPULIN_LOG(LDebug, "Cutter simulator ignores command %u", frame[0]);
      break;
  }
}

void CutterSimulator::drive()
{
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (cutting_ && depth_ < target_depth_)
  {
    ++depth_;
  }
}

void CutterSimulator::send_data_packet()
{
  CutterDataPayload data;
  data.sequence = sequence_++;
  data.depth = depth_;
  data.target_depth = target_depth_;
  data.status = static_cast<uint8_t>((cutting_ ? 0x01 : 0x00) |
                                     (depth_ >= target_depth_ ? 0x02 : 0x00));

  std::vector<uint8_t> payload;
  encode_cutter_data(data, payload);
  payload.resize(data_size_, 0);
  queue_packet(ids_.data, payload.data(), payload.size());
}

}  // namespace internal
}  // namespace capulin
