/**
 * @file control_board.cpp
 * @brief Inspection control board facade implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "capulin/control_board.hpp"

#include <algorithm>
#include <utility>

#include "log.hpp"
#include "payloads.hpp"
#include "simulator.hpp"

namespace capulin
{

/* ========================================================================= */
/* EncoderValues                                                             */
/* ========================================================================= */

void EncoderValues::set_all_to_max()
{
  on_pipe = INT32_MAX;
  off_pipe = INT32_MAX;
  head1_down = INT32_MAX;
  head1_up = INT32_MAX;
  head2_down = INT32_MAX;
  head2_up = INT32_MAX;
}

bool EncoderValues::complete() const
{
  return on_pipe != INT32_MAX && off_pipe != INT32_MAX && head1_down != INT32_MAX &&
         head1_up != INT32_MAX && head2_down != INT32_MAX && head2_up != INT32_MAX;
}

/* ========================================================================= */
/* ControlBoard                                                              */
/* ========================================================================= */

ControlBoard::ControlBoard(std::string name, int index, SessionSettings settings,
                           ControlBoardConfig config)
    : Board(std::move(name), index, std::move(settings)),
      config_(std::move(config)),
      control_flags_(0),
      monitor_request_timer_(0),
      chassis_(-1),
      slot_(-1),
      reply_byte_(-1),
      new_inspect_packet_ready_(false),
      inspect_(std::make_shared<InspectState>()),
      monitor_(std::make_shared<MonitorPacket>()),
      encoder_values_(std::make_shared<EncoderValues>()),
      status_(std::make_shared<std::vector<uint8_t>>()),
      simulator_(nullptr)
{
  register_packets();
}

ControlBoard::~ControlBoard()
{
  // The connection thread calls back into this class
  shut_down();
}

void ControlBoard::register_packets()
{
  const ControlPacketIds& ids = config_.packet_ids;

  dispatcher_.register_packet(ids.status, config_.status_payload_size,
                              [this](const uint8_t* p, size_t n) { decode_status(p, n); });
  dispatcher_.register_packet(ids.chassis_slot, config_.address_payload_size,
                              [this](const uint8_t* p, size_t n) { decode_address(p, n); });
  dispatcher_.register_packet(ids.inspect, INSPECT_PACKET_SIZE,
                              [this](const uint8_t* p, size_t n) { decode_inspect(p, n); });
  dispatcher_.register_packet(ids.monitor, MONITOR_PACKET_SIZE,
                              [this](const uint8_t* p, size_t n) { decode_monitor(p, n); });
  dispatcher_.register_packet(ids.all_encoders, ALL_ENCODERS_PACKET_SIZE,
                              [this](const uint8_t* p, size_t n) { decode_all_encoders(p, n); });
}

std::unique_ptr<ByteStream> ControlBoard::create_simulator()
{
  if (!config_.simulation_data_source.empty())
  {
    CAPULIN_LOG(LInfo, "%s: simulation data source %s", name().c_str(),
                config_.simulation_data_source.c_str());
  }

  auto simulator = std::unique_ptr<internal::ControlSimulator>(
      new internal::ControlSimulator(config_, 0, index() & 0x0F));
  simulator_.store(simulator.get());
  return std::unique_ptr<ByteStream>(std::move(simulator));
}

void ControlBoard::on_connected()
{
  const int address = get_remote_data(ControlCommand::GET_CHASSIS_SLOT_ADDRESS,
                                      config_.packet_ids.chassis_slot);
  if (address < 0)
  {
    CAPULIN_LOG(LWarn, "%s: chassis & slot address not received", name().c_str());
    return;
  }

  CAPULIN_LOG(LInfo, "Control %s chassis & slot address: %d-%d",
              session_.settings().address.c_str(), chassis(), slot());
  CAPULIN_LOG(LInfo, "Control %d:%d is ready.", chassis(), slot());
}

void ControlBoard::initialize(const ConfigSource& source)
{
  load_control_board_extended_config(source, std::max(chassis(), 0), std::max(slot(), 0),
                                     config_);

  control_flags_ = static_cast<uint16_t>(
      (control_flags_ & ~(FLAG_SEND_CLOCK_MARKERS | FLAG_SEND_TDC)) |
      parse_position_tracking_mode(config_.position_tracking_mode));

  send_control_flags();
  set_encoders_delta_trigger();
}

void ControlBoard::set_track_pulses_enabled(bool enabled)
{
  if (enabled)
  {
    control_flags_ |= FLAG_TRACK_PULSES_ENABLED;
  }
  else
  {
    control_flags_ &= static_cast<uint16_t>(~FLAG_TRACK_PULSES_ENABLED);
  }
  send_control_flags();
}

bool ControlBoard::send_control_flags()
{
  return send(ControlCommand::SET_CONTROL_FLAGS,
              {static_cast<uint8_t>((control_flags_ >> 8) & 0xFF),
               static_cast<uint8_t>(control_flags_ & 0xFF)});
}

bool ControlBoard::set_encoders_delta_trigger()
{
  const int t1 = config_.encoder1_delta_trigger;
  const int t2 = config_.encoder2_delta_trigger;
  return send(ControlCommand::SET_ENCODERS_DELTA_TRIGGER,
              {static_cast<uint8_t>((t1 >> 8) & 0xFF), static_cast<uint8_t>(t1 & 0xFF),
               static_cast<uint8_t>((t2 >> 8) & 0xFF), static_cast<uint8_t>(t2 & 0xFF)});
}

bool ControlBoard::send(ControlCommand cmd, std::initializer_list<uint8_t> params)
{
  return send_command(static_cast<uint8_t>(cmd), params);
}

/* ===== Requests ===== */

bool ControlBoard::request_inspect_packet()
{
  return send(ControlCommand::GET_INSPECT_PACKET, {0});
}

MonitorPacket ControlBoard::get_monitor_packet(bool request_packet)
{
  if (request_packet)
  {
    // The reply is processed by the polling thread and seen on a later call
    if (monitor_request_timer_++ == config_.monitor_request_interval)
    {
      monitor_request_timer_ = 0;
      send(ControlCommand::GET_MONITOR_PACKET, {0});
    }
  }

  return *std::atomic_load(&monitor_);
}

bool ControlBoard::request_all_encoder_values()
{
  // A value still at INT32_MAX tells the caller the reply has not arrived
  auto values = std::make_shared<EncoderValues>();
  values->set_all_to_max();
  std::atomic_store(&encoder_values_, std::shared_ptr<const EncoderValues>(std::move(values)));
  return send(ControlCommand::GET_ALL_ENCODER_VALUES);
}

bool ControlBoard::request_status()
{
  return request_reply(static_cast<uint8_t>(ControlCommand::GET_STATUS),
                       config_.packet_ids.status);
}

int ControlBoard::get_remote_data(ControlCommand cmd, uint8_t reply_type)
{
  reply_byte_.store(-1);
  if (!request_reply(static_cast<uint8_t>(cmd), reply_type))
  {
    return -1;
  }
  return reply_byte_.load();
}

bool ControlBoard::process_data_packets_until_inspect_packet()
{
  return dispatcher_.process_until_type(config_.packet_ids.inspect) ==
         PacketDispatcher::Result::DECODED;
}

/* ===== Commands ===== */

bool ControlBoard::start_inspect()
{
  return send(ControlCommand::START_INSPECT, {0});
}

bool ControlBoard::stop_inspect()
{
  return send(ControlCommand::STOP_INSPECT, {0});
}

bool ControlBoard::start_monitor()
{
  return send(ControlCommand::START_MONITOR, {0});
}

bool ControlBoard::stop_monitor()
{
  return send(ControlCommand::STOP_MONITOR, {0});
}

bool ControlBoard::zero_encoder_counts()
{
  return send(ControlCommand::ZERO_ENCODERS, {0});
}

bool ControlBoard::reset_track_counters()
{
  return send(ControlCommand::RESET_TRACK_COUNTERS, {0});
}

bool ControlBoard::pulse_output(uint8_t which)
{
  // TODO: send config_.audible_alarm_pulse_duration once the firmware accepts a duration
  return send(ControlCommand::PULSE_OUTPUT, {which});
}

bool ControlBoard::turn_on_output(uint8_t which)
{
  return send(ControlCommand::TURN_ON_OUTPUT, {which});
}

bool ControlBoard::turn_off_output(uint8_t which)
{
  return send(ControlCommand::TURN_OFF_OUTPUT, {which});
}

bool ControlBoard::pulse_audible_alarm()
{
  return pulse_output(static_cast<uint8_t>(config_.audible_alarm_output_channel));
}

bool ControlBoard::turn_on_audible_alarm()
{
  return turn_on_output(static_cast<uint8_t>(config_.audible_alarm_output_channel));
}

bool ControlBoard::turn_off_audible_alarm()
{
  return turn_off_output(static_cast<uint8_t>(config_.audible_alarm_output_channel));
}

bool ControlBoard::install_new_firmware(FirmwareInstaller& installer)
{
  FirmwareInstallSettings settings;
  settings.load_firmware_cmd = static_cast<uint8_t>(ControlCommand::LOAD_FIRMWARE);
  settings.no_action = static_cast<uint8_t>(ControlCommand::NO_ACTION);
  settings.error = static_cast<uint8_t>(ControlCommand::ERROR);
  settings.send_data_cmd = static_cast<uint8_t>(ControlCommand::SEND_DATA);
  settings.data_cmd = static_cast<uint8_t>(ControlCommand::DATA);
  settings.exit_cmd = static_cast<uint8_t>(ControlCommand::EXIT);

  if (!is_ready())
  {
    CAPULIN_LOG(LError, "%s: firmware install - %s", name().c_str(),
                error_message(ErrorCode::NOT_CONNECTED));
    return false;
  }
  return installer.install("Control", "CAPULIN CONTROL BOARD.bin", settings, session_);
}

void ControlBoard::drive_simulation()
{
  internal::ControlSimulator* simulator = simulator_.load();
  if (simulator != nullptr && is_ready())
  {
    simulator->drive();
  }
}

/* ===== Decoded state ===== */

InspectState ControlBoard::inspect_state() const
{
  return *std::atomic_load(&inspect_);
}

EncoderValues ControlBoard::encoder_values() const
{
  return *std::atomic_load(&encoder_values_);
}

std::vector<uint8_t> ControlBoard::status() const
{
  return *std::atomic_load(&status_);
}

/* ===== Decoders, run on the polling thread ===== */

void ControlBoard::decode_status(const uint8_t* payload, size_t len)
{
  std::atomic_store(&status_, std::shared_ptr<const std::vector<uint8_t>>(
                                  std::make_shared<std::vector<uint8_t>>(payload, payload + len)));
  reply_byte_.store(len > 0 ? payload[0] : 0);
}

void ControlBoard::decode_address(const uint8_t* payload, size_t len)
{
  const uint8_t address = len > 0 ? payload[0] : 0;
  chassis_.store((address >> 4) & 0x0F);
  slot_.store(address & 0x0F);
  reply_byte_.store(address);
}

void ControlBoard::decode_inspect(const uint8_t* payload, size_t len)
{
  (void)len;
  const internal::InspectPayload raw = internal::decode_inspect(payload);
  const std::shared_ptr<const InspectState> previous = std::atomic_load(&inspect_);

  auto state = std::make_shared<InspectState>();
  state->packet_count = raw.packet_count;
  state->encoder1 = raw.encoder1;
  state->encoder2 = raw.encoder2;
  state->prev_encoder1 = previous->encoder1;
  state->prev_encoder2 = previous->encoder2;

  // Packets are only sent on a change, so equal counts are not expected
  state->encoder1_direction =
      raw.encoder1 > previous->encoder1 ? Direction::INCREASING : Direction::DECREASING;
  state->encoder2_direction =
      raw.encoder2 > previous->encoder2 ? Direction::INCREASING : Direction::DECREASING;

  // Process control flags are active high
  state->process_control_flags = raw.process_control_flags;
  state->on_pipe = (raw.process_control_flags & ON_PIPE_CTRL) != 0;
  state->head1_down = (raw.process_control_flags & HEAD1_DOWN_CTRL) != 0;
  state->head2_down = (raw.process_control_flags & HEAD2_DOWN_CTRL) != 0;

  // Port E inputs are active low
  state->port_e = raw.port_e;
  state->tdc = (raw.port_e & TDC_MASK) == 0;
  state->unused3 = (raw.port_e & UNUSED3_MASK) == 0;

  std::atomic_store(&inspect_, std::shared_ptr<const InspectState>(std::move(state)));
  new_inspect_packet_ready_.store(true);
}

void ControlBoard::decode_monitor(const uint8_t* payload, size_t len)
{
  auto packet = std::make_shared<MonitorPacket>();
  std::copy(payload, payload + std::min(len, packet->size()), packet->begin());
  std::atomic_store(&monitor_, std::shared_ptr<const MonitorPacket>(std::move(packet)));
}

void ControlBoard::decode_all_encoders(const uint8_t* payload, size_t len)
{
  (void)len;
  const internal::AllEncodersPayload raw = internal::decode_all_encoders(payload);

  auto values = std::make_shared<EncoderValues>();
  values->on_pipe = raw.on_pipe;
  values->off_pipe = raw.off_pipe;
  values->head1_down = raw.head1_down;
  values->head1_up = raw.head1_up;
  values->head2_down = raw.head2_down;
  values->head2_up = raw.head2_up;
  std::atomic_store(&encoder_values_, std::shared_ptr<const EncoderValues>(std::move(values)));
}

}  // namespace capulin
