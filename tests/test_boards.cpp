/**
 * @file test_boards.cpp
 * @brief Board facade unit tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "capulin/capulin.h"
#include "capulin/control_board.hpp"
#include "capulin/cutter_board.hpp"
#include "capulin/log.hpp"
#include "frame.hpp"
#include "memory_stream.hpp"
#include "payloads.hpp"

using namespace capulin;
using capulin::test::LogCapture;
using capulin::test::MemoryStream;

namespace
{

using Bytes = std::vector<uint8_t>;

/// Control board wired to a MemoryStream that already holds the address reply
class MemoryControlBoard : public ControlBoard
{
 public:
  explicit MemoryControlBoard(ControlBoardConfig config = ControlBoardConfig(),
                              uint8_t address = 0x23)
      : ControlBoard("Control Board", 0, test::memory_settings(), config), address_(address)
  {
  }

  ~MemoryControlBoard() override
  {
    shut_down();
  }

  MemoryStream* stream = nullptr;

 protected:
  std::unique_ptr<ByteStream> create_simulator() override
  {
    auto memory = std::unique_ptr<MemoryStream>(new MemoryStream());
    const uint8_t payload[] = {address_, 0x00};
    Bytes reply;
    internal::encode_packet(config().packet_ids.chassis_slot, payload, sizeof(payload), reply);
    memory->feed(reply);

    stream = memory.get();
    return std::unique_ptr<ByteStream>(std::move(memory));
  }

 private:
  uint8_t address_;
};

class MemoryCutterBoard : public CutterBoard
{
 public:
  explicit MemoryCutterBoard(CutterBoardConfig config = CutterBoardConfig())
      : CutterBoard("Cutter Board", 0, test::memory_settings(), config)
  {
  }

  ~MemoryCutterBoard() override
  {
    shut_down();
  }

  MemoryStream* stream = nullptr;

 protected:
  std::unique_ptr<ByteStream> create_simulator() override
  {
    auto memory = std::unique_ptr<MemoryStream>(new MemoryStream());
    stream = memory.get();
    return std::unique_ptr<ByteStream>(std::move(memory));
  }
};

Bytes inspect_packet(uint8_t type, uint16_t count, int32_t encoder1, int32_t encoder2,
                     uint8_t control_flags, uint8_t port_e)
{
  internal::InspectPayload inspect;
  inspect.packet_count = count;
  inspect.encoder1 = encoder1;
  inspect.encoder2 = encoder2;
  inspect.process_control_flags = control_flags;
  inspect.port_e = port_e;

  Bytes payload;
  internal::encode_inspect(inspect, payload);
  Bytes packet;
  internal::encode_packet(type, payload.data(), payload.size(), packet);
  return packet;
}

/// Stream of a board that never stops sending inspect packets
class InspectFloodStream : public MemoryStream
{
 public:
  explicit InspectFloodStream(uint8_t inspect_type) : inspect_type_(inspect_type), count_(0)
  {
  }

  int available() override
  {
    refill();
    return MemoryStream::available();
  }

  int read(uint8_t* buf, size_t len) override
  {
    refill();
    return MemoryStream::read(buf, len);
  }

 private:
  void refill()
  {
    if (remaining().empty())
    {
      const uint16_t count = count_++;
      feed(inspect_packet(inspect_type_, count, count, count, 0, 0xFF));
    }
  }

  uint8_t inspect_type_;
  uint16_t count_;
};

class FloodControlBoard : public ControlBoard
{
 public:
  explicit FloodControlBoard(bool answer_address)
      : ControlBoard("Control Board", 0, test::memory_settings()), answer_address_(answer_address)
  {
  }

  ~FloodControlBoard() override
  {
    shut_down();
  }

 protected:
  std::unique_ptr<ByteStream> create_simulator() override
  {
    auto flood =
        std::unique_ptr<InspectFloodStream>(new InspectFloodStream(config().packet_ids.inspect));
    if (answer_address_)
    {
      const uint8_t payload[] = {0x23, 0x00};
      Bytes reply;
      internal::encode_packet(config().packet_ids.chassis_slot, payload, sizeof(payload), reply);
      flood->feed(reply);
    }
    return std::unique_ptr<ByteStream>(std::move(flood));
  }

 private:
  bool answer_address_;
};

SessionSettings simulator_settings()
{
  SessionSettings settings;
  settings.address = "169.254.56.11";
  settings.simulate = true;
  return settings;
}

class RecordingInstaller : public FirmwareInstaller
{
 public:
  bool install(const std::string& board_type, const std::string& image_name,
               const FirmwareInstallSettings& settings, TransportSession& session) override
  {
    this->board_type = board_type;
    this->image_name = image_name;
    this->settings = settings;
    session_ready = session.is_ready();
    return true;
  }

  std::string board_type;
  std::string image_name;
  FirmwareInstallSettings settings = {};
  bool session_ready = false;
};

}  // namespace

/* ========================================================================= */
/* Control Board Decode Tests                                                */
/* ========================================================================= */

TEST_CASE("Control board connect retrieves the chassis and slot address")
{
  set_log_level(LError);
  MemoryControlBoard board(ControlBoardConfig(), 0x2B);

  CHECK(board.chassis() == -1);
  CHECK(board.slot() == -1);

  REQUIRE(board.connect());
  CHECK(board.chassis() == 2);
  CHECK(board.slot() == 11);

  const auto writes = board.stream->writes();
  REQUIRE(writes.size() == 1);
  CHECK(writes[0] == Bytes{static_cast<uint8_t>(ControlCommand::GET_CHASSIS_SLOT_ADDRESS)});
}

TEST_CASE("Inspect packet decode")
{
  set_log_level(LError);
  MemoryControlBoard board;
  REQUIRE(board.connect());
  const uint8_t type = board.config().packet_ids.inspect;

  SUBCASE("Fields follow the big-endian payload")
  {
    const Bytes packet = {0xAA, 0x55, 0xBB, 0x66, 0x0C,              // header
                          0x12, 0x34,                                // packet count
                          0x00, 0x00, 0x10, 0x00,                    // encoder 1
                          0xFF, 0xFF, 0xFF, 0xF0,                    // encoder 2
                          0x03,                                      // control flags
                          0xFE};                                     // port E
    board.stream->feed(packet);

    CHECK_FALSE(board.new_inspect_packet_ready());
    CHECK(board.process_one_data_packet(false, 0) == 12);
    CHECK(board.new_inspect_packet_ready());

    const InspectState state = board.inspect_state();
    CHECK(state.packet_count == 0x1234);
    CHECK(state.encoder1 == 0x1000);
    CHECK(state.encoder2 == -16);
    CHECK(state.process_control_flags == 0x03);
    CHECK(state.port_e == 0xFE);

    board.set_new_inspect_packet_ready(false);
    CHECK_FALSE(board.new_inspect_packet_ready());
  }

  SUBCASE("Taking the new-packet flag clears it")
  {
    board.stream->feed(inspect_packet(type, 1, 1, 1, 0, 0xFF));
    CHECK_FALSE(board.take_new_inspect_packet());

    REQUIRE(board.process_one_data_packet(false, 0) == 12);
    CHECK(board.take_new_inspect_packet());
    CHECK_FALSE(board.new_inspect_packet_ready());
    CHECK_FALSE(board.take_new_inspect_packet());
  }

  SUBCASE("Direction is increasing only on a strictly greater count")
  {
    board.stream->feed(inspect_packet(type, 1, 100, 100, 0, 0xFF));
    board.stream->feed(inspect_packet(type, 2, 150, 100, 0, 0xFF));
    board.stream->feed(inspect_packet(type, 3, 120, 90, 0, 0xFF));

    REQUIRE(board.process_one_data_packet(false, 0) == 12);
    InspectState state = board.inspect_state();
    CHECK(state.encoder1_direction == Direction::INCREASING);
    CHECK(state.encoder2_direction == Direction::INCREASING);

    REQUIRE(board.process_one_data_packet(false, 0) == 12);
    state = board.inspect_state();
    CHECK(state.prev_encoder1 == 100);
    CHECK(state.encoder1_direction == Direction::INCREASING);
    CHECK(state.encoder2_direction == Direction::DECREASING);  // equal counts

    REQUIRE(board.process_one_data_packet(false, 0) == 12);
    state = board.inspect_state();
    CHECK(state.encoder1_direction == Direction::DECREASING);
    CHECK(state.encoder2_direction == Direction::DECREASING);
  }

  SUBCASE("Port E inputs are active low")
  {
    board.stream->feed(inspect_packet(type, 1, 1, 1, 0x00, 0x00));
    REQUIRE(board.process_one_data_packet(false, 0) == 12);
    CHECK(board.inspect_state().tdc);
    CHECK(board.inspect_state().unused3);

    board.stream->feed(inspect_packet(type, 2, 2, 2, 0x00, 0xFF));
    REQUIRE(board.process_one_data_packet(false, 0) == 12);
    CHECK_FALSE(board.inspect_state().tdc);
    CHECK_FALSE(board.inspect_state().unused3);
  }

  SUBCASE("Process control flags are active high")
  {
    board.stream->feed(inspect_packet(type, 1, 1, 1, 0x07, 0xFF));
    REQUIRE(board.process_one_data_packet(false, 0) == 12);
    InspectState state = board.inspect_state();
    CHECK(state.on_pipe);
    CHECK(state.head1_down);
    CHECK(state.head2_down);

    board.stream->feed(inspect_packet(type, 2, 2, 2, 0x02, 0xFF));
    REQUIRE(board.process_one_data_packet(false, 0) == 12);
    state = board.inspect_state();
    CHECK_FALSE(state.on_pipe);
    CHECK(state.head1_down);
    CHECK_FALSE(state.head2_down);
  }

  SUBCASE("Monitor and status packets leave the direction alone")
  {
    board.stream->feed(inspect_packet(type, 1, 100, 100, 0, 0xFF));
    REQUIRE(board.process_one_data_packet(false, 0) == 12);

    Bytes monitor(MONITOR_PACKET_SIZE, 0x00);
    Bytes packet;
    internal::encode_packet(board.config().packet_ids.monitor, monitor.data(), monitor.size(),
                            packet);
    const uint8_t status[] = {0x01, 0x00};
    internal::encode_packet(board.config().packet_ids.status, status, sizeof(status), packet);
    board.stream->feed(packet);

    CHECK(board.process_one_data_packet(false, 0) == static_cast<int>(MONITOR_PACKET_SIZE));
    CHECK(board.process_one_data_packet(false, 0) == 2);
    CHECK(board.inspect_state().encoder1_direction == Direction::INCREASING);
    CHECK(board.inspect_state().encoder1 == 100);
  }

  SUBCASE("Process until the next inspect packet")
  {
    Bytes packet;
    const uint8_t status[] = {0x01, 0x00};
    internal::encode_packet(board.config().packet_ids.status, status, sizeof(status), packet);
    board.stream->feed(packet);
    board.stream->feed(inspect_packet(type, 9, 5, 6, 0, 0xFF));

    CHECK(board.process_data_packets_until_inspect_packet());
    CHECK(board.inspect_state().packet_count == 9);
    CHECK(board.status() == Bytes{0x01, 0x00});
    CHECK_FALSE(board.process_data_packets_until_inspect_packet());
  }
}

/* ========================================================================= */
/* Control Board Request Tests                                               */
/* ========================================================================= */

TEST_CASE("Monitor packet request throttle")
{
  set_log_level(LError);
  MemoryControlBoard board;
  REQUIRE(board.connect());
  board.stream->clear_writes();

  SUBCASE("A request goes out every 51st call")
  {
    for (int i = 0; i < 50; i++)
    {
      board.get_monitor_packet(true);
    }
    CHECK(board.stream->writes().empty());

    board.get_monitor_packet(true);
    auto writes = board.stream->writes();
    REQUIRE(writes.size() == 1);
    CHECK(writes[0] == Bytes{static_cast<uint8_t>(ControlCommand::GET_MONITOR_PACKET), 0x00});

    for (int i = 0; i < 51; i++)
    {
      board.get_monitor_packet(true);
    }
    CHECK(board.stream->writes().size() == 2);
  }

  SUBCASE("No requests when polling passively")
  {
    for (int i = 0; i < 200; i++)
    {
      board.get_monitor_packet(false);
    }
    CHECK(board.stream->writes().empty());
  }

  SUBCASE("Returns the last decoded monitor packet")
  {
    Bytes monitor(MONITOR_PACKET_SIZE);
    for (size_t i = 0; i < monitor.size(); i++)
    {
      monitor[i] = static_cast<uint8_t>(i + 1);
    }
    Bytes packet;
    internal::encode_packet(board.config().packet_ids.monitor, monitor.data(), monitor.size(),
                            packet);
    board.stream->feed(packet);
    REQUIRE(board.process_one_data_packet(false, 0) == static_cast<int>(MONITOR_PACKET_SIZE));

    const MonitorPacket result = board.get_monitor_packet(false);
    CHECK(Bytes(result.begin(), result.end()) == monitor);
  }
}

TEST_CASE("All encoder values request")
{
  set_log_level(LError);
  MemoryControlBoard board;
  REQUIRE(board.connect());
  board.stream->clear_writes();

  REQUIRE(board.request_all_encoder_values());
  CHECK(board.stream->writes().back() ==
        Bytes{static_cast<uint8_t>(ControlCommand::GET_ALL_ENCODER_VALUES)});

  EncoderValues values = board.encoder_values();
  CHECK(values.on_pipe == INT32_MAX);
  CHECK(values.head2_up == INT32_MAX);
  CHECK_FALSE(values.complete());

  internal::AllEncodersPayload reply = {1000, 9000, 1200, 8800, 1400, -8600};
  Bytes payload;
  internal::encode_all_encoders(reply, payload);
  Bytes packet;
  internal::encode_packet(board.config().packet_ids.all_encoders, payload.data(), payload.size(),
                          packet);
  board.stream->feed(packet);
  REQUIRE(board.process_one_data_packet(false, 0) == static_cast<int>(ALL_ENCODERS_PACKET_SIZE));

  values = board.encoder_values();
  CHECK(values.complete());
  CHECK(values.on_pipe == 1000);
  CHECK(values.off_pipe == 9000);
  CHECK(values.head1_down == 1200);
  CHECK(values.head1_up == 8800);
  CHECK(values.head2_down == 1400);
  CHECK(values.head2_up == -8600);
}

TEST_CASE("Status request waits for its reply")
{
  set_log_level(LError);
  ControlBoardConfig config;
  config.status_payload_size = 3;
  MemoryControlBoard board(config);
  REQUIRE(board.connect());

  const uint8_t status[] = {0x41, 0x42, 0x43};
  Bytes packet;
  internal::encode_packet(config.packet_ids.status, status, sizeof(status), packet);
  board.stream->feed(packet);

  CHECK(board.request_status());
  CHECK(board.status() == Bytes{0x41, 0x42, 0x43});
  CHECK(board.stream->writes().back() == Bytes{static_cast<uint8_t>(ControlCommand::GET_STATUS)});

  board.stream->feed(packet);
  CHECK(board.get_remote_data(ControlCommand::GET_STATUS, config.packet_ids.status) == 0x41);
}

/* ========================================================================= */
/* Control Board Command Tests                                               */
/* ========================================================================= */

TEST_CASE("Control board commands")
{
  set_log_level(LError);
  MemoryControlBoard board;
  REQUIRE(board.connect());
  board.stream->clear_writes();

  auto last = [&board]() { return board.stream->writes().back(); };

  CHECK(board.start_inspect());
  CHECK(last() == Bytes{0x08, 0x00});
  CHECK(board.stop_inspect());
  CHECK(last() == Bytes{0x09, 0x00});
  CHECK(board.start_monitor());
  CHECK(last() == Bytes{0x0A, 0x00});
  CHECK(board.stop_monitor());
  CHECK(last() == Bytes{0x0B, 0x00});
  CHECK(board.zero_encoder_counts());
  CHECK(last() == Bytes{0x02, 0x00});
  CHECK(board.reset_track_counters());
  CHECK(last() == Bytes{0x12, 0x00});
  CHECK(board.request_inspect_packet());
  CHECK(last() == Bytes{0x01, 0x00});

  CHECK(board.pulse_output(3));
  CHECK(last() == Bytes{0x04, 0x03});
  CHECK(board.turn_on_output(4));
  CHECK(last() == Bytes{0x05, 0x04});
  CHECK(board.turn_off_output(4));
  CHECK(last() == Bytes{0x06, 0x04});

  CHECK(board.send_command(0x07, {0x01, 0x53, 0x00, 0x53}));
  CHECK(last() == Bytes{0x07, 0x01, 0x53, 0x00, 0x53});

  const size_t before = board.stream->writes().size();
  CHECK_FALSE(board.send_command(0x07, {1, 2, 3, 4, 5}));
  CHECK(board.stream->writes().size() == before);
}

TEST_CASE("Commands are dropped before connect")
{
  set_log_level(LError);
  MemoryControlBoard board;
  CHECK_FALSE(board.start_inspect());
  CHECK_FALSE(board.request_all_encoder_values());
  CHECK(board.process_one_data_packet(false, 0) == PacketDispatcher::NO_PACKET);
  CHECK(board.stream == nullptr);
}

TEST_CASE("Initialize sends the chassis and slot settings")
{
  set_log_level(LError);

  MapConfigSource source;
  source.set("Hardware", "Encoder 1 Delta Count Trigger", "339");
  source.set("Hardware", "Encoder 2 Delta Count Trigger", "83");
  source.set("Control Board in Chassis 2 Slot 3", "Position Tracking Mode", "Send TDC Markers");
  source.set("Control Board in Chassis 2 Slot 3", "Audible Alarm Module", "true");
  source.set("Control Board in Chassis 2 Slot 3", "Audible Alarm Output Channel", "5");

  MemoryControlBoard board(load_control_board_config(source), 0x23);
  REQUIRE(board.connect());
  board.stream->clear_writes();

  board.initialize(source);

  auto writes = board.stream->writes();
  REQUIRE(writes.size() == 2);
  CHECK(writes[0] == Bytes{0x11, 0x00, 0x02});              // control flags: TDC markers
  CHECK(writes[1] == Bytes{0x07, 0x01, 0x53, 0x00, 0x53});  // 339 = 0x0153, 83 = 0x0053
  CHECK(board.control_flags() == FLAG_SEND_TDC);

  CHECK(board.is_audible_alarm_controller());
  CHECK(board.pulse_audible_alarm());
  CHECK(board.stream->writes().back() == Bytes{0x04, 0x05});
  CHECK(board.turn_on_audible_alarm());
  CHECK(board.stream->writes().back() == Bytes{0x05, 0x05});
  CHECK(board.turn_off_audible_alarm());
  CHECK(board.stream->writes().back() == Bytes{0x06, 0x05});

  SUBCASE("Track pulses flag")
  {
    board.set_track_pulses_enabled(true);
    CHECK(board.control_flags() == (FLAG_SEND_TDC | FLAG_TRACK_PULSES_ENABLED));
    CHECK(board.stream->writes().back() == Bytes{0x11, 0x00, 0x06});

    board.set_track_pulses_enabled(false);
    CHECK(board.control_flags() == FLAG_SEND_TDC);
    CHECK(board.stream->writes().back() == Bytes{0x11, 0x00, 0x02});
  }
}

TEST_CASE("Firmware install is passed through")
{
  set_log_level(LError);
  MemoryControlBoard board;
  RecordingInstaller installer;

  CHECK_FALSE(board.install_new_firmware(installer));  // not connected
  CHECK(installer.image_name.empty());

  REQUIRE(board.connect());
  CHECK(board.install_new_firmware(installer));
  CHECK(installer.board_type == "Control");
  CHECK(installer.image_name == "CAPULIN CONTROL BOARD.bin");
  CHECK(installer.settings.load_firmware_cmd == 13);
  CHECK(installer.settings.send_data_cmd == 14);
  CHECK(installer.settings.data_cmd == 15);
  CHECK(installer.settings.error == 125);
  CHECK(installer.settings.exit_cmd == 127);
  CHECK(installer.session_ready);
}

/* ========================================================================= */
/* Configuration Tests                                                       */
/* ========================================================================= */

TEST_CASE("Configuration loading")
{
  set_log_level(LError);

  SUBCASE("Defaults")
  {
    MapConfigSource source;
    const ControlBoardConfig config = load_control_board_config(source);
    CHECK(config.encoder1_delta_trigger == 83);
    CHECK(config.encoder2_delta_trigger == 83);
    CHECK(config.simulation_data_source.empty());
    CHECK(config.position_tracking_mode == "Send Clock Markers");
  }

  SUBCASE("Unparseable integers fall back to the default")
  {
    MapConfigSource source;
    source.set("Hardware", "Encoder 1 Delta Count Trigger", "fast");
    CHECK(load_control_board_config(source).encoder1_delta_trigger == 83);
  }

  SUBCASE("Position tracking modes")
  {
    CHECK(parse_position_tracking_mode("Send Clock Markers") == FLAG_SEND_CLOCK_MARKERS);
    CHECK(parse_position_tracking_mode("Send TDC Markers") == FLAG_SEND_TDC);
    CHECK(parse_position_tracking_mode("Send Nothing") == 0);
  }
}

/* ========================================================================= */
/* Simulated Board Tests                                                     */
/* ========================================================================= */

TEST_CASE("Control board against the simulator")
{
  set_log_level(LError);
  MapConfigSource source;
  ControlBoard board("Control Board", 4, simulator_settings(), load_control_board_config(source));

  board.start();
  REQUIRE(board.wait_for_setup(std::chrono::seconds(5)));
  REQUIRE(board.is_ready());
  CHECK(board.chassis() == 0);
  CHECK(board.slot() == 4);
  CHECK(board.session().greeting() == "Control Board Simulator");

  board.initialize(source);
  REQUIRE(board.zero_encoder_counts());
  REQUIRE(board.start_inspect());

  for (int i = 1; i <= 12; i++)
  {
    board.drive_simulation();
    REQUIRE(board.process_one_data_packet(true, 5) == 12);

    const InspectState state = board.inspect_state();
    CHECK(state.encoder1 == 83 * i);
    CHECK(state.encoder1_direction == Direction::INCREASING);
    CHECK(state.on_pipe == (i >= 10));
  }

  REQUIRE(board.request_all_encoder_values());
  REQUIRE(board.process_one_data_packet(true, 5) == static_cast<int>(ALL_ENCODERS_PACKET_SIZE));
  CHECK(board.encoder_values().on_pipe == 830);

  REQUIRE(board.request_status());
  REQUIRE_FALSE(board.status().empty());
  CHECK(board.status()[0] == 0x01);  // inspecting

  REQUIRE(board.stop_inspect());
  board.drive_simulation();
  CHECK(board.process_one_data_packet(false, 0) == PacketDispatcher::NO_PACKET);

  board.shut_down();
  CHECK_FALSE(board.is_ready());
  board.shut_down();
}

TEST_CASE("Board without an address never connects")
{
  set_log_level(LError);
  ControlBoard board("Control Board", 0, SessionSettings());

  board.start();
  REQUIRE(board.wait_for_setup(std::chrono::seconds(5)));
  CHECK_FALSE(board.is_ready());
  CHECK(board.session().last_error() == ErrorCode::NO_ADDRESS);
  CHECK(board.chassis() == -1);
  CHECK(board.process_one_data_packet(true, 1) == PacketDispatcher::NO_PACKET);
}

/* ========================================================================= */
/* Cutter Board Tests                                                        */
/* ========================================================================= */

TEST_CASE("Cutter board")
{
  set_log_level(LError);

  SUBCASE("Commands and data packet decode")
  {
    MemoryCutterBoard board;
    REQUIRE(board.connect());

    CHECK(board.cut_mode());
    CHECK(board.stream->writes().back() == Bytes{0x01});
    CHECK(board.stop_mode());
    CHECK(board.stream->writes().back() == Bytes{0x02});
    CHECK(board.zero_depth());
    CHECK(board.stream->writes().back() == Bytes{0x03});
    CHECK(board.zero_target_depth());
    CHECK(board.stream->writes().back() == Bytes{0x04});
    CHECK(board.request_data_packet());
    CHECK(board.stream->writes().back() == Bytes{0x05});

    board.stream->feed({0xAA, 0x55, 0xBB, 0x66, 0x05,  // header
                        0x00, 0x07,                    // sequence
                        0xFF, 0xFF, 0xFF, 0xFB,        // depth = -5
                        0x00, 0x00, 0x00, 0x64,        // target = 100
                        0x03});                        // status
    CHECK(board.process_one_data_packet(false, 0) == 11);

    const CutterData data = board.data_packet();
    CHECK(data.sequence == 7);
    CHECK(data.depth == -5);
    CHECK(data.target_depth == 100);
    CHECK(data.cutting());
    CHECK(data.target_reached());
  }

  SUBCASE("Against the simulator")
  {
    CutterBoard board("Cutter Board", 0, simulator_settings());
    REQUIRE(board.connect());

    REQUIRE(board.cut_mode());
    for (int i = 0; i < 5; i++)
    {
      board.drive_simulation();
    }
    REQUIRE(board.get_data_packet());
    CHECK(board.data_packet().depth == 5);
    CHECK(board.data_packet().cutting());
    CHECK_FALSE(board.data_packet().target_reached());

    REQUIRE(board.zero_target_depth());
    REQUIRE(board.get_data_packet());
    CHECK(board.data_packet().target_reached());

    REQUIRE(board.stop_mode());
    REQUIRE(board.request_status());
    CHECK(board.status() == Bytes{0x00, 0x00});

    RecordingInstaller installer;
    CHECK(board.install_new_firmware(installer));
    CHECK(installer.board_type == "Cutter");
  }
}

TEST_CASE("Short cutter data packets are not decoded")
{
  CutterBoardConfig config;
  config.data_payload_size = 4;
  MemoryCutterBoard board(config);
  LogCapture log;
  REQUIRE(board.connect());

  board.stream->feed({0xAA, 0x55, 0xBB, 0x66, 0x05, 0x00, 0x07, 0xFF, 0xFF});
  CHECK(board.process_one_data_packet(false, 0) == 4);

  const CutterData data = board.data_packet();
  CHECK(data.sequence == 0);
  CHECK(data.depth == 0);
  CHECK(log.contains("Cutter Board: data packet of 4 bytes is too short"));
}

/* ========================================================================= */
/* Reply Wait Tests                                                          */
/* ========================================================================= */

TEST_CASE("Reply waits end while other packets keep arriving")
{
  set_log_level(LError);

  SUBCASE("Status request")
  {
    FloodControlBoard board(true);
    REQUIRE(board.connect());
    CHECK(board.slot() == 3);

    const auto begin = std::chrono::steady_clock::now();
    CHECK_FALSE(board.request_status());
    const bool bounded = std::chrono::steady_clock::now() - begin < std::chrono::seconds(3);
    CHECK(bounded);
    CHECK(board.inspect_state().packet_count > 0);
    CHECK(board.status().empty());

    CHECK(board.get_remote_data(ControlCommand::GET_STATUS, board.config().packet_ids.status) ==
          -1);
  }

  SUBCASE("Address request on the connect thread")
  {
    FloodControlBoard board(false);
    board.start();
    REQUIRE(board.wait_for_setup(std::chrono::seconds(3)));
    CHECK(board.is_ready());
    CHECK(board.chassis() == -1);
    CHECK(board.slot() == -1);
  }
}

/* ========================================================================= */
/* Reply Layout Tests                                                        */
/* ========================================================================= */

TEST_CASE("Simulators answer with the configured payload sizes")
{
  set_log_level(LError);

  SUBCASE("Control board")
  {
    ControlBoardConfig config;
    config.status_payload_size = 3;
    config.address_payload_size = 4;
    ControlBoard board("Control Board", 6, simulator_settings(), config);

    REQUIRE(board.connect());
    CHECK(board.chassis() == 0);
    CHECK(board.slot() == 6);

    REQUIRE(board.request_status());
    CHECK(board.status() == Bytes{0x00, 0x00, 0x00});
    CHECK(board.resync_state().resync_count == 0);
  }

  SUBCASE("Cutter board")
  {
    CutterBoardConfig config;
    config.status_payload_size = 1;
    CutterBoard board("Cutter Board", 0, simulator_settings(), config);

    REQUIRE(board.connect());
    REQUIRE(board.cut_mode());
    REQUIRE(board.request_status());
    CHECK(board.status() == Bytes{0x01});
    REQUIRE(board.get_data_packet());
    CHECK(board.data_packet().cutting());
    CHECK(board.resync_state().resync_count == 0);
  }
}

TEST_CASE("Command echo reply types")
{
  set_log_level(LError);
  const ControlPacketIds ids = command_echo_packet_ids();
  CHECK(ids.inspect == 1);
  CHECK(ids.monitor == 3);
  CHECK(ids.status == 12);
  CHECK(ids.chassis_slot == 16);
  CHECK(ids.all_encoders == 19);

  ControlBoardConfig config;
  config.packet_ids = ids;
  MemoryControlBoard board(config);
  REQUIRE(board.connect());
  CHECK(board.slot() == 3);

  board.stream->feed(inspect_packet(ids.inspect, 5, 200, 300, 0x01, 0xFF));
  REQUIRE(board.process_one_data_packet(false, 0) == 12);
  CHECK(board.inspect_state().encoder2 == 300);
  CHECK(board.inspect_state().on_pipe);
}

TEST_CASE("Runtime data packets are read whole")
{
  set_log_level(LError);
  MemoryCutterBoard board;
  CHECK_FALSE(board.prepare_data());

  REQUIRE(board.connect());
  Bytes data(RUNTIME_PACKET_SIZE - 1, 0x5A);
  board.stream->feed(data);
  CHECK_FALSE(board.prepare_data());
  CHECK(board.stream->remaining().size() == RUNTIME_PACKET_SIZE - 1);

  board.stream->feed({0xA5, 0x01});
  REQUIRE(board.prepare_data());
  REQUIRE(board.runtime_packet().size() == RUNTIME_PACKET_SIZE);
  CHECK(board.runtime_packet().front() == 0x5A);
  CHECK(board.runtime_packet().back() == 0xA5);
  CHECK(board.stream->remaining() == Bytes{0x01});
}

/* ========================================================================= */
/* C API Tests                                                               */
/* ========================================================================= */

TEST_CASE("C API")
{
  set_log_level(LError);

  SUBCASE("Simulated board")
  {
    CapulinControlBoard* board = capulin_control_create("Control Board", "10.0.0.2", 1);
    REQUIRE(board != nullptr);

    capulin_control_start(board);
    REQUIRE(capulin_control_wait_ready(board, 5000) == CAPULIN_ERR_OK);
    CHECK(capulin_control_is_ready(board) == 1);

    CHECK(capulin_control_start_inspect(board) == CAPULIN_ERR_OK);
    capulin_control_drive_simulation(board);
    CHECK(capulin_control_process_one(board, 1, 5) == 12);

    capulin_inspect_t inspect;
    CHECK(capulin_control_get_inspect(board, &inspect) == 1);
    CHECK(inspect.encoder1 == 83);
    CHECK(inspect.encoder1_increasing == 1);
    CHECK(capulin_control_get_inspect(board, &inspect) == 0);  // already consumed

    int32_t encoder1 = 0;
    int32_t encoder2 = 0;
    capulin_control_get_encoders(board, &encoder1, &encoder2);
    CHECK(encoder1 == 83);
    CHECK(encoder2 == 83);

    capulin_control_shut_down(board);
    CHECK(capulin_control_is_ready(board) == 0);
    CHECK(capulin_control_stop_inspect(board) == CAPULIN_ERR_NOT_CONNECTED);
    capulin_control_destroy(board);
  }

  SUBCASE("Board without an address")
  {
    CapulinControlBoard* board = capulin_control_create("Control Board", nullptr, 0);
    REQUIRE(board != nullptr);
    capulin_control_start(board);
    CHECK(capulin_control_wait_ready(board, 5000) == CAPULIN_ERR_NO_ADDRESS);
    CHECK(capulin_control_process_one(board, 0, 0) == CAPULIN_NO_PACKET);
    capulin_control_destroy(board);
  }

  SUBCASE("NULL handles")
  {
    capulin_control_destroy(nullptr);
    CHECK(capulin_control_is_ready(nullptr) == 0);
    CHECK(capulin_control_process_one(nullptr, 0, 0) == CAPULIN_NO_PACKET);
  }

  SUBCASE("Error strings")
  {
    CHECK(std::strcmp(capulin_strerror(CAPULIN_ERR_OK), "no error") == 0);
    CHECK(std::strcmp(capulin_strerror(CAPULIN_ERR_TIMEOUT), "timed out waiting for board") == 0);
  }
}
