/**
 * @file cutter_board.cpp
 * @brief Notch cutter board facade implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "capulin/cutter_board.hpp"

#include <utility>

#include "log.hpp"
#include "payloads.hpp"
#include "simulator.hpp"

namespace capulin
{

CutterBoard::CutterBoard(std::string name, int index, SessionSettings settings,
                         CutterBoardConfig config)
    : Board(std::move(name), index, std::move(settings)),
      config_(std::move(config)),
      data_(std::make_shared<CutterData>()),
      status_(std::make_shared<std::vector<uint8_t>>()),
      simulator_(nullptr)
{
  dispatcher_.register_packet(
      config_.packet_ids.status, config_.status_payload_size,
      [this](const uint8_t* payload, size_t len)
      {
        std::atomic_store(&status_, std::shared_ptr<const std::vector<uint8_t>>(
                                        std::make_shared<std::vector<uint8_t>>(payload,
                                                                               payload + len)));
      });

  dispatcher_.register_packet(
      config_.packet_ids.data, config_.data_payload_size,
      [this](const uint8_t* payload, size_t len)
      {
        if (len < CUTTER_DATA_PACKET_SIZE)
        {
          CAPULIN_LOG(LWarn, "%s: data packet of %zu bytes is too short", this->name().c_str(),
                      len);
          return;
        }
        const internal::CutterDataPayload raw = internal::decode_cutter_data(payload);

        auto data = std::make_shared<CutterData>();
        data->sequence = raw.sequence;
        data->depth = raw.depth;
        data->target_depth = raw.target_depth;
        data->status = raw.status;
        std::atomic_store(&data_, std::shared_ptr<const CutterData>(std::move(data)));
      });
}

CutterBoard::~CutterBoard()
{
  shut_down();
}

std::unique_ptr<ByteStream> CutterBoard::create_simulator()
{
  auto simulator = std::unique_ptr<internal::CutterSimulator>(
      new internal::CutterSimulator(config_));
  simulator_.store(simulator.get());
  return std::unique_ptr<ByteStream>(std::move(simulator));
}

bool CutterBoard::send(CutterCommand cmd, std::initializer_list<uint8_t> params)
{
  return send_command(static_cast<uint8_t>(cmd), params);
}

bool CutterBoard::cut_mode()
{
  return send(CutterCommand::CUT_MODE);
}

bool CutterBoard::stop_mode()
{
  return send(CutterCommand::STOP_MODE);
}

bool CutterBoard::zero_depth()
{
  return send(CutterCommand::ZERO_DEPTH);
}

bool CutterBoard::zero_target_depth()
{
  return send(CutterCommand::ZERO_TARGET_DEPTH);
}

bool CutterBoard::request_data_packet()
{
  return send(CutterCommand::GET_DATA_PACKET);
}

bool CutterBoard::get_data_packet()
{
  return request_reply(static_cast<uint8_t>(CutterCommand::GET_DATA_PACKET),
                       config_.packet_ids.data);
}

CutterData CutterBoard::data_packet() const
{
  return *std::atomic_load(&data_);
}

bool CutterBoard::request_status()
{
  return request_reply(static_cast<uint8_t>(CutterCommand::GET_STATUS),
                       config_.packet_ids.status);
}

std::vector<uint8_t> CutterBoard::status() const
{
  return *std::atomic_load(&status_);
}

bool CutterBoard::install_new_firmware(FirmwareInstaller& installer)
{
  FirmwareInstallSettings settings;
  settings.load_firmware_cmd = static_cast<uint8_t>(CutterCommand::LOAD_FIRMWARE);
  settings.no_action = static_cast<uint8_t>(CutterCommand::NO_ACTION);
  settings.error = static_cast<uint8_t>(CutterCommand::ERROR);
  settings.send_data_cmd = static_cast<uint8_t>(CutterCommand::SEND_DATA);
  settings.data_cmd = static_cast<uint8_t>(CutterCommand::DATA);
  settings.exit_cmd = static_cast<uint8_t>(CutterCommand::EXIT);

  if (!is_ready())
  {
    CAPULIN_LOG(LError, "%s: firmware install - %s", name().c_str(),
                error_message(ErrorCode::NOT_CONNECTED));
    return false;
  }
  return installer.install("Cutter", "CAPULIN NOTCH CUTTER.bin", settings, session_);
}

void CutterBoard::drive_simulation()
{
  internal::CutterSimulator* simulator = simulator_.load();
  if (simulator != nullptr && is_ready())
  {
    simulator->drive();
  }
}

}  // namespace capulin
