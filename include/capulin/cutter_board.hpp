/**
 * @file cutter_board.hpp
 * @brief Notch cutter board facade
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include "capulin/board.hpp"
#include "capulin/config.hpp"

namespace capulin
{

namespace internal
{
class CutterSimulator;
}

/**
 * @brief Decoded cutter data packet
 */
struct CutterData
{
  uint16_t sequence = 0;
  int32_t depth = 0;         ///< Current cut depth in encoder counts
  int32_t target_depth = 0;  ///< Depth at which the cut stops
  uint8_t status = 0;

  bool cutting() const
  {
    return (status & 0x01) != 0;
  }

  bool target_reached() const
  {
    return (status & 0x02) != 0;
  }
};

/**
 * @brief Notch cutter board
 */
class CutterBoard : public Board
{
 public:
  CutterBoard(std::string name, int index, SessionSettings settings,
              CutterBoardConfig config = CutterBoardConfig());

  ~CutterBoard() override;

  bool cut_mode();
  bool stop_mode();
  bool zero_depth();
  bool zero_target_depth();

  /**
   * @brief Ask the board for a data packet
   *
   * The reply is decoded by a later process_one_data_packet() call.
   */
  bool request_data_packet();

  /**
   * @brief Request a data packet and process packets until it arrives
   *
   * @return true if the reply was decoded
   */
  bool get_data_packet();

  /** @brief Last decoded data packet */
  CutterData data_packet() const;

  /**
   * @brief Request status and wait for the reply
   */
  bool request_status();

  /** @brief Payload of the last status reply */
  std::vector<uint8_t> status() const;

  bool install_new_firmware(FirmwareInstaller& installer);

  /**
   * @brief Advance the simulated board one step; no-op on real hardware
   */
  void drive_simulation();

  const CutterBoardConfig& config() const
  {
    return config_;
  }

 protected:
  std::unique_ptr<ByteStream> create_simulator() override;

 private:
  bool send(CutterCommand cmd, std::initializer_list<uint8_t> params = {});

  CutterBoardConfig config_;

  std::shared_ptr<const CutterData> data_;
  std::shared_ptr<const std::vector<uint8_t>> status_;

  std::atomic<internal::CutterSimulator*> simulator_;
};

}  // namespace capulin
