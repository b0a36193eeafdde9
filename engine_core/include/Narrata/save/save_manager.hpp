#pragma once

/**
 * @file save_manager.hpp
 * @brief Slot-based storage of SaveData snapshots
 *
 * Each slot is one JSON document, "slot_<n>.json", under the save path.
 * The autosave lives beside the slots in "autosave.json". Documents are
 * written through a temporary file and renamed into place.
 */

#include "Narrata/core/result.hpp"
#include "Narrata/core/types.hpp"
#include "Narrata/save/save_data.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Narrata::save {

struct SaveConfig {
  i32 maxSlots = 100;
  bool verifyChecksum = true;
  bool prettyPrint = true;
};

struct SlotMetadata {
  i32 slot = -1;
  u64 timestamp = 0;
  std::string name;
  std::string currentNodeId;
  bool hasScreenshot = false;
};

class SaveManager {
public:
  SaveManager();
  ~SaveManager() = default;

  /**
   * @brief Write @p data to @p slot, stamping timestamp and checksum
   */
  Result<void> save(i32 slot, const SaveData& data);

  /**
   * @brief Read a slot, verifying its checksum when enabled
   */
  Result<SaveData> load(i32 slot);

  Result<void> saveAuto(const SaveData& data);
  Result<SaveData> loadAuto();
  [[nodiscard]] bool autoSaveExists() const;

  [[nodiscard]] bool slotExists(i32 slot) const;
  Result<void> deleteSlot(i32 slot);

  [[nodiscard]] std::optional<u64> getSlotTimestamp(i32 slot) const;
  [[nodiscard]] std::optional<SlotMetadata> getSlotMetadata(i32 slot) const;

  /**
   * @brief Metadata of every occupied slot, newest first
   */
  [[nodiscard]] std::vector<SlotMetadata> listSlots() const;

  [[nodiscard]] i32 getMaxSlots() const { return m_config.maxSlots; }

  /**
   * @brief Set the save directory; a trailing '/' is added if missing
   */
  void setSavePath(const std::string& path);
  [[nodiscard]] const std::string& getSavePath() const { return m_savePath; }

  void setConfig(const SaveConfig& config) { m_config = config; }
  [[nodiscard]] const SaveConfig& getConfig() const { return m_config; }

private:
  [[nodiscard]] bool isValidSlot(i32 slot) const;
  [[nodiscard]] std::string slotFilePath(i32 slot) const;
  [[nodiscard]] std::string autoSaveFilePath() const;

  Result<void> writeFile(const std::string& path, const SaveData& data);
  [[nodiscard]] Result<SaveData> readFile(const std::string& path) const;

  std::string m_savePath;
  SaveConfig m_config;
  u64 m_lastTimestamp = 0;
};

} // namespace Narrata::save
