/**
 * @file save_manager.cpp
 * @brief Slot-based save storage
 */

#include "Narrata/save/save_manager.hpp"
#include "Narrata/core/logger.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace Narrata::save {

namespace {
constexpr const char* InvalidSlotMessage = "Invalid save slot";
}

SaveManager::SaveManager() : m_savePath("./saves/") {}

void SaveManager::setSavePath(const std::string& path) {
  m_savePath = path;
  if (m_savePath.empty() || (m_savePath.back() != '/' && m_savePath.back() != '\\')) {
    m_savePath += '/';
  }
}

bool SaveManager::isValidSlot(i32 slot) const { return slot >= 0 && slot < m_config.maxSlots; }

std::string SaveManager::slotFilePath(i32 slot) const {
  return m_savePath + "slot_" + std::to_string(slot) + ".json";
}

std::string SaveManager::autoSaveFilePath() const { return m_savePath + "autosave.json"; }

Result<void> SaveManager::writeFile(const std::string& path, const SaveData& data) {
  SaveData stamped = data;

  // Timestamps strictly increase so listSlots() ordering is stable
  auto now = static_cast<u64>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::system_clock::now().time_since_epoch())
                                  .count());
  stamped.timestamp = std::max(now, m_lastTimestamp + 1);
  m_lastTimestamp = stamped.timestamp;
  stamped.version = SaveFormatVersion;
  stamped.checksum = calculateChecksum(stamped);

  try {
    fs::create_directories(m_savePath);

    std::string tempPath = path + ".tmp";
    {
      std::ofstream file(tempPath, std::ios::trunc);
      if (!file.is_open()) {
        return Result<void>::error("Cannot open file for writing: " + path);
      }
      file << toJson(stamped).dump(m_config.prettyPrint ? 2 : -1);
      if (!file) {
        return Result<void>::error("Failed to write save file: " + path);
      }
    }

    fs::rename(tempPath, path);
  } catch (const std::exception& e) {
    return Result<void>::error(std::string("Failed to save: ") + e.what());
  }

  NARRATA_LOG_INFO("Saved '{}' at node '{}' to {}", stamped.name, stamped.currentNodeId, path);
  return Result<void>::ok();
}

Result<SaveData> SaveManager::readFile(const std::string& path) const {
  std::string content;
  try {
    if (!fs::exists(path)) {
      return Result<SaveData>::error("Save file not found: " + path);
    }
    std::ifstream file(path);
    if (!file.is_open()) {
      return Result<SaveData>::error("Cannot open save file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    content = buffer.str();
  } catch (const std::exception& e) {
    return Result<SaveData>::error(std::string("Failed to read save file: ") + e.what());
  }

  if (content.empty()) {
    return Result<SaveData>::error("Save file is empty: " + path);
  }

  nlohmann::json document = nlohmann::json::parse(content, nullptr, false);
  if (document.is_discarded()) {
    return Result<SaveData>::error("Save file is corrupted: " + path);
  }

  auto parsed = fromJson(document);
  if (parsed.isError()) {
    return parsed;
  }

  if (m_config.verifyChecksum) {
    const SaveData& data = parsed.value();
    if (data.checksum != calculateChecksum(data)) {
      return Result<SaveData>::error("Checksum mismatch in save file: " + path);
    }
  }

  return parsed;
}

Result<void> SaveManager::save(i32 slot, const SaveData& data) {
  if (!isValidSlot(slot)) {
    return Result<void>::error(InvalidSlotMessage);
  }
  return writeFile(slotFilePath(slot), data);
}

Result<SaveData> SaveManager::load(i32 slot) {
  if (!isValidSlot(slot)) {
    return Result<SaveData>::error(InvalidSlotMessage);
  }
  auto result = readFile(slotFilePath(slot));
  if (result.isError()) {
    NARRATA_LOG_WARN("Failed to load slot {}: {}", slot, result.error());
  }
  return result;
}

Result<void> SaveManager::saveAuto(const SaveData& data) {
  return writeFile(autoSaveFilePath(), data);
}

Result<SaveData> SaveManager::loadAuto() { return readFile(autoSaveFilePath()); }

bool SaveManager::autoSaveExists() const {
  std::error_code ec;
  return fs::exists(autoSaveFilePath(), ec);
}

bool SaveManager::slotExists(i32 slot) const {
  if (!isValidSlot(slot)) {
    return false;
  }
  std::error_code ec;
  return fs::exists(slotFilePath(slot), ec);
}

Result<void> SaveManager::deleteSlot(i32 slot) {
  if (!isValidSlot(slot)) {
    return Result<void>::error(InvalidSlotMessage);
  }

  std::error_code ec;
  if (!fs::remove(slotFilePath(slot), ec)) {
    return Result<void>::error("Failed to delete save slot " + std::to_string(slot) +
                               (ec ? ": " + ec.message() : ": not found"));
  }
  return Result<void>::ok();
}

std::optional<u64> SaveManager::getSlotTimestamp(i32 slot) const {
  auto metadata = getSlotMetadata(slot);
  if (!metadata) {
    return std::nullopt;
  }
  return metadata->timestamp;
}

std::optional<SlotMetadata> SaveManager::getSlotMetadata(i32 slot) const {
  if (!slotExists(slot)) {
    return std::nullopt;
  }

  auto result = readFile(slotFilePath(slot));
  if (result.isError()) {
    NARRATA_LOG_WARN("Unreadable save slot {}: {}", slot, result.error());
    return std::nullopt;
  }

  const SaveData& data = result.value();
  SlotMetadata metadata;
  metadata.slot = slot;
  metadata.timestamp = data.timestamp;
  metadata.name = data.name;
  metadata.currentNodeId = data.currentNodeId;
  metadata.hasScreenshot = data.screenshot.has_value();
  return metadata;
}

std::vector<SlotMetadata> SaveManager::listSlots() const {
  std::vector<SlotMetadata> slots;
  for (i32 slot = 0; slot < m_config.maxSlots; ++slot) {
    if (auto metadata = getSlotMetadata(slot)) {
      slots.push_back(std::move(*metadata));
    }
  }
  std::sort(slots.begin(), slots.end(), [](const SlotMetadata& a, const SlotMetadata& b) {
    return a.timestamp > b.timestamp;
  });
  return slots;
}

} // namespace Narrata::save
