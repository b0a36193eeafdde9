#include "Narrata/save/save_data.hpp"
#include <stdexcept>

namespace Narrata::save {

namespace {

u32 crc32(const std::string& bytes) {
  u32 crc = 0xFFFFFFFF;
  for (unsigned char byte : bytes) {
    crc ^= byte;
    for (int bit = 0; bit < 8; ++bit) {
      crc = (crc >> 1) ^ (0xEDB88320u & (0u - (crc & 1u)));
    }
  }
  return crc ^ 0xFFFFFFFF;
}

nlohmann::json documentWithoutChecksum(const SaveData& data) {
  nlohmann::json doc;
  doc["version"] = data.version;
  doc["timestamp"] = data.timestamp;
  doc["name"] = data.name;
  doc["screenshot"] = data.screenshot ? nlohmann::json(*data.screenshot) : nlohmann::json();
  doc["currentNodeId"] = data.currentNodeId;
  doc["visitedNodes"] = data.visitedNodes;
  doc["completedBranches"] = data.completedBranches;

  nlohmann::json characters = nlohmann::json::object();
  for (const auto& [id, state] : data.characterStates) {
    characters[id] = state;
  }
  doc["characterStates"] = std::move(characters);
  doc["gameState"] = data.gameState.is_object() ? data.gameState : nlohmann::json::object();
  doc["customData"] = data.customData.is_null() ? nlohmann::json::object() : data.customData;
  return doc;
}

} // namespace

nlohmann::json toJson(const SaveData& data) {
  nlohmann::json doc = documentWithoutChecksum(data);
  doc["checksum"] = data.checksum;
  return doc;
}

u32 calculateChecksum(const SaveData& data) { return crc32(documentWithoutChecksum(data).dump()); }

Result<SaveData> fromJson(const nlohmann::json& document) {
  if (!document.is_object()) {
    return Result<SaveData>::error("Save document is not an object");
  }

  SaveData data;
  try {
    data.version = document.value("version", 0);
    if (data.version <= 0) {
      return Result<SaveData>::error("Save document has no format version");
    }
    if (data.version > SaveFormatVersion) {
      return Result<SaveData>::error("Unsupported save version: " +
                                     std::to_string(data.version));
    }

    data.timestamp = document.value("timestamp", u64{0});
    data.name = document.value("name", std::string());
    if (auto it = document.find("screenshot"); it != document.end() && it->is_string()) {
      data.screenshot = it->get<std::string>();
    }

    data.currentNodeId = document.at("currentNodeId").get<std::string>();
    data.visitedNodes = document.value("visitedNodes", std::vector<std::string>{});
    data.completedBranches = document.value("completedBranches", std::vector<std::string>{});

    if (auto it = document.find("characterStates"); it != document.end()) {
      if (!it->is_object()) {
        return Result<SaveData>::error("characterStates must be an object");
      }
      for (const auto& [id, value] : it->items()) {
        character::CharacterState state = value.get<character::CharacterState>();
        state.id = id;
        data.characterStates.emplace(id, std::move(state));
      }
    }

    data.gameState = document.value("gameState", nlohmann::json::object());
    if (!data.gameState.is_object()) {
      return Result<SaveData>::error("gameState must be an object");
    }
    data.customData = document.value("customData", nlohmann::json::object());
    data.checksum = document.value("checksum", u32{0});
  } catch (const nlohmann::json::exception& e) {
    return Result<SaveData>::error(std::string("Malformed save document: ") + e.what());
  } catch (const std::invalid_argument& e) {
    return Result<SaveData>::error(std::string("Malformed character state: ") + e.what());
  }

  return Result<SaveData>::ok(std::move(data));
}

} // namespace Narrata::save
