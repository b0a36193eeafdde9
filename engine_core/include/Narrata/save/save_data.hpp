#pragma once

/**
 * @file save_data.hpp
 * @brief Serializable snapshot of a play session
 *
 * A snapshot records the narrative position (current node, history,
 * completed branches), every character's state and the game state.
 * Presentation details such as running animations or typing progress
 * are not part of it.
 */

#include "Narrata/character/character_state_manager.hpp"
#include "Narrata/core/result.hpp"
#include "Narrata/core/types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Narrata::save {

inline constexpr i32 SaveFormatVersion = 1;

struct SaveData {
  i32 version = SaveFormatVersion;
  u64 timestamp = 0; // milliseconds since epoch
  std::string name;
  std::optional<std::string> screenshot;

  std::string currentNodeId;
  std::vector<std::string> visitedNodes;
  std::vector<std::string> completedBranches;

  character::CharacterStateMap characterStates;
  nlohmann::json gameState = nlohmann::json::object();
  nlohmann::json customData = nlohmann::json::object();

  // CRC32 of the document without this field; 0 when never written
  u32 checksum = 0;
};

[[nodiscard]] nlohmann::json toJson(const SaveData& data);

/**
 * @brief Rebuild a snapshot from its JSON document
 *
 * Fails on a missing or mistyped field and on a format version newer
 * than SaveFormatVersion.
 */
[[nodiscard]] Result<SaveData> fromJson(const nlohmann::json& document);

/**
 * @brief CRC32 over the serialized snapshot, excluding the checksum
 */
[[nodiscard]] u32 calculateChecksum(const SaveData& data);

} // namespace Narrata::save
