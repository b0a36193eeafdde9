#include <catch2/catch_test_macros.hpp>
#include "Narrata/save/save_data.hpp"

using namespace Narrata;
using namespace Narrata::save;

namespace {

SaveData sampleSave() {
  SaveData data;
  data.name = "Before the storm";
  data.currentNodeId = "decide";
  data.visitedNodes = {"arrival", "greeting", "decide"};
  data.completedBranches = {"greeting"};
  character::CharacterState mara;
  mara.id = "mara";
  mara.isVisible = true;
  mara.position = character::CharacterPosition::Left;
  mara.currentEmotion = character::CharacterEmotion::Worried;
  data.characterStates["mara"] = mara;
  data.gameState = {{"trust", 2}, {"visitedCellar", false}};
  return data;
}

} // namespace

TEST_CASE("SaveData serializes every field", "[save_data]") {
  SaveData data = sampleSave();
  data.screenshot = "iVBORw0KGgo=";
  data.checksum = calculateChecksum(data);

  nlohmann::json doc = toJson(data);
  REQUIRE(doc["version"] == SaveFormatVersion);
  REQUIRE(doc["currentNodeId"] == "decide");
  REQUIRE(doc["visitedNodes"].size() == 3);
  REQUIRE(doc["characterStates"]["mara"]["position"] == "left");
  REQUIRE(doc["characterStates"]["mara"]["currentEmotion"] == "worried");
  REQUIRE(doc["gameState"]["trust"] == 2);

  auto restored = fromJson(doc);
  REQUIRE(restored.isOk());
  const SaveData& back = restored.value();
  REQUIRE(back.name == data.name);
  REQUIRE(back.screenshot == data.screenshot);
  REQUIRE(back.visitedNodes == data.visitedNodes);
  REQUIRE(back.completedBranches == data.completedBranches);
  REQUIRE(back.characterStates == data.characterStates);
  REQUIRE(back.gameState == data.gameState);
  REQUIRE(back.checksum == data.checksum);
  REQUIRE(calculateChecksum(back) == back.checksum);
}

TEST_CASE("SaveData checksum covers the content", "[save_data][checksum]") {
  SaveData data = sampleSave();
  u32 original = calculateChecksum(data);
  REQUIRE(original == calculateChecksum(sampleSave()));

  data.checksum = 12345;
  REQUIRE(calculateChecksum(data) == original);

  data.gameState["trust"] = 3;
  REQUIRE(calculateChecksum(data) != original);
}

TEST_CASE("SaveData rejects malformed documents", "[save_data][errors]") {
  nlohmann::json doc = toJson(sampleSave());

  SECTION("not an object") { REQUIRE(fromJson(nlohmann::json::array()).isError()); }

  SECTION("missing version") {
    doc.erase("version");
    REQUIRE(fromJson(doc).isError());
  }

  SECTION("newer version") {
    doc["version"] = SaveFormatVersion + 1;
    auto result = fromJson(doc);
    REQUIRE(result.isError());
    REQUIRE(result.error().find("Unsupported save version") != std::string::npos);
  }

  SECTION("missing current node") {
    doc.erase("currentNodeId");
    REQUIRE(fromJson(doc).isError());
  }

  SECTION("bad character state") {
    doc["characterStates"]["mara"]["currentEmotion"] = "bored";
    REQUIRE(fromJson(doc).isError());
  }

  SECTION("game state must be an object") {
    doc["gameState"] = 7;
    REQUIRE(fromJson(doc).isError());
  }

  SECTION("a minimal document is accepted") {
    nlohmann::json minimal = {{"version", 1}, {"currentNodeId", "start"}};
    auto result = fromJson(minimal);
    REQUIRE(result.isOk());
    REQUIRE(result.value().visitedNodes.empty());
    REQUIRE(result.value().gameState.is_object());
  }
}
