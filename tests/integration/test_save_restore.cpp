/**
 * @file test_save_restore.cpp
 * @brief Integration tests for saving a session and resuming it elsewhere
 */

#include <catch2/catch_test_macros.hpp>
#include "Narrata/runtime/game_session.hpp"
#include <filesystem>

using namespace Narrata;
using namespace Narrata::runtime;

namespace {

const std::string kLighthouse = NARRATA_SAMPLES_DIR "/stories/lighthouse.yaml";

class SaveRestoreFixture {
public:
  SaveRestoreFixture() {
    saveDir = std::filesystem::temp_directory_path() / "narrata_save_restore_tests";
    std::error_code ec;
    std::filesystem::remove_all(saveDir, ec);
    config.saves.saveDirectory = saveDir.string();
  }

  ~SaveRestoreFixture() {
    std::error_code ec;
    std::filesystem::remove_all(saveDir, ec);
  }

  std::unique_ptr<GameSession> newSession() {
    auto session = std::make_unique<GameSession>(config);
    REQUIRE(session->loadStoryFile(kLighthouse).isOk());
    session->getActionGenerator().setRandomSource([] { return 0.99; });
    return session;
  }

  std::filesystem::path saveDir;
  RuntimeConfig config;
};

class StubScreenshot : public dialogue::IScreenshotProvider {
public:
  std::optional<std::string> captureThumbnail() override { return std::string("thumb"); }
};

void advance(GameSession& session) {
  session.getDirector().onTypingComplete();
  REQUIRE(session.getDirector().continueDialogue().isOk());
  session.update();
  session.getDirector().onTypingComplete();
}

} // namespace

TEST_CASE_METHOD(SaveRestoreFixture, "A restored session continues like the original",
                 "[integration][save]") {
  auto original = newSession();
  REQUIRE(original->start().isOk());
  original->update();
  advance(*original);
  advance(*original);
  REQUIRE(original->getStoryManager().getCurrentNodeId() == "decide");

  REQUIRE(original->saveToSlot(1, "At the crossroads").isOk());

  auto resumed = newSession();
  REQUIRE(resumed->loadFromSlot(1).isOk());
  resumed->getDirector().onTypingComplete();

  auto& a = original->getStoryManager();
  auto& b = resumed->getStoryManager();
  REQUIRE(b.getCurrentNodeId() == "decide");
  REQUIRE(b.getHistory() == a.getHistory());
  REQUIRE(b.getGameState() == a.getGameState());
  REQUIRE(resumed->getCharacterStates().exportForSave() ==
          original->getCharacterStates().exportForSave());
  REQUIRE(resumed->getDirector().isAwaitingChoice());

  REQUIRE(original->getDirector().selectChoice(1).isOk());
  REQUIRE(resumed->getDirector().selectChoice(1).isOk());
  advance(*original);
  advance(*resumed);
  advance(*original);
  advance(*resumed);

  REQUIRE(b.getCurrentNodeId() == a.getCurrentNodeId());
  REQUIRE(b.getHistory() == a.getHistory());
  REQUIRE(b.getGameState() == a.getGameState());
  REQUIRE(b.getCompletedBranches() == a.getCompletedBranches());
}

TEST_CASE_METHOD(SaveRestoreFixture, "Restoring onto a hook node keeps the saved state",
                 "[integration][save]") {
  auto original = newSession();
  REQUIRE(original->start().isOk());
  original->update();
  advance(*original);
  advance(*original);
  REQUIRE(original->getDirector().selectChoice(1).isOk());
  REQUIRE(original->getStoryManager().getCurrentNodeId() == "cellar");

  save::SaveData data = original->createSaveData("cellar");
  REQUIRE(data.gameState["trust"] == 2);
  REQUIRE(data.customData["storyId"] == "lighthouse");

  auto resumed = newSession();
  REQUIRE(resumed->restoreFromSaveData(data).isOk());
  REQUIRE(resumed->getStoryManager().getGameState()["trust"] == 2);
  REQUIRE(resumed->getStoryManager().getHistory() == data.visitedNodes);
}

TEST_CASE_METHOD(SaveRestoreFixture, "Session saves carry metadata", "[integration][save]") {
  auto session = newSession();

  SECTION("nothing to save before the story starts") {
    REQUIRE(session->saveToSlot(0, "empty").isError());
  }

  SECTION("screenshots and slot listing") {
    StubScreenshot screenshot;
    session->setScreenshotProvider(&screenshot);
    REQUIRE(session->start().isOk());
    session->update();
    REQUIRE(session->saveToSlot(2, "Opening").isOk());

    auto slots = session->getSaveManager().listSlots();
    REQUIRE(slots.size() == 1);
    REQUIRE(slots[0].name == "Opening");
    REQUIRE(slots[0].currentNodeId == "greeting");
    REQUIRE(slots[0].hasScreenshot);
  }

  SECTION("missing slots and stories are errors") {
    REQUIRE(session->loadFromSlot(9).isError());

    GameSession empty(config);
    save::SaveData data;
    data.currentNodeId = "greeting";
    auto result = empty.restoreFromSaveData(data);
    REQUIRE(result.isError());
    REQUIRE(result.error().code == story::StoryErrorCode::NoStoryLoaded);
  }

  SECTION("a save for a removed node restarts the story") {
    save::SaveData data;
    data.currentNodeId = "demolished_wing";
    data.visitedNodes = {"arrival", "demolished_wing"};
    REQUIRE(session->restoreFromSaveData(data).isOk());
    session->update();
    REQUIRE(session->getStoryManager().getCurrentNodeId() == "greeting");
  }
}
