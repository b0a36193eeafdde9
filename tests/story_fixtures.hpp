#pragma once

/**
 * @file story_fixtures.hpp
 * @brief Small stories shared by the story, dialogue and save tests
 */

#include "Narrata/story/story_manager.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

namespace Narrata::test {

// start -> choice1 -> end1 | end2
inline const char* kTwoEndingsJson = R"({
  "id": "two_endings",
  "title": "Two Endings",
  "startNode": "start",
  "initialState": { "score": 0 },
  "nodes": {
    "start":   { "type": "dialogue", "character": "hero", "text": "Ready?", "nextNode": "choice1" },
    "choice1": { "type": "choice", "choices": [
                   { "text": "yes", "nextNode": "end1", "stateChanges": { "score": 10 } },
                   { "text": "no", "nextNode": "end2" } ] },
    "end1":    { "type": "end", "text": "Yes!" },
    "end2":    { "type": "end" }
  }
})";

// A scene that falls through to dialogue, a branch and conditional choices
inline const char* kForestYaml = R"(
id: forest
title: Into the Forest
startNode: clearing
assets:
  characters:
    alice:
      name: Alice
      textColor: "#ff8888"
      textSpeed: 30
    bob:
      name: Bob
initialState:
  flag: true
  courage: 1
  met: false
nodes:
  clearing:
    type: scene
    sceneId: forest_clearing
    characters:
      - id: alice
        position: left
        expression: happy
    nextNode: hello
  hello:
    type: dialogue
    character: alice
    mood: joyful
    text: "What a lovely morning."
    onEnter: "met = true"
    nextNode: gate
  gate:
    type: branch
    condition: "state.flag == true"
    nextNode: path
  path:
    type: choice
    text: "Which way?"
    choices:
      - text: Into the dark
        nextNode: dark
        condition: "courage >= 2"
      - text: Along the river
        nextNode: river
      - text: Back home
        nextNode: home
        condition: "met"
  dark:
    type: end
    text: "Brave."
  river:
    type: dialogue
    character: bob
    text: "Mind the stones!"
    nextNode: home
  home:
    type: end
)";

/**
 * @brief Records story notifications in order
 */
class RecordingStoryListener : public story::IStoryListener {
public:
  void onStoryLoaded(const story::Story& story) override { events.push_back("loaded:" + story.id); }
  void onStoryStarted(const story::Story&) override { events.push_back("started"); }
  void onStoryReset() override { events.push_back("reset"); }
  void onStoryResumed(const std::string& nodeId) override { events.push_back("resumed:" + nodeId); }
  void onNodeEntered(const story::StoryNode& current, const story::StoryNode* previous) override {
    entered.push_back(current.getId());
    previousIds.push_back(previous ? previous->getId() : "");
    events.push_back("entered:" + current.getId());
  }
  void onNodeExited(const story::StoryNode& node) override {
    events.push_back("exited:" + node.getId());
  }
  void onChoiceMade(const story::StoryChoice& choice, int index) override {
    events.push_back("choice:" + std::to_string(index) + ":" + choice.nextNode);
  }
  void onStateChanged(const story::GameState&, const story::GameState&,
                      const story::GameState&) override {
    ++stateChanges;
  }

  std::vector<std::string> events;
  std::vector<std::string> entered;
  std::vector<std::string> previousIds;
  int stateChanges = 0;
};

inline void loadJson(story::StoryManager& manager, const char* text) {
  auto result = manager.loadFromJson(text);
  REQUIRE(result.isOk());
}

inline void loadYaml(story::StoryManager& manager, const char* text) {
  auto result = manager.loadFromYaml(text);
  REQUIRE(result.isOk());
}

} // namespace Narrata::test
