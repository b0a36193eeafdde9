#include <catch2/catch_test_macros.hpp>
#include "Narrata/story/story_validator.hpp"
#include <algorithm>

using namespace Narrata::story;

namespace {

StoryNodeData makeNode(const std::string& id, NodeType type) {
  StoryNodeData node;
  node.id = id;
  node.type = type;
  if (type == NodeType::Dialogue) {
    node.character = "hero";
    node.text = "Hello";
  }
  return node;
}

Story makeStory() {
  Story story;
  story.id = "s";
  story.title = "S";
  story.startNode = "start";

  auto start = makeNode("start", NodeType::Dialogue);
  start.nextNode = "pick";
  story.nodes["start"] = start;

  auto pick = makeNode("pick", NodeType::Choice);
  pick.choices.push_back({"a", "Go left", "left", std::nullopt, nullptr});
  pick.choices.push_back({"b", "Go right", "right", std::nullopt, nullptr});
  story.nodes["pick"] = pick;

  story.nodes["left"] = makeNode("left", NodeType::End);
  story.nodes["right"] = makeNode("right", NodeType::End);
  return story;
}

} // namespace

TEST_CASE("StoryValidator accepts a well formed story", "[story_validator]") {
  REQUIRE(StoryValidator::validate(makeStory()).isOk());
}

TEST_CASE("StoryValidator rejects dangling references", "[story_validator]") {
  Story story = makeStory();

  SECTION("startNode") {
    story.startNode = "missing";
    auto result = StoryValidator::validate(story);
    REQUIRE(result.isError());
    REQUIRE(result.error().field == "startNode");
  }

  SECTION("nextNode names the offending node") {
    story.nodes["start"].nextNode = "nowhere";
    auto result = StoryValidator::validate(story);
    REQUIRE(result.isError());
    REQUIRE(result.error().code == StoryErrorCode::ValidationError);
    REQUIRE(result.error().nodeId == "start");
    REQUIRE(result.error().field == "nextNode");
  }

  SECTION("choice target") {
    story.nodes["pick"].choices[1].nextNode = "nowhere";
    auto result = StoryValidator::validate(story);
    REQUIRE(result.isError());
    REQUIRE(result.error().nodeId == "pick");
    REQUIRE(result.error().field == "choices[1].nextNode");
  }

  SECTION("branch target") {
    auto branch = makeNode("gate", NodeType::Branch);
    branch.condition = "true";
    branch.nextNode = "nowhere";
    story.nodes["gate"] = branch;
    auto result = StoryValidator::validate(story);
    REQUIRE(result.isError());
    REQUIRE(result.error().nodeId == "gate");
  }
}

TEST_CASE("StoryValidator checks per-type required fields", "[story_validator]") {
  Story story = makeStory();

  SECTION("dialogue without text") {
    story.nodes["start"].text.reset();
    auto result = StoryValidator::validate(story);
    REQUIRE(result.isError());
    REQUIRE(result.error().field == "text");
  }

  SECTION("dialogue without character") {
    story.nodes["start"].character = "";
    REQUIRE(StoryValidator::validate(story).isError());
  }

  SECTION("choice without choices") {
    story.nodes["pick"].choices.clear();
    auto result = StoryValidator::validate(story);
    REQUIRE(result.isError());
    REQUIRE(result.error().field == "choices");
  }

  SECTION("scene without sceneId") {
    story.nodes["scene"] = makeNode("scene", NodeType::Scene);
    auto result = StoryValidator::validate(story);
    REQUIRE(result.isError());
    REQUIRE(result.error().field == "sceneId");
  }

  SECTION("branch without condition") {
    auto branch = makeNode("gate", NodeType::Branch);
    branch.nextNode = "left";
    story.nodes["gate"] = branch;
    auto result = StoryValidator::validate(story);
    REQUIRE(result.isError());
    REQUIRE(result.error().field == "condition");
  }

  SECTION("end node with a nextNode") {
    story.nodes["left"].nextNode = "right";
    auto result = StoryValidator::validate(story);
    REQUIRE(result.isError());
    REQUIRE(result.error().nodeId == "left");
  }

  SECTION("initialState must be a mapping") {
    story.initialState = nlohmann::json::array();
    REQUIRE(StoryValidator::validate(story).isError());
  }
}

TEST_CASE("StoryValidator diagnostics", "[story_validator][diagnostics]") {
  Story story = makeStory();

  SECTION("unreachable nodes") {
    story.nodes["orphan"] = makeNode("orphan", NodeType::End);
    auto unreachable = StoryValidator::findUnreachableNodes(story);
    REQUIRE(unreachable == std::vector<std::string>{"orphan"});
    REQUIRE(StoryValidator::validate(story).isOk());
  }

  SECTION("auto-progress cycles") {
    auto a = makeNode("loop_a", NodeType::Branch);
    a.condition = "true";
    a.nextNode = "loop_b";
    auto b = makeNode("loop_b", NodeType::Scene);
    b.sceneId = "room";
    b.nextNode = "loop_a";
    story.nodes["loop_a"] = a;
    story.nodes["loop_b"] = b;

    auto cycles = StoryValidator::findAutoProgressCycles(story);
    REQUIRE(cycles.size() == 1);
    REQUIRE(cycles[0] == std::vector<std::string>{"loop_a", "loop_b"});
  }

  SECTION("a self-looping branch is a cycle") {
    auto gate = makeNode("gate", NodeType::Branch);
    gate.condition = "true";
    gate.nextNode = "gate";
    story.nodes["gate"] = gate;
    REQUIRE(StoryValidator::findAutoProgressCycles(story).size() == 1);
  }

  SECTION("dialogue breaks a cycle") {
    story.nodes["left"] = makeNode("left", NodeType::Dialogue);
    story.nodes["left"].nextNode = "pick";
    REQUIRE(StoryValidator::findAutoProgressCycles(story).empty());
  }

  SECTION("script errors") {
    story.nodes["start"].onEnter = "trust += ";
    story.nodes["pick"].choices[0].condition = "a &";
    auto diagnostics = StoryValidator::findScriptErrors(story);
    REQUIRE(diagnostics.size() == 2);

    bool sawHook = std::any_of(diagnostics.begin(), diagnostics.end(), [](const auto& d) {
      return d.nodeId == "start" && d.field == "onEnter";
    });
    REQUIRE(sawHook);
    REQUIRE(StoryValidator::validate(story).isOk());
  }
}
