#include <catch2/catch_test_macros.hpp>
#include "Narrata/story/story_node.hpp"

using namespace Narrata::story;

namespace {

StoryNodeData choiceNode() {
  StoryNodeData data;
  data.id = "crossroads";
  data.type = NodeType::Choice;
  data.choices.push_back({"a", "Needs the key", "vault", std::string("hasKey"), nullptr});
  data.choices.push_back({"b", "Always open", "road", std::nullopt, nullptr});
  data.choices.push_back({"c", "Rich only", "shop", std::string("gold >= 100"), nullptr});
  data.choices.push_back({"d", "Broken", "void", std::string("gold >="), nullptr});
  return data;
}

} // namespace

TEST_CASE("StoryNode exposes typed accessors", "[story_node]") {
  StoryNodeData data;
  data.id = "intro";
  data.type = NodeType::Scene;
  data.sceneId = "harbor";
  data.background = StoryBackground{"dock", std::nullopt, std::string("fade")};
  data.metadata = NodeMetadata{};
  data.metadata->transition = TransitionHint{"dissolve", 0.5};

  StoryNode node(data);
  REQUIRE(node.getId() == "intro");
  REQUIRE(node.getType() == NodeType::Scene);
  REQUIRE(node.getSceneId() == "harbor");
  REQUIRE(node.getBackground() == "dock");
  REQUIRE(node.getBackgroundTransitionType() == "fade");
  REQUIRE(node.getTransitionType() == "dissolve");

  SECTION("sceneId is only reported for scene nodes") {
    data.type = NodeType::Dialogue;
    StoryNode dialogue(data);
    REQUIRE_FALSE(dialogue.getSceneId().has_value());
  }

  SECTION("transition type defaults") {
    StoryNodeData plain;
    plain.id = "plain";
    plain.type = NodeType::End;
    REQUIRE(StoryNode(plain).getTransitionType() == "default");
  }
}

TEST_CASE("StoryNode filters available choices", "[story_node]") {
  StoryNode node(choiceNode());

  SECTION("conditions are evaluated against the state, order preserved") {
    GameState state = {{"hasKey", true}, {"gold", 5}};
    auto available = node.getAvailableChoices(state);
    REQUIRE(available.size() == 2);
    REQUIRE(available[0].id == "a");
    REQUIRE(available[1].id == "b");
  }

  SECTION("exactly the failing choices are excluded") {
    GameState state = {{"hasKey", false}, {"gold", 150}};
    auto available = node.getAvailableChoices(state);
    REQUIRE(available.size() == 2);
    REQUIRE(available[0].id == "b");
    REQUIRE(available[1].id == "c");
  }

  SECTION("a choice whose condition does not compile is never offered") {
    REQUIRE_FALSE(node.evaluateChoiceCondition(3, GameState::object()));
    REQUIRE_FALSE(node.evaluateChoiceCondition(99, GameState::object()));
  }
}

TEST_CASE("StoryNode conditions fail closed", "[story_node]") {
  StoryNodeData data;
  data.id = "gate";
  data.type = NodeType::Branch;
  data.nextNode = "next";

  SECTION("no condition is true") {
    REQUIRE(StoryNode(data).evaluateCondition(GameState::object()));
  }

  SECTION("a true condition") {
    data.condition = "state.flag == true";
    REQUIRE(StoryNode(data).evaluateCondition({{"flag", true}}));
  }

  SECTION("an evaluation error is false and never escapes") {
    data.condition = "missing.deeper.still";
    StoryNode node(data);
    bool result = true;
    REQUIRE_NOTHROW(result = node.evaluateCondition(GameState::object()));
    REQUIRE_FALSE(result);
  }

  SECTION("a syntax error is false") {
    data.condition = "flag ==";
    REQUIRE_FALSE(StoryNode(data).evaluateCondition({{"flag", true}}));
  }
}

TEST_CASE("StoryNode hooks mutate game state", "[story_node]") {
  StoryNodeData data;
  data.id = "shop";
  data.type = NodeType::Dialogue;
  data.character = "clerk";
  data.text = "Welcome";
  data.onEnter = "visits++; gold -= 5";
  data.onExit = "leftShop = true";

  StoryNode node(data);
  GameState state = {{"gold", 20}};

  REQUIRE(node.executeOnEnter(state));
  REQUIRE(state["visits"] == 1);
  REQUIRE(state["gold"] == 15);

  REQUIRE(node.executeOnExit(state));
  REQUIRE(state["leftShop"] == true);

  SECTION("a failing hook changes nothing") {
    data.onEnter = "gold -= 1; name.first = 'x'";
    StoryNode broken(data);
    GameState before = {{"gold", 3}, {"name", "Ann"}};
    GameState after = before;
    REQUIRE_FALSE(broken.executeOnEnter(after));
    REQUIRE(after == before);
  }

  SECTION("missing hooks succeed") {
    StoryNodeData bare;
    bare.id = "bare";
    bare.type = NodeType::End;
    GameState untouched = {{"x", 1}};
    GameState expected = untouched;
    REQUIRE(StoryNode(bare).executeOnEnter(untouched));
    REQUIRE(untouched == expected);
  }
}
