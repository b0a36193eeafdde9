#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include "Narrata/character/character_action_generator.hpp"
#include "Narrata/story/story_node.hpp"

using namespace Narrata::character;
using Narrata::story::NodeType;
using Narrata::story::SceneCharacter;
using Narrata::story::StoryNode;
using Narrata::story::StoryNodeData;

namespace {

CharacterState makeState(const std::string& id, bool visible, CharacterPosition position,
                         CharacterEmotion emotion = CharacterEmotion::Neutral) {
  CharacterState state;
  state.id = id;
  state.isVisible = visible;
  state.position = position;
  state.currentEmotion = emotion;
  return state;
}

StoryNode dialogueNode(const std::string& id, const std::string& speaker, const std::string& text,
                       std::optional<std::string> mood = std::nullopt) {
  StoryNodeData data;
  data.id = id;
  data.type = NodeType::Dialogue;
  data.character = speaker;
  data.text = text;
  data.mood = std::move(mood);
  return StoryNode(data);
}

CharacterActionGenerator quietGenerator() {
  CharacterActionGenerator generator;
  generator.setRandomSource([] { return 0.99; });
  return generator;
}

} // namespace

TEST_CASE("Scene nodes send departing characters off before others enter",
          "[action_generator][scene]") {
  StoryNodeData data;
  data.id = "harbor_scene";
  data.type = NodeType::Scene;
  data.sceneId = "harbor";
  data.characters = std::vector<SceneCharacter>{{"a", CharacterPosition::Left, std::nullopt}};
  StoryNode node(data);

  CharacterStateMap characters;
  characters["a"] = makeState("a", false, CharacterPosition::OffScreenLeft);
  characters["b"] = makeState("b", true, CharacterPosition::Right);

  auto generator = quietGenerator();
  auto actions = generator.generateActionsFromNode(node, characters);

  REQUIRE(actions.size() == 2);
  REQUIRE(actions[0].type == CharacterActionType::Exit);
  REQUIRE(actions[0].characterId == "b");
  REQUIRE(actions[0].position == CharacterPosition::OffScreenRight);
  REQUIRE(*actions[0].duration == Catch::Approx(0.7));
  REQUIRE(actions[1].type == CharacterActionType::Enter);
  REQUIRE(actions[1].characterId == "a");
  REQUIRE(actions[1].position == CharacterPosition::Left);
  REQUIRE(*actions[1].duration == Catch::Approx(0.8));

  REQUIRE(generator.getCurrentSceneId() == "harbor");

  SECTION("visible characters are moved and re-expressed") {
    characters["a"] = makeState("a", true, CharacterPosition::Right);
    characters["b"].isVisible = false;
    data.characters->at(0).expression = CharacterEmotion::Sad;
    auto moved = generator.generateActionsFromNode(StoryNode(data), characters);

    REQUIRE(moved.size() == 2);
    REQUIRE(moved[0].type == CharacterActionType::Move);
    REQUIRE(moved[0].position == CharacterPosition::Left);
    REQUIRE(moved[1].type == CharacterActionType::ChangeEmotion);
    REQUIRE(moved[1].emotion == CharacterEmotion::Sad);
  }

  SECTION("characters left of stage exit to the left") {
    characters["b"].position = CharacterPosition::Left;
    auto exits = generator.generateActionsFromNode(node, characters);
    REQUIRE(exits[0].position == CharacterPosition::OffScreenLeft);
  }

  SECTION("unknown characters are skipped") {
    data.characters->push_back(SceneCharacter{"ghost", CharacterPosition::Center, std::nullopt});
    auto skipped = generator.generateActionsFromNode(StoryNode(data), characters);
    REQUIRE(skipped.size() == 2);
  }

  SECTION("a scene without a character list keeps the stage as it is") {
    data.characters.reset();
    data.sceneId = "harbor_night";
    auto untouched = generator.generateActionsFromNode(StoryNode(data), characters);
    REQUIRE(untouched.empty());
    REQUIRE(generator.getCurrentSceneId() == "harbor_night");
  }

  SECTION("an empty character list clears the stage") {
    data.characters->clear();
    auto cleared = generator.generateActionsFromNode(StoryNode(data), characters);
    REQUIRE(cleared.size() == 1);
    REQUIRE(cleared[0].type == CharacterActionType::Exit);
    REQUIRE(cleared[0].characterId == "b");
  }
}

TEST_CASE("Dialogue nodes bring the speaker in and speak", "[action_generator][dialogue]") {
  auto generator = quietGenerator();
  CharacterStateMap characters;
  characters["mara"] = makeState("mara", false, CharacterPosition::OffScreenLeft);

  SECTION("an invisible speaker enters at center") {
    auto actions =
        generator.generateActionsFromNode(dialogueNode("n1", "mara", "Hello."), characters);
    REQUIRE(actions.size() == 2);
    REQUIRE(actions[0].type == CharacterActionType::Enter);
    REQUIRE(actions[0].position == CharacterPosition::Center);
    REQUIRE(actions[1].type == CharacterActionType::Speak);
    REQUIRE(actions[1].text == "Hello.");
    REQUIRE(actions[1].emotion == CharacterEmotion::Neutral);
  }

  SECTION("a mood synonym changes the emotion") {
    characters["mara"].isVisible = true;
    auto actions = generator.generateActionsFromNode(
        dialogueNode("n1", "mara", "What a day.", "joyful"), characters);
    REQUIRE(actions.size() == 2);
    REQUIRE(actions[0].type == CharacterActionType::ChangeEmotion);
    REQUIRE(actions[0].emotion == CharacterEmotion::Happy);
    REQUIRE(actions[1].type == CharacterActionType::Speak);
  }

  SECTION("an unchanged mood produces no emotion change") {
    characters["mara"] = makeState("mara", true, CharacterPosition::Left, CharacterEmotion::Sad);
    auto actions = generator.generateActionsFromNode(
        dialogueNode("n1", "mara", "Still raining.", "sad"), characters);
    REQUIRE(actions.size() == 1);
    REQUIRE(actions[0].type == CharacterActionType::Speak);
  }

  SECTION("exclamations trigger an emote") {
    characters["mara"].isVisible = true;
    auto actions =
        generator.generateActionsFromNode(dialogueNode("n1", "mara", "Look out!"), characters);
    REQUIRE(actions.size() == 2);
    REQUIRE(actions[1].type == CharacterActionType::Animate);
    REQUIRE(actions[1].animation == std::string(animation::Emote));
    REQUIRE(actions[1].customParams["intensity"].get<double>() == Catch::Approx(0.6));
  }

  SECTION("emote intensity is clamped") {
    characters["mara"].isVisible = true;
    auto actions = generator.generateActionsFromNode(
        dialogueNode("n1", "mara", "STOP RIGHT THERE!!!!!!", "angry"), characters);
    REQUIRE(actions.back().customParams["intensity"].get<double>() == Catch::Approx(1.0));
  }

  SECTION("the random baseline decides quiet lines") {
    characters["mara"].isVisible = true;
    generator.setRandomSource([] { return 0.1; });
    auto actions =
        generator.generateActionsFromNode(dialogueNode("n1", "mara", "Fine."), characters);
    REQUIRE(actions.size() == 2);
    REQUIRE(actions[1].animation == std::string(animation::Emote));
  }

  SECTION("unknown speakers produce nothing") {
    auto actions =
        generator.generateActionsFromNode(dialogueNode("n1", "ghost", "Boo!"), characters);
    REQUIRE(actions.empty());
  }
}

TEST_CASE("Node animations target known characters", "[action_generator][animation]") {
  StoryNodeData data;
  data.id = "shake";
  data.type = NodeType::Branch;
  Narrata::story::StoryAnimation shake;
  shake.target = "tom";
  shake.type = "shake";
  shake.duration = 0.4;
  data.animations.push_back(shake);
  shake.target = "ghost";
  data.animations.push_back(shake);

  CharacterStateMap characters;
  characters["tom"] = makeState("tom", true, CharacterPosition::Right);

  auto generator = quietGenerator();
  auto actions = generator.generateActionsFromNode(StoryNode(data), characters);
  REQUIRE(actions.size() == 1);
  REQUIRE(actions[0].type == CharacterActionType::Animate);
  REQUIRE(actions[0].animation == "shake");
  REQUIRE(*actions[0].duration == Catch::Approx(0.4));
}

TEST_CASE("Contextual actions smooth speaker changes", "[action_generator][contextual]") {
  auto generator = quietGenerator();
  auto current = dialogueNode("n1", "mara", "Who's there?");
  auto next = dialogueNode("n2", "tom", "Only me.", "worried");

  CharacterStateMap characters;
  characters["mara"] = makeState("mara", true, CharacterPosition::Left);
  characters["tom"] = makeState("tom", false, CharacterPosition::OffScreenRight);

  SECTION("the incoming speaker enters opposite the outgoing one") {
    auto actions = generator.generateContextualActions(current, &next, characters);
    REQUIRE(actions.size() == 1);
    REQUIRE(actions[0].type == CharacterActionType::Enter);
    REQUIRE(actions[0].characterId == "tom");
    REQUIRE(actions[0].position == CharacterPosition::Right);
    REQUIRE(actions[0].emotion == CharacterEmotion::Worried);
  }

  SECTION("a centered speaker lets chance pick the side") {
    characters["mara"].position = CharacterPosition::Center;
    generator.setRandomSource([] { return 0.2; });
    auto actions = generator.generateContextualActions(current, &next, characters);
    REQUIRE(actions[0].position == CharacterPosition::Left);
  }

  SECTION("visible speakers look at each other") {
    characters["tom"] = makeState("tom", true, CharacterPosition::Right);
    auto actions = generator.generateContextualActions(current, &next, characters);
    REQUIRE(actions.size() == 1);
    REQUIRE(actions[0].characterId == "mara");
    REQUIRE(actions[0].animation == std::string(animation::LookAt));
    REQUIRE(actions[0].customParams["target"] == "right");
  }

  SECTION("the same speaker or a missing next node does nothing") {
    REQUIRE(generator.generateContextualActions(current, nullptr, characters).empty());
    auto same = dialogueNode("n3", "mara", "Hm.");
    REQUIRE(generator.generateContextualActions(current, &same, characters).empty());
  }
}

TEST_CASE("Generator tracks recent nodes", "[action_generator][tracking]") {
  auto generator = quietGenerator();
  CharacterStateMap characters;
  for (int i = 0; i < 7; ++i) {
    auto node = dialogueNode("n" + std::to_string(i), "nobody", "...");
    (void)generator.generateActionsFromNode(node, characters);
  }

  auto recent = generator.getRecentNodeIds();
  REQUIRE(recent.size() == CharacterActionGenerator::MaxRecentNodes);
  REQUIRE(recent.front() == "n6");
  REQUIRE(recent.back() == "n2");

  generator.reset();
  REQUIRE(generator.getRecentNodeIds().empty());
  REQUIRE_FALSE(generator.getCurrentSceneId().has_value());
}
