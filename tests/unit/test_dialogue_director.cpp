#include <catch2/catch_test_macros.hpp>
#include "Narrata/dialogue/dialogue_director.hpp"
#include "story_fixtures.hpp"

using namespace Narrata;
using namespace Narrata::dialogue;

namespace {

class RecordingCharacterPresenter : public ICharacterPresenter {
public:
  void executeAction(const character::CharacterAction& action) override {
    actions.push_back(std::string(character::actionTypeName(action.type)) + ":" +
                      action.characterId);
  }
  std::vector<std::string> actions;
};

class RecordingDialoguePresenter : public IDialoguePresenter {
public:
  void showDialogue(const DialogueLine& line) override { lines.push_back(line); }
  void showChoices(const std::vector<story::StoryChoice>& shown,
                   const std::string& shownAnimation) override {
    choices = shown;
    animation = shownAnimation;
  }
  void hideDialogue() override { ++hides; }
  void changeBackground(const std::string& backgroundId) override {
    backgrounds.push_back(backgroundId);
  }
  void playSceneEffect(const story::EffectHint& effect) override { effects.push_back(effect.type); }

  std::vector<DialogueLine> lines;
  std::vector<story::StoryChoice> choices;
  std::string animation;
  std::vector<std::string> backgrounds;
  std::vector<std::string> effects;
  int hides = 0;
};

class RecordingDialogueListener : public IDialogueListener {
public:
  void onDialogueStarted(const DialogueLine& line) override {
    events.push_back("started:" + line.nodeId);
  }
  void onChoicesShown(const std::vector<story::StoryChoice>& choices) override {
    events.push_back("choices:" + std::to_string(choices.size()));
  }
  void onDialogueEnded(const std::string& nodeId) override { events.push_back("ended:" + nodeId); }
  void onStoryEnded() override { events.push_back("story_ended"); }
  std::vector<std::string> events;
};

struct DirectorFixture {
  DirectorFixture() : director(manager, characters, generator) {
    generator.setRandomSource([] { return 0.99; });
    director.setCharacterPresenter(&characterPresenter);
    director.setDialoguePresenter(&dialoguePresenter);
    director.addListener(&listener);
  }

  story::StoryManager manager;
  character::CharacterStateManager characters;
  character::CharacterActionGenerator generator;
  DialogueDirector director;
  RecordingCharacterPresenter characterPresenter;
  RecordingDialoguePresenter dialoguePresenter;
  RecordingDialogueListener listener;
};

} // namespace

TEST_CASE_METHOD(DirectorFixture, "DialogueDirector walks a story", "[dialogue_director]") {
  director.registerCharacter("alice", CharacterDefinition{"Alice", std::nullopt,
                                                          std::string("#ff8888"), 30.0,
                                                          std::nullopt, std::nullopt});
  director.registerCharacter("bob", CharacterDefinition{"Bob", std::string("Old Bob"),
                                                        std::nullopt, std::nullopt,
                                                        std::string("slideIn"), std::nullopt});
  test::loadYaml(manager, test::kForestYaml);

  REQUIRE(manager.start().isOk());
  manager.processPendingTransitions();
  REQUIRE(manager.getCurrentNodeId() == "hello");

  SECTION("the scene brings characters in before anyone speaks") {
    REQUIRE(characterPresenter.actions ==
            std::vector<std::string>{"ENTER:alice", "CHANGE_EMOTION:alice", "SPEAK:alice"});
    auto alice = characters.getCharacterState("alice");
    REQUIRE(alice->isVisible);
    REQUIRE(alice->position == character::CharacterPosition::Left);
    REQUIRE(alice->currentEmotion == character::CharacterEmotion::Happy);
  }

  SECTION("dialogue lines carry the speaker's display settings") {
    REQUIRE(dialoguePresenter.lines.size() == 1);
    const DialogueLine& line = dialoguePresenter.lines[0];
    REQUIRE(line.nodeId == "hello");
    REQUIRE(line.displayName == "Alice");
    REQUIRE(line.textColor == "#ff8888");
    REQUIRE(line.textSpeed == 30.0);
    REQUIRE(line.emotion == character::CharacterEmotion::Happy);
    REQUIRE(line.animationIn == DialogueDirector::DefaultAnimationIn);
    REQUIRE(director.isActive());
    REQUIRE(listener.events == std::vector<std::string>{"started:hello"});
  }

  SECTION("choices wait for typing to finish") {
    REQUIRE(director.continueDialogue().isOk());
    manager.processPendingTransitions();
    REQUIRE(manager.getCurrentNodeId() == "path");
    REQUIRE(dialoguePresenter.lines.back().text == "Which way?");
    REQUIRE_FALSE(director.isAwaitingChoice());
    REQUIRE(dialoguePresenter.choices.empty());

    director.onTypingComplete();
    REQUIRE(director.isAwaitingChoice());
    REQUIRE(dialoguePresenter.choices.size() == 2);
    REQUIRE(dialoguePresenter.choices[0].nextNode == "river");
    REQUIRE(dialoguePresenter.animation == DialogueDirector::DefaultChoiceAnimation);

    REQUIRE(director.selectChoice(0).isOk());
    REQUIRE(manager.getCurrentNodeId() == "river");
    const DialogueLine& line = dialoguePresenter.lines.back();
    REQUIRE(line.displayName == "Old Bob");
    REQUIRE(line.animationIn == "slideIn");
    REQUIRE(characterPresenter.actions.back() == "ANIMATE:bob");

    REQUIRE(director.continueDialogue().isOk());
    REQUIRE(manager.getCurrentNodeId() == "home");
    REQUIRE(dialoguePresenter.hides >= 1);
    REQUIRE(listener.events.back() == "story_ended");
  }

  SECTION("continuing a choice node reveals the choices at once") {
    REQUIRE(director.continueDialogue().isOk());
    manager.processPendingTransitions();
    REQUIRE(director.continueDialogue().isOk());
    REQUIRE(director.isAwaitingChoice());
    REQUIRE(manager.getCurrentNodeId() == "path");
  }

  SECTION("invalid choices are reported") {
    REQUIRE(director.continueDialogue().isOk());
    manager.processPendingTransitions();
    auto result = director.selectChoice(7);
    REQUIRE(result.isError());
    REQUIRE(result.error().code == story::StoryErrorCode::InvalidChoice);
  }
}

TEST_CASE_METHOD(DirectorFixture, "DialogueDirector handles unregistered speakers",
                 "[dialogue_director]") {
  test::loadJson(manager, test::kTwoEndingsJson);
  REQUIRE(manager.start().isOk());

  REQUIRE(characters.hasCharacter("hero"));
  REQUIRE(dialoguePresenter.lines.size() == 1);
  REQUIRE(dialoguePresenter.lines[0].displayName == "hero");
  REQUIRE_FALSE(dialoguePresenter.lines[0].textColor.has_value());

  SECTION("a choice node without text shows choices straight away") {
    REQUIRE(director.continueDialogue().isOk());
    REQUIRE(director.isAwaitingChoice());
    REQUIRE(listener.events.back() == "choices:2");
  }

  SECTION("continuing with nowhere to go ends the dialogue") {
    REQUIRE(director.continueDialogue().isOk());
    REQUIRE(director.selectChoice(1).isOk());
    REQUIRE(listener.events.back() == "story_ended");
    REQUIRE(director.continueDialogue().isOk());
    REQUIRE(listener.events.back() == "ended:end2");
    REQUIRE_FALSE(director.isActive());
  }
}

TEST_CASE("DialogueDirector reports nothing to continue without a story",
          "[dialogue_director]") {
  story::StoryManager manager;
  character::CharacterStateManager characters;
  character::CharacterActionGenerator generator;
  DialogueDirector director(manager, characters, generator);

  auto result = director.continueDialogue();
  REQUIRE(result.isError());
  REQUIRE(result.error().code == story::StoryErrorCode::CannotProgress);
}
