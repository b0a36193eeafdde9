#include "Narrata/dialogue/dialogue_director.hpp"
#include "Narrata/core/logger.hpp"
#include <algorithm>
#include <exception>

namespace Narrata::dialogue {

using character::CharacterActionList;
using story::NodeType;
using story::StoryError;
using story::StoryNode;

DialogueDirector::DialogueDirector(story::StoryManager& story,
                                   character::CharacterStateManager& characters,
                                   character::CharacterActionGenerator& generator)
    : m_story(story), m_characters(characters), m_generator(generator) {
  m_story.addListener(this);
}

DialogueDirector::~DialogueDirector() { m_story.removeListener(this); }

template <typename Fn> void DialogueDirector::notify(Fn&& fn) {
  auto listeners = m_listeners;
  for (IDialogueListener* listener : listeners) {
    try {
      fn(*listener);
    } catch (const std::exception& e) {
      NARRATA_LOG_ERROR("Dialogue listener failed: {}", e.what());
    }
  }
}

void DialogueDirector::addListener(IDialogueListener* listener) {
  if (listener && std::find(m_listeners.begin(), m_listeners.end(), listener) == m_listeners.end()) {
    m_listeners.push_back(listener);
  }
}

void DialogueDirector::removeListener(IDialogueListener* listener) {
  m_listeners.erase(std::remove(m_listeners.begin(), m_listeners.end(), listener),
                    m_listeners.end());
}

void DialogueDirector::registerCharacter(const std::string& id, CharacterDefinition definition) {
  m_definitions[id] = std::move(definition);
  m_characters.initializeCharacter(id);
}

const CharacterDefinition* DialogueDirector::getCharacterDefinition(const std::string& id) const {
  auto it = m_definitions.find(id);
  return it != m_definitions.end() ? &it->second : nullptr;
}

void DialogueDirector::onStoryLoaded(const story::Story& /*story*/) {
  m_generator.reset();
  m_active = false;
  m_choicesShown = false;
  m_pendingChoiceNode.clear();
}

void DialogueDirector::onStoryReset() {
  m_generator.reset();
  m_pendingChoiceNode.clear();
  m_choicesShown = false;
}

void DialogueDirector::applyActions(const CharacterActionList& actions) {
  for (const auto& action : actions) {
    m_characters.applyAction(action);
    if (m_characterPresenter) {
      m_characterPresenter->executeAction(action);
    }
  }
}

void DialogueDirector::onNodeEntered(const StoryNode& node, const StoryNode* /*previous*/) {
  m_pendingChoiceNode.clear();
  m_choicesShown = false;

  applyActions(m_generator.generateActionsFromNode(node, m_characters.getAllCharacterStates()));

  if (const auto& nextId = node.getNextNodeId()) {
    if (const StoryNode* next = m_story.getNode(*nextId)) {
      applyActions(
          m_generator.generateContextualActions(node, next, m_characters.getAllCharacterStates()));
    }
  }

  // Speakers that were never registered get a default state for later lines
  if (const auto& speaker = node.getCharacterId()) {
    if (!m_characters.hasCharacter(*speaker)) {
      m_characters.initializeCharacter(*speaker);
    }
  }

  switch (node.getType()) {
  case NodeType::Dialogue:
    showDialogue(node);
    break;

  case NodeType::Choice:
    if (node.getText() && !node.getText()->empty()) {
      m_pendingChoiceNode = node.getId();
      showDialogue(node);
    } else {
      showChoices(node);
    }
    break;

  case NodeType::Scene:
    if (node.getText() && !node.getText()->empty()) {
      showDialogue(node);
    }
    if (auto background = node.getBackground(); background && m_dialoguePresenter) {
      m_dialoguePresenter->changeBackground(*background);
    }
    break;

  case NodeType::End:
    hideDialogue();
    notify([](IDialogueListener& l) { l.onStoryEnded(); });
    break;

  case NodeType::Branch:
    break;
  }

  const auto& metadata = node.getMetadata();
  if (metadata && metadata->effect && m_dialoguePresenter) {
    m_dialoguePresenter->playSceneEffect(*metadata->effect);
  }
}

DialogueLine DialogueDirector::buildLine(const StoryNode& node) const {
  DialogueLine line;
  line.nodeId = node.getId();
  line.text = node.getText().value_or("");
  line.speakerId = node.getCharacterId();
  line.animationIn = DefaultAnimationIn;
  line.animationOut = DefaultAnimationOut;

  if (line.speakerId) {
    if (const CharacterDefinition* definition = getCharacterDefinition(*line.speakerId)) {
      line.displayName = definition->displayName.value_or(definition->name);
      line.textColor = definition->textColor;
      line.textSpeed = definition->textSpeed;
      if (definition->animationIn) {
        line.animationIn = *definition->animationIn;
      }
      if (definition->animationOut) {
        line.animationOut = *definition->animationOut;
      }
    } else {
      line.displayName = *line.speakerId;
    }
  }

  if (const auto& mood = node.getMood()) {
    line.emotion = character::emotionFromMood(*mood);
  }

  if (const auto& options = node.getDialogueOptions()) {
    if (options->speed) {
      line.textSpeed = options->speed;
    }
    line.textEffect = options->textEffects;
  }
  if (node.getData().textSpeed) {
    line.textSpeed = node.getData().textSpeed;
  }

  if (const auto& metadata = node.getMetadata()) {
    if (metadata->animationIn) {
      line.animationIn = *metadata->animationIn;
    }
    if (metadata->animationOut) {
      line.animationOut = *metadata->animationOut;
    }
    if (metadata->textSpeed) {
      line.textSpeed = metadata->textSpeed;
    }
    if (metadata->emotion) {
      line.emotion = metadata->emotion;
    }
  }

  return line;
}

void DialogueDirector::showDialogue(const StoryNode& node) {
  const auto& text = node.getText();
  if (!text || text->empty()) {
    return;
  }

  m_active = true;
  DialogueLine line = buildLine(node);
  if (m_dialoguePresenter) {
    m_dialoguePresenter->showDialogue(line);
  }
  notify([&line](IDialogueListener& l) { l.onDialogueStarted(line); });
}

void DialogueDirector::showChoices(const StoryNode& node) {
  m_pendingChoiceNode.clear();

  auto choices = node.getAvailableChoices(m_story.getGameState());
  if (choices.empty()) {
    NARRATA_LOG_WARN("Choice node '{}' has no available choices", node.getId());
    return;
  }

  std::string animation = DefaultChoiceAnimation;
  if (const auto& metadata = node.getMetadata(); metadata && metadata->choiceAnimation) {
    animation = *metadata->choiceAnimation;
  }

  m_active = true;
  m_choicesShown = true;
  if (m_dialoguePresenter) {
    m_dialoguePresenter->showChoices(choices, animation);
  }
  notify([&choices](IDialogueListener& l) { l.onChoicesShown(choices); });
}

void DialogueDirector::onTypingComplete() {
  if (m_pendingChoiceNode.empty()) {
    return;
  }
  const StoryNode* current = m_story.getCurrentNode();
  if (!current || current->getId() != m_pendingChoiceNode) {
    m_pendingChoiceNode.clear();
    return;
  }
  showChoices(*current);
}

Result<void, StoryError> DialogueDirector::continueDialogue() {
  const StoryNode* current = m_story.getCurrentNode();
  if (!current) {
    return Result<void, StoryError>::error(
        StoryError::cannotProgress(story::ProgressBlockReason::NoCurrentNode, {}));
  }

  if (current->getType() == NodeType::Choice) {
    if (!m_choicesShown) {
      showChoices(*current);
    }
    return Result<void, StoryError>::ok();
  }

  if (current->getNextNodeId()) {
    return m_story.progress();
  }

  hideDialogue();
  const std::string nodeId = current->getId();
  notify([&nodeId](IDialogueListener& l) { l.onDialogueEnded(nodeId); });
  return Result<void, StoryError>::ok();
}

Result<void, StoryError> DialogueDirector::selectChoice(int index) {
  auto result = m_story.makeChoice(index);
  if (result.isError()) {
    NARRATA_LOG_WARN("Choice {} rejected: {}", index, result.error().format());
  }
  return result;
}

void DialogueDirector::hideDialogue() {
  m_active = false;
  m_choicesShown = false;
  if (m_dialoguePresenter) {
    m_dialoguePresenter->hideDialogue();
  }
}

} // namespace Narrata::dialogue
