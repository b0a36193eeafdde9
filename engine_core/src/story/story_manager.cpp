#include "Narrata/story/story_manager.hpp"
#include "Narrata/core/logger.hpp"
#include "Narrata/story/story_validator.hpp"
#include <algorithm>
#include <exception>

namespace Narrata::story {

using VoidResult = Result<void, StoryError>;

const char* storyStateName(StoryState state) {
  switch (state) {
  case StoryState::Idle:
    return "Idle";
  case StoryState::Loaded:
    return "Loaded";
  case StoryState::Active:
    return "Active";
  case StoryState::Ended:
    return "Ended";
  }
  return "Idle";
}

StoryManager::StoryManager() = default;

StoryManager::~StoryManager() = default;

// ============================================================================
// Listener dispatch
// ============================================================================

template <typename Fn> void StoryManager::notify(const char* event, Fn&& fn) {
  ++m_dispatchDepth;
  for (IStoryListener* listener : m_listeners) {
    try {
      fn(*listener);
    } catch (const std::exception& e) {
      NARRATA_LOG_ERROR("Story listener failed while handling {}: {}", event, e.what());
    }
  }
  --m_dispatchDepth;

  if (m_dispatchDepth == 0 && !m_deferredListenerChanges.empty()) {
    applyDeferredListenerChanges();
  }
}

void StoryManager::addListener(IStoryListener* listener) {
  if (!listener) {
    return;
  }
  if (m_dispatchDepth > 0) {
    m_deferredListenerChanges.emplace_back(true, listener);
    return;
  }
  if (std::find(m_listeners.begin(), m_listeners.end(), listener) == m_listeners.end()) {
    m_listeners.push_back(listener);
  }
}

void StoryManager::removeListener(IStoryListener* listener) {
  if (m_dispatchDepth > 0) {
    m_deferredListenerChanges.emplace_back(false, listener);
    return;
  }
  m_listeners.erase(std::remove(m_listeners.begin(), m_listeners.end(), listener),
                    m_listeners.end());
}

void StoryManager::applyDeferredListenerChanges() {
  auto changes = std::move(m_deferredListenerChanges);
  m_deferredListenerChanges.clear();
  for (const auto& [add, listener] : changes) {
    if (add) {
      addListener(listener);
    } else {
      removeListener(listener);
    }
  }
}

// ============================================================================
// Loading
// ============================================================================

VoidResult StoryManager::loadStory(Story story) {
  auto validation = StoryValidator::validate(story);
  if (validation.isError()) {
    NARRATA_LOG_ERROR("Failed to load story: {}", validation.error().format());
    return validation;
  }
  installStory(std::make_unique<Story>(std::move(story)));
  return VoidResult::ok();
}

VoidResult StoryManager::loadFromJson(std::string_view text) {
  auto story = StoryParser::parseFromJson(text);
  if (story.isError()) {
    NARRATA_LOG_ERROR("Failed to load story from JSON: {}", story.error().format());
    return VoidResult::error(story.error());
  }
  installStory(std::make_unique<Story>(std::move(story).value()));
  return VoidResult::ok();
}

VoidResult StoryManager::loadFromYaml(std::string_view text) {
  auto story = StoryParser::parseFromYaml(text);
  if (story.isError()) {
    NARRATA_LOG_ERROR("Failed to load story from YAML: {}", story.error().format());
    return VoidResult::error(story.error());
  }
  installStory(std::make_unique<Story>(std::move(story).value()));
  return VoidResult::ok();
}

VoidResult StoryManager::loadFromFile(const std::string& path) {
  auto story = StoryParser::parseFile(path);
  if (story.isError()) {
    NARRATA_LOG_ERROR("Failed to load story from '{}': {}", path, story.error().format());
    return VoidResult::error(story.error());
  }
  installStory(std::make_unique<Story>(std::move(story).value()));
  return VoidResult::ok();
}

void StoryManager::installStory(std::unique_ptr<Story> story) {
  m_currentNode = nullptr;
  m_pending.clear();
  ++m_navigationSerial;

  m_nodes.clear();
  for (const auto& [id, data] : story->nodes) {
    m_nodes.emplace(id, std::make_unique<StoryNode>(data));
  }

  m_story = std::move(story);
  m_gameState = m_story->initialState;
  m_history.clear();

  NARRATA_LOG_INFO("Story '{}' loaded with {} nodes", m_story->id, m_nodes.size());

  const Story& loaded = *m_story;
  notify("storyLoaded", [&loaded](IStoryListener& l) { l.onStoryLoaded(loaded); });
}

StoryState StoryManager::getState() const {
  if (!m_story) {
    return StoryState::Idle;
  }
  if (!m_currentNode) {
    return StoryState::Loaded;
  }
  if (m_currentNode->getType() == NodeType::End) {
    return StoryState::Ended;
  }
  return StoryState::Active;
}

VoidResult StoryManager::requireStory() const {
  if (!m_story) {
    return VoidResult::error(StoryError(StoryErrorCode::NoStoryLoaded, "No story loaded"));
  }
  return VoidResult::ok();
}

// ============================================================================
// Traversal
// ============================================================================

VoidResult StoryManager::start() {
  if (auto loaded = requireStory(); loaded.isError()) {
    return loaded;
  }

  auto result = navigateToNode(m_story->startNode);
  if (result.isError()) {
    return result;
  }

  const Story& story = *m_story;
  notify("storyStarted", [&story](IStoryListener& l) { l.onStoryStarted(story); });
  return VoidResult::ok();
}

VoidResult StoryManager::navigateToNode(const std::string& nodeId) {
  if (auto loaded = requireStory(); loaded.isError()) {
    return loaded;
  }

  auto it = m_nodes.find(nodeId);
  if (it == m_nodes.end()) {
    return VoidResult::error(StoryError(StoryErrorCode::NodeNotFound,
                                        "Node with id '" + nodeId + "' does not exist", nodeId));
  }

  ++m_navigationSerial;

  if (m_currentNode) {
    const StoryNode& leaving = *m_currentNode;
    leaving.executeOnExit(m_gameState);
    notify("nodeExited", [&leaving](IStoryListener& l) { l.onNodeExited(leaving); });
  }

  const StoryNode* previous = m_currentNode;
  m_currentNode = it->second.get();
  const StoryNode& entered = *m_currentNode;

  m_history.push_back(nodeId);

  if (entered.getStateChanges().is_object() && !entered.getStateChanges().empty()) {
    updateGameState(entered.getStateChanges());
  }

  entered.executeOnEnter(m_gameState);

  if (m_traceTransitions) {
    NARRATA_LOG_DEBUG("Entered node '{}' ({}) from '{}'", nodeId, nodeTypeName(entered.getType()),
                      previous ? previous->getId() : std::string("<none>"));
  }

  u64 serial = m_navigationSerial;
  notify("nodeEntered",
         [&entered, previous](IStoryListener& l) { l.onNodeEntered(entered, previous); });

  // A listener may already have moved the story on
  if (serial == m_navigationSerial) {
    scheduleAutoProgress();
  }

  return VoidResult::ok();
}

void StoryManager::scheduleAutoProgress() {
  if (!m_currentNode) {
    return;
  }

  const StoryNode& node = *m_currentNode;
  PendingTransition transition;
  transition.serial = m_navigationSerial;

  switch (node.getType()) {
  case NodeType::Scene: {
    auto sceneId = node.getSceneId();
    if (sceneId && m_sceneController && m_sceneController->hasScene(*sceneId)) {
      transition.kind = PendingTransition::Kind::SwitchScene;
      transition.target = *sceneId;
      transition.transition = node.getTransitionType();
      m_pending.push_back(std::move(transition));
    } else if (node.getNextNodeId()) {
      transition.target = *node.getNextNodeId();
      m_pending.push_back(std::move(transition));
    }
    break;
  }

  case NodeType::Branch:
    if (node.evaluateCondition(m_gameState) && node.getNextNodeId()) {
      transition.target = *node.getNextNodeId();
      m_pending.push_back(std::move(transition));
    }
    break;

  case NodeType::Dialogue:
  case NodeType::Choice:
  case NodeType::End:
    break;
  }
}

bool StoryManager::processNextTransition() {
  if (m_pending.empty()) {
    return false;
  }

  PendingTransition transition = std::move(m_pending.front());
  m_pending.pop_front();

  if (transition.serial != m_navigationSerial) {
    NARRATA_LOG_DEBUG("Discarding stale transition to '{}'", transition.target);
    return true;
  }

  if (transition.kind == PendingTransition::Kind::SwitchScene) {
    const std::string& sceneId = transition.target;
    const std::string& key = transition.transition;
    notify("sceneSwitchRequested",
           [&sceneId, &key](IStoryListener& l) { l.onSceneSwitchRequested(sceneId, key); });
    if (m_sceneController) {
      m_sceneController->switchTo(sceneId, key);
    }
    return true;
  }

  auto result = navigateToNode(transition.target);
  if (result.isError()) {
    NARRATA_LOG_ERROR("Auto-progression failed: {}", result.error().format());
  }
  return true;
}

size_t StoryManager::processPendingTransitions(size_t limit) {
  size_t executed = 0;
  while (!m_pending.empty() && executed < limit) {
    bool stale = m_pending.front().serial != m_navigationSerial;
    processNextTransition();
    if (!stale) {
      ++executed;
    }
  }
  return executed;
}

VoidResult StoryManager::progress() {
  if (auto loaded = requireStory(); loaded.isError()) {
    return loaded;
  }

  if (!m_currentNode) {
    return VoidResult::error(StoryError::cannotProgress(ProgressBlockReason::NoCurrentNode, ""));
  }

  const StoryNode& node = *m_currentNode;
  if (node.getType() == NodeType::Choice) {
    return VoidResult::error(
        StoryError::cannotProgress(ProgressBlockReason::IsChoiceNode, node.getId()));
  }
  if (node.getType() == NodeType::End) {
    return VoidResult::error(
        StoryError::cannotProgress(ProgressBlockReason::IsEndNode, node.getId()));
  }
  if (!node.getNextNodeId()) {
    return VoidResult::error(
        StoryError::cannotProgress(ProgressBlockReason::NoNextNode, node.getId()));
  }

  // Copy: navigation replaces m_currentNode
  std::string next = *node.getNextNodeId();
  return navigateToNode(next);
}

VoidResult StoryManager::makeChoice(int choiceIndex) {
  if (auto loaded = requireStory(); loaded.isError()) {
    return loaded;
  }

  if (!m_currentNode || m_currentNode->getType() != NodeType::Choice) {
    return VoidResult::error(StoryError(
        StoryErrorCode::NotChoiceNode, "Cannot make a choice: current node is not a choice node",
        m_currentNode ? m_currentNode->getId() : std::string()));
  }

  auto available = m_currentNode->getAvailableChoices(m_gameState);
  if (choiceIndex < 0 || static_cast<size_t>(choiceIndex) >= available.size()) {
    return VoidResult::error(StoryError(StoryErrorCode::InvalidChoice,
                                        "Invalid choice index " + std::to_string(choiceIndex) +
                                            " (" + std::to_string(available.size()) +
                                            " available)",
                                        m_currentNode->getId()));
  }

  const StoryChoice choice = available[static_cast<size_t>(choiceIndex)];

  if (choice.stateChanges.is_object() && !choice.stateChanges.empty()) {
    updateGameState(choice.stateChanges);
  }

  notify("choiceMade",
         [&choice, choiceIndex](IStoryListener& l) { l.onChoiceMade(choice, choiceIndex); });

  return navigateToNode(choice.nextNode);
}

VoidResult StoryManager::jumpToNode(const std::string& nodeId, bool preserveHistory) {
  if (auto loaded = requireStory(); loaded.isError()) {
    return loaded;
  }
  if (!hasNode(nodeId)) {
    return VoidResult::error(StoryError(StoryErrorCode::NodeNotFound,
                                        "Node with id '" + nodeId + "' does not exist", nodeId));
  }

  if (!preserveHistory) {
    m_history.clear();
  }

  auto result = navigateToNode(nodeId);
  if (result.isError()) {
    return result;
  }

  notify("storyJumped", [&nodeId, preserveHistory](IStoryListener& l) {
    l.onStoryJumped(nodeId, preserveHistory);
  });
  return VoidResult::ok();
}

VoidResult StoryManager::reset() {
  if (auto loaded = requireStory(); loaded.isError()) {
    return loaded;
  }

  m_gameState = m_story->initialState;
  m_history.clear();
  m_currentNode = nullptr;
  m_pending.clear();
  ++m_navigationSerial;

  notify("storyReset", [](IStoryListener& l) { l.onStoryReset(); });

  return start();
}

VoidResult StoryManager::loadProgress(const std::string& currentNodeId,
                                      const std::vector<std::string>& visitedNodes,
                                      const std::vector<std::string>& completedBranches) {
  if (auto loaded = requireStory(); loaded.isError()) {
    return loaded;
  }

  m_gameState = m_story->initialState;
  m_history = visitedNodes;
  // A saved history ends with the saved node, which navigation records again
  if (!m_history.empty() && m_history.back() == currentNodeId) {
    m_history.pop_back();
  }
  m_pending.clear();

  NARRATA_LOG_DEBUG("Restoring progress at '{}' ({} visited, {} completed branches)",
                    currentNodeId, visitedNodes.size(), completedBranches.size());

  if (currentNodeId.empty() || !hasNode(currentNodeId)) {
    NARRATA_LOG_WARN("Saved node '{}' is not part of the story, restarting from '{}'",
                     currentNodeId, m_story->startNode);
    m_currentNode = nullptr;
    return start();
  }

  // Resuming is not a transition out of whatever node was current
  m_currentNode = nullptr;

  auto result = navigateToNode(currentNodeId);
  if (result.isError()) {
    return result;
  }

  notify("storyResumed", [&currentNodeId](IStoryListener& l) { l.onStoryResumed(currentNodeId); });
  return VoidResult::ok();
}

// ============================================================================
// State
// ============================================================================

void StoryManager::updateGameState(const GameState& changes) {
  if (!changes.is_object()) {
    NARRATA_LOG_WARN("Ignoring game state update that is not a mapping");
    return;
  }

  GameState previous = m_gameState;
  if (!m_gameState.is_object()) {
    m_gameState = GameState::object();
  }
  for (const auto& [key, value] : changes.items()) {
    m_gameState[key] = value;
  }

  const GameState& current = m_gameState;
  notify("stateChanged", [&current, &previous, &changes](IStoryListener& l) {
    l.onStateChanged(current, previous, changes);
  });
}

void StoryManager::replaceGameState(const GameState& state) {
  if (!state.is_object()) {
    NARRATA_LOG_WARN("Ignoring game state replacement that is not a mapping");
    return;
  }

  GameState previous = m_gameState;
  m_gameState = state;

  const GameState& current = m_gameState;
  notify("stateChanged", [&current, &previous](IStoryListener& l) {
    l.onStateChanged(current, previous, current);
  });
}

// ============================================================================
// Queries
// ============================================================================

std::optional<std::string> StoryManager::getCurrentNodeId() const {
  if (m_currentNode) {
    return m_currentNode->getId();
  }
  return std::nullopt;
}

const StoryNode* StoryManager::getNode(const std::string& nodeId) const {
  auto it = m_nodes.find(nodeId);
  return it != m_nodes.end() ? it->second.get() : nullptr;
}

bool StoryManager::hasNode(const std::string& nodeId) const { return m_nodes.contains(nodeId); }

std::vector<const StoryNode*> StoryManager::getNodesByType(NodeType type) const {
  std::vector<const StoryNode*> nodes;
  for (const auto& [id, node] : m_nodes) {
    if (node->getType() == type) {
      nodes.push_back(node.get());
    }
  }
  return nodes;
}

std::vector<std::string> StoryManager::getCompletedBranches() const {
  std::vector<std::string> branches;
  for (const auto& [id, node] : m_nodes) {
    if (node->getType() == NodeType::Branch &&
        std::find(m_history.begin(), m_history.end(), id) != m_history.end()) {
      branches.push_back(id);
    }
  }
  return branches;
}

} // namespace Narrata::story
