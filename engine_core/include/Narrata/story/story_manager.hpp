#pragma once

/**
 * @file story_manager.hpp
 * @brief Story graph executor
 *
 * StoryManager owns the loaded story, the current position, the visit
 * history and the game state. navigateToNode() is the single transition
 * primitive; start, progress, makeChoice, jumpToNode, reset and
 * loadProgress are built on it.
 *
 * Auto-progression of scene and branch nodes is never performed inside
 * the navigation that entered them. It is queued as a pending transition
 * and runs when the host drains the queue, so listeners observe each
 * enter notification before the next transition begins. A pending
 * transition is dropped if any other navigation happened after it was
 * queued.
 *
 * No cycle guard exists: a chain of scene/branch nodes whose conditions
 * stay true keeps producing transitions for as long as the queue is
 * drained. StoryValidator::findAutoProgressCycles() reports such chains.
 */

#include "Narrata/core/result.hpp"
#include "Narrata/core/types.hpp"
#include "Narrata/story/story_data.hpp"
#include "Narrata/story/story_error.hpp"
#include "Narrata/story/story_node.hpp"
#include "Narrata/story/story_parser.hpp"
#include <deque>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Narrata::story {

enum class StoryState { Idle, Loaded, Active, Ended };

[[nodiscard]] const char* storyStateName(StoryState state);

/**
 * @brief Receives story lifecycle notifications
 *
 * All methods default to no-ops. Exceptions thrown by a listener are
 * logged and do not stop delivery to the remaining listeners.
 */
class IStoryListener {
public:
  virtual ~IStoryListener() = default;

  virtual void onStoryLoaded(const Story& /*story*/) {}
  virtual void onStoryStarted(const Story& /*story*/) {}
  virtual void onStoryReset() {}
  virtual void onStoryResumed(const std::string& /*nodeId*/) {}
  virtual void onStoryJumped(const std::string& /*nodeId*/, bool /*preserveHistory*/) {}

  /**
   * @param previous The node left by this transition, or nullptr
   */
  virtual void onNodeEntered(const StoryNode& /*current*/, const StoryNode* /*previous*/) {}
  virtual void onNodeExited(const StoryNode& /*node*/) {}
  virtual void onChoiceMade(const StoryChoice& /*choice*/, int /*index*/) {}
  virtual void onStateChanged(const GameState& /*state*/, const GameState& /*previous*/,
                              const GameState& /*changes*/) {}
  virtual void onSceneSwitchRequested(const std::string& /*sceneId*/,
                                      const std::string& /*transition*/) {}
};

/**
 * @brief Presentation-side scene switching used by scene nodes
 */
class ISceneController {
public:
  virtual ~ISceneController() = default;

  [[nodiscard]] virtual bool hasScene(const std::string& sceneId) const = 0;
  virtual void switchTo(const std::string& sceneKey, const std::string& transitionKey) = 0;
};

class StoryManager {
public:
  StoryManager();
  ~StoryManager();

  StoryManager(const StoryManager&) = delete;
  StoryManager& operator=(const StoryManager&) = delete;

  // =========================================================================
  // Loading
  // =========================================================================

  /**
   * @brief Install an already built story after validating it
   *
   * On failure the previously loaded story, if any, stays installed.
   */
  Result<void, StoryError> loadStory(Story story);
  Result<void, StoryError> loadFromJson(std::string_view text);
  Result<void, StoryError> loadFromYaml(std::string_view text);
  Result<void, StoryError> loadFromFile(const std::string& path);

  [[nodiscard]] bool isLoaded() const { return m_story != nullptr; }
  [[nodiscard]] const Story* getStory() const { return m_story.get(); }
  [[nodiscard]] StoryState getState() const;

  // =========================================================================
  // Traversal
  // =========================================================================

  Result<void, StoryError> start();
  Result<void, StoryError> navigateToNode(const std::string& nodeId);
  Result<void, StoryError> progress();
  Result<void, StoryError> makeChoice(int choiceIndex);
  Result<void, StoryError> jumpToNode(const std::string& nodeId, bool preserveHistory = false);
  Result<void, StoryError> reset();

  /**
   * @brief Restore a saved narrative position
   *
   * Resets game state to the story's initialState, replaces the history
   * with @p visitedNodes and navigates to @p currentNodeId. Navigation
   * appends @p currentNodeId, so a trailing copy of it in @p visitedNodes is
   * dropped first: a history saved by getHistory() comes back unchanged
   * instead of ending with the node twice, and any other history gains
   * @p currentNodeId at its end. Hooks of the
   * nodes between the start and the restored node are not replayed. An
   * empty or unknown node id restarts the story instead.
   * @p completedBranches is derived from the history and is accepted for
   * symmetry with getCompletedBranches() only.
   */
  Result<void, StoryError> loadProgress(const std::string& currentNodeId,
                                        const std::vector<std::string>& visitedNodes,
                                        const std::vector<std::string>& completedBranches = {});

  // =========================================================================
  // Pending auto-progression
  // =========================================================================

  [[nodiscard]] bool hasPendingTransitions() const { return !m_pending.empty(); }

  /**
   * @brief Run the oldest queued transition
   * @return false if the queue was empty
   */
  bool processNextTransition();

  /**
   * @brief Drain the queue, including transitions queued while draining
   * @return Number of transitions that were executed (stale ones excluded)
   */
  size_t processPendingTransitions(size_t limit = std::numeric_limits<size_t>::max());

  // =========================================================================
  // State
  // =========================================================================

  /**
   * @brief Shallow-merge @p changes into the game state
   */
  void updateGameState(const GameState& changes);

  /**
   * @brief Replace the whole game state, used when restoring a save
   */
  void replaceGameState(const GameState& state);

  [[nodiscard]] GameState getGameState() const { return m_gameState; }

  // =========================================================================
  // Queries
  // =========================================================================

  [[nodiscard]] const StoryNode* getCurrentNode() const { return m_currentNode; }
  [[nodiscard]] std::optional<std::string> getCurrentNodeId() const;
  [[nodiscard]] const StoryNode* getNode(const std::string& nodeId) const;
  [[nodiscard]] bool hasNode(const std::string& nodeId) const;
  [[nodiscard]] std::vector<const StoryNode*> getNodesByType(NodeType type) const;
  [[nodiscard]] std::vector<std::string> getHistory() const { return m_history; }
  [[nodiscard]] std::vector<std::string> getVisitedNodes() const { return m_history; }

  /**
   * @brief Branch nodes that appear in the history
   */
  [[nodiscard]] std::vector<std::string> getCompletedBranches() const;

  // =========================================================================
  // Collaborators
  // =========================================================================

  void setSceneController(ISceneController* controller) { m_sceneController = controller; }
  void setTraceTransitions(bool enabled) { m_traceTransitions = enabled; }

  void addListener(IStoryListener* listener);
  void removeListener(IStoryListener* listener);

private:
  struct PendingTransition {
    enum class Kind { Navigate, SwitchScene };

    Kind kind = Kind::Navigate;
    std::string target;
    std::string transition;
    u64 serial = 0;
  };

  void installStory(std::unique_ptr<Story> story);
  void scheduleAutoProgress();
  Result<void, StoryError> requireStory() const;

  template <typename Fn> void notify(const char* event, Fn&& fn);
  void applyDeferredListenerChanges();

  std::unique_ptr<Story> m_story;
  std::map<std::string, std::unique_ptr<StoryNode>> m_nodes;
  const StoryNode* m_currentNode = nullptr;
  GameState m_gameState = GameState::object();
  std::vector<std::string> m_history;

  std::deque<PendingTransition> m_pending;
  u64 m_navigationSerial = 0;

  ISceneController* m_sceneController = nullptr;
  bool m_traceTransitions = false;

  std::vector<IStoryListener*> m_listeners;
  std::vector<std::pair<bool, IStoryListener*>> m_deferredListenerChanges;
  int m_dispatchDepth = 0;
};

} // namespace Narrata::story
