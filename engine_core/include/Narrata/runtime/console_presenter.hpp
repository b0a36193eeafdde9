#pragma once

/**
 * @file console_presenter.hpp
 * @brief Text-only presenters used by narrata_player
 */

#include "Narrata/dialogue/presenters.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace Narrata::runtime {

class ConsolePresenter : public dialogue::ICharacterPresenter, public dialogue::IDialoguePresenter {
public:
  explicit ConsolePresenter(std::ostream& out) : m_out(out) {}

  /**
   * @brief Also print character staging actions
   */
  void setShowStaging(bool enabled) { m_showStaging = enabled; }

  void executeAction(const character::CharacterAction& action) override;

  void showDialogue(const dialogue::DialogueLine& line) override;
  void showChoices(const std::vector<story::StoryChoice>& choices,
                   const std::string& animation) override;
  void hideDialogue() override;
  void changeBackground(const std::string& backgroundId) override;
  void playSceneEffect(const story::EffectHint& effect) override;

  [[nodiscard]] usize getVisibleChoiceCount() const { return m_visibleChoices; }

private:
  std::ostream& m_out;
  bool m_showStaging = false;
  usize m_visibleChoices = 0;
};

} // namespace Narrata::runtime
