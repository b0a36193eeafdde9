#include "Narrata/runtime/console_presenter.hpp"

namespace Narrata::runtime {

void ConsolePresenter::executeAction(const character::CharacterAction& action) {
  if (!m_showStaging) {
    return;
  }

  m_out << "  [" << character::actionTypeName(action.type) << " " << action.characterId;
  if (action.position) {
    m_out << " -> " << character::positionName(*action.position);
  }
  if (action.emotion) {
    m_out << " (" << character::emotionName(*action.emotion) << ")";
  }
  if (action.animation) {
    m_out << " " << *action.animation;
  }
  m_out << "]\n";
}

void ConsolePresenter::showDialogue(const dialogue::DialogueLine& line) {
  m_visibleChoices = 0;
  m_out << "\n";
  if (line.displayName) {
    m_out << *line.displayName;
    if (line.emotion && *line.emotion != character::CharacterEmotion::Neutral) {
      m_out << " (" << character::emotionName(*line.emotion) << ")";
    }
    m_out << ": ";
  }
  m_out << line.text << "\n";
}

void ConsolePresenter::showChoices(const std::vector<story::StoryChoice>& choices,
                                   const std::string& /*animation*/) {
  m_visibleChoices = choices.size();
  m_out << "\n";
  for (usize i = 0; i < choices.size(); ++i) {
    m_out << "  " << (i + 1) << ") " << choices[i].text << "\n";
  }
}

void ConsolePresenter::hideDialogue() { m_visibleChoices = 0; }

void ConsolePresenter::changeBackground(const std::string& backgroundId) {
  m_out << "\n-- " << backgroundId << " --\n";
}

void ConsolePresenter::playSceneEffect(const story::EffectHint& effect) {
  if (m_showStaging) {
    m_out << "  [effect " << effect.type << "]\n";
  }
}

} // namespace Narrata::runtime
