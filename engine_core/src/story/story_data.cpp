#include "Narrata/story/story_data.hpp"
#include <algorithm>
#include <cctype>

namespace Narrata::story {

namespace {
std::string lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}
} // namespace

const char* nodeTypeName(NodeType type) {
  switch (type) {
  case NodeType::Dialogue:
    return "dialogue";
  case NodeType::Scene:
    return "scene";
  case NodeType::Choice:
    return "choice";
  case NodeType::Branch:
    return "branch";
  case NodeType::End:
    return "end";
  }
  return "dialogue";
}

std::optional<NodeType> parseNodeType(std::string_view name) {
  if (name == "dialogue")
    return NodeType::Dialogue;
  if (name == "scene")
    return NodeType::Scene;
  if (name == "choice")
    return NodeType::Choice;
  if (name == "branch")
    return NodeType::Branch;
  if (name == "end")
    return NodeType::End;
  return std::nullopt;
}

const char* textEffectTypeName(TextEffectType type) {
  switch (type) {
  case TextEffectType::Wave:
    return "wave";
  case TextEffectType::Shake:
    return "shake";
  case TextEffectType::Bounce:
    return "bounce";
  case TextEffectType::Typewriter:
    return "typewriter";
  }
  return "typewriter";
}

std::optional<TextEffectType> parseTextEffectType(std::string_view name) {
  std::string key = lower(name);
  if (key == "wave")
    return TextEffectType::Wave;
  if (key == "shake")
    return TextEffectType::Shake;
  if (key == "bounce")
    return TextEffectType::Bounce;
  if (key == "typewriter")
    return TextEffectType::Typewriter;
  return std::nullopt;
}

} // namespace Narrata::story
