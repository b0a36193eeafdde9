#include "Narrata/scripting/script_error.hpp"
#include <sstream>
#include <vector>

namespace Narrata::scripting {

namespace {

const char* stageName(ScriptErrorStage stage) {
  switch (stage) {
  case ScriptErrorStage::Lexer:
    return "syntax error";
  case ScriptErrorStage::Parser:
    return "parse error";
  case ScriptErrorStage::Runtime:
    return "evaluation error";
  }
  return "error";
}

} // namespace

std::string ScriptError::format() const {
  std::ostringstream out;
  out << stageName(stage) << " at " << location.line << ":" << location.column << ": "
      << message;
  return out.str();
}

std::string ScriptError::formatWithSource(std::string_view source) const {
  std::string result = format();
  if (source.empty() || location.line == 0) {
    return result;
  }

  std::vector<std::string_view> lines;
  size_t start = 0;
  while (start <= source.size()) {
    size_t end = source.find('\n', start);
    if (end == std::string_view::npos) {
      lines.push_back(source.substr(start));
      break;
    }
    lines.push_back(source.substr(start, end - start));
    start = end + 1;
  }

  if (location.line > lines.size()) {
    return result;
  }

  std::string_view line = lines[location.line - 1];
  result += "\n  | ";
  result.append(line);
  result += "\n  | ";

  // Tabs keep their width so the caret lines up with the offending column
  u32 caretPos = location.column > 0 ? location.column - 1 : 0;
  for (u32 i = 0; i < caretPos && i < line.size(); ++i) {
    result += line[i] == '\t' ? '\t' : ' ';
  }
  result += '^';
  return result;
}

} // namespace Narrata::scripting
