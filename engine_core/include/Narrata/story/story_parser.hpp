#pragma once

#include "Narrata/core/result.hpp"
#include "Narrata/story/story_data.hpp"
#include "Narrata/story/story_error.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace Narrata::story {

enum class StoryFormat { Json, Yaml };

[[nodiscard]] const char* storyFormatName(StoryFormat format);
[[nodiscard]] std::optional<StoryFormat> parseStoryFormat(std::string_view name);

/**
 * @brief Turns JSON or YAML story text into a validated Story
 *
 * Both formats are first converted into a JSON document so the typed
 * build and the validation run through a single path. A Story is only
 * returned once StoryValidator::validate() has accepted it.
 */
class StoryParser {
public:
  [[nodiscard]] static Result<Story, StoryError> parseFromJson(std::string_view text);
  [[nodiscard]] static Result<Story, StoryError> parseFromYaml(std::string_view text);
  [[nodiscard]] static Result<Story, StoryError> parse(std::string_view text, StoryFormat format);

  /**
   * @brief Read and parse a story file
   *
   * ".yaml" and ".yml" are parsed as YAML, ".json" as JSON. Any other
   * extension is sniffed: text starting with '{' is JSON, anything else
   * YAML. An unreadable file is a FormatError.
   */
  [[nodiscard]] static Result<Story, StoryError> parseFile(const std::string& path);

  /**
   * @brief Build and validate a Story from an already decoded document
   */
  [[nodiscard]] static Result<Story, StoryError> fromDocument(const nlohmann::json& document);

  /**
   * @brief Decode YAML text into the equivalent JSON document
   *
   * Plain scalars are typed with the YAML 1.2 core schema (true/false,
   * null/~, integers, floats); quoted scalars always stay strings.
   */
  [[nodiscard]] static Result<nlohmann::json, StoryError> yamlToJson(std::string_view text);

  [[nodiscard]] static std::optional<StoryFormat> formatFromPath(const std::string& path);
};

} // namespace Narrata::story
