#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "Narrata/story/story_parser.hpp"
#include "story_fixtures.hpp"
#include <filesystem>
#include <fstream>

using namespace Narrata;
using namespace Narrata::story;

TEST_CASE("StoryParser reads JSON stories", "[story_parser]") {
  auto result = StoryParser::parseFromJson(test::kTwoEndingsJson);
  REQUIRE(result.isOk());

  const Story& story = result.value();
  REQUIRE(story.id == "two_endings");
  REQUIRE(story.title == "Two Endings");
  REQUIRE(story.startNode == "start");
  REQUIRE(story.nodes.size() == 4);
  REQUIRE(story.initialState["score"] == 0);

  const auto& choice = story.nodes.at("choice1");
  REQUIRE(choice.type == NodeType::Choice);
  REQUIRE(choice.choices.size() == 2);
  REQUIRE(choice.choices[0].text == "yes");
  REQUIRE(choice.choices[0].stateChanges["score"] == 10);
  REQUIRE(choice.choices[1].stateChanges.is_null());

  SECTION("choices without an id get a generated one") {
    REQUIRE(choice.choices[0].id == "choice1_choice_0");
    REQUIRE(choice.choices[1].id == "choice1_choice_1");
  }
}

TEST_CASE("StoryParser reads YAML stories", "[story_parser][yaml]") {
  auto result = StoryParser::parseFromYaml(test::kForestYaml);
  REQUIRE(result.isOk());

  const Story& story = result.value();
  REQUIRE(story.id == "forest");
  REQUIRE(story.initialState["flag"] == true);
  REQUIRE(story.initialState["courage"] == 1);

  SECTION("scene characters are typed") {
    const auto& clearing = story.nodes.at("clearing");
    REQUIRE(clearing.type == NodeType::Scene);
    REQUIRE(clearing.sceneId == "forest_clearing");
    REQUIRE(clearing.characters);
    REQUIRE(clearing.characters->size() == 1);
    REQUIRE(clearing.characters->at(0).id == "alice");
    REQUIRE(clearing.characters->at(0).position == character::CharacterPosition::Left);
    REQUIRE(clearing.characters->at(0).expression == character::CharacterEmotion::Happy);
  }

  SECTION("asset characters are read") {
    REQUIRE(story.assets.characters.size() == 2);
    const auto& alice = story.assets.characters.at("alice");
    REQUIRE(alice.name == "Alice");
    REQUIRE(alice.textColor == "#ff8888");
    REQUIRE(alice.textSpeed.value() == Catch::Approx(30.0));
    REQUIRE(story.assets.characters.at("bob").id == "bob");
  }

  SECTION("hooks and conditions stay as source text") {
    REQUIRE(story.nodes.at("hello").onEnter == "met = true");
    REQUIRE(story.nodes.at("gate").condition == "state.flag == true");
  }
}

TEST_CASE("StoryParser YAML scalars follow the core schema", "[story_parser][yaml]") {
  auto result = StoryParser::yamlToJson(R"(
plainTrue: true
quotedTrue: "true"
integer: 42
negative: -7
decimal: 2.5
quotedNumber: "42"
nothing: ~
word: hello
)");
  REQUIRE(result.isOk());

  const auto& doc = result.value();
  REQUIRE(doc["plainTrue"] == true);
  REQUIRE(doc["quotedTrue"] == "true");
  REQUIRE(doc["integer"] == 42);
  REQUIRE(doc["negative"] == -7);
  REQUIRE(doc["decimal"].get<double>() == Catch::Approx(2.5));
  REQUIRE(doc["quotedNumber"] == "42");
  REQUIRE(doc["nothing"].is_null());
  REQUIRE(doc["word"] == "hello");
}

TEST_CASE("StoryParser reports format errors", "[story_parser][error]") {
  SECTION("malformed JSON") {
    auto result = StoryParser::parseFromJson("{ \"id\": ");
    REQUIRE(result.isError());
    REQUIRE(result.error().code == StoryErrorCode::FormatError);
  }

  SECTION("malformed YAML") {
    auto result = StoryParser::parseFromYaml("id: [unclosed");
    REQUIRE(result.isError());
    REQUIRE(result.error().code == StoryErrorCode::FormatError);
  }

  SECTION("missing file") {
    auto result = StoryParser::parseFile("/nonexistent/story.yaml");
    REQUIRE(result.isError());
    REQUIRE(result.error().code == StoryErrorCode::FormatError);
  }
}

TEST_CASE("StoryParser rejects structural problems", "[story_parser][error]") {
  SECTION("unknown node type names the node and field") {
    auto result = StoryParser::parseFromJson(R"({
      "id": "s", "title": "S", "startNode": "a",
      "nodes": { "a": { "type": "cutscene" } }
    })");
    REQUIRE(result.isError());
    REQUIRE(result.error().code == StoryErrorCode::ValidationError);
    REQUIRE(result.error().nodeId == "a");
    REQUIRE(result.error().field == "type");
  }

  SECTION("invalid scene position") {
    auto result = StoryParser::parseFromJson(R"({
      "id": "s", "title": "S", "startNode": "a",
      "nodes": { "a": { "type": "scene", "sceneId": "x",
                        "characters": [ { "id": "c", "position": "upstage" } ] } }
    })");
    REQUIRE(result.isError());
    REQUIRE(result.error().field == "characters[0].position");
  }

  SECTION("invalid metadata emotion") {
    auto result = StoryParser::parseFromJson(R"({
      "id": "s", "title": "S", "startNode": "a",
      "nodes": { "a": { "type": "end", "metadata": { "emotion": "grumpy" } } }
    })");
    REQUIRE(result.isError());
    REQUIRE(result.error().nodeId == "a");
  }

  SECTION("missing title") {
    auto result = StoryParser::parseFromJson(R"({
      "id": "s", "startNode": "a", "nodes": { "a": { "type": "end" } }
    })");
    REQUIRE(result.isError());
    REQUIRE(result.error().field == "title");
  }

  SECTION("node id must match its key") {
    auto result = StoryParser::parseFromJson(R"({
      "id": "s", "title": "S", "startNode": "a",
      "nodes": { "a": { "id": "b", "type": "end" } }
    })");
    REQUIRE(result.isError());
    REQUIRE(result.error().field == "id");
  }
}

TEST_CASE("StoryParser picks the format from the file", "[story_parser][file]") {
  namespace fs = std::filesystem;
  fs::path dir = fs::temp_directory_path() / "narrata_story_parser_tests";
  fs::create_directories(dir);

  SECTION("extension decides") {
    REQUIRE(StoryParser::formatFromPath("a/b/story.YAML") == StoryFormat::Yaml);
    REQUIRE(StoryParser::formatFromPath("story.yml") == StoryFormat::Yaml);
    REQUIRE(StoryParser::formatFromPath("story.json") == StoryFormat::Json);
    REQUIRE_FALSE(StoryParser::formatFromPath("story.txt").has_value());
  }

  SECTION("unknown extensions are sniffed") {
    fs::path path = dir / "story.txt";
    {
      std::ofstream out(path);
      out << "  " << test::kTwoEndingsJson;
    }
    auto result = StoryParser::parseFile(path.string());
    REQUIRE(result.isOk());
    REQUIRE(result.value().id == "two_endings");
  }

  SECTION("format names") {
    REQUIRE(parseStoryFormat("YML") == StoryFormat::Yaml);
    REQUIRE(parseStoryFormat("json") == StoryFormat::Json);
    REQUIRE_FALSE(parseStoryFormat("xml").has_value());
    REQUIRE(std::string(storyFormatName(StoryFormat::Yaml)) == "yaml");
  }

  std::error_code ec;
  fs::remove_all(dir, ec);
}

TEST_CASE("StoryParser loads the bundled sample stories", "[story_parser][file]") {
  auto lighthouse = StoryParser::parseFile(NARRATA_SAMPLES_DIR "/stories/lighthouse.yaml");
  REQUIRE(lighthouse.isOk());
  REQUIRE(lighthouse.value().startNode == "arrival");

  auto courier = StoryParser::parseFile(NARRATA_SAMPLES_DIR "/stories/courier.json");
  REQUIRE(courier.isOk());
  REQUIRE(courier.value().nodes.size() == 5);
}
