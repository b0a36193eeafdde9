#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include "Narrata/runtime/config_manager.hpp"
#include <filesystem>
#include <fstream>

using namespace Narrata;
using namespace Narrata::runtime;

namespace {

class ConfigTestFixture {
public:
  ConfigTestFixture() {
    baseDir = std::filesystem::temp_directory_path() / "narrata_config_tests";
    std::error_code ec;
    std::filesystem::remove_all(baseDir, ec);
    std::filesystem::create_directories(baseDir);
  }

  ~ConfigTestFixture() {
    std::error_code ec;
    std::filesystem::remove_all(baseDir, ec);
  }

  void writeConfig(const std::string& name, const std::string& content) {
    std::filesystem::create_directories(baseDir / "config");
    std::ofstream(baseDir / "config" / name) << content;
  }

  std::filesystem::path baseDir;
};

} // namespace

TEST_CASE("RuntimeConfig defaults", "[config]") {
  RuntimeConfig config;
  REQUIRE(config.story.file == "story.yaml");
  REQUIRE(config.story.validateOnLoad);
  REQUIRE(config.characters.enterDuration == Catch::Approx(0.8));
  REQUIRE(config.characters.exitDuration == Catch::Approx(0.7));
  REQUIRE(config.characters.moveDuration == Catch::Approx(0.5));
  REQUIRE(config.characters.emoteBaseline == Catch::Approx(0.3));
  REQUIRE(config.saves.maxSlots == 100);
  REQUIRE(config.logging.logLevel == "info");
}

TEST_CASE("ConfigManager::applyJson overlays present keys", "[config]") {
  RuntimeConfig config;

  SECTION("partial sections keep other defaults") {
    auto result = ConfigManager::applyJson(
        {{"story", {{"file", "tale.json"}}}, {"characters", {{"randomSeed", 42}}}}, config);
    REQUIRE(result.isOk());
    REQUIRE(config.story.file == "tale.json");
    REQUIRE(config.story.validateOnLoad);
    REQUIRE(config.characters.randomSeed == 42);
    REQUIRE(config.characters.enterDuration == Catch::Approx(0.8));
  }

  SECTION("type mismatches are errors") {
    REQUIRE(ConfigManager::applyJson({{"saves", {{"maxSlots", "many"}}}}, config).isError());
    REQUIRE(ConfigManager::applyJson({{"story", 3}}, config).isError());
    REQUIRE(ConfigManager::applyJson(nlohmann::json::array(), config).isError());
  }

  SECTION("out of range values are errors") {
    REQUIRE(ConfigManager::applyJson({{"saves", {{"maxSlots", 0}}}}, config).isError());
    RuntimeConfig other;
    REQUIRE(
        ConfigManager::applyJson({{"characters", {{"emoteBaseline", 1.5}}}}, other).isError());
    RuntimeConfig third;
    REQUIRE(ConfigManager::applyJson({{"logging", {{"logLevel", "loud"}}}}, third).isError());
  }

  SECTION("toJson feeds back into applyJson") {
    RuntimeConfig custom;
    custom.game.name = "Lighthouse";
    custom.saves.maxSlots = 12;
    custom.debug.traceTransitions = true;
    RuntimeConfig restored;
    REQUIRE(ConfigManager::applyJson(ConfigManager::toJson(custom), restored).isOk());
    REQUIRE(restored.game.name == "Lighthouse");
    REQUIRE(restored.saves.maxSlots == 12);
    REQUIRE(restored.debug.traceTransitions);
  }
}

TEST_CASE_METHOD(ConfigTestFixture, "ConfigManager loads layered files", "[config][files]") {
  ConfigManager manager;
  REQUIRE(manager.loadConfig().isError());

  REQUIRE(manager.initialize(baseDir.string()).isOk());
  REQUIRE(std::filesystem::exists(baseDir / "config"));
  REQUIRE(std::filesystem::exists(baseDir / "saves"));
  REQUIRE(std::filesystem::exists(baseDir / "logs"));

  SECTION("no files means defaults") {
    REQUIRE(manager.loadConfig().isOk());
    REQUIRE(manager.getConfig().story.file == "story.yaml");
  }

  SECTION("user file overrides base file") {
    writeConfig("runtime_config.json",
                R"({"game": {"name": "Base"}, "story": {"file": "base.yaml"}})");
    writeConfig("runtime_user.json", R"({"story": {"file": "user.yaml"}})");
    REQUIRE(manager.loadConfig().isOk());
    REQUIRE(manager.getConfig().game.name == "Base");
    REQUIRE(manager.getConfig().story.file == "user.yaml");

    manager.resetUserSettings();
    REQUIRE(manager.getConfig().story.file == "base.yaml");
  }

  SECTION("broken files are reported") {
    writeConfig("runtime_config.json", "{ broken");
    auto result = manager.loadConfig();
    REQUIRE(result.isError());
    REQUIRE(result.error().find("Invalid JSON") != std::string::npos);
  }

  SECTION("saved user config holds only differences") {
    writeConfig("runtime_config.json", R"({"game": {"name": "Base"}})");
    REQUIRE(manager.loadConfig().isOk());
    manager.setLogLevel("debug");
    REQUIRE(manager.saveUserConfig().isOk());

    std::ifstream file(baseDir / "config" / "runtime_user.json");
    nlohmann::json saved = nlohmann::json::parse(file);
    REQUIRE(saved == nlohmann::json{{"logging", {{"logLevel", "debug"}}}});

    ConfigManager reloaded;
    REQUIRE(reloaded.initialize(baseDir.string()).isOk());
    REQUIRE(reloaded.loadConfig().isOk());
    REQUIRE(reloaded.getConfig().logging.logLevel == "debug");
    REQUIRE(reloaded.getConfig().game.name == "Base");
  }

  SECTION("paths follow the configuration") {
    std::string base = manager.getBasePath();
    REQUIRE(base.back() == '/');
    REQUIRE(manager.getConfigPath() == base + "config/");
    manager.getConfigMutable().saves.saveDirectory = "slots";
    REQUIRE(manager.getSavesPath() == base + "slots/");
  }

  SECTION("change callback") {
    int calls = 0;
    manager.setOnConfigChanged([&calls](const RuntimeConfig&) { ++calls; });
    manager.setStoryFile("other.json");
    manager.setTraceTransitions(true);
    REQUIRE(calls == 2);
    REQUIRE(manager.getConfig().debug.traceTransitions);
  }
}
