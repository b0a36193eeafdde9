/**
 * @file story_launcher_main.cpp
 * @brief Narrata story player - Main Entry Point
 *
 * Usage:
 *   narrata_player --story story.yaml        # Play a story
 *   narrata_player --story story.yaml --load 1
 *   narrata_player --story story.json --validate
 *   narrata_player --help
 */

#include "Narrata/runtime/story_launcher.hpp"
#include <iostream>

namespace {

int runStoryLauncher(int argc, char* argv[]) {
  Narrata::runtime::StoryLauncher launcher;

  launcher.setOnError([](const Narrata::runtime::LauncherError& error) {
    if (!error.suggestion.empty()) {
      std::cerr << "How to fix:\n  " << error.suggestion << "\n\n";
    }
    std::cerr << "If this problem persists, run with --verbose for more details.\n";
  });

  auto result = launcher.initialize(argc, argv);
  if (result.isError()) {
    launcher.showError(result.error());
    return 1;
  }

  return launcher.run(std::cin, std::cout);
}

} // namespace

int main(int argc, char* argv[]) {
  return runStoryLauncher(argc, argv);
}
