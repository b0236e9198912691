#include "sweeper/game/config.h"

#include "sweeper/game/grid.h"

namespace sweeper {

const Difficulty kBeginnerDifficulty = {9, 9, 10};
const Difficulty kIntermediateDifficulty = {16, 16, 40};
const Difficulty kExpertDifficulty = {16, 30, 99};

Config MakeConfig(const Difficulty& difficulty, unsigned seed) {
  return Config{difficulty.rows, difficulty.cols, difficulty.mines, seed,
                CascadePolicy::SKIP_FLAGGED};
}

bool ConfigFromDifficultyName(const std::string& name, unsigned seed,
                              Config& config) {
  if (name == "beginner") {
    config = MakeConfig(kBeginnerDifficulty, seed);
  } else if (name == "intermediate") {
    config = MakeConfig(kIntermediateDifficulty, seed);
  } else if (name == "expert") {
    config = MakeConfig(kExpertDifficulty, seed);
  } else {
    return false;
  }
  return true;
}

Error ValidateConfig(const Config& config) {
  if (!IsValidSize(config.rows, config.cols) ||
      config.mines >= config.rows * config.cols) {
    return Error::INVALID_CONFIGURATION;
  }
  return Error::NONE;
}

}  // namespace sweeper
