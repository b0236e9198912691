#ifndef SWEEPER_GAME_CONFIG_H_
#define SWEEPER_GAME_CONFIG_H_

#include <cstddef>
#include <string>

#include "sweeper/game/error.h"
#include "sweeper/game/reveal.h"

namespace sweeper {

// Parameters for creating a new game.
struct Config {
  // The number of rows.
  std::size_t rows;

  // The number of columns.
  std::size_t cols;

  // The number of mines.
  std::size_t mines;

  // Seed for the PRNG to generate the mine locations.
  unsigned seed;

  // How flagged cells are treated when empty areas expand.
  CascadePolicy cascade_policy;
};

// The size and mine count of a game.
struct Difficulty {
  std::size_t rows;
  std::size_t cols;
  std::size_t mines;
};

// Premade common difficulties.
extern const Difficulty kBeginnerDifficulty;
extern const Difficulty kIntermediateDifficulty;
extern const Difficulty kExpertDifficulty;

// Creates a Config for the given difficulty using the default cascade policy.
Config MakeConfig(const Difficulty& difficulty, unsigned seed);

// Looks up a premade difficulty by name ("beginner", "intermediate" or
// "expert") and fills in config.
//
// Returns false (leaving config untouched) if the name is not recognized.
bool ConfigFromDifficultyName(const std::string& name, unsigned seed,
                              Config& config);

// Returns INVALID_CONFIGURATION unless the board has at least one row and
// column, a cell count that fits in a std::size_t, and fewer mines than cells.
Error ValidateConfig(const Config& config);

}  // namespace sweeper

#endif  // SWEEPER_GAME_CONFIG_H_
