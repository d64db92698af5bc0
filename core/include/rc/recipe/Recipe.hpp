#pragma once
#include "rc/ids/Id.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace rc {

// A single JSON command string for the host's scene engine.
using CmdString = std::string;

// Result of building a recipe: the commands to create/dispose it.
struct RecipeBuildResult {
  std::vector<CmdString> createCommands;
  std::vector<CmdString> disposeCommands; // applied in order to tear down
};

// Base class for recipes. A recipe translates a declarative description
// into engine commands using deterministic ID allocation (idBase + offset).
class Recipe {
public:
  explicit Recipe(Id idBase) : idBase_(idBase) {}
  virtual ~Recipe() = default;

  Id idBase() const { return idBase_; }

  virtual RecipeBuildResult build() const = 0;

  // IDs of all DrawItems created by this recipe.
  virtual std::vector<Id> drawItemIds() const { return {}; }

protected:
  Id idBase_;

  Id rid(std::uint32_t offset) const {
    return idBase_ + static_cast<Id>(offset);
  }
};

} // namespace rc
