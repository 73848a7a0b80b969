#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sq::cli {

enum class Command { kMount, kUnmount };

struct CommandResolution {
  std::optional<Command> command;
  bool ambiguous{false};
  std::vector<std::string> suggestions;  // filled when `command` is empty
};

// Alias first ("m", "um"), then the exact name, then a unique prefix of at
// least two characters.
CommandResolution ResolveCommand(std::string_view input);

std::string_view CommandName(Command command);

// Levenshtein distance, used for "did you mean" hints.
size_t EditDistance(std::string_view a, std::string_view b);

} // namespace sq::cli
