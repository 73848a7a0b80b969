#include "sq/cli/commands.h"

#include <algorithm>
#include <array>

namespace sq::cli {
namespace {

struct CommandSpec {
  Command command;
  std::string_view name;
  std::string_view alias;
};

constexpr std::array<CommandSpec, 2> kCommands{{
    {Command::kMount, "mount", "m"},
    {Command::kUnmount, "unmount", "um"},
}};

constexpr size_t kMinPrefixLength = 2;
constexpr size_t kMaxSuggestionDistance = 2;

} // namespace

std::string_view CommandName(Command command) {
  for (const auto& spec : kCommands) {
    if (spec.command == command) {
      return spec.name;
    }
  }
  return {};
}

size_t EditDistance(std::string_view a, std::string_view b) {
  std::vector<size_t> previous(b.size() + 1);
  std::vector<size_t> current(b.size() + 1);
  for (size_t j = 0; j <= b.size(); ++j) {
    previous[j] = j;
  }
  for (size_t i = 1; i <= a.size(); ++i) {
    current[0] = i;
    for (size_t j = 1; j <= b.size(); ++j) {
      const size_t substitution = previous[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      current[j] = std::min({previous[j] + 1, current[j - 1] + 1, substitution});
    }
    std::swap(previous, current);
  }
  return previous[b.size()];
}

CommandResolution ResolveCommand(std::string_view input) {
  CommandResolution resolution;
  if (input.empty()) {
    return resolution;
  }
  for (const auto& spec : kCommands) {
    if (input == spec.alias || input == spec.name) {
      resolution.command = spec.command;
      return resolution;
    }
  }

  std::vector<const CommandSpec*> prefixed;
  for (const auto& spec : kCommands) {
    if (spec.name.substr(0, input.size()) == input) {
      prefixed.push_back(&spec);
    }
  }
  if (input.size() >= kMinPrefixLength && prefixed.size() == 1) {
    resolution.command = prefixed.front()->command;
    return resolution;
  }
  resolution.ambiguous = prefixed.size() > 1;

  for (const auto& spec : kCommands) {
    const bool is_prefix = spec.name.substr(0, input.size()) == input;
    if (is_prefix || EditDistance(input, spec.name) <= kMaxSuggestionDistance) {
      resolution.suggestions.emplace_back(spec.name);
    }
  }
  return resolution;
}

} // namespace sq::cli
