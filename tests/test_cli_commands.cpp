#include "sq/cli/commands.h"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

namespace {

  bool Suggests(const sq::cli::CommandResolution& resolution, const std::string& name) {
    return std::find(resolution.suggestions.begin(), resolution.suggestions.end(), name) !=
           resolution.suggestions.end();
  }

} // namespace

int main() {
  using sq::cli::Command;
  using sq::cli::ResolveCommand;

  assert(ResolveCommand("m").command == Command::kMount);
  assert(ResolveCommand("um").command == Command::kUnmount);
  assert(ResolveCommand("mount").command == Command::kMount);
  assert(ResolveCommand("unmount").command == Command::kUnmount);
  assert(ResolveCommand("mou").command == Command::kMount);
  assert(ResolveCommand("un").command == Command::kUnmount);

  // Single letters other than aliases are too short to count as prefixes.
  auto short_prefix = ResolveCommand("u");
  assert(!short_prefix.command);
  assert(Suggests(short_prefix, "unmount"));

  auto typo = ResolveCommand("mnt");
  assert(!typo.command);
  assert(!typo.ambiguous);
  assert(Suggests(typo, "mount"));

  auto unknown = ResolveCommand("extract");
  assert(!unknown.command);
  assert(unknown.suggestions.empty());

  assert(!ResolveCommand("").command);
  assert(sq::cli::CommandName(Command::kUnmount) == "unmount");
  assert(sq::cli::EditDistance("kitten", "sitting") == 3);
  assert(sq::cli::EditDistance("", "abc") == 3);

  std::cout << "cli command tests ok\n";
  return 0;
}
