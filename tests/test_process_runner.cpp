#include "sq/orchestrator/event_bus.h"
#include "sq/platform/process_runner.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

int main() {
  const auto log_path = std::filesystem::temp_directory_path() /
                        ("sq_process_runner_" + std::to_string(::getpid()) + ".log");
  sq::orchestrator::DefaultJsonLogger().SetPath(log_path);
  sq::orchestrator::ResetEventBusForTesting();
  std::vector<sq::orchestrator::Event> events;
  sq::orchestrator::EventBus::Instance().Subscribe(
      [&events](const sq::orchestrator::Event& e) { events.push_back(e); });

  sq::platform::SubprocessRunner runner;

  auto ok = runner.Run({"/bin/sh", "-c", "exit 0"});
  assert(ok.ok());
  assert(ok.stderr_output.empty());

  // Arguments may name user files; only their hash reaches the log.
  assert(events.size() == 1);
  const auto& executed = events.front();
  assert(executed.event_id == "command_executed");
  assert(executed.fields.size() == 3);
  assert(executed.fields[0].key == "program" && executed.fields[0].value == "/bin/sh");
  assert(executed.fields[1].key == "arguments");
  assert(executed.fields[1].privacy == sq::orchestrator::FieldPrivacy::kHash);
  assert(sq::orchestrator::RenderFieldValue(executed.fields[1]) ==
         sq::orchestrator::HashForTelemetry("-c 'exit 0'"));

  auto failed = runner.Run({"/bin/sh", "-c", "echo 'mount: bad superblock' >&2; exit 3"});
  assert(!failed.ok());
  assert(failed.exit_code == 3);
  assert(failed.stderr_output == "mount: bad superblock\n");

  // stdout is not captured.
  auto quiet = runner.Run({"/bin/sh", "-c", "echo to-stdout"});
  assert(quiet.ok() && quiet.stderr_output.empty());

  auto signalled = runner.Run({"/bin/sh", "-c", "kill -TERM $$"});
  assert(signalled.exit_code == 128 + 15);

  auto missing = runner.Run({"/nonexistent/squish-helper", "-u", "/mnt"});
  assert(missing.exit_code == 127);
  assert(missing.stderr_output.find("failed to execute /nonexistent/squish-helper") != std::string::npos);

  auto empty = runner.Run({});
  assert(empty.exit_code == -1 && !empty.stderr_output.empty());

  assert(sq::platform::FormatCommandLine({"squashfuse", "-o", "ro", "/a b.sqsh", "/mnt/it's"}) ==
         "squashfuse -o ro '/a b.sqsh' '/mnt/it'\\''s'");
  assert(sq::platform::FormatCommandLine({"fusermount", ""}) == "fusermount ''");

  sq::orchestrator::ResetEventBusForTesting();
  std::filesystem::remove(log_path);
  std::cout << "process runner tests ok\n";
  return 0;
}
