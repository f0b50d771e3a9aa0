#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using taskpilot::factory::Build;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

constexpr auto kReplyTimeout = std::chrono::seconds(30);

// Text after a "prefix:" marker, leading blanks removed.
std::string Rest(const std::string& line, std::size_t prefix_length) {
  const auto first = line.find_first_not_of(' ', prefix_length);
  return first == std::string::npos ? std::string() : line.substr(first);
}

void PrintLastReply(const taskpilot::factory::Application& app) {
  const auto recent = app.supervisor->RecentInteractions(1);
  if (recent.empty()) return;
  const auto& last = recent.front();
  std::cout << "[" << last.handler << (last.ok ? "" : " FAILED") << "] " << last.response << std::endl;
}

// One request per line: "goal: <text>" plans a complex goal,
// "task: <id>" re-submits a task, anything else is dispatched as a query.
void ServeStdin(const taskpilot::factory::Application& app) {
  std::string line;
  while (g_running && std::getline(std::cin, line)) {
    if (line.empty()) continue;
    if (line == "quit" || line == "exit") break;

    try {
      if (line.rfind("goal:", 0) == 0) {
        const auto id = app.supervisor->EnqueueComplexGoal(Rest(line, 5));
        std::cout << "goal planned: " << id << std::endl;
        continue;
      }

      if (line.rfind("task:", 0) == 0) {
        const auto id = Rest(line, 5);
        if (!app.supervisor->SubmitTask(id)) {
          std::cout << "no open task " << id << std::endl;
          continue;
        }
      } else {
        taskpilot::queue::WorkItem item;
        item.query = line;
        app.supervisor->Submit(std::move(item));
      }

      if (!app.supervisor->WaitIdle(kReplyTimeout)) {
        std::cout << "still working..." << std::endl;
        continue;
      }
      PrintLastReply(app);
    } catch (const std::exception& e) {
      std::cout << "error: " << e.what() << std::endl;
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool        interactive = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--stdin") {
      interactive = true;
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (config_path.empty()) {
      config_path = arg;
    } else {
      config_path.clear();
      break;
    }
  }
  if (config_path.empty()) {
    std::cerr << "Usage: taskpilot [--stdin] <config.yaml> OR taskpilot [--stdin] --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = taskpilot::config::ConfigLoader::LoadFromYaml(config_path);

    taskpilot::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.supervisor->Start();
    app.maintenance->Start();
    TASKPILOT_LOG_INFO("taskpilot started", {taskpilot::observability::BoolField("interactive", interactive)});

    if (interactive) {
      ServeStdin(app);
    } else {
      while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    TASKPILOT_LOG_INFO("Shutting down taskpilot");

    app.maintenance->Stop();
    app.supervisor->Stop();
    taskpilot::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    TASKPILOT_LOG_ERROR("Fatal error", {taskpilot::observability::StringField("error", e.what())});
    taskpilot::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
