#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

using voicecode::session::v1::Priority;

static void Usage() {
  std::cout << "Usage:\n"
            << "  sessionctl <config.yaml> list\n"
            << "  sessionctl <config.yaml> add <session_id> [priority=high|medium|low]\n"
            << "  sessionctl <config.yaml> remove <session_id>\n"
            << "  sessionctl <config.yaml> priority <session_id> <high|medium|low>\n"
            << "  sessionctl <config.yaml> move <from_index> <to_index>\n"
            << "  sessionctl <config.yaml> reorder <session_id> <above_id|-> <below_id|->\n"
            << "  sessionctl <config.yaml> renormalize\n"
            << "  sessionctl new-id\n";
}

static std::optional<Priority> ParsePriority(const std::string& value) {
  if (value == "high") {
    return voicecode::session::v1::PRIORITY_HIGH;
  }
  if (value == "medium") {
    return voicecode::session::v1::PRIORITY_MEDIUM;
  }
  if (value == "low") {
    return voicecode::session::v1::PRIORITY_LOW;
  }
  return std::nullopt;
}

static const char* PriorityName(Priority priority) {
  switch (priority) {
    case voicecode::session::v1::PRIORITY_HIGH:   return "high";
    case voicecode::session::v1::PRIORITY_MEDIUM: return "medium";
    case voicecode::session::v1::PRIORITY_LOW:    return "low";
    default:                                      return "unspecified";
  }
}

static std::string SessionArg(const std::string& value) {
  try {
    return voicecode::util::Canonicalize(value);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    std::exit(1);
  }
}

static std::optional<std::string> NeighbourArg(const std::string& value) {
  if (value == "-") return std::nullopt;
  return SessionArg(value);
}

static void PrintQueue(const voicecode::queue::PriorityQueueManager& queue) {
  std::size_t index = 0;
  for (const auto& entry : queue.Snapshot()) {
    std::cout << std::setw(4) << index++ << "  " << entry.session_id << "  " << std::setw(6) << PriorityName(entry.priority) << "  "
              << std::setprecision(17) << entry.order_key << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc == 2 && std::string(argv[1]) == "new-id") {
    std::cout << voicecode::util::GenerateUUIDString() << "\n";
    return 0;
  }

  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string config_path = argv[1];
  std::string cmd         = argv[2];

  try {
    auto config = voicecode::config::ConfigLoader::LoadFromYaml(config_path);
    if (!config.database().has_sqlite()) {
      std::cerr << "sessionctl needs a sqlite database in " << config_path << "; the memory backend does not outlive the process\n";
      return 1;
    }

    // quiet unless asked otherwise
    if (config.logging().level().empty()) config.mutable_logging()->set_level("warn");
    voicecode::observability::InitializeLogging(config);

    auto  app   = voicecode::factory::Build(config);
    auto& queue = *app.queue;

    // ------------------------------------------------------------

    if (cmd == "list") {
      PrintQueue(queue);
      return 0;
    }

    if (cmd == "add") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      Priority priority = voicecode::session::v1::PRIORITY_LOW;
      if (argc >= 5) {
        auto parsed = ParsePriority(argv[4]);
        if (!parsed.has_value()) {
          std::cerr << "unsupported priority: " << argv[4] << "\n";
          return 1;
        }
        priority = parsed.value();
      }

      const auto session_id = SessionArg(argv[3]);
      if (!queue.Enqueue(session_id, priority)) {
        std::cout << session_id << " already queued\n";
        return 0;
      }
      PrintQueue(queue);
      return 0;
    }

    if (cmd == "remove") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      const auto session_id = SessionArg(argv[3]);
      if (!queue.Remove(session_id)) {
        std::cerr << session_id << " not queued\n";
        return 1;
      }
      PrintQueue(queue);
      return 0;
    }

    if (cmd == "priority") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      auto parsed = ParsePriority(argv[4]);
      if (!parsed.has_value()) {
        std::cerr << "unsupported priority: " << argv[4] << "\n";
        return 1;
      }

      queue.ChangePriority(SessionArg(argv[3]), parsed.value());
      PrintQueue(queue);
      return 0;
    }

    if (cmd == "move") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      const auto from = static_cast<std::size_t>(std::stoull(argv[3]));
      const auto to   = static_cast<std::size_t>(std::stoull(argv[4]));
      if (!queue.Move(from, to)) std::cout << "position unchanged\n";
      PrintQueue(queue);
      return 0;
    }

    if (cmd == "reorder") {
      if (argc < 6) {
        Usage();
        return 1;
      }

      if (!queue.Reorder(SessionArg(argv[3]), NeighbourArg(argv[4]), NeighbourArg(argv[5]))) std::cout << "position unchanged\n";
      PrintQueue(queue);
      return 0;
    }

    if (cmd == "renormalize") {
      queue.Renormalize();
      PrintQueue(queue);
      return 0;
    }
  } catch (const voicecode::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
    return 1;
  } catch (const std::out_of_range& e) {
    std::cerr << "out of range: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
