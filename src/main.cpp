/// @file main.cpp
/// @brief Entry point: builds a LoadBalancer from config file + CLI flags,
///        runs it for the configured duration and prints a report.
///
/// With --server the run is paced to wall-clock time and streamed to
/// browser clients over WebSocket; the clients drive start/stop/reset and
/// reconfiguration through JSON commands.

#include "config/sim_config.hpp"
#include "core/error.hpp"
#include "scheduling/policy.hpp"
#include "serialization/json_serializer.hpp"
#include "server/live_server.hpp"
#include "simulation/load_balancer.hpp"
#include "simulation/runner.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <expected>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace {

using namespace lbsim;
using namespace lbsim::sim;
using namespace std::chrono_literals;

// ─── CLI argument parsing ───────────────────────────────────────────────

struct CliArgs {
  std::optional<std::string> config_path;
  std::optional<std::size_t> servers;
  std::optional<std::string> policy;
  std::optional<double> rate;
  std::optional<double> duration_s;
  std::optional<std::size_t> tick_ms;
  std::optional<std::uint64_t> seed;
  std::optional<std::size_t> history;
  bool realtime = false;
  bool enable_server = false;
  std::optional<unsigned short> port;
  std::optional<std::string> web_root;
  bool show_progress = true;
};

void print_usage(const char *prog) {
  std::cout
      << "Usage: " << prog << " [options]\n\n"
      << "Options:\n"
      << "  --config <FILE>      JSON configuration file\n"
      << "  --servers <N>        Number of servers (default: 4)\n"
      << "  --policy <P>         round-robin|random|least-requests|\n"
      << "                       least-response-time|dynamic-cpu "
         "(default: round-robin)\n"
      << "  --rate <R>           Arrivals per simulated second (default: 1)\n"
      << "  --duration <S>       Run duration in seconds (default: 60)\n"
      << "  --tick-ms <T>        Tick interval in ms (default: 100)\n"
      << "  --seed <N>           RNG seed, 0 = random (default: 0)\n"
      << "  --history <N>        Balance history length (default: 50)\n"
      << "  --realtime           Pace ticks to wall-clock time\n"
      << "  --server             Enable the live WebSocket server\n"
      << "  --port <N>           Server port (default: 8080)\n"
      << "  --web-root <DIR>     Static file root (default: web)\n"
      << "  --no-progress        Disable progress output\n"
      << "  --help               Show this help\n";
}

auto parse_args(int argc, char *argv[]) -> CliArgs {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--servers" && i + 1 < argc) {
      args.servers = parse_unsigned_arg(argv[++i]);
    } else if (arg == "--policy" && i + 1 < argc) {
      args.policy = argv[++i];
    } else if (arg == "--rate" && i + 1 < argc) {
      args.rate = std::stod(argv[++i]);
    } else if (arg == "--duration" && i + 1 < argc) {
      args.duration_s = std::stod(argv[++i]);
    } else if (arg == "--tick-ms" && i + 1 < argc) {
      args.tick_ms = parse_unsigned_arg(argv[++i]);
    } else if (arg == "--seed" && i + 1 < argc) {
      args.seed = parse_unsigned_arg(argv[++i]);
    } else if (arg == "--history" && i + 1 < argc) {
      args.history = parse_unsigned_arg(argv[++i]);
    } else if (arg == "--realtime") {
      args.realtime = true;
    } else if (arg == "--server") {
      args.enable_server = true;
    } else if (arg == "--port" && i + 1 < argc) {
      args.port = parse_port_arg(argv[++i]);
    } else if (arg == "--web-root" && i + 1 < argc) {
      args.web_root = argv[++i];
    } else if (arg == "--no-progress") {
      args.show_progress = false;
    } else {
      std::cerr << "warning: ignoring unknown argument '" << arg << "'\n";
    }
  }
  return args;
}

/// Defaults → config file → CLI flags.
auto build_config(const CliArgs &args)
    -> std::expected<SimConfig, std::error_code> {
  SimConfig cfg;
  if (args.config_path) {
    auto loaded = load_config(*args.config_path);
    if (!loaded) {
      return std::unexpected(loaded.error());
    }
    cfg = std::move(*loaded);
  }

  if (args.servers)
    cfg.server_count = *args.servers;
  if (args.policy)
    cfg.policy = *args.policy;
  if (args.rate)
    cfg.arrival_rate = *args.rate;
  if (args.duration_s)
    cfg.run_duration_s = *args.duration_s;
  if (args.tick_ms)
    cfg.tick_interval_ms = *args.tick_ms;
  if (args.seed)
    cfg.seed = *args.seed;
  if (args.history)
    cfg.history_capacity = *args.history;
  if (args.realtime)
    cfg.realtime = true;
  if (args.enable_server)
    cfg.server.enabled = true;
  if (args.port)
    cfg.server.port = *args.port;
  if (args.web_root)
    cfg.server.web_root = *args.web_root;

  if (auto ok = validate(cfg); !ok) {
    return std::unexpected(ok.error());
  }
  return cfg;
}

// ─── Report formatting ─────────────────────────────────────────────────

void print_separator() { std::cout << std::string(60, '=') << '\n'; }

void print_report(const LoadBalancer &lb, const RunSummary &summary) {
  std::cout << '\n';
  print_separator();
  std::cout << "  LOAD BALANCER SIMULATION RESULTS\n";
  print_separator();

  std::cout << std::fixed << std::setprecision(1);

  const auto arrivals = lb.total_arrivals();
  const double reject_pct =
      arrivals > 0 ? 100.0 * static_cast<double>(lb.total_rejected()) /
                         static_cast<double>(arrivals)
                   : 0.0;

  std::cout << "\n  Run\n"
            << "    Policy:      " << to_string(lb.policy_kind()) << '\n'
            << "    Ticks:       " << summary.ticks
            << (summary.stopped ? " (stopped early)" : "") << '\n'
            << "    Simulated:   " << summary.simulated_ms / 1000.0 << " s\n"
            << "    Wall time:   " << std::setprecision(3)
            << std::chrono::duration<double>(summary.wall_time).count()
            << " s\n";

  std::cout << std::setprecision(1);
  std::cout << "\n  Requests\n"
            << "    Arrivals:    " << arrivals << '\n'
            << "    Admitted:    " << lb.total_admitted() << '\n'
            << "    Rejected:    " << lb.total_rejected() << " ("
            << reject_pct << " %)\n"
            << "    Completed:   " << lb.total_completed() << '\n';

  std::cout << "\n  Servers\n"
            << "    #   CPU%   MEM%  Active  Done    Rejected  AvgLat(ms)\n";
  const auto snapshot = lb.server_snapshot();
  for (std::size_t i = 0; i < snapshot.size(); ++i) {
    const auto &s = snapshot[i];
    std::cout << "    " << std::setw(2) << i << std::setw(7) << s.cpu_load
              << std::setw(7) << s.memory_load << std::setw(8)
              << s.active_count << std::setw(8) << s.completed_count
              << std::setw(10) << s.rejected_count << std::setw(12)
              << s.avg_response_time_ms << '\n';
  }

  const auto &stats = lb.latest_stats();
  std::cout << "\n  Load distribution (last sample)\n"
            << "    CPU  mean " << stats.cpu.mean << "  sd " << stats.cpu.std_dev
            << "  min " << stats.cpu.min << "  max " << stats.cpu.max << '\n'
            << "    MEM  mean " << stats.memory.mean << "  sd "
            << stats.memory.std_dev << "  min " << stats.memory.min
            << "  max " << stats.memory.max << '\n'
            << "    Balance  CPU " << stats.cpu_balance << " / MEM "
            << stats.memory_balance << '\n';

  print_separator();
  std::cout << std::endl;
}

// ─── Live mode ──────────────────────────────────────────────────────────

/// Latest full-state JSON, refreshed on the tick thread and read by the
/// I/O thread when a client connects.
class SnapshotCache {
public:
  void update(const LoadBalancer &lb) {
    auto text = snapshot_to_json(lb).dump();
    std::lock_guard lock(mutex_);
    text_ = std::move(text);
  }
  auto get() -> std::string {
    std::lock_guard lock(mutex_);
    return text_;
  }

private:
  std::mutex mutex_;
  std::string text_;
};

/// Apply a reconfiguration on the tick thread, reporting failures to clients.
void post_reconfigure(SimulationRunner &runner, LiveServer &server,
                      SnapshotCache &cache, std::string name,
                      std::function<std::expected<void, std::error_code>(
                          LoadBalancer &)>
                          apply) {
  runner.post([&server, &cache, name = std::move(name),
               apply = std::move(apply)](LoadBalancer &lb) {
    if (auto ok = apply(lb); !ok) {
      std::cerr << "[cmd] " << name << " failed: " << ok.error().message()
                << "\n";
      server.broadcast(error_to_json(name, ok.error().message()).dump());
      return;
    }
    std::cout << "[cmd] " << name << " applied\n";
    cache.update(lb);
    server.broadcast(cache.get());
  });
}

void handle_command(const std::string &msg, const SimConfig &initial,
                    SimulationRunner &runner, LiveServer &server,
                    SnapshotCache &cache, std::atomic<bool> &start_requested) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(msg);
  } catch (const nlohmann::json::exception &e) {
    std::cerr << "[cmd] parse error: " << e.what() << "\n";
    server.broadcast(error_to_json("", e.what()).dump());
    return;
  }
  if (!j.is_object() || !j.contains("command") ||
      !j["command"].is_string()) {
    std::cerr << "[cmd] message has no command field\n";
    server.broadcast(error_to_json("", "missing command").dump());
    return;
  }

  const auto cmd = j["command"].get<std::string>();
  try {
    if (cmd == "start") {
      if (runner.running()) {
        std::cout << "[cmd] simulation already running, ignoring\n";
        return;
      }
      runner.clear_stop();
      start_requested.store(true);
    } else if (cmd == "stop") {
      start_requested.store(false);
      runner.stop();
      std::cout << "[cmd] stop requested\n";
    } else if (cmd == "reset") {
      // Back to the launch settings, like the control panel's reset button.
      start_requested.store(false);
      runner.stop();
      post_reconfigure(runner, server, cache, cmd,
                       [&initial, &runner](LoadBalancer &lb) {
                         runner.set_run_duration(initial.run_duration_s);
                         return lb.reset_to(initial);
                       });
    } else if (cmd == "set_servers") {
      const auto count = j.at("count").get<std::size_t>();
      post_reconfigure(runner, server, cache, cmd,
                       [count](LoadBalancer &lb) {
                         return lb.set_server_count(count);
                       });
    } else if (cmd == "set_policy") {
      auto name = j.at("policy").get<std::string>();
      post_reconfigure(runner, server, cache, cmd,
                       [name](LoadBalancer &lb) { return lb.set_policy(name); });
    } else if (cmd == "set_rate") {
      const auto rate = j.at("rate").get<double>();
      post_reconfigure(runner, server, cache, cmd, [rate](LoadBalancer &lb) {
        return lb.set_arrival_rate(rate);
      });
    } else if (cmd == "set_duration") {
      const auto seconds = j.at("seconds").get<double>();
      if (!(seconds > 0.0)) {
        server.broadcast(
            error_to_json(cmd,
                          make_error_code(Errc::invalid_run_duration).message())
                .dump());
        return;
      }
      runner.post([&runner, seconds](LoadBalancer &) {
        runner.set_run_duration(seconds);
      });
    } else {
      std::cerr << "[cmd] unknown command: " << cmd << "\n";
      server.broadcast(error_to_json(cmd, "unknown command").dump());
    }
  } catch (const nlohmann::json::exception &e) {
    std::cerr << "[cmd] bad arguments for " << cmd << ": " << e.what() << "\n";
    server.broadcast(error_to_json(cmd, e.what()).dump());
  }
}

auto run_live(LoadBalancer &lb, const SimConfig &cfg) -> int {
  SimulationRunner runner{lb, {.run_duration_s = cfg.run_duration_s,
                               .realtime = true}};
  LiveServer server{cfg.server.port, cfg.server.web_root};
  SnapshotCache cache;
  cache.update(lb);

  std::atomic<bool> start_requested{false};

  server.set_snapshot_provider([&cache] { return cache.get(); });
  server.set_command_handler([&](const std::string &msg) {
    handle_command(msg, cfg, runner, server, cache, start_requested);
  });

  lb.on_request_admitted([&server](const Request &r, std::size_t idx) {
    server.broadcast(request_event_to_json("admitted", r, idx).dump());
  });
  lb.on_request_rejected([&server](const Request &r, std::size_t idx) {
    server.broadcast(request_event_to_json("rejected", r, idx).dump());
  });
  lb.on_request_completed([&server](const Request &r, std::size_t idx) {
    server.broadcast(request_event_to_json("completed", r, idx).dump());
  });

  std::thread server_thread([&server]() { server.run(); });
  server_thread.detach();

  std::cout << "Open http://localhost:" << cfg.server.port
            << " in your browser and press Start.\n";

  // Tick thread: idle between runs, applying commands as they arrive.
  while (true) {
    runner.drain_commands();
    if (start_requested.exchange(false)) {
      std::cout << "[runner] started (" << runner.config().run_duration_s
                << " s)\n";
      auto summary = runner.run([&](const TickReport &report,
                                    const LoadBalancer &state) {
        cache.update(state);
        server.broadcast(tick_to_json(report, state).dump());
      });
      std::cout << "[runner] " << (summary.stopped ? "stopped" : "finished")
                << " after " << summary.ticks << " ticks\n";
      server.broadcast(nlohmann::json{{"type", "run_finished"},
                                      {"ticks", summary.ticks},
                                      {"stopped", summary.stopped}}
                           .dump());
    }
    std::this_thread::sleep_for(50ms);
  }

  return 0;
}

// ─── Batch mode ─────────────────────────────────────────────────────────

auto run_batch(LoadBalancer &lb, const SimConfig &cfg, bool show_progress)
    -> int {
  SimulationRunner runner{lb, {.run_duration_s = cfg.run_duration_s,
                               .realtime = cfg.realtime}};

  const auto total_ticks = static_cast<std::uint64_t>(
      cfg.run_duration_s * 1000.0 / static_cast<double>(cfg.tick_interval_ms));
  const auto progress_interval =
      std::max<std::uint64_t>(1, total_ticks / 20);

  auto summary = runner.run([&](const TickReport &report,
                                const LoadBalancer &state) {
    if (show_progress && report.tick % progress_interval == 0) {
      const auto pct = total_ticks > 0 ? 100 * report.tick / total_ticks : 100;
      std::cout << "\r  Progress: " << pct << "% (tick " << report.tick
                << ", rejected " << state.total_rejected() << ")"
                << std::flush;
    }
  });

  if (show_progress) {
    std::cout << "\r  Progress: 100% (tick " << summary.ticks << ")"
              << std::string(20, ' ') << '\n';
  }

  print_report(lb, summary);
  return 0;
}

} // namespace

// ─── Main ───────────────────────────────────────────────────────────────

int main(int argc, char *argv[]) {
  CliArgs args;
  try {
    args = parse_args(argc, argv);
  } catch (const std::exception &e) {
    std::cerr << "ERROR: invalid argument value (" << e.what() << ")\n";
    print_usage(argv[0]);
    return 1;
  }

  auto cfg = build_config(args);
  if (!cfg) {
    std::cerr << "ERROR: invalid configuration: " << cfg.error().message()
              << '\n';
    return 1;
  }

  auto lb = LoadBalancer::create(*cfg);
  if (!lb) {
    std::cerr << "ERROR: failed to create load balancer: "
              << lb.error().message() << '\n';
    return 1;
  }

  std::cout << "\n  Load Balancer Simulation\n"
            << "  Policy:     " << to_string(lb->policy_kind()) << '\n'
            << "  Servers:    " << cfg->server_count << '\n'
            << "  Rate:       " << cfg->arrival_rate << " req/s\n"
            << "  Duration:   " << cfg->run_duration_s << " s\n"
            << "  Tick:       " << cfg->tick_interval_ms << " ms\n";
  if (cfg->server.enabled) {
    std::cout << "  Server:     http://localhost:" << cfg->server.port << '\n';
  }
  std::cout << '\n';

  if (cfg->server.enabled) {
    try {
      return run_live(*lb, *cfg);
    } catch (const boost::system::system_error &e) {
      std::cerr << "ERROR: live server failed: " << e.what() << '\n';
      return 1;
    }
  }
  return run_batch(*lb, *cfg, args.show_progress);
}
