#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "toolrun/cache.hpp"
#include "toolrun/config.hpp"
#include "toolrun/engine.hpp"
#include "toolrun/jsonlite.hpp"
#include "toolrun/output.hpp"
#include "toolrun/timeout.hpp"
#include "toolrun/version.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

void on_interrupt(int) { g_interrupted.store(true); }

std::string arg_value(int argc, char **argv, const std::string &flag,
                      const std::string &def = "") {
  for (int i = 2; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--")
      break;
    if (std::string(argv[i]) == flag)
      return argv[i + 1];
  }
  return def;
}

bool parse_u64(const std::string &s, std::uint64_t &out) {
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
    return false;
  try {
    out = std::stoull(s);
  } catch (const std::exception &) {
    return false;
  }
  return true;
}

// --config FILE (if given), then TOOLRUN_* overrides.
toolrun::EngineConfig load_config(int argc, char **argv) {
  const std::string file = arg_value(argc, argv, "--config");
  toolrun::EngineConfig base = file.empty()
                                   ? toolrun::EngineConfig{}
                                   : toolrun::EngineConfig::from_json_file(file);
  auto cfg = toolrun::EngineConfig::from_env(std::move(base));
  const std::string cache_dir = arg_value(argc, argv, "--cache-dir");
  if (!cache_dir.empty())
    cfg.cache_dir = cache_dir;
  return cfg;
}

std::string signals_json(const toolrun::ScaleSignals &s) {
  std::ostringstream o;
  o << "{\"item_count\":" << s.item_count << ",\"dir_count\":" << s.dir_count
    << ",\"total_bytes\":" << s.total_bytes
    << ",\"complete\":" << (s.complete ? "true" : "false")
    << ",\"summary\":\"" << toolrun::jsonlite::escape(toolrun::describe(s))
    << "\"}";
  return o.str();
}

// Maps a terminal result onto a shell exit status.
int exit_status(const toolrun::ExecutionResult &r) {
  using toolrun::ErrorCode;
  using toolrun::TaskState;
  switch (r.state) {
  case TaskState::succeeded:
    return 0;
  case TaskState::timed_out:
    return 124;
  case TaskState::cancelled:
    return 130;
  default:
    break;
  }
  if (r.error_code == ErrorCode::tool_not_found)
    return 127;
  if (r.error_code == ErrorCode::spawn_failed)
    return 126;
  if (r.error_code == ErrorCode::process_failed && r.exit_code > 0)
    return r.exit_code;
  return 1;
}

int cmd_run(int argc, char **argv) {
  toolrun::CommandSpec spec;
  toolrun::RunOptions options;
  bool html = false;
  bool json = false;
  bool quiet = false;
  int i = 2;
  for (; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--") {
      ++i;
      break;
    }
    const bool has_next = i + 1 < argc;
    if (a == "--timeout" && has_next) {
      std::uint64_t s = 0;
      if (!parse_u64(argv[++i], s)) {
        std::cerr << "invalid --timeout\n";
        return 2;
      }
      spec.timeout = std::chrono::seconds(static_cast<long long>(s));
    } else if (a == "--cwd" && has_next) {
      spec.cwd = argv[++i];
    } else if (a == "--encoding" && has_next) {
      spec.encoding_hint = argv[++i];
    } else if (a == "--env" && has_next) {
      const std::string kv = argv[++i];
      const auto eq = kv.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "invalid --env, expected KEY=VALUE\n";
        return 2;
      }
      spec.env[kv.substr(0, eq)] = kv.substr(eq + 1);
    } else if (a == "--max-output" && has_next) {
      std::uint64_t n = 0;
      if (!parse_u64(argv[++i], n)) {
        std::cerr << "invalid --max-output\n";
        return 2;
      }
      spec.max_output_bytes = static_cast<std::size_t>(n);
    } else if (a == "--prescan" && has_next) {
      options.prescan_path = argv[++i];
    } else if (a == "--input" && has_next) {
      options.input_paths.push_back(argv[++i]);
    } else if (a == "--tool-version" && has_next) {
      options.tool_version = argv[++i];
    } else if (a == "--no-cache") {
      options.cacheable = false;
    } else if (a == "--html") {
      html = true;
    } else if (a == "--json") {
      json = true;
    } else if (a == "--quiet") {
      quiet = true;
    } else if ((a == "--config" || a == "--cache-dir") && has_next) {
      ++i;
    } else {
      std::cerr << "unknown option: " << a << "\n";
      return 2;
    }
  }
  for (; i < argc; ++i)
    spec.argv.emplace_back(argv[i]);
  if (spec.argv.empty()) {
    std::cerr << "usage: toolrun run [options] -- <tool> [args...]\n";
    return 2;
  }

  toolrun::Engine engine(load_config(argc, argv));
  for (const auto &note : engine.config_repairs())
    std::cerr << "config: " << note << "\n";

  toolrun::ProgressSink sink;
  if (!quiet) {
    sink = [](const toolrun::ProgressEvent &ev) {
      std::cerr << "[" << ev.task_id << "] " << ev.message << "\n";
    };
  }

  std::signal(SIGINT, on_interrupt);
  std::signal(SIGTERM, on_interrupt);

  auto handle = engine.run(spec, sink, toolrun::CancellationToken(), options);
  std::optional<toolrun::ExecutionResult> result;
  bool cancel_sent = false;
  while (!(result = engine.await_for(handle, std::chrono::milliseconds(100)))) {
    if (g_interrupted.load() && !cancel_sent) {
      engine.cancel(handle);
      cancel_sent = true;
    }
  }
  engine.flush_progress();

  const auto &r = *result;
  if (json) {
    std::cout << "{\"state\":\"" << toolrun::to_string(r.state) << "\""
              << ",\"error_code\":\"" << toolrun::to_string(r.error_code)
              << "\""
              << ",\"exit_code\":" << r.exit_code
              << ",\"duration_ms\":" << r.duration.count()
              << ",\"budget_s\":" << r.budget.count()
              << ",\"stdout_encoding\":\"" << r.stdout_encoding << "\""
              << ",\"stderr_encoding\":\"" << r.stderr_encoding << "\""
              << ",\"converted\":" << (r.converted ? "true" : "false")
              << ",\"from_cache\":" << (r.from_cache ? "true" : "false")
              << ",\"fingerprint\":\"" << r.fingerprint << "\""
              << ",\"stdout\":\"" << toolrun::jsonlite::escape(r.stdout_text)
              << "\""
              << ",\"stderr\":\"" << toolrun::jsonlite::escape(r.stderr_text)
              << "\""
              << ",\"status\":\""
              << toolrun::jsonlite::escape(toolrun::status_line(r)) << "\"}\n";
  } else {
    std::cout << (html ? r.rendered : toolrun::strip_escapes(r.stdout_text));
    if (!r.ok() && !r.stderr_text.empty())
      std::cerr << r.stderr_text;
    std::cerr << toolrun::status_line(r) << "\n";
  }
  return exit_status(r);
}

int cmd_estimate(int argc, char **argv) {
  toolrun::EngineConfig cfg = load_config(argc, argv);
  cfg.validate();
  toolrun::ScaleSignals signals;
  const std::string path = arg_value(argc, argv, "--path");
  if (!path.empty()) {
    signals = toolrun::prescan(
        path, std::chrono::duration_cast<std::chrono::milliseconds>(
                  cfg.prescan_time_box));
  } else {
    std::uint64_t gib = 0;
    if (!parse_u64(arg_value(argc, argv, "--items", "0"), signals.item_count) ||
        !parse_u64(arg_value(argc, argv, "--bytes", "0"), signals.total_bytes) ||
        !parse_u64(arg_value(argc, argv, "--gib", "0"), gib)) {
      std::cerr << "usage: toolrun estimate --items N [--bytes B | --gib G] | "
                   "--path DIR\n";
      return 2;
    }
    if (gib > 0)
      signals.total_bytes = gib * toolrun::kBytesPerGiB;
  }
  const auto est = toolrun::estimate(signals, cfg.timeout);
  std::cout << "{\"budget_s\":" << est.budget.count()
            << ",\"possibly_underestimated\":"
            << (est.possibly_underestimated ? "true" : "false")
            << ",\"signals\":" << signals_json(signals) << "}\n";
  return 0;
}

int cmd_scan(int argc, char **argv) {
  std::string path = arg_value(argc, argv, "--path");
  if (path.empty() && argc > 2 && std::string(argv[2]).rfind("--", 0) != 0)
    path = argv[2];
  if (path.empty()) {
    std::cerr << "usage: toolrun scan <dir>\n";
    return 2;
  }
  toolrun::EngineConfig cfg = load_config(argc, argv);
  cfg.validate();
  const auto signals = toolrun::prescan(
      path,
      std::chrono::duration_cast<std::chrono::milliseconds>(cfg.prescan_time_box));
  std::cout << signals_json(signals) << "\n";
  return 0;
}

int cmd_probe(int argc, char **argv) {
  if (argc < 3) {
    std::cerr << "usage: toolrun probe <tool>\n";
    return 2;
  }
  const auto p = toolrun::probe_tool(argv[2]);
  std::cout << "{\"tool\":\"" << toolrun::jsonlite::escape(argv[2]) << "\""
            << ",\"available\":" << (p.available ? "true" : "false")
            << ",\"path\":\"" << toolrun::jsonlite::escape(p.path) << "\""
            << ",\"version\":\"" << toolrun::jsonlite::escape(p.version)
            << "\"}\n";
  return p.available ? 0 : 1;
}

int cmd_cache(int argc, char **argv) {
  const std::string sub = argc > 2 ? argv[2] : "";
  toolrun::EngineConfig cfg = load_config(argc, argv);
  cfg.validate();
  if (cfg.cache_dir.empty()) {
    std::cerr << "no cache directory (set TOOLRUN_CACHE_DIR or --cache-dir)\n";
    return 2;
  }
  toolrun::ResultCache::Options opts;
  opts.dir = cfg.cache_dir;
  opts.max_bytes = cfg.cache_max_bytes;
  opts.default_ttl = cfg.cache_ttl;
  opts.compression = cfg.cache_compression;
  toolrun::ResultCache cache(opts);

  if (sub == "stats") {
    std::uint64_t records = 0;
    std::uint64_t bytes = 0;
    std::error_code ec;
    namespace fs = std::filesystem;
    for (auto it = fs::recursive_directory_iterator(cfg.cache_dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (!it->is_regular_file(ec))
        continue;
      if (it->path().extension() == ".rec")
        ++records;
      bytes += it->file_size(ec);
    }
    std::cout << "{\"dir\":\"" << toolrun::jsonlite::escape(cfg.cache_dir)
              << "\",\"records\":" << records << ",\"bytes\":" << bytes
              << "}\n";
    return 0;
  }
  if (sub == "prune") {
    std::cout << "{\"pruned\":" << cache.prune_expired() << "}\n";
    return 0;
  }
  if (sub == "clear") {
    cache.clear();
    std::cout << "{\"cleared\":true}\n";
    return 0;
  }
  std::cerr << "usage: toolrun cache stats|prune|clear [--cache-dir DIR]\n";
  return 2;
}

int cmd_config(int argc, char **argv) {
  toolrun::EngineConfig cfg = load_config(argc, argv);
  const auto repairs = cfg.validate();
  std::cout << "{\"config\":" << cfg.to_json() << ",\"repairs\":[";
  for (std::size_t i = 0; i < repairs.size(); ++i) {
    if (i)
      std::cout << ",";
    std::cout << "\"" << toolrun::jsonlite::escape(repairs[i]) << "\"";
  }
  std::cout << "]}\n";
  return 0;
}

void usage() {
  std::cerr
      << "usage: toolrun <command> [options]\n"
         "  run [--timeout S] [--cwd DIR] [--encoding ENC] [--env K=V]\n"
         "      [--prescan DIR] [--input FILE] [--tool-version V] [--no-cache]\n"
         "      [--max-output BYTES] [--html|--json] [--quiet] -- <tool> "
         "[args...]\n"
         "  estimate --items N [--bytes B | --gib G] | --path DIR\n"
         "  scan <dir>\n"
         "  probe <tool>\n"
         "  cache stats|prune|clear [--cache-dir DIR]\n"
         "  config [--config FILE]\n"
         "  version\n";
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 2;
  }
  const std::string cmd = argv[1];

  if (cmd == "version") {
    std::cout << toolrun::version::manifest_json() << "\n";
    return 0;
  }
  if (cmd == "run")
    return cmd_run(argc, argv);
  if (cmd == "estimate")
    return cmd_estimate(argc, argv);
  if (cmd == "scan")
    return cmd_scan(argc, argv);
  if (cmd == "probe")
    return cmd_probe(argc, argv);
  if (cmd == "cache")
    return cmd_cache(argc, argv);
  if (cmd == "config")
    return cmd_config(argc, argv);

  usage();
  return 2;
}
