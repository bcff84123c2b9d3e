// File: src/apps/chunkex/main.cpp
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "cx/adapters/file/file_chunk_sink.hpp"
#include "cx/adapters/lines/lines_record_source.hpp"
#include "cx/adapters/synth/synth_record_source.hpp"
#include "cx/core/events/jsonl_event_sink.hpp"
#include "cx/core/io/record_source.hpp"
#include "cx/core/model/export_runner.hpp"
#include "cx/core/util/config_loader.hpp"

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true); }

struct Args {
  std::string config_path;
  bool help{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "chunkex\n"
            << "  --config <path>\n";
}

cx::Result<std::unique_ptr<cx::RecordSource>> make_source_from_config(const cx::Config& cfg) {
  using R = cx::Result<std::unique_ptr<cx::RecordSource>>;

  if (cfg.input.type == "synth") {
    cx::SynthSourceConfig sc;
    sc.count = cfg.input.synth.count;
    return R::ok(std::make_unique<cx::SynthRecordSource>(sc));
  }

  if (cfg.input.type == "lines") {
    cx::LinesSourceConfig lc;
    lc.path = cfg.input.lines.path;
    auto src = std::make_unique<cx::LinesRecordSource>(lc);
    const cx::Status st = src->open();
    if (!st.ok()) return R::err(st);
    return R::ok(std::move(src));
  }

  return R::err(cx::Status::invalid_argument("Unknown input.type: " + cfg.input.type));
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.config_path.empty()) {
    print_usage();
    return args.help ? 0 : 2;
  }

  auto cfg_r = cx::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return 1;
  }
  cx::Config cfg = cfg_r.take_value();

  auto source_r = make_source_from_config(cfg);
  if (!source_r.ok()) {
    std::cerr << source_r.status().message() << "\n";
    return 2;
  }
  std::unique_ptr<cx::RecordSource> source = source_r.take_value();

  // A shutdown signal becomes a stop request; the runner still closes the last chunk.
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  cx::FileChunkSinkFactory sinks;
  cx::JsonlEventSink events;
  cx::ExportRunner runner(cfg, args.config_path);

  std::cout << "Feed: " << cfg.feed.uri << "  format=" << cfg.feed.format
            << "  items_per_chunk=" << cfg.feed.items_per_chunk.value_or(0) << "\n";
  std::cout << "Input: " << source->name() << "  job=" << cfg.job.job_id << "\n\n";

  const cx::Status st = runner.run(*source, sinks, events, &g_stop);

  for (const auto& c : runner.chunks()) {
    std::cout << "chunk " << c.chunk_number << ": " << c.address << " (" << c.items
              << " items)\n";
  }
  if (!events.path().empty()) std::cout << "Events: " << events.path() << "\n";

  if (!st.ok()) {
    std::cerr << st.message() << "\n";
    return 2;
  }
  if (runner.stopped_early()) std::cout << "Stopped after " << runner.records_exported() << " records\n";
  std::cout << "OK\n";
  return 0;
}
