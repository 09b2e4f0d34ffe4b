/**
 * @file main.cpp
 * @brief MeshSplit CLI: split one message into numbered chunks, optionally send them.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); overlay them on an optional JSON config file.
 *  - Read the message from --text or stdin.
 *  - Run meshsplit::split_message() and print the chunks (pretty|json|raw).
 *  - With --send, pace the chunks onto a transport through meshsplit::Dispatcher:
 *      --dev PATH  → LinuxSerial (one SLIP frame per chunk)
 *      no --dev    → StreamTransport on stdout (one chunk per line)
 *
 * Exit codes:
 *  - 0 success
 *  - 1 I/O failure (stdin, serial device)
 *  - 2 usage or configuration error, including split errors
 *  - 3 the transport rejected a chunk during --send
 *
 * Errors are reported on stderr as `status=error reason=<token>`.
 */

#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <limits>
#include <string>
#include <vector>
#include <chrono>

#include <unistd.h> // isatty, usleep

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "meshsplit/config.hpp"
#include "meshsplit/dispatcher.hpp"
#include "meshsplit/message_splitter.hpp"
#include "meshsplit/segment_message.hpp"
#include "meshsplit/transport/transport_linux_serial.hpp"
#include "meshsplit/transport/transport_stream.hpp"

using json = nlohmann::json;
using namespace meshsplit;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

static uint32_t now_ms_steady32() {
  using namespace std::chrono;
  auto ms = duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
  return static_cast<uint32_t>(ms & 0xFFFFFFFFu);
}

static int fail(const std::string& reason, int code) {
  std::cerr << "status=error reason=" << reason << "\n";
  return code;
}

static const char* cut_name(CutKind k) {
  switch (k) {
    case CutKind::Tail:            return "tail";
    case CutKind::WordBoundaryCut: return "word";
    case CutKind::ForcedCut:       return "forced";
  }
  return "?";
}

static void print_plan_pretty(const HostChunkPlan& plan, const SplitLimits& limits, const Ansi& ansi) {
  std::cout << ansi.bold("PLAN") << "  chunks=" << plan.count()
            << "  total_limit=" << limits.total_limit
            << "  chunk_limit=" << limits.chunk_limit << "\n";
  std::cout << "  numbered=" << (plan.numbered ? "yes" : "no")
            << "  marker_width=" << plan.marker_width
            << "  body_budget=" << plan.body_budget
            << "  passes=" << unsigned(plan.passes)
            << "  converged=" << (plan.converged ? "yes" : "no") << "\n";
  if (plan.clipped) {
    std::cout << "  " << ansi.red("clipped") << ansi.dim(" (source longer than total_limit)") << "\n";
  }
  std::cout << "\n";
}

static void print_chunks(const HostChunkPlan& plan, const std::vector<std::string>& chunks,
                         const std::string& format, const Ansi& ansi) {
  if (format == "json") {
    json arr = json::array();
    for (size_t i = 0; i < chunks.size(); ++i) {
      json j;
      j["index"]  = i + 1;
      j["length"] = chunks[i].size();
      j["cut"]    = cut_name(plan.fragments[i].cut);
      j["text"]   = chunks[i];
      arr.push_back(j);
    }
    std::cout << arr.dump(2) << "\n";
  } else if (format == "raw") {
    for (const auto& c : chunks) std::cout << c << "\n";
  } else {
    for (size_t i = 0; i < chunks.size(); ++i) {
      std::cout << ansi.bold("#" + std::to_string(i + 1))
                << ansi.dim(" [" + std::to_string(chunks[i].size()) + ", "
                            + cut_name(plan.fragments[i].cut) + "] ")
                << chunks[i] << "\n";
    }
  }
}

// ---------- main ----------

int main(int argc, char** argv) {
  // CLI-centered options
  bool opt_print = false;
  std::string opt_format = "pretty"; // pretty|json|raw
  bool opt_no_color = false;
  std::string opt_config;

  // Split / send options; applied on top of the config file only when given.
  size_t opt_total_limit = DEFAULT_TOTAL_LIMIT;
  size_t opt_chunk_limit = DEFAULT_CHUNK_LIMIT;
  std::string opt_text;
  bool opt_send = false;
  std::string opt_dev;
  int opt_baud = 115200;
  uint32_t opt_split_delay_ms = 0;

  CLI::App app{"MeshSplit: split a message into numbered chunks for a mesh link"};

  app.add_option("--config", opt_config, "JSON config file");
  auto* o_total = app.add_option("--total-limit", opt_total_limit, "Characters kept from the message");
  auto* o_chunk = app.add_option("--chunk-limit", opt_chunk_limit, "Characters per chunk, marker included");
  auto* o_text  = app.add_option("--text", opt_text, "Message text (default: read stdin)");
  app.add_flag("--print", opt_print, "Print the resolved plan before the chunks");
  app.add_option("--format", opt_format, "Output format: pretty|json|raw")->check(CLI::IsMember({"pretty","json","raw"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_flag("--send", opt_send, "Dispatch the chunks with pacing");
  auto* o_dev   = app.add_option("--dev", opt_dev, "Serial device for --send (default: stdout)");
  auto* o_baud  = app.add_option("--baud", opt_baud, "Serial baud rate");
  auto* o_delay = app.add_option("--split-delay-ms", opt_split_delay_ms, "Delay between chunks")
                      ->check(CLI::Range(uint32_t{0}, std::numeric_limits<uint32_t>::max()));

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && (opt_format=="pretty");

  // Config file first, flags override.
  SplitterConfig cfg;
  if (!opt_config.empty()) {
    std::string err;
    if (!load_config(opt_config, cfg, err)) return fail(err, 2);
  }
  if (o_total->count()) cfg.limits.total_limit = opt_total_limit;
  if (o_chunk->count()) cfg.limits.chunk_limit = opt_chunk_limit;
  if (o_dev->count())   cfg.device = opt_dev;
  if (o_baud->count())  cfg.baud = opt_baud;
  if (o_delay->count()) cfg.pacing.split_delay_ms = opt_split_delay_ms;

  if (!is_supported_baud(cfg.baud)) return fail("bad_value:baud", 2);

  // Message text
  std::string text;
  if (o_text->count()) {
    text = opt_text;
  } else {
    text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    if (std::cin.bad()) return fail("stdin_read_failed", 1);
  }

  // Split (host plan: no chunk-count cap)
  HostChunkPlan plan;
  const SplitStatus st = split_message(text.data(), text.size(), cfg.limits, plan);
  if (st != SplitStatus::Ok) return fail(status_reason(st), 2);

  std::vector<std::string> chunks;
  render_all(plan, chunks);

  // Stream sending owns stdout; the chunk listing would duplicate it.
  const bool send_to_stdout = opt_send && cfg.device.empty();

  if (!send_to_stdout) {
    if (opt_print && opt_format=="pretty") print_plan_pretty(plan, cfg.limits, ansi);
    print_chunks(plan, chunks, opt_format, ansi);
  }

  if (!opt_send) return 0;

  // ---------- dispatch ----------
  if (cfg.limits.chunk_limit > Dispatcher::TEXT_CAP) return fail("chunk_limit_exceeds_link", 2);

  // The Dispatcher runs on the heap-free core plan, bounded by MAX_CHUNKS.
  ChunkPlan core_plan;
  const SplitStatus cst = split_message(text.data(), text.size(), cfg.limits, core_plan);
  if (cst != SplitStatus::Ok) return fail(status_reason(cst), 2);

  transport::SerialConfig tcfg;
  tcfg.mtu  = static_cast<uint16_t>(cfg.limits.chunk_limit);
  tcfg.path = cfg.device;
  tcfg.baud = cfg.baud;

  transport::StreamTransport stream(std::cout);
  transport::LinuxSerial     serial(cfg.device, cfg.baud);
  transport::ITransport&     link = send_to_stdout ? static_cast<transport::ITransport&>(stream)
                                                   : static_cast<transport::ITransport&>(serial);

  if (!link.begin(tcfg)) return fail(std::string("open_failed dev=") + cfg.device, 1);

  Dispatcher dispatcher(link, cfg.pacing);
  if (!dispatcher.load(core_plan)) {
    link.end();
    return fail("load_failed", 2);
  }

  while (!dispatcher.done() && !dispatcher.failed()) {
    dispatcher.tick(now_ms_steady32());
    ::usleep(10 * 1000);
  }
  link.end();

  if (dispatcher.failed()) {
    std::cerr << "status=error reason=send_failed link=" << link.name()
              << " sent=" << dispatcher.sent() << "/" << plan.count() << "\n";
    return 3;
  }

  std::cerr << "status=ok link=" << link.name()
            << " sent=" << dispatcher.sent()
            << " clipped=" << (plan.clipped ? 1 : 0) << "\n";
  return 0;
}
