/**
 * labelscan-cli: parse shipping-label OCR text into structured addresses, or
 * replay a recorded frame script through a scan session.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/labelscan_cli [--config path] [--input file]... [--frames script] [--validate-mock]
 * With --input: also writes each record to output/<basename>.txt (same content as terminal).
 */

#include <labelscan/app/batch_parser.hpp>
#include <labelscan/app/batch_parser_tbb.hpp>
#include <labelscan/app/config.hpp>
#include <labelscan/app/mock_validation_client.hpp>
#include <labelscan/app/scan_session.hpp>
#include <labelscan/core/geometry.hpp>
#include <labelscan/core/logging.hpp>
#include <labelscan/core/parsed_address.hpp>
#include <labelscan/text/address_parser.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr auto kFrameInterval = std::chrono::milliseconds(100);

std::string format_record(const labelscan::core::ParsedAddress& a) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2);
  out << "confidence=" << a.confidence << (labelscan::core::is_addressable(a) ? "" : " (not addressable)")
      << "\n";
  auto field = [&out](const char* name, const std::string& value) {
    if (!value.empty()) out << "  " << name << ": " << value << "\n";
  };
  field("first_name", a.first_name);
  field("last_name", a.last_name);
  field("company", a.company_name);
  field("street", a.street);
  field("annex", a.address_annex);
  field("postal_code", a.postal_code);
  field("city", a.city);
  field("phone", a.phone_number);
  field("full_address", a.full_address);
  return out.str();
}

std::string format_rect(const labelscan::core::Rect& r) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << "(" << r.x << "," << r.y << " " << r.width << "x"
      << r.height << ")";
  return out.str();
}

std::optional<std::string> read_file(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return std::nullopt;
  std::ostringstream buf;
  buf << f.rdbuf();
  return buf.str();
}

void write_output(const std::string& input_path, const std::string& text) {
  std::filesystem::path p(input_path);
  std::filesystem::path out_dir("output");
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  std::filesystem::path out_file = out_dir / (p.stem().string() + ".txt");
  std::ofstream f(out_file);
  if (f) {
    f << text;
  } else {
    std::cerr << "Warning: could not write " << out_file << "\n";
  }
}

int parse_inputs(const std::vector<std::string>& input_paths) {
  std::vector<std::string> texts;
  std::vector<std::string> paths;
  for (const auto& path : input_paths) {
    auto content = read_file(path);
    if (!content) {
      std::cerr << "Failed to read input: " << path << "\n";
      return 1;
    }
    texts.push_back(std::move(*content));
    paths.push_back(path);
  }

  std::vector<std::string> rendered(texts.size());
  const labelscan::text::AddressParser parser;
#ifdef LABELSCAN_HAS_TBB
  std::vector<std::pair<std::string, std::string>> items;
  for (std::size_t i = 0; i < texts.size(); ++i) {
    items.emplace_back(std::to_string(i), texts[i]);
  }
  labelscan::app::run_parse_batch_tbb(
      parser, items,
      [&rendered](const labelscan::core::ParsedAddress& a, const std::string& source_id) {
        rendered[std::stoul(source_id)] = format_record(a);
      });
#else
  labelscan::app::run_parse_batch_parallel(
      parser, texts, [&rendered](std::size_t i, const labelscan::core::ParsedAddress& a) {
        rendered[i] = format_record(a);
      });
#endif

  for (std::size_t i = 0; i < paths.size(); ++i) {
    std::cout << "== " << paths[i] << "\n" << rendered[i];
    write_output(paths[i], rendered[i]);
  }
  return 0;
}

/// Frame script: "frame W H", then "block x y w h text" lines, then "end".
/// "tap x y" and "clear_tap" apply to the next frame. '#' starts a comment line.
int replay_frames(const std::string& script_path, const labelscan::app::ScannerConfig& cfg,
                  bool validate_mock) {
  std::ifstream script(script_path);
  if (!script) {
    std::cerr << "Failed to read frame script: " << script_path << "\n";
    return 1;
  }

  auto client = std::make_shared<labelscan::app::MockValidationClient>();
  if (validate_mock) {
    labelscan::app::ValidationResponse response;
    response.is_valid = true;
    response.confidence = 0.9f;
    response.source = "mock";
    client->set_response(response);
  } else {
    client->set_failure({labelscan::core::ValidationErrorKind::Network, "no validation service"});
  }
  labelscan::app::ScanSession session(cfg, client);

  auto now = labelscan::app::ScanSession::Clock::now();
  labelscan::core::RawObservation frame;
  bool in_frame = false;
  std::size_t frame_index = 0;
  std::size_t line_no = 0;
  std::string line;
  while (std::getline(script, line)) {
    ++line_no;
    std::istringstream in(line);
    std::string cmd;
    if (!(in >> cmd) || cmd[0] == '#') continue;

    if (cmd == "frame") {
      frame = {};
      in_frame = static_cast<bool>(in >> frame.frame_width >> frame.frame_height);
      if (!in_frame) std::cerr << script_path << ":" << line_no << ": bad frame header\n";
    } else if (cmd == "block" && in_frame) {
      labelscan::core::Rect r;
      if (!(in >> r.x >> r.y >> r.width >> r.height)) {
        std::cerr << script_path << ":" << line_no << ": bad block\n";
        continue;
      }
      std::string text;
      std::getline(in >> std::ws, text);
      frame.blocks.push_back({text, r});
    } else if (cmd == "end" && in_frame) {
      in_frame = false;
      now += kFrameInterval;
      const auto update = session.process_frame(frame, now);
      std::cout << "frame " << frame_index++ << " phase=" << labelscan::vision::to_string(update.stability.phase)
                << " roi=" << (update.tracker.roi ? format_rect(*update.tracker.roi) : "none")
                << " status=" << labelscan::app::to_string(update.status) << "\n";
      if (update.parsed) std::cout << format_record(*update.parsed);
    } else if (cmd == "tap") {
      labelscan::core::Point p;
      if (in >> p.x >> p.y) session.set_tap_point(p);
    } else if (cmd == "clear_tap") {
      session.clear_tap_point();
    } else {
      std::cerr << script_path << ":" << line_no << ": ignored '" << cmd << "'\n";
    }
  }

  if (auto parsed = session.flush(now)) std::cout << "late parse\n" << format_record(*parsed);
  now += cfg.validation.debounce + kFrameInterval;
  const auto status = session.poll(now);

  std::cout << "final status=" << labelscan::app::to_string(status) << "\n";
  if (const auto record = session.validator().final_record()) {
    std::cout << format_record(*record);
  } else {
    std::cout << "no address locked\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> input_paths;
  std::string frames_path;
  std::string log_level;
  bool validate_mock = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_paths.emplace_back(argv[++i]);
    } else if (arg == "--frames" && i + 1 < argc) {
      frames_path = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else if (arg == "--validate-mock") {
      validate_mock = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: labelscan_cli [options]\n"
                << "  --config <path>     Scanner config (key=value file); default: built-in\n"
                << "  --input <path>      Label text file to parse (repeatable)\n"
                << "  --frames <path>     Replay a frame script through a scan session\n"
                << "  --validate-mock     Accept every validation request (mock server)\n"
                << "  --log-level <name>  trace | debug | info | warn | error | off\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  const labelscan::app::ScannerConfig cfg = config_path.empty()
                                                ? labelscan::app::default_config()
                                                : labelscan::app::load_config(config_path);
  const std::string level = log_level.empty() ? cfg.log_level : log_level;
  if (!labelscan::core::set_log_level(level)) {
    std::cerr << "Unknown log level " << level << "\n";
    return 1;
  }

  if (input_paths.empty() && frames_path.empty()) {
    std::cerr << "Nothing to do: pass --input or --frames (see --help)\n";
    return 1;
  }
  if (!input_paths.empty()) {
    if (const int rc = parse_inputs(input_paths); rc != 0) return rc;
  }
  if (!frames_path.empty()) {
    return replay_frames(frames_path, cfg, validate_mock);
  }
  return 0;
}
