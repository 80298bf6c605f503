#include "layercast/core/config.h"
#include "layercast/core/diagnostics.h"
#include "layercast/core/file_io.h"
#include "layercast/dom/rendered_node.h"
#include "layercast/extract/extractor.h"
#include "layercast/extract/image_resolver.h"
#include "layercast/ir/ir_json.h"
#include "layercast/materialize/materializer.h"
#include "layercast/materialize/progress.h"
#include "layercast/scene/memory_host.h"

#include <charconv>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

constexpr const char kProgramName[] = "layercast";

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName
         << " extract <snapshot.json[.gz]> [design.json[.gz]] [--size=WIDTHxHEIGHT]"
            " [--base-dir=DIR] [--no-images] [--no-pseudo]\n"
         << "       " << kProgramName
         << " materialize <design.json[.gz]> [scene.json] [--fonts=Family:Style,...]\n"
         << "       " << kProgramName << " --help | --version\n"
         << "common options: --quiet, --verbose\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_positive_int(std::string_view text, int& value) {
  if (text.empty()) {
    return false;
  }

  int parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const std::from_chars_result result = std::from_chars(begin, end, parsed);
  if (result.ec != std::errc() || result.ptr != end || parsed <= 0) {
    return false;
  }

  value = parsed;
  return true;
}

bool parse_size_value(std::string_view dimensions, int& width, int& height) {
  const std::size_t separator = dimensions.find('x');
  if (separator == std::string_view::npos || separator == 0 || separator + 1 >= dimensions.size()) {
    return false;
  }
  if (dimensions.find('x', separator + 1) != std::string_view::npos) {
    return false;
  }

  int parsed_width = 0;
  int parsed_height = 0;
  if (!parse_positive_int(dimensions.substr(0, separator), parsed_width) ||
      !parse_positive_int(dimensions.substr(separator + 1), parsed_height)) {
    return false;
  }

  width = parsed_width;
  height = parsed_height;
  return true;
}

// "Inter:Bold,Georgia:Regular"
bool parse_font_list(std::string_view text, std::vector<layercast::scene::FontName>& fonts) {
  while (!text.empty()) {
    const std::size_t comma = text.find(',');
    const std::string_view entry = text.substr(0, comma);
    const std::size_t colon = entry.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 >= entry.size()) {
      return false;
    }
    fonts.push_back({std::string(entry.substr(0, colon)), std::string(entry.substr(colon + 1))});
    if (comma == std::string_view::npos) {
      break;
    }
    text.remove_prefix(comma + 1);
  }
  return !fonts.empty();
}

std::string directory_of(const std::string& path) {
  const std::size_t slash = path.find_last_of('/');
  if (slash == std::string::npos) {
    return ".";
  }
  if (slash == 0) {
    return "/";
  }
  return path.substr(0, slash);
}

struct CommandLine {
  std::string command;
  std::vector<std::string> positional;
  bool has_size = false;
  int width = static_cast<int>(layercast::core::config::kDefaultViewportWidth);
  int height = static_cast<int>(layercast::core::config::kDefaultViewportHeight);
  std::string base_dir;
  bool fetch_images = true;
  bool capture_pseudo = true;
  std::vector<layercast::scene::FontName> extra_fonts;
  layercast::core::Severity min_severity = layercast::core::Severity::Warning;
};

bool parse_command_line(int argc, char** argv, CommandLine& cli) {
  cli.command = argv[1];
  for (int index = 2; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");

    if (argument == "--size" || starts_with(argument, "--size=")) {
      if (cli.has_size) {
        std::cerr << "Invalid --size: duplicate flag '" << argument << "'\n";
        return false;
      }
      if (!starts_with(argument, "--size=") ||
          !parse_size_value(argument.substr(7), cli.width, cli.height)) {
        std::cerr << "Invalid --size: '" << argument
                  << "' (expected --size=WIDTHxHEIGHT with positive integers)\n";
        return false;
      }
      cli.has_size = true;
    } else if (starts_with(argument, "--base-dir=")) {
      cli.base_dir = std::string(argument.substr(11));
      if (cli.base_dir.empty()) {
        std::cerr << "Invalid --base-dir: empty directory\n";
        return false;
      }
    } else if (starts_with(argument, "--fonts=")) {
      if (!parse_font_list(argument.substr(8), cli.extra_fonts)) {
        std::cerr << "Invalid --fonts: '" << argument
                  << "' (expected --fonts=Family:Style,...)\n";
        return false;
      }
    } else if (argument == "--no-images") {
      cli.fetch_images = false;
    } else if (argument == "--no-pseudo") {
      cli.capture_pseudo = false;
    } else if (argument == "--quiet") {
      cli.min_severity = layercast::core::Severity::Error;
    } else if (argument == "--verbose") {
      cli.min_severity = layercast::core::Severity::Info;
    } else if (starts_with(argument, "--")) {
      std::cerr << "Unknown option: " << argument << "\n";
      return false;
    } else {
      cli.positional.emplace_back(argument);
    }
  }

  if (cli.positional.empty() || cli.positional.size() > 2) {
    return false;
  }
  return true;
}

int run_extract(const CommandLine& cli, layercast::core::DiagnosticEmitter& diagnostics) {
  if (!cli.extra_fonts.empty()) {
    std::cerr << "--fonts only applies to materialize\n";
    return 1;
  }

  const std::string& input_path = cli.positional[0];
  const std::string output_path =
      cli.positional.size() >= 2 ? cli.positional[1] : layercast::core::config::kDefaultDesignPath;

  const layercast::core::FileReadResult input = layercast::core::read_document_file(input_path);
  if (!input.ok) {
    std::cerr << input.error << "\n";
    return 1;
  }

  const layercast::dom::SnapshotLoadResult snapshot = layercast::dom::load_snapshot(input.contents);
  for (const auto& warning : snapshot.warnings) {
    diagnostics.warning("snapshot", "load", warning);
  }
  if (!snapshot.ok) {
    std::cerr << "Invalid snapshot: " << snapshot.error << "\n";
    return 1;
  }

  layercast::extract::ExtractOptions options;
  options.fallback_viewport_width = static_cast<float>(cli.width);
  options.fallback_viewport_height = static_cast<float>(cli.height);
  options.capture_pseudo_elements = cli.capture_pseudo;

  layercast::extract::ExtractResult result =
      layercast::extract::extract_document(snapshot.document, options, &diagnostics);
  if (!result.ok) {
    std::cerr << result.message << "\n";
    return 1;
  }

  if (cli.fetch_images) {
    layercast::extract::LocalImageResolver resolver(
        cli.base_dir.empty() ? directory_of(input_path) : cli.base_dir);
    layercast::extract::resolve_images(result, resolver, &diagnostics);
  }

  std::string error;
  if (!layercast::core::write_document_file(
          output_path, layercast::ir::serialize_document(result.document), error)) {
    std::cerr << error << "\n";
    return 1;
  }

  std::cout << result.stats.node_count << " nodes, " << result.stats.resolved_images
            << " images -> " << output_path << "\n";
  return 0;
}

int run_materialize(const CommandLine& cli, layercast::core::DiagnosticEmitter& diagnostics) {
  if (cli.has_size || !cli.base_dir.empty() || !cli.fetch_images || !cli.capture_pseudo) {
    std::cerr << "--size, --base-dir, --no-images and --no-pseudo only apply to extract\n";
    return 1;
  }

  const std::string& input_path = cli.positional[0];
  const std::string output_path =
      cli.positional.size() >= 2 ? cli.positional[1] : layercast::core::config::kDefaultScenePath;

  const layercast::core::FileReadResult input = layercast::core::read_document_file(input_path);
  if (!input.ok) {
    std::cerr << input.error << "\n";
    return 1;
  }

  const layercast::ir::DocumentParseResult parsed = layercast::ir::parse_document(input.contents);
  for (const auto& warning : parsed.warnings) {
    diagnostics.warning("ir", "parse", warning);
  }
  if (!parsed.ok) {
    std::cerr << parsed.error << "\n";
    return 1;
  }

  layercast::scene::MemoryHost host;
  for (const auto& font : cli.extra_fonts) {
    host.add_font(font);
  }

  const bool show_progress = cli.min_severity == layercast::core::Severity::Info;
  layercast::materialize::CallbackProgressReporter progress(
      [show_progress](const layercast::materialize::ProgressEvent& event) {
        if (event.is_error) {
          std::cerr << event.message << "\n";
        } else if (show_progress) {
          std::cerr << "[" << static_cast<int>(event.fraction * 100.0f) << "%] " << event.message
                    << "\n";
        }
      });

  const layercast::materialize::MaterializeResult result =
      layercast::materialize::materialize_document(parsed.document, host, {}, &progress,
                                                   &diagnostics);
  if (!result.ok) {
    std::cerr << result.message << "\n";
    return 1;
  }

  std::string error;
  if (!layercast::core::write_document_file(output_path, host.dump(), error)) {
    std::cerr << error << "\n";
    return 1;
  }

  std::cout << result.message << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2 && argv[1] != nullptr && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return 0;
  }
  if (argc == 2 && argv[1] != nullptr && is_version_flag(argv[1])) {
    std::cout << layercast::core::config::kVersionString << "\n";
    return 0;
  }

  if (argc < 3 || argv[1] == nullptr) {
    print_usage(std::cerr);
    return 1;
  }

  CommandLine cli;
  if (!parse_command_line(argc, argv, cli)) {
    print_usage(std::cerr);
    return 1;
  }

  layercast::core::DiagnosticEmitter diagnostics;
  diagnostics.set_min_severity(cli.min_severity);
  diagnostics.add_observer(layercast::core::stream_observer(std::cerr));

  if (cli.command == "extract") {
    return run_extract(cli, diagnostics);
  }
  if (cli.command == "materialize") {
    return run_materialize(cli, diagnostics);
  }

  std::cerr << "Unknown command: " << cli.command << "\n";
  print_usage(std::cerr);
  return 1;
}
