#include <lolite/core/config.h>
#include <lolite/engine/registry.h>

#include <atomic>
#include <charconv>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace {

constexpr const char kProgramName[] = "lolite_demo";

constexpr const char kSampleStylesheet[] =
    ".blue-bg { background-color: #7777FF; margin: 10px; padding: 10px; }\n"
    ".red-bg { background-color: #FF7777; }\n";

struct SampleNode {
  lolite::dom::NodeId id;
  const char* text;
  const char* class_name;
};

constexpr SampleNode kSampleNodes[] = {
    {1, "Hello, World!", "blue-bg"},
    {2, "Welcome to lolite!", "red-bg"},
};

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName << " [--worker] [--css FILE] [--frames N]\n";
}

bool parse_positive_int(const char* input, int& value) {
  if (input == nullptr) {
    return false;
  }

  const std::string_view text(input);
  int parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const std::from_chars_result result = std::from_chars(begin, end, parsed);
  if (text.empty() || result.ec != std::errc() || result.ptr != end || parsed <= 0) {
    return false;
  }

  value = parsed;
  return true;
}

bool read_file(const std::string& path, std::string& contents) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  contents = buffer.str();
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  bool use_worker = false;
  std::string css_path;
  int frames = 1;

  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
    if (argument == "-h" || argument == "--help") {
      print_usage(std::cout);
      return 0;
    }
    if (argument == "--worker") {
      use_worker = true;
      continue;
    }
    if (argument == "--css" && index + 1 < argc) {
      css_path = argv[++index];
      continue;
    }
    if (argument == "--frames" && index + 1 < argc) {
      if (!parse_positive_int(argv[++index], frames)) {
        std::cerr << "Invalid --frames: " << argv[index] << "\n";
        print_usage(std::cerr);
        return 1;
      }
      continue;
    }
    std::cerr << "Unknown argument: " << argument << "\n";
    print_usage(std::cerr);
    return 1;
  }

  std::string stylesheet = kSampleStylesheet;
  if (!css_path.empty() && !read_file(css_path, stylesheet)) {
    std::cerr << "Cannot read stylesheet: " << css_path << "\n";
    return 1;
  }

  lolite::engine::Registry registry;
  const lolite::engine::Handle engine = registry.init(!use_worker);
  if (engine == 0) {
    std::cerr << lolite::core::describe(registry.last_error()) << "\n";
    return 1;
  }

  const lolite::css::StylesheetResult sheet = registry.add_stylesheet(engine, stylesheet);
  for (const auto& issue : sheet.issues) {
    std::cerr << "css:" << issue.line << ":" << issue.column << ": " << issue.message << "\n";
  }
  if (!sheet.ok()) {
    std::cerr << lolite::core::describe(sheet.status) << "\n";
    registry.destroy(engine);
    return 1;
  }

  const lolite::dom::NodeId root = registry.root_id(engine);
  for (const SampleNode& node : kSampleNodes) {
    if (registry.create_node(engine, node.id, std::string(node.text)) == 0 ||
        !registry.set_parent(engine, root, node.id).ok() ||
        !registry.set_attribute(engine, node.id, "class", node.class_name).ok()) {
      std::cerr << lolite::core::describe(registry.last_error(engine)) << "\n";
      registry.destroy(engine);
      return 1;
    }
  }

  // Each frame after the first is provoked by touching node 1 again.
  std::atomic<int> remaining{frames};
  const lolite::core::Status sink_status =
      registry.set_frame_sink(engine, [&](const lolite::engine::StyleFrame& frame) {
        for (const auto& [id, style] : frame.styles) {
          std::cout << "frame " << frame.sequence << " node " << id
                    << " background-color: " << style.value("background-color") << "\n";
        }
        lolite::core::Status status;
        if (--remaining <= 0) {
          status = registry.request_stop(engine);
        } else {
          status = registry.set_attribute(engine, 1, "data-frame", std::to_string(frame.sequence));
        }
        if (!status.ok()) {
          throw std::runtime_error(lolite::core::describe(status));
        }
      });
  if (!sink_status.ok()) {
    std::cerr << lolite::core::describe(sink_status) << "\n";
    registry.destroy(engine);
    return 1;
  }

  const int run_result = registry.run(engine);
  if (run_result != 0) {
    std::cerr << lolite::core::describe(registry.last_error(engine)) << "\n";
  }

  if (registry.contains(engine)) {
    registry.destroy(engine);
  }
  return run_result == 0 ? 0 : 1;
}
