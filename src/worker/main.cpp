#include <lolite/core/config.h>
#include <lolite/engine/worker_server.h>

#include <charconv>
#include <iostream>
#include <string_view>
#include <system_error>

namespace {

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_fd_flag(const char* input, int& fd) {
  if (input == nullptr) {
    return false;
  }

  const std::string_view text(input);
  const std::string_view prefix(lolite::core::config::kWorkerFdFlag);
  if (!starts_with(text, prefix)) {
    return false;
  }

  const std::string_view digits = text.substr(prefix.size());
  int parsed = -1;
  const char* begin = digits.data();
  const char* end = begin + digits.size();
  const std::from_chars_result result = std::from_chars(begin, end, parsed);
  if (digits.empty() || result.ec != std::errc() || result.ptr != end || parsed < 0) {
    return false;
  }

  fd = parsed;
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  int fd = -1;
  if (argc != 2 || !parse_fd_flag(argv[1], fd)) {
    std::cerr << "usage: " << lolite::core::config::kWorkerExecutableName << " "
              << lolite::core::config::kWorkerFdFlag << "<fd>\n"
              << "(started by the lolite host; not meant to be run by hand)\n";
    return 2;
  }

  return lolite::engine::run_worker(fd);
}
