#include "process/procfs.hpp"

#include <cerrno>
#include <cstdlib>
#include <string>

namespace guardian::process {

std::optional<ProcStat> parse_proc_stat(const std::string& content) {
  const auto lp = content.find('(');
  const auto rp = content.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp || rp + 2 >= content.size()) {
    return std::nullopt;
  }

  ProcStat stat{};
  char* end = nullptr;
  errno = 0;
  const long pid = std::strtol(content.c_str(), &end, 10);
  if (errno != 0 || end == content.c_str() || pid <= 0) {
    return std::nullopt;
  }
  stat.pid = static_cast<int>(pid);
  stat.comm = content.substr(lp + 1, rp - lp - 1);

  // Field 3 (state) follows ") "; nice is field 19, starttime is field 22.
  const char* cursor = content.c_str() + rp + 2;
  stat.state = *cursor;
  ++cursor;

  for (int field = 4; field <= 22; ++field) {
    while (*cursor == ' ') {
      ++cursor;
    }
    if (*cursor == '\0' || *cursor == '\n') {
      return std::nullopt;
    }

    errno = 0;
    const long long value = std::strtoll(cursor, &end, 10);
    if (errno != 0 || end == cursor) {
      return std::nullopt;
    }
    cursor = end;

    if (field == 19) {
      stat.nice = static_cast<int>(value);
    } else if (field == 22) {
      stat.start_time = static_cast<std::uint64_t>(value);
    }
  }

  return stat;
}

}  // namespace guardian::process
