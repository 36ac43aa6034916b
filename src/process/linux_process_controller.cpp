#include "process/process_control.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/resource.h>
#include <sys/types.h>
#include <unistd.h>

#include "process/procfs.hpp"

namespace guardian::process {
namespace {

// The kernel truncates comm to TASK_COMM_LEN - 1 characters.
constexpr std::size_t kCommMaxLength = 15;

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::optional<std::string> read_file(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    return std::nullopt;
  }
  std::ostringstream content;
  content << input.rdbuf();
  return content.str();
}

bool name_matches(const std::string& comm, const std::string& name, const model::match_mode mode) {
  if (mode == model::match_mode::SUBSTRING) {
    return to_lower(comm).find(to_lower(name)) != std::string::npos;
  }
  if (name.size() > kCommMaxLength) {
    return comm == name.substr(0, kCommMaxLength);
  }
  return comm == name;
}

std::optional<int> parse_id(const std::string& name) noexcept {
  if (name.empty() || !std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return std::nullopt;
  }

  char* end = nullptr;
  errno = 0;
  const long value = std::strtol(name.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || value <= 0 || value > std::numeric_limits<int>::max()) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

// Numeric entries of a procfs directory in ascending order.
std::vector<int> list_ids(const std::string& dir, std::error_code& ec) {
  std::vector<int> ids;
  std::filesystem::directory_iterator it(dir, ec);
  for (const std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec)) {
    if (const auto id = parse_id(it->path().filename().string()); id.has_value()) {
      ids.push_back(*id);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

ControlStatus status_from_errno(const int error) noexcept {
  switch (error) {
    case EPERM:
    case EACCES:
      return ControlStatus::PERMISSION_DENIED;
    case ESRCH:
      return ControlStatus::PROCESS_GONE;
    default:
      return ControlStatus::FAILED;
  }
}

class LinuxProcessController final : public ProcessController {
 public:
  explicit LinuxProcessController(std::string proc_root) : proc_root_(std::move(proc_root)) {}

  std::optional<ProcessHandle> resolve(const std::string& name, const model::match_mode mode) override {
    std::error_code ec;
    const std::vector<int> pids = list_ids(proc_root_, ec);
    if (ec) {
      std::cerr << "[process] unable to scan " << proc_root_ << ": " << ec.message() << '\n';
      return std::nullopt;
    }

    const int self = static_cast<int>(::getpid());
    for (const int pid : pids) {
      if (pid == self) {
        continue;
      }

      const auto stat = read_stat(pid);
      if (!stat.has_value() || is_exited_state(stat->state)) {
        continue;
      }

      std::string comm = stat->comm;
      if (const auto comm_file = read_file(proc_root_ + "/" + std::to_string(pid) + "/comm"); comm_file.has_value()) {
        comm = *comm_file;
        while (!comm.empty() && (comm.back() == '\n' || comm.back() == '\r')) {
          comm.pop_back();
        }
      }

      if (name_matches(comm, name, mode)) {
        return ProcessHandle{pid, stat->start_time, stat->nice, comm};
      }
    }
    return std::nullopt;
  }

  ControlStatus set_priority(const ProcessHandle& handle, const model::priority_level level) override {
    const auto status = query(handle);
    if (!status.has_value()) {
      return ControlStatus::PROCESS_GONE;
    }

    // Nice is per thread: PRIO_PROCESS on the pid only reaches the main thread.
    const int wanted = model::nice_for(level, handle.original_nice);
    ControlStatus result = ControlStatus::OK;
    for (const int tid : thread_ids(handle.pid)) {
      if (const auto task = read_thread_stat(handle.pid, tid); task.has_value() && task->nice == wanted) {
        continue;
      }

      errno = 0;
      if (::setpriority(PRIO_PROCESS, static_cast<id_t>(tid), wanted) != 0) {
        const int error = errno;
        if (error == ESRCH && tid != handle.pid) {
          continue;
        }
        if (result == ControlStatus::OK) {
          result = status_from_errno(error);
        }
      }
    }
    return result;
  }

  ControlStatus suspend(const ProcessHandle& handle) override {
    const auto status = query(handle);
    if (!status.has_value()) {
      return ControlStatus::PROCESS_GONE;
    }
    if (status->suspended) {
      return ControlStatus::OK;
    }
    return signal(handle, SIGSTOP);
  }

  ControlStatus resume(const ProcessHandle& handle) override {
    const auto status = query(handle);
    if (!status.has_value()) {
      return ControlStatus::PROCESS_GONE;
    }
    // The state letter lags a SIGSTOP still in flight, so it cannot prove the
    // process is running. SIGCONT to a running process changes nothing.
    return signal(handle, SIGCONT);
  }

  bool is_alive(const ProcessHandle& handle) override { return query(handle).has_value(); }

  std::optional<ProcessStatus> query(const ProcessHandle& handle) override {
    const auto stat = read_stat(handle.pid);
    if (!stat.has_value() || stat->start_time != handle.start_time || is_exited_state(stat->state)) {
      return std::nullopt;
    }

    // Report the least-lowered thread so a thread that escaped throttling counts as drift.
    ProcessStatus status{true, is_stopped_state(stat->state), stat->nice};
    for (const int tid : thread_ids(handle.pid)) {
      if (const auto task = read_thread_stat(handle.pid, tid); task.has_value() && !is_exited_state(task->state)) {
        status.nice = std::min(status.nice, task->nice);
      }
    }
    return status;
  }

 private:
  std::optional<ProcStat> read_stat(const int pid) const {
    const auto content = read_file(proc_root_ + "/" + std::to_string(pid) + "/stat");
    if (!content.has_value()) {
      return std::nullopt;
    }
    return parse_proc_stat(*content);
  }

  // Falls back to the main thread alone when the task directory is unreadable.
  std::vector<int> thread_ids(const int pid) const {
    std::error_code ec;
    std::vector<int> tids = list_ids(proc_root_ + "/" + std::to_string(pid) + "/task", ec);
    if (tids.empty()) {
      tids.push_back(pid);
    }
    return tids;
  }

  std::optional<ProcStat> read_thread_stat(const int pid, const int tid) const {
    const auto content =
        read_file(proc_root_ + "/" + std::to_string(pid) + "/task/" + std::to_string(tid) + "/stat");
    if (!content.has_value()) {
      return tid == pid ? read_stat(pid) : std::nullopt;
    }
    return parse_proc_stat(*content);
  }

  static ControlStatus signal(const ProcessHandle& handle, const int signo) noexcept {
    if (::kill(static_cast<pid_t>(handle.pid), signo) != 0) {
      return status_from_errno(errno);
    }
    return ControlStatus::OK;
  }

  std::string proc_root_;
};

}  // namespace

const char* to_string(const ControlStatus status) noexcept {
  switch (status) {
    case ControlStatus::OK:
      return "ok";
    case ControlStatus::PERMISSION_DENIED:
      return "permission_denied";
    case ControlStatus::PROCESS_GONE:
      return "process_gone";
    case ControlStatus::FAILED:
      return "failed";
  }
  return "unknown";
}

std::unique_ptr<ProcessController> make_linux_process_controller(std::string proc_root) {
  return std::make_unique<LinuxProcessController>(std::move(proc_root));
}

std::unique_ptr<ProcessController> make_platform_process_controller() { return make_linux_process_controller(); }

}  // namespace guardian::process
