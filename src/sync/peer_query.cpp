#include "sync/peer_query.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>
#include <utility>

#include "clock/time_service.hpp"
#include "core/log.hpp"

namespace utc_time::sync {
namespace {

constexpr std::size_t kMaxOutputBytes = 1024U * 1024U;

struct CommandOutput {
  int exit_status{-1};
  std::string output{};
};

double parse_double(const std::string& value) noexcept {
  const char* begin = value.c_str();
  char* end = nullptr;
  const double parsed = std::strtod(begin, &end);
  if (end == begin || !std::isfinite(parsed)) {
    return 0.0;
  }
  return parsed;
}

int parse_int_or(const std::string& value, const int fallback, const int base = 10) noexcept {
  int parsed = 0;
  const auto result = std::from_chars(value.data(), value.data() + value.size(), parsed, base);
  if (result.ec != std::errc{}) {
    return fallback;
  }
  return parsed;
}

std::vector<std::string> split_fields(const std::string& line) {
  std::vector<std::string> fields;
  std::istringstream stream(line);
  std::string field;
  while (stream >> field) {
    fields.push_back(field);
  }
  return fields;
}

void kill_and_reap(const pid_t pid) noexcept {
  ::kill(pid, SIGKILL);
  ::waitpid(pid, nullptr, 0);
}

CommandOutput run_with_deadline(const std::vector<std::string>& args, const std::chrono::milliseconds timeout) {
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  int pipe_fds[2]{};
  if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
    throw PeerQueryError(std::string("pipe failed: ") + std::strerror(errno));
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int saved = errno;
    ::close(pipe_fds[0]);
    ::close(pipe_fds[1]);
    throw PeerQueryError(std::string("fork failed: ") + std::strerror(saved));
  }

  if (pid == 0) {
    const int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::dup2(devnull, STDERR_FILENO);
    }
    ::dup2(pipe_fds[1], STDOUT_FILENO);
    ::execvp(argv[0], argv.data());
    ::_exit(127);
  }

  ::close(pipe_fds[1]);
  const int read_fd = pipe_fds[0];
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  CommandOutput result{};
  char chunk[4096]{};
  while (true) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      ::close(read_fd);
      kill_and_reap(pid);
      throw PeerQueryError(args.front() + " timed out after " + std::to_string(timeout.count()) + "ms");
    }

    pollfd descriptor{read_fd, POLLIN, 0};
    const int ready = ::poll(&descriptor, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int saved = errno;
      ::close(read_fd);
      kill_and_reap(pid);
      throw PeerQueryError(std::string("poll failed: ") + std::strerror(saved));
    }
    if (ready == 0) {
      continue;
    }

    const ssize_t bytes_read = ::read(read_fd, chunk, sizeof(chunk));
    if (bytes_read > 0) {
      if (result.output.size() + static_cast<std::size_t>(bytes_read) > kMaxOutputBytes) {
        ::close(read_fd);
        kill_and_reap(pid);
        throw PeerQueryError(args.front() + " produced too much output");
      }
      result.output.append(chunk, static_cast<std::size_t>(bytes_read));
      continue;
    }
    if (bytes_read == 0) {
      break;
    }
    if (errno == EINTR || errno == EAGAIN) {
      continue;
    }

    const int saved = errno;
    ::close(read_fd);
    kill_and_reap(pid);
    throw PeerQueryError(std::string("read failed: ") + std::strerror(saved));
  }
  ::close(read_fd);

  // stdout is closed; the child should exit promptly, but stay inside the budget.
  int status = 0;
  while (true) {
    const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
    if (reaped == pid) {
      break;
    }
    if (reaped < 0 && errno != EINTR) {
      throw PeerQueryError(std::string("waitpid failed: ") + std::strerror(errno));
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      kill_and_reap(pid);
      throw PeerQueryError(args.front() + " timed out after " + std::to_string(timeout.count()) + "ms");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  result.exit_status = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  return result;
}

}  // namespace

NtpqPeerQuery::NtpqPeerQuery(std::string command) : command_(std::move(command)) {}

PeerList NtpqPeerQuery::query_peers(const std::chrono::milliseconds timeout) {
  const auto started = std::chrono::steady_clock::now();
  const auto result = run_with_deadline({command_, "-p", "-n"}, timeout);
  const auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  core::log_debug("sync", command_ + " finished in " + std::to_string(elapsed.count()) + "ms");

  if (result.exit_status == 127) {
    throw PeerQueryError(command_ + " not found");
  }
  if (result.exit_status != 0) {
    throw PeerQueryError(command_ + " exited with status " + std::to_string(result.exit_status));
  }
  return parse_peer_table(result.output);
}

PeerList parse_peer_table(const std::string& text) {
  PeerList peers;
  bool header_seen = false;
  bool body_started = false;
  std::string pending_remote;
  char pending_tally = ' ';

  std::istringstream input(text);
  std::string line;
  while (std::getline(input, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (!header_seen) {
      header_seen = line.find("remote") != std::string::npos && line.find("refid") != std::string::npos;
      continue;
    }
    if (!body_started) {
      body_started = line.rfind("===", 0) == 0;
      continue;
    }
    if (line.empty()) {
      continue;
    }

    char tally = line.front();
    auto fields = split_fields(line.substr(1));

    // Long addresses push the remaining columns onto the next line.
    if (fields.size() == 1 && pending_remote.empty()) {
      pending_remote = fields.front();
      pending_tally = tally;
      continue;
    }
    if (!pending_remote.empty()) {
      if (fields.size() == 9) {
        fields.insert(fields.begin(), pending_remote);
        tally = pending_tally;
      }
      pending_remote.clear();
    }
    if (fields.size() != 10) {
      continue;
    }

    PeerInfo peer{};
    peer.tally = tally;
    peer.remote = fields[0];
    peer.refid = fields[1];
    peer.stratum = parse_int_or(fields[2], 16);
    peer.type = fields[3].empty() ? '-' : fields[3].front();
    peer.when = fields[4];
    peer.poll = parse_int_or(fields[5], 0);
    peer.reach = static_cast<std::uint16_t>(parse_int_or(fields[6], 0, 8));
    peer.delay_ms = parse_double(fields[7]);
    peer.offset_ms = parse_double(fields[8]);
    peer.jitter_ms = parse_double(fields[9]);
    peers.push_back(std::move(peer));
  }

  if (!header_seen) {
    throw PeerQueryError("unrecognized peer query output");
  }
  return peers;
}

SyncStatus status_from_peers(const PeerList& peers) {
  SyncStatus status{};
  status.available = true;
  status.source = SyncSource::kPeerQuery;
  status.sampled_at_ns = static_cast<std::uint64_t>(clock::snapshot_time().nanos_since_epoch());

  const auto selected = std::find_if(peers.begin(), peers.end(), [](const PeerInfo& peer) { return peer.selected(); });
  if (selected == peers.end()) {
    status.detail = peers.empty() ? "no peers configured" : "no system peer selected";
    return status;
  }

  status.synced = true;
  status.offset_ms = selected->offset_ms;
  status.stratum = static_cast<std::uint8_t>(std::clamp(selected->stratum + 1, 1, 16));
  status.detail = "system peer " + selected->remote;
  return status;
}

nlohmann::json to_json(const PeerInfo& peer) {
  return nlohmann::json{{"tally", std::string(1, peer.tally)},
                        {"remote", peer.remote},
                        {"refid", peer.refid},
                        {"stratum", peer.stratum},
                        {"type", std::string(1, peer.type)},
                        {"when", peer.when},
                        {"poll", peer.poll},
                        {"reach", peer.reach},
                        {"delay_ms", peer.delay_ms},
                        {"offset_ms", peer.offset_ms},
                        {"jitter_ms", peer.jitter_ms}};
}

}  // namespace utc_time::sync
