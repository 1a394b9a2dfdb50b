#include "bluxguard/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <thread>

extern char** environ;

namespace bluxguard {

namespace {

// Owns both ends of a pipe; either end may be released early.
struct Pipe {
  int read_end{-1};
  int write_end{-1};

  Pipe() = default;
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;
  ~Pipe() {
    close_read();
    close_write();
  }

  bool open() {
    // Close-on-exec so children forked by concurrent calls never inherit
    // this call's write ends; dup2 clears the flag on the child's stdio.
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) return false;
    read_end = fds[0];
    write_end = fds[1];
    return true;
  }
  void close_read() {
    if (read_end >= 0) ::close(read_end);
    read_end = -1;
  }
  void close_write() {
    if (write_end >= 0) ::close(write_end);
    write_end = -1;
  }
};

// Captured output of one child stream, capped at `limit` bytes. Bytes past
// the cap are read and discarded so the child never blocks on a full pipe.
struct Capture {
  Pipe pipe;
  std::string* text{nullptr};
  bool* truncated{nullptr};

  // Returns false once the stream reaches EOF or fails.
  bool pump(std::size_t limit) {
    char chunk[1024];
    const ssize_t n = ::read(pipe.read_end, chunk, sizeof(chunk));
    if (n < 0 && (errno == EAGAIN || errno == EINTR)) return true;
    if (n <= 0) {
      pipe.close_read();
      return false;
    }
    const auto got = static_cast<std::size_t>(n);
    const std::size_t room = text->size() < limit ? limit - text->size() : 0;
    if (got > room) *truncated = true;
    text->append(chunk, got < room ? got : room);
    return true;
  }
};

int decode_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

}  // namespace

std::optional<std::string> resolve_executable(const std::string& name) {
  if (name.empty()) return std::nullopt;
  auto runnable = [](const std::string& p) { return ::access(p.c_str(), X_OK) == 0; };
  if (name.find('/') != std::string::npos) {
    return runnable(name) ? std::optional<std::string>(name) : std::nullopt;
  }
  const char* path_env = std::getenv("PATH");
  const std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
  std::size_t begin = 0;
  for (;;) {
    const std::size_t end = search.find(':', begin);
    std::string dir = search.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
    if (dir.empty()) dir = ".";
    std::string candidate = dir + "/" + name;
    if (runnable(candidate)) return candidate;
    if (end == std::string::npos) return std::nullopt;
    begin = end + 1;
  }
}

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult out;
  auto spawn_error = [&out](std::string message, int exit_code) {
    out.error = ErrorCode::spawn_failed;
    out.error_message = std::move(message);
    out.exit_code = exit_code;
    return out;
  };

  const auto exe = resolve_executable(spec.command);
  if (!exe) return spawn_error("executable not found: " + spec.command, 127);

  Capture streams[2];
  streams[0].text = &out.stdout_text;
  streams[0].truncated = &out.stdout_truncated;
  streams[1].text = &out.stderr_text;
  streams[1].truncated = &out.stderr_truncated;
  if (!streams[0].pipe.open() || !streams[1].pipe.open()) return spawn_error("pipe failed", -1);

  // Everything the child needs is prepared before fork.
  std::vector<std::string> args;
  args.reserve(spec.argv.size() + 1);
  args.push_back(*exe);
  args.insert(args.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> child_argv;
  for (auto& a : args) child_argv.push_back(a.data());
  child_argv.push_back(nullptr);
  const char* child_cwd = spec.cwd.empty() ? nullptr : spec.cwd.c_str();

  const pid_t child = ::fork();
  if (child < 0) return spawn_error("fork failed", -1);

  if (child == 0) {
    // New process group so a timeout kill reaches grandchildren too.
    ::setsid();
    ::dup2(streams[0].pipe.write_end, STDOUT_FILENO);
    ::dup2(streams[1].pipe.write_end, STDERR_FILENO);
    for (auto& s : streams) {
      ::close(s.pipe.read_end);
      ::close(s.pipe.write_end);
    }
    if (child_cwd && ::chdir(child_cwd) != 0) ::_exit(127);
    ::execve(child_argv[0], child_argv.data(), environ);
    ::_exit(127);
  }

  for (auto& s : streams) {
    s.pipe.close_write();
    ::fcntl(s.pipe.read_end, F_SETFL, O_NONBLOCK);
  }

  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::chrono::milliseconds(spec.timeout_ms);
  int open_streams = 2;
  while (open_streams > 0) {
    const auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
    if (left <= 0) {
      out.timed_out = true;
      break;
    }
    pollfd fds[2];
    nfds_t count = 0;
    Capture* owners[2];
    for (auto& s : streams) {
      if (s.pipe.read_end < 0) continue;
      fds[count] = pollfd{s.pipe.read_end, POLLIN, 0};
      owners[count++] = &s;
    }
    const int ready = ::poll(fds, count, static_cast<int>(left));
    if (ready < 0 && errno != EINTR) break;
    for (nfds_t k = 0; k < count && ready > 0; ++k) {
      if (fds[k].revents == 0) continue;
      if (!owners[k]->pump(spec.max_output_bytes)) --open_streams;
    }
  }

  // Both streams may hit EOF while the child keeps running, so reaping is
  // bounded by the same deadline.
  int status = 0;
  while (!out.timed_out) {
    const pid_t w = ::waitpid(child, &status, WNOHANG);
    if (w == child) break;
    if (w < 0 && errno != EINTR) return spawn_error("waitpid failed", -1);
    if (clock::now() >= deadline) {
      out.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  if (out.timed_out) {
    ::kill(-child, SIGKILL);
    ::kill(child, SIGKILL);
    ::waitpid(child, &status, 0);
    out.exit_code = 124;
    out.error = ErrorCode::timeout;
    out.error_message = "deadline exceeded";
    return out;
  }

  out.exit_code = decode_status(status);
  return out;
}

}  // namespace bluxguard
