#include "agency/core/error.hpp"
#include "agency/executor/agent_runtime.hpp"
#include "agency/util/log.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstring>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

extern char** environ;

namespace agency {

namespace {

inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kStderrTailSize = 512;
inline constexpr int kPollIntervalMs = 50;
// A runaway child is killed this long after its own timeout even if the
// caller never cancels.
inline constexpr std::chrono::seconds kKillGrace{5};

struct Pipe {
  int read_fd{-1};
  int write_fd{-1};
};

auto create_pipe() -> Pipe {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    return {};
  }
  return {fds[0], fds[1]};
}

auto set_nonblocking(int fd) -> void {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

auto close_fd(int& fd) -> void {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

auto shell_quote(std::string_view s) -> std::string {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

auto render_command(std::string_view tmpl, std::string_view agent)
    -> std::string {
  constexpr std::string_view placeholder = "{agent}";
  std::string out;
  std::size_t pos = 0;
  while (true) {
    auto found = tmpl.find(placeholder, pos);
    if (found == std::string_view::npos) {
      out.append(tmpl.substr(pos));
      break;
    }
    out.append(tmpl.substr(pos, found - pos));
    out.append(shell_quote(agent));
    pos = found + placeholder.size();
  }
  return out;
}

auto build_environment(const RuntimeConfig& config, const AgentRequest& req)
    -> std::vector<std::string> {
  std::vector<std::string> env;
  auto overridden = [&](std::string_view entry) {
    auto eq = entry.find('=');
    auto name = entry.substr(0, eq);
    return name == "AGENCY_AGENT" || name == "AGENCY_INVOCATION_ID" ||
           name == "AGENCY_TIMEOUT_MS" || config.env.contains(std::string(name));
  };
  for (char** e = environ; e && *e; ++e) {
    if (!overridden(*e)) {
      env.emplace_back(*e);
    }
  }
  for (const auto& [name, value] : config.env) {
    env.push_back(std::format("{}={}", name, value));
  }
  env.push_back(std::format("AGENCY_AGENT={}", req.agent_name));
  env.push_back(std::format("AGENCY_INVOCATION_ID={}", req.invocation_id));
  env.push_back(std::format("AGENCY_TIMEOUT_MS={}", req.timeout.count()));
  return env;
}

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// A "tokens_used: <n>" line on stderr reports usage.
auto parse_tokens_used(std::string_view err) -> std::optional<std::uint64_t> {
  constexpr std::string_view marker = "tokens_used:";
  auto pos = err.rfind(marker);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  auto rest = err.substr(pos + marker.size());
  while (!rest.empty() && rest.front() == ' ') {
    rest.remove_prefix(1);
  }
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), value);
  if (ec != std::errc{} || ptr == rest.data()) {
    return std::nullopt;
  }
  return value;
}

auto tail(std::string_view s, std::size_t n) -> std::string {
  return std::string(s.size() > n ? s.substr(s.size() - n) : s);
}

class ProcessAgentRuntime : public IAgentRuntime {
public:
  explicit ProcessAgentRuntime(RuntimeConfig config)
      : config_(std::move(config)) {}

  ~ProcessAgentRuntime() override {
    std::unordered_map<InvocationId, Invocation> active;
    std::vector<std::jthread> finished;
    {
      std::lock_guard lock(mu_);
      for (auto& [id, inv] : active_) {
        inv.cancel_requested = true;
        if (inv.pid > 0) {
          kill(-inv.pid, SIGKILL);
        }
      }
      active = std::move(active_);
      finished = std::move(finished_);
    }
    for (auto& [id, inv] : active) {
      if (inv.thread.joinable()) {
        inv.thread.join();
      }
    }
    for (auto& t : finished) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

  auto start(AgentRequest request, AgentCallback on_complete) -> void override {
    std::vector<std::jthread> reaped;
    std::lock_guard lock(mu_);
    reaped.swap(finished_);

    auto id = request.invocation_id;
    if (active_.contains(id)) {
      on_complete(id, AgentResponse{.success = false,
                                    .output = std::nullopt,
                                    .error = "duplicate invocation id",
                                    .tokens_used = std::nullopt});
      return;
    }
    auto& inv = active_[id];
    inv.thread = std::jthread([this, request = std::move(request),
                               on_complete = std::move(on_complete)]() mutable {
      auto id = request.invocation_id;
      auto response = run(request);
      on_complete(id, std::move(response));
      retire(id);
    });
  }

  auto cancel(const InvocationId& id) -> void override {
    std::lock_guard lock(mu_);
    auto it = active_.find(id);
    if (it == active_.end()) {
      return;
    }
    it->second.cancel_requested = true;
    if (it->second.pid > 0) {
      kill(-it->second.pid, SIGKILL);
    }
    log::info("Cancelled agent process for invocation {}", id);
  }

private:
  struct Invocation {
    pid_t pid{-1};
    bool cancel_requested{false};
    std::jthread thread;
  };

  auto run(const AgentRequest& req) -> AgentResponse {
    AgentResponse response;

    auto in = create_pipe();
    auto out = create_pipe();
    auto err = create_pipe();
    if (in.read_fd < 0 || out.read_fd < 0 || err.read_fd < 0) {
      for (auto* p : {&in, &out, &err}) {
        close_fd(p->read_fd);
        close_fd(p->write_fd);
      }
      response.error = std::format("failed to create pipe: {}", strerror(errno));
      return response;
    }

    auto cmd = render_command(config_.command, req.agent_name);
    auto env = build_environment(config_, req);
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& e : env) {
      envp.push_back(e.data());
    }
    envp.push_back(nullptr);
    const char* argv[] = {"sh", "-c", cmd.c_str(), nullptr};

    pid_t pid = fork();
    if (pid < 0) {
      for (auto* p : {&in, &out, &err}) {
        close_fd(p->read_fd);
        close_fd(p->write_fd);
      }
      response.error = std::format("failed to fork: {}", strerror(errno));
      return response;
    }

    if (pid == 0) {
      // Child: async-signal-safe calls only.
      setpgid(0, 0);
      dup2(in.read_fd, STDIN_FILENO);
      dup2(out.write_fd, STDOUT_FILENO);
      dup2(err.write_fd, STDERR_FILENO);
      if (!config_.working_dir.empty() &&
          chdir(config_.working_dir.c_str()) < 0) {
        _exit(127);
      }
      execve("/bin/sh", const_cast<char* const*>(argv), envp.data());
      _exit(127);
    }

    setpgid(pid, pid);
    close_fd(in.read_fd);
    close_fd(out.write_fd);
    close_fd(err.write_fd);
    set_nonblocking(in.write_fd);
    set_nonblocking(out.read_fd);
    set_nonblocking(err.read_fd);

    if (!register_pid(req.invocation_id, pid)) {
      kill(-pid, SIGKILL);
    }

    std::string prompt = req.context.empty()
                             ? req.task
                             : std::format("{}\n\n## Task\n\n{}\n", req.context,
                                           req.task);
    std::size_t written = 0;
    std::string stdout_data;
    std::string stderr_data;
    bool truncated = false;
    bool killed_for_overrun = false;
    auto hard_deadline = std::chrono::steady_clock::now() + req.timeout + kKillGrace;
    std::array<char, kReadBufferSize> buffer;

    if (prompt.empty()) {
      close_fd(in.write_fd);
    }

    while (out.read_fd >= 0 || err.read_fd >= 0) {
      if (!killed_for_overrun && req.timeout.count() > 0 &&
          std::chrono::steady_clock::now() > hard_deadline) {
        log::warn("Agent process {} outlived its deadline, killing", pid);
        kill(-pid, SIGKILL);
        killed_for_overrun = true;
      }

      pollfd fds[3];
      nfds_t n = 0;
      int out_idx = -1;
      int err_idx = -1;
      int in_idx = -1;
      if (out.read_fd >= 0) {
        out_idx = static_cast<int>(n);
        fds[n++] = {out.read_fd, POLLIN, 0};
      }
      if (err.read_fd >= 0) {
        err_idx = static_cast<int>(n);
        fds[n++] = {err.read_fd, POLLIN, 0};
      }
      if (in.write_fd >= 0) {
        in_idx = static_cast<int>(n);
        fds[n++] = {in.write_fd, POLLOUT, 0};
      }

      int rc = poll(fds, n, kPollIntervalMs);
      if (rc < 0) {
        if (errno == EINTR) {
          continue;
        }
        log::error("poll failed for agent process {}: {}", pid, strerror(errno));
        kill(-pid, SIGKILL);
        break;
      }
      if (rc == 0) {
        continue;
      }

      if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
        if (fds[in_idx].revents & POLLOUT) {
          auto w = write(in.write_fd, prompt.data() + written,
                         prompt.size() - written);
          if (w > 0) {
            written += static_cast<std::size_t>(w);
          } else if (w < 0 && errno != EAGAIN && errno != EINTR) {
            written = prompt.size();  // EPIPE: the child stopped reading
          }
        } else {
          written = prompt.size();
        }
        if (written >= prompt.size()) {
          close_fd(in.write_fd);
        }
      }

      auto drain = [&](int idx, int& fd, std::string& sink) {
        if (idx < 0 || !(fds[idx].revents & (POLLIN | POLLHUP | POLLERR))) {
          return;
        }
        auto r = read(fd, buffer.data(), buffer.size());
        if (r > 0) {
          auto room = config_.max_output_bytes > sink.size()
                          ? config_.max_output_bytes - sink.size()
                          : 0;
          auto take = std::min(room, static_cast<std::size_t>(r));
          sink.append(buffer.data(), take);
          truncated = truncated || take < static_cast<std::size_t>(r);
        } else if (r == 0 || (errno != EAGAIN && errno != EINTR)) {
          close_fd(fd);
        }
      };
      drain(out_idx, out.read_fd, stdout_data);
      drain(err_idx, err.read_fd, stderr_data);
    }
    close_fd(in.write_fd);
    close_fd(out.read_fd);
    close_fd(err.read_fd);

    int status = 0;
    int exit_code = -1;
    while (waitpid(pid, &status, 0) < 0) {
      if (errno != EINTR) {
        log::warn("waitpid failed for pid {}: {}", pid, strerror(errno));
        break;
      }
    }
    exit_code = get_exit_code(status);
    bool cancelled = unregister_pid(req.invocation_id);

    if (truncated) {
      log::warn("Agent {} output truncated at {} bytes", req.agent_name,
                config_.max_output_bytes);
    }
    response.tokens_used = parse_tokens_used(stderr_data);
    if (cancelled || killed_for_overrun) {
      response.error = "cancelled";
      if (!stdout_data.empty()) {
        response.output = std::move(stdout_data);
      }
      return response;
    }
    if (exit_code == 0) {
      response.success = true;
      response.output = std::move(stdout_data);
      return response;
    }
    response.error = std::format("agent exited with code {}: {}", exit_code,
                                 tail(stderr_data, kStderrTailSize));
    if (!stdout_data.empty()) {
      response.output = std::move(stdout_data);
    }
    return response;
  }

  // False if the invocation was cancelled before the child existed.
  auto register_pid(const InvocationId& id, pid_t pid) -> bool {
    std::lock_guard lock(mu_);
    auto it = active_.find(id);
    if (it == active_.end()) {
      return false;
    }
    it->second.pid = pid;
    return !it->second.cancel_requested;
  }

  // Returns whether a cancellation was requested.
  auto unregister_pid(const InvocationId& id) -> bool {
    std::lock_guard lock(mu_);
    auto it = active_.find(id);
    if (it == active_.end()) {
      return true;
    }
    it->second.pid = -1;
    return it->second.cancel_requested;
  }

  auto retire(const InvocationId& id) -> void {
    std::lock_guard lock(mu_);
    if (auto it = active_.find(id); it != active_.end()) {
      finished_.push_back(std::move(it->second.thread));
      active_.erase(it);
    }
  }

  RuntimeConfig config_;
  std::mutex mu_;
  std::unordered_map<InvocationId, Invocation> active_;
  std::vector<std::jthread> finished_;
};

}  // namespace

auto create_process_agent_runtime(RuntimeConfig config)
    -> std::unique_ptr<IAgentRuntime> {
  // Writing a prompt to a child that already exited must not kill us.
  std::signal(SIGPIPE, SIG_IGN);
  return std::make_unique<ProcessAgentRuntime>(std::move(config));
}

}  // namespace agency
