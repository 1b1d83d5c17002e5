#include "sandbox/unix.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

// Returns the value of a "<field>: <n> kB" line of /proc/<pid>/status, or -1
// if it cannot be read (for example, because the process is a zombie).
int64_t GetProcStatusKb(const std::string& pid, const char* field) {
  int fd = open(("/proc/" + pid + "/status").c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) return -1;
  char buf[8 * 1024] = {};
  size_t num_read = 0;
  ssize_t cur = 0;
  do {
    cur = read(fd, buf + num_read, sizeof(buf) - 1 - num_read);
    if (cur < 0) {
      if (errno == EINTR) continue;
      close(fd);
      return -1;
    }
    num_read += cur;
  } while (cur > 0 && num_read < sizeof(buf) - 1);
  close(fd);
  const char* line = strstr(buf, field);
  if (line == nullptr) return -1;
  long long value = 0;
  if (sscanf(line + strlen(field), "%lld", &value) != 1) return -1;
  return value;
}

const constexpr auto kPollInterval = std::chrono::milliseconds(1);
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

bool Unix::PrepareForExecution(const std::string& executable,
                               std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (chmod(executable.c_str(), S_IRUSR | S_IXUSR) == -1) {
    *error_msg = "chmod: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  return true;
}

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!Wait(info, error_msg)) return false;
  return true;
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  // The pipe is created close-on-exec atomically, so that children forked by
  // other threads in the meantime do not inherit it. It is non-blocking so
  // that Wait can keep enforcing limits while the child has not exec'd yet.
  if (pipe2(pipe_fds_, O_CLOEXEC | O_NONBLOCK) == -1) {
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }

  arg_storage_.clear();
  argv_.clear();
  auto add_arg = [this](const std::string& arg) {
    arg_storage_.emplace_back(arg.begin(), arg.end());
    arg_storage_.back().push_back(0);
  };
  add_arg(options_->executable);
  for (const std::string& arg : options_->args) add_arg(arg);
  for (std::vector<char>& arg : arg_storage_) argv_.push_back(arg.data());
  argv_.push_back(nullptr);

  return OnSetup(error_msg);
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  forked_image_kb_ = GetProcStatusKb("self", "VmRSS:");
  pid_t fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (fork_result == 0) Child();
  child_pid_ = fork_result;
  forked_image_kb_ =
      std::max(forked_image_kb_, GetProcStatusKb("self", "VmRSS:"));
  return true;
}

void Unix::Child() {
  close(pipe_fds_[0]);
  // The length and the message are sent with a single write, which is atomic
  // as it is shorter than PIPE_BUF.
  auto die2 = [this](const char* prefix, const char* err) {
    char msg[sizeof(int) + kStrErrorBufSize + 64 + 3 + 1] = {};
    char* buf = msg + sizeof(int);
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 3);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    memcpy(msg, &len, sizeof(len));
    if (write(pipe_fds_[1], msg, sizeof(len) + len) == -1) _Exit(1);
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // Change process group, so that we do not receive Ctrl-Cs in the terminal
  // and the whole group can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  if (!options_->stdin_file.empty()) {
    stdin_fd = open(options_->stdin_file.c_str(), O_RDONLY | O_CLOEXEC);
    if (stdin_fd == -1) die("open", errno);
  }
  if (!options_->stdout_file.empty()) {
    stdout_fd =
        open(options_->stdout_file.c_str(),
             O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("open", errno);
  }
  if (!options_->stderr_file.empty()) {
    stderr_fd =
        open(options_->stderr_file.c_str(),
             O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("open", errno);
  }

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != -1) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
  }
  if (stdin_fd != -1) {
    DUP(stdin, STDIN_FILENO);
  } else if (close(STDIN_FILENO) == -1) {
    die("close", errno);
  }
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Set resource limits.
  struct rlimit rlim {};
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = value;                    \
      rlim.rlim_max = value;                    \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM(CORE, 0);
#undef SET_RLIM

  char buf[kStrErrorBufSize] = {};
  if (!OnChild(buf, kStrErrorBufSize)) {
    die2("OnChild", buf);
  }
  int count = 0;
  do {
    execv(options_->executable.c_str(), argv_.data());
    usleep(100);
    // A freshly written executable may still be open for writing in some
    // other process; retry a bounded number of times.
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  close(pipe_fds_[1]);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  // Until the error pipe is closed by exec, the child runs our own code on a
  // copy of our memory: it may block (for example opening a FIFO), and its
  // memory usage is not the program's.
  bool exec_done = false;
  // Returns false and sets error_msg if the child reported an error.
  auto check_exec = [this, &exec_done, &buf, error_msg]() {
    char msg[PIPE_BUF] = {};
    ssize_t ret = read(pipe_fds_[0], msg, PIPE_BUF - 1);
    if (ret == -1) {
      if (errno == EAGAIN || errno == EINTR) return true;
      *error_msg = "read: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      return false;
    }
    close(pipe_fds_[0]);
    exec_done = true;
    if (ret == 0) return true;
    int error_len = 0;
    if (static_cast<size_t>(ret) < sizeof(error_len)) {
      *error_msg = "short read from the child";
      return false;
    }
    memcpy(&error_len, msg, sizeof(error_len));
    if (error_len < 0 || error_len > ret - static_cast<ssize_t>(sizeof(int)))
      error_len = ret - sizeof(int);
    *error_msg = std::string(msg + sizeof(int), error_len);
    return false;
  };
  auto kill_child = [this]() {
    // Kill the whole process group first, as the program may have spawned
    // children of its own. If the child did not get to call setsid yet, the
    // group does not exist and the child itself is killed.
    if (kill(-child_pid_, SIGKILL) == -1 && kill(child_pid_, SIGKILL) == -1 &&
        errno != ESRCH) {
      return false;
    }
    return true;
  };
  auto reap = [this](int* child_status, struct rusage* rusage) {
    pid_t ret = 0;
    do {
      ret = wait4(child_pid_, child_status, 0, rusage);
    } while (ret == -1 && errno == EINTR);
    return ret == child_pid_;
  };

  // wait4 returns the resource usage of exactly this child, which
  // getrusage(RUSAGE_CHILDREN) cannot do when other threads are running
  // programs at the same time.
  int child_status = 0;
  bool has_exited = false;
  int64_t sampled_memory_kb = 0;
  std::string pid = std::to_string(child_pid_);
  struct rusage rusage {};
  while (true) {
    pid_t ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
    if (ret == -1) {
      if (errno == EINTR) continue;
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      if (!exec_done) close(pipe_fds_[0]);
      kill_child();
      reap(&child_status, &rusage);
      return false;
    }
    has_exited = ret == child_pid_;
    // After an exit, whatever the child reported is already in the pipe.
    if (!exec_done && !check_exec()) {
      if (!exec_done) close(pipe_fds_[0]);
      if (!has_exited) {
        kill_child();
        reap(&child_status, &rusage);
      }
      return false;
    }
    if (has_exited) break;
    if (exec_done) {
      sampled_memory_kb =
          std::max(sampled_memory_kb, GetProcStatusKb(pid, "VmHWM:"));
    }
    if (options_->stop != nullptr && options_->stop->load()) {
      info->stopped = true;
      break;
    }
    if (options_->wall_limit_millis != 0 &&
        elapsed_millis() >= options_->wall_limit_millis) {
      break;
    }
    std::this_thread::sleep_for(kPollInterval);
  }
  if (!exec_done) close(pipe_fds_[0]);
  if (!has_exited) {
    if (!kill_child()) {
      *error_msg = "kill: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      return false;
    }
    info->killed = true;
    if (!reap(&child_status, &rusage)) {
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      return false;
    }
  }
  info->wall_time_millis = elapsed_millis();
  // ru_maxrss (in kilobytes on Linux) also covers the image the child was
  // forked from, so it is only exact when the program used more than that.
  // Otherwise the peak sampled while the program was running is used.
  int64_t maxrss_kb = rusage.ru_maxrss;
  info->memory_usage_kb =
      maxrss_kb > forked_image_kb_ ? maxrss_kb : sampled_memory_kb;
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->cpu_time_millis =
      rusage.ru_utime.tv_sec * 1000LL + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      rusage.ru_stime.tv_sec * 1000LL + rusage.ru_stime.tv_usec / 1000;
  if (info->stopped) {
    info->message = "Stopped";
  } else if (info->killed) {
    info->message = "Wall limit exceeded";
  } else if (info->signal != 0) {
    info->message = strsignal(info->signal);
  } else if (info->status_code != 0) {
    info->message = "Non-zero return code";
  }
  OnFinish(info);
  return true;
}

namespace {
Sandbox::Register<Unix> r;
}  // namespace

}  // namespace sandbox
