#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>
#include <thread>

#include "absl/strings/str_cat.h"

extern char** environ;

namespace sandbox {

namespace {

// Sent by the child to the parent when it cannot exec the program.
struct ChildFailure {
  char step[32];
  int error;
};

[[noreturn]] void Fail(int fd, const char* step, int error) {
  ChildFailure failure{};
  strncpy(failure.step, step, sizeof(failure.step) - 1);
  failure.error = error;
  (void)!write(fd, &failure, sizeof(failure));
  _exit(127);
}

std::string ErrnoMessage(const char* step, int error) {
  return absl::StrCat(step, ": ", std::system_category().message(error));
}

int64_t Millis(const struct timeval& tv) {
  return static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000;
}

char* Data(std::string& s) { return &s[0]; }

}  // namespace

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  *info = ExecutionInfo();
  if (!Prepare(error_msg)) return false;
  child_pid_ = fork();
  if (child_pid_ == -1) {
    *error_msg = ErrnoMessage("fork", errno);
    close(status_pipe_[0]);
    close(status_pipe_[1]);
    return false;
  }
  if (child_pid_ == 0) RunChild();
  return Supervise(info, error_msg);
}

bool Unix::Prepare(std::string* error_msg) {
  arg_storage_.clear();
  arg_storage_.push_back(options_->executable);
  arg_storage_.insert(arg_storage_.end(), options_->args.begin(),
                      options_->args.end());
  argv_.clear();
  for (std::string& arg : arg_storage_) argv_.push_back(Data(arg));
  argv_.push_back(nullptr);

  env_storage_.clear();
  for (char** var = environ; *var != nullptr; var++) {
    std::string entry = *var;
    std::string name = entry.substr(0, entry.find('='));
    bool hidden = false;
    for (const std::string& hidden_name : options_->hidden_variables) {
      if (name == hidden_name) hidden = true;
    }
    if (!hidden) env_storage_.push_back(std::move(entry));
  }
  envp_.clear();
  for (std::string& entry : env_storage_) envp_.push_back(Data(entry));
  envp_.push_back(nullptr);

  if (pipe2(status_pipe_, O_CLOEXEC) == -1) {
    *error_msg = ErrnoMessage("pipe", errno);
    return false;
  }
  return true;
}

void Unix::RunChild() {
  int fd = status_pipe_[1];
  close(status_pipe_[0]);

  // A session of its own makes the program the leader of a process group
  // that can be killed at once, and detaches it from the terminal.
  if (setsid() == -1) Fail(fd, "setsid", errno);

  const char* stdin_path = options_->stdin_file.empty()
                               ? "/dev/null"
                               : options_->stdin_file.c_str();
  int in = open(stdin_path, O_RDONLY);
  if (in == -1) Fail(fd, "open", errno);
  int out = -1;
  int err = -1;
  if (!options_->stdout_file.empty()) {
    out = creat(options_->stdout_file.c_str(), S_IRUSR | S_IWUSR);
    if (out == -1) Fail(fd, "creat", errno);
  }
  if (!options_->stderr_file.empty()) {
    err = creat(options_->stderr_file.c_str(), S_IRUSR | S_IWUSR);
    if (err == -1) Fail(fd, "creat", errno);
  }
  if (chdir(options_->root.c_str()) == -1) Fail(fd, "chdir", errno);

  if (dup2(in, STDIN_FILENO) == -1) Fail(fd, "dup2 stdin", errno);
  if (out != -1 && dup2(out, STDOUT_FILENO) == -1) {
    Fail(fd, "dup2 stdout", errno);
  }
  if (err != -1 && dup2(err, STDERR_FILENO) == -1) {
    Fail(fd, "dup2 stderr", errno);
  }

  if (options_->max_file_size_kb > 0) {
    struct rlimit limit {};
    limit.rlim_cur = limit.rlim_max = options_->max_file_size_kb * 1024;
    if (setrlimit(RLIMIT_FSIZE, &limit) == -1) Fail(fd, "setrlimit", errno);
  }
  // The supervisor may ignore SIGPIPE, the program must not inherit that.
  signal(SIGPIPE, SIG_DFL);

  // A freshly written executable may still be open for writing in another
  // thread that is about to close it.
  for (int retry = 0; retry < 16; retry++) {
    execve(options_->executable.c_str(), argv_.data(), envp_.data());
    if (errno != ETXTBSY) break;
    usleep(100);
  }
  Fail(fd, "exec", errno);
}

bool Unix::Supervise(ExecutionInfo* info, std::string* error_msg) {
  close(status_pipe_[1]);
  ChildFailure failure{};
  ssize_t got;
  do {
    got = read(status_pipe_[0], &failure, sizeof(failure));
  } while (got == -1 && errno == EINTR);
  close(status_pipe_[0]);
  if (got == sizeof(failure)) {
    waitpid(child_pid_, nullptr, 0);
    *error_msg = ErrnoMessage(failure.step, failure.error);
    return false;
  }

  auto start = std::chrono::steady_clock::now();
  auto elapsed = [&start]() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
  };

  int status = 0;
  struct rusage usage {};
  bool exited = false;
  while (!exited) {
    if (options_->wall_limit_millis > 0 &&
        elapsed() >= options_->wall_limit_millis) {
      break;
    }
    pid_t ret = wait4(child_pid_, &status, WNOHANG, &usage);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      *error_msg = ErrnoMessage("wait4", errno);
      kill(-child_pid_, SIGKILL);
      return false;
    }
    if (ret == child_pid_) {
      exited = true;
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  // Also reaps whatever the program left running in its group.
  kill(-child_pid_, SIGKILL);
  if (!exited) {
    info->timed_out = true;
    pid_t ret;
    do {
      ret = wait4(child_pid_, &status, 0, &usage);
    } while (ret == -1 && errno == EINTR);
    if (ret != child_pid_) {
      *error_msg = ErrnoMessage("wait4", errno);
      return false;
    }
  }

  info->wall_time_millis = elapsed();
  if (WIFEXITED(status)) info->status_code = WEXITSTATUS(status);
  if (WIFSIGNALED(status)) info->signal = WTERMSIG(status);
  info->cpu_time_millis = Millis(usage.ru_utime);
  info->sys_time_millis = Millis(usage.ru_stime);
  return true;
}

namespace {
Sandbox::Register<Unix> registration;
}  // namespace

}  // namespace sandbox
