#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <sys/types.h>

#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// fork/exec sandbox for POSIX systems. The program runs in its own session,
// so that it can be killed together with everything it spawned, with the
// file size limit set through setrlimit.
class Unix : public Sandbox {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

 private:
  Unix() = default;

  // Everything the child needs is allocated here, as the child of a possibly
  // multithreaded process must not allocate.
  bool Prepare(std::string* error_msg);

  // Function run by the child process. Failures before exec are reported to
  // the parent through status_pipe_.
  [[noreturn]] void RunChild();

  // Waits for the child, enforcing the wall limit.
  bool Supervise(ExecutionInfo* info, std::string* error_msg);

  const ExecutionOptions* options_ = nullptr;
  std::vector<std::string> arg_storage_;
  std::vector<std::string> env_storage_;
  std::vector<char*> argv_;
  std::vector<char*> envp_;
  int status_pipe_[2] = {-1, -1};
  pid_t child_pid_ = 0;
};

}  // namespace sandbox

#endif
