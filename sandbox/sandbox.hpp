#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sandbox {

// What to run and how. Zero limits and empty file names mean "not set".
struct ExecutionOptions {
  std::string root;
  std::string executable;
  std::vector<std::string> args;

  // Without a stdin_file the program reads from /dev/null; without an
  // output file it shares the descriptor of the supervisor.
  std::string stdin_file;
  std::string stdout_file;
  std::string stderr_file;

  int64_t wall_limit_millis = 0;
  // Caps every file the program writes, its captured output included.
  int64_t max_file_size_kb = 0;

  // The program gets the environment of the supervisor without the
  // variables named here.
  std::vector<std::string> hidden_variables;

  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// How the program terminated and what it consumed.
struct ExecutionInfo {
  // Exit status, meaningful only if signal is zero.
  int32_t status_code = 0;
  int32_t signal = 0;
  // The wall limit expired and the program was killed.
  bool timed_out = false;
  int64_t wall_time_millis = 0;
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
};

// Runs one program at a time as a supervised child process.
//
// Implementations are chosen at run time: each one registers a factory and a
// score with a global Sandbox::Register<Impl> object, and Create returns an
// instance of the registered implementation with the highest positive score.
// Registration happens during static initialization.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;

  // Returns nullptr if no usable implementation is registered.
  static std::unique_ptr<Sandbox> Create();

  // Starts the program and waits for it. Returns false and sets error_msg if
  // the program could not be started; otherwise fills info. On wall limit
  // expiry the whole process group of the program is killed.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  Sandbox() = default;
  virtual ~Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Add(&T::Create, &T::Score); }
  };

 private:
  struct Implementation {
    create_t create;
    score_t score;
  };
  static std::vector<Implementation>* Implementations();
  static void Add(create_t create, score_t score);
};

}  // namespace sandbox

#endif
