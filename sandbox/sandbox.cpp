#include "sandbox/sandbox.hpp"

#include <mutex>

#include "glog/logging.h"

namespace sandbox {

std::vector<Sandbox::Implementation>* Sandbox::Implementations() {
  static auto* implementations = new std::vector<Implementation>;
  return implementations;
}

void Sandbox::Add(create_t create, score_t score) {
  Implementations()->push_back(Implementation{std::move(create),
                                              std::move(score)});
}

std::unique_ptr<Sandbox> Sandbox::Create() {
  static const Implementation* best = nullptr;
  static std::once_flag chosen;
  std::call_once(chosen, []() {
    int best_score = 0;
    for (const Implementation& implementation : *Implementations()) {
      int score = implementation.score();
      VLOG(1) << "Sandbox implementation with score " << score;
      if (score > best_score) {
        best_score = score;
        best = &implementation;
      }
    }
  });
  if (best == nullptr) {
    LOG(ERROR) << "No usable sandbox implementation is registered";
    return nullptr;
  }
  return std::unique_ptr<Sandbox>(best->create());
}

}  // namespace sandbox
