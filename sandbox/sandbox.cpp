#include "sandbox/sandbox.hpp"

#include "glog/logging.h"

namespace sandbox {

std::vector<Sandbox::Implementation>* Sandbox::Implementations() {
  // Never destroyed: sandboxes may still be created during exit.
  static auto* implementations = new std::vector<Implementation>();
  return implementations;
}

void Sandbox::Add(Implementation implementation) {
  Implementations()->push_back(std::move(implementation));
}

std::unique_ptr<Sandbox> Sandbox::Create() {
  // Scores cannot change while the process runs.
  static const Implementation* chosen = []() -> const Implementation* {
    const Implementation* best = nullptr;
    int best_score = 0;
    for (const Implementation& implementation : *Implementations()) {
      int score = implementation.score();
      VLOG(1) << "Sandbox " << implementation.name << " has score " << score;
      if (score > best_score) {
        best_score = score;
        best = &implementation;
      }
    }
    if (best != nullptr) VLOG(1) << "Using the " << best->name << " sandbox";
    return best;
  }();
  if (chosen == nullptr) {
    LOG(ERROR) << "No usable sandbox is registered";
    return nullptr;
  }
  return std::unique_ptr<Sandbox>(chosen->create());
}

}  // namespace sandbox
