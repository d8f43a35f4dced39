#include "sandbox/sandbox.hpp"

#include "glog/logging.h"

namespace sandbox {

Sandbox::store_t* Sandbox::Boxes_() {
  static store_t* boxes = new store_t;
  return boxes;
}

void Sandbox::Register_(const char* name, Sandbox::create_t create,
                        Sandbox::score_t score) {
  Boxes_()->push_back(Entry{name, create, score});
}

std::unique_ptr<Sandbox> Sandbox::Create(const SandboxConfig& config,
                                         std::vector<std::string>* available) {
  const store_t& boxes = *Boxes_();
  const Entry* best_sandbox = nullptr;
  int best_score = 0;
  for (const Entry& box : boxes) {
    int score = box.score(config);
    VLOG(1) << "Sandbox " << box.name << " has score " << score;
    if (score <= 0) continue;
    if (available) available->push_back(box.name);
    if (config.backend != "auto" && config.backend != box.name) continue;
    if (score > best_score) {
      best_score = score;
      best_sandbox = &box;
    }
  }
  if (best_sandbox == nullptr) {
    if (config.backend == "auto") {
      LOG(ERROR) << "No sandbox could be found";
    } else {
      LOG(ERROR) << "Sandbox " << config.backend << " is not available";
    }
    return nullptr;
  }
  LOG(INFO) << "Using the " << best_sandbox->name << " sandbox";
  return std::unique_ptr<Sandbox>(best_sandbox->create(config));
}

}  // namespace sandbox
