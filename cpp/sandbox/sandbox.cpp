#include "sandbox/sandbox.hpp"

#include <kj/debug.h>

namespace sandbox {

Sandbox::store_t* Sandbox::Boxes_() {
  static store_t* boxes = new store_t;
  return boxes;
}

void Sandbox::Register_(std::string name, Sandbox::create_t create,
                        Sandbox::score_t score) {
  Boxes_()->push_back({std::move(name), std::move(create), std::move(score)});
}

std::vector<std::string> Sandbox::Available() {
  std::vector<std::string> names;
  for (const Entry& entry : *Boxes_()) names.push_back(entry.name);
  return names;
}

std::unique_ptr<Sandbox> Sandbox::Create(kj::LowLevelAsyncIoProvider* io,
                                         kj::Timer* timer,
                                         const std::string& name) {
  const store_t& boxes = *Boxes_();
  const Entry* best = nullptr;
  int best_score = 0;
  for (const Entry& entry : boxes) {
    if (!name.empty() && entry.name != name) continue;
    int score = entry.score();
    if (score > best_score) {
      best_score = score;
      best = &entry;
    }
  }
  if (best == nullptr) {
    KJ_LOG(ERROR, "No usable sandbox could be found", name);
    return nullptr;
  }
  KJ_LOG(INFO, "Using sandbox", best->name, best_score);
  return std::unique_ptr<Sandbox>(best->create(io, timer));
}

kj::Promise<ExecutionInfo> Sandbox::Execute(const ExecutionOptions& options) {
  return kj::evalNow([&]() {
    KJ_REQUIRE(!options.name.empty(), "Sandbox instances need a name");
    KJ_REQUIRE(!options.script.empty(), "Nothing to execute");
    KJ_REQUIRE(!options.mount_source.empty() && !options.mount_target.empty(),
               "The script directory must be mounted");
    KJ_REQUIRE(options.memory_limit_mb > 0, options.memory_limit_mb,
               "Memory limit is required");
    KJ_REQUIRE(options.max_procs > 0, options.max_procs,
               "Process limit is required");
    KJ_REQUIRE(!options.cpus.empty(), "CPU limit is required");
    return ExecuteInternal(options);
  });
}

}  // namespace sandbox
