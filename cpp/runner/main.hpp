#ifndef RUNNER_MAIN_HPP
#define RUNNER_MAIN_HPP
#include <string>

#include <kj/main.h>

namespace runner {

// Runs one file through the pipeline, without a server.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context_(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::MainBuilder::Validity SetFile(kj::StringPtr file);

  kj::ProcessContext& context_;
  std::string file_;
};

}  // namespace runner
#endif
