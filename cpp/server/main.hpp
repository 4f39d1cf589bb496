#ifndef SERVER_MAIN_HPP
#define SERVER_MAIN_HPP
#include <kj/main.h>

namespace server {

class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context_(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context_;
};
}  // namespace server
#endif
