#ifndef CLIENT_MAIN_HPP
#define CLIENT_MAIN_HPP
#include <string>

#include <kj/main.h>

namespace client {

// Sends a file to a running server and prints the response.
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

}  // namespace client
#endif
