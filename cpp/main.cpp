#include "client/main.hpp"
#include "runner/main.hpp"
#include "server/main.hpp"
#include "util/version.hpp"

class RunboxMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit RunboxMain(kj::ProcessContext& context)
      : context(context), sm(&context), rm(&context), cm(&context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, util::version_string,
                           "Runs untrusted code in disposable containers")
        .addSubCommand("server", KJ_BIND_METHOD(sm, getMain),
                       "serve run requests over Cap'n Proto RPC")
        .addSubCommand("run", KJ_BIND_METHOD(rm, getMain),
                       "run a file locally")
        .addSubCommand("submit", KJ_BIND_METHOD(cm, getMain),
                       "run a file on a server")
        .build();
  }

 private:
  kj::ProcessContext& context;
  server::Main sm;
  runner::Main rm;
  client::Main cm;
};

KJ_MAIN(RunboxMain);
