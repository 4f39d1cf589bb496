#include "server/main.hpp"

#include <capnp/ez-rpc.h>

#include "runner/pipeline.hpp"
#include "server/server.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace server {
kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(&context_);
  auto impl = kj::heap<server::Server>();
  server::Server* server_impl = impl.get();
  capnp::EzRpcServer server(kj::mv(impl), Flags::listen_address, Flags::port);
  auto& wait_scope = server.getWaitScope();
  kj::Timer& timer = server.getIoProvider().getTimer();

  auto pipeline =
      kj::heap<runner::Pipeline>(&server.getLowLevelIoProvider(), &timer);
  const staging::Stager* stager = &pipeline->GetStager();
  server_impl->SetPipeline(kj::mv(pipeline));

  uint port = server.getPort().wait(wait_scope);
  KJ_LOG(INFO, "Listening", Flags::listen_address, port);

  if (Flags::artifact_ttl > 0) {
    SweepPeriodically(stager, &timer, Flags::artifact_ttl).wait(wait_scope);
  } else {
    kj::NEVER_DONE.wait(wait_scope);
  }
  KJ_UNREACHABLE;
}

kj::MainFunc Main::getMain() {
  kj::MainBuilder builder(context_, util::version_string,
                          "Runs submissions received over the network");
  builder
      .addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOptionWithArg({'l', "address"},
                        util::setString(&Flags::listen_address), "<ADDRESS>",
                        "Address to listen on")
      .addOptionWithArg({'p', "port"}, util::setInt(&Flags::port), "<PORT>",
                        "Port to listen on")
      .addOptionWithArg({"artifact-ttl"}, util::setInt(&Flags::artifact_ttl),
                        "<SECONDS>",
                        "Delete staged submissions older than this. 0 means "
                        "never");
  runner::AddPipelineOptions(&builder);
  return builder.callAfterParsing(KJ_BIND_METHOD(*this, Run)).build();
}
}  // namespace server
