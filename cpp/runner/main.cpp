#include "runner/main.hpp"

#include <cstdlib>
#include <iostream>
#include <system_error>

#include <capnp/message.h>
#include <kj/async-io.h>

#include "client/report.hpp"
#include "runner/pipeline.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace runner {

kj::MainBuilder::Validity Main::SetFile(kj::StringPtr file) {
  file_ = file;
  if (!util::File::Exists(file_)) return kj::str("No such file: ", file);
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  int status = client::kInternalErrorStatus;
  {
    util::LogManager log_manager(&context_);
    std::string code;
    try {
      code = util::File::ReadContents(file_);
    } catch (const std::system_error& e) {
      return kj::str(e.what());
    }
    auto io = kj::setupAsyncIo();
    Pipeline pipeline(io.lowLevelProvider.get(), &io.provider->getTimer());
    Response response = pipeline.GetRunner().Run(code).wait(io.waitScope);
    capnp::MallocMessageBuilder message;
    auto builder = message.initRoot<capnproto::RunResponse>();
    response.ToCapnp(builder);
    status = client::Report(builder.asReader(), std::cout, std::cerr);
    // Do not leave removals behind.
    pipeline.GetExecutor().OnRemovalsDone().wait(io.waitScope);
  }
  std::cout.flush();
  std::cerr.flush();
  std::exit(status);
}

kj::MainFunc Main::getMain() {
  kj::MainBuilder builder(context_, util::version_string,
                          "Runs a file in a sandbox and prints its output");
  builder.addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                           "<LOGFILE>",
                           "Path where the log file should be stored");
  AddPipelineOptions(&builder);
  return builder.expectArg("<FILE>", KJ_BIND_METHOD(*this, SetFile))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}

}  // namespace runner
