#include "client/main.hpp"

#include <cstdlib>
#include <iostream>
#include <system_error>

#include <capnp/ez-rpc.h>

#include "capnp/runner.capnp.h"
#include "client/report.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace client {

kj::MainBuilder::Validity Main::SetFile(kj::StringPtr file) {
  file_ = file;
  if (!util::File::Exists(file_)) return kj::str("No such file: ", file);
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  int status = kInternalErrorStatus;
  {
    util::LogManager log_manager(&context_);
    std::string code;
    try {
      code = util::File::ReadContents(file_);
    } catch (const std::system_error& e) {
      return kj::str(e.what());
    }
    capnp::EzRpcClient client(Flags::server, Flags::port);
    auto runner = client.getMain<capnproto::Runner>();
    auto request = runner.runRequest();
    request.setCode(capnp::Text::Reader(code.data(), code.size()));
    auto response = request.send().wait(client.getWaitScope());
    status = Report(response.getResponse(), std::cout, std::cerr);
  }
  std::cout.flush();
  std::cerr.flush();
  std::exit(status);
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context_, util::version_string,
                         "Runs a file on a server and prints its output")
      .addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOptionWithArg({'s', "server"}, util::setString(&Flags::server),
                        "<ADDRESS>", "Address of the server")
      .addOptionWithArg({'p', "port"}, util::setInt(&Flags::port), "<PORT>",
                        "Port of the server")
      .expectArg("<FILE>", KJ_BIND_METHOD(*this, SetFile))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}

}  // namespace client
