#include "client/report.hpp"

#include <kj/debug.h>

namespace client {
namespace {

void PrintLine(std::ostream& stream, capnp::Text::Reader text) {
  if (text.size() == 0) return;
  stream.write(text.begin(), text.size());
  stream << std::endl;
}

}  // namespace

int Report(capnproto::RunResponse::Reader response, std::ostream& out,
           std::ostream& err) {
  switch (response.which()) {
    case capnproto::RunResponse::INVALID_REQUEST:
      PrintLine(err, response.getInvalidRequest());
      return kInvalidRequestStatus;
    case capnproto::RunResponse::INTERNAL_ERROR:
      PrintLine(err, response.getInternalError());
      return kInternalErrorStatus;
    case capnproto::RunResponse::RESULT:
      break;
  }
  auto result = response.getResult();
  PrintLine(out, result.getOutput());
  PrintLine(err, result.getError());
  switch (result.getClassification()) {
    case capnproto::Classification::SUCCESS:
      return 0;
    case capnproto::Classification::TIMEOUT:
      return kTimeoutStatus;
    case capnproto::Classification::MEMORY_LIMIT_EXCEEDED:
      return kMemoryLimitStatus;
    case capnproto::Classification::RUNTIME_ERROR:
      break;
  }
  if (result.getExitCode().isCode()) return result.getExitCode().getCode();
  return kInternalErrorStatus;
}

}  // namespace client
