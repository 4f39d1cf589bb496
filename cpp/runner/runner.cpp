#include "runner/runner.hpp"

#include <system_error>

#include <kj/debug.h>

#include "runner/validation.hpp"
#include "util/flags.hpp"

namespace runner {

const ExecutionResult& Response::GetResult() const {
  KJ_IF_MAYBE(result, result_) { return *result; }
  KJ_FAIL_REQUIRE("Response has no result", message_);
}

void Response::ToCapnp(capnproto::RunResponse::Builder builder) const {
  switch (kind_) {
    case RESULT:
      GetResult().ToCapnp(builder.initResult());
      break;
    case INVALID_REQUEST:
      builder.setInvalidRequest(
          capnp::Text::Reader(message_.data(), message_.size()));
      break;
    case INTERNAL_ERROR:
      builder.setInternalError(
          capnp::Text::Reader(message_.data(), message_.size()));
      break;
  }
}

RunnerSettings RunnerSettings::FromFlags() {
  RunnerSettings settings;
  settings.max_code_length = Flags::max_code_length;
  settings.keep_artifacts = Flags::keep_artifacts;
  return settings;
}

kj::Promise<Response> Runner::Run(const std::string& code) {
  KJ_IF_MAYBE(error, ValidateCode(code, settings_.max_code_length)) {
    KJ_LOG(INFO, "Submission rejected", *error);
    return Response::InvalidRequest(*error);
  }

  staging::Artifact artifact;
  try {
    artifact = stager_->Stage(code);
  } catch (const std::system_error& e) {
    KJ_LOG(ERROR, "Cannot stage the submission", e.what());
    return Response::InternalError(std::string("Staging failed: ") +
                                   e.what());
  }

  auto retain = kj::defer([this, artifact]() { Retain(artifact); });
  return admission_
      ->Schedule<ExecutionResult>([this, artifact]() {
        return executor_->Execute(artifact, stager_->Root());
      })
      .then(
          [](ExecutionResult result) {
            return Response::Result(kj::mv(result));
          },
          [](kj::Exception&& exception) {
            if (exception.getType() == kj::Exception::Type::OVERLOADED) {
              KJ_LOG(WARNING, "Execution rejected", exception.getDescription());
            } else {
              KJ_LOG(ERROR, "Execution failed", exception);
            }
            return Response::InternalError(
                std::string(exception.getDescription().cStr()));
          })
      .attach(kj::mv(retain));
}

void Runner::Retain(const staging::Artifact& artifact) {
  if (settings_.keep_artifacts) return;
  try {
    stager_->Release(artifact);
  } catch (const std::system_error& e) {
    KJ_LOG(WARNING, "Cannot release artifact", artifact.id, e.what());
  }
}

}  // namespace runner
