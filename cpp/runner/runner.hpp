#ifndef RUNNER_RUNNER_HPP
#define RUNNER_RUNNER_HPP

#include <cstddef>
#include <string>

#include <kj/async.h>

#include "capnp/runner.capnp.h"
#include "runner/admission.hpp"
#include "runner/executor.hpp"
#include "runner/result.hpp"
#include "staging/stager.hpp"

namespace runner {

// The answer to a submission: either a result, or the reason why the code
// was not run.
class Response {
 public:
  enum Kind { RESULT, INVALID_REQUEST, INTERNAL_ERROR };

  static Response Result(ExecutionResult result) {
    return Response(RESULT, kj::mv(result), "");
  }
  static Response InvalidRequest(std::string message) {
    return Response(INVALID_REQUEST, nullptr, std::move(message));
  }
  static Response InternalError(std::string message) {
    return Response(INTERNAL_ERROR, nullptr, std::move(message));
  }

  Kind GetKind() const { return kind_; }
  // Only valid for RESULT.
  const ExecutionResult& GetResult() const;
  // Only valid for INVALID_REQUEST and INTERNAL_ERROR.
  const std::string& Message() const { return message_; }

  void ToCapnp(capnproto::RunResponse::Builder builder) const;

 private:
  Response(Kind kind, kj::Maybe<ExecutionResult> result, std::string message)
      : kind_(kind), result_(kj::mv(result)), message_(std::move(message)) {}

  Kind kind_;
  kj::Maybe<ExecutionResult> result_;
  std::string message_;
};

struct RunnerSettings {
  // In code points.
  size_t max_code_length = 0;
  bool keep_artifacts = false;

  static RunnerSettings FromFlags();
};

// Takes a submission from validation to its response: the code is checked,
// staged, admitted and executed, then the artifact is released unless
// artifacts are kept.
class Runner {
 public:
  Runner(staging::Stager* stager, Admission* admission, Executor* executor,
         RunnerSettings settings)
      : stager_(stager),
        admission_(admission),
        executor_(executor),
        settings_(settings) {}
  KJ_DISALLOW_COPY(Runner);

  // Never rejected: failures are reported as INTERNAL_ERROR responses.
  kj::Promise<Response> Run(const std::string& code);

 private:
  void Retain(const staging::Artifact& artifact);

  staging::Stager* stager_;
  Admission* admission_;
  Executor* executor_;
  RunnerSettings settings_;
};

}  // namespace runner

#endif
