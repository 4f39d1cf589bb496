#ifndef CLIENT_REPORT_HPP
#define CLIENT_REPORT_HPP

#include <ostream>

#include "capnp/runner.capnp.h"

namespace client {

// Exit statuses of the command-line tools.
static const constexpr int kInternalErrorStatus = 1;
static const constexpr int kInvalidRequestStatus = 2;
static const constexpr int kTimeoutStatus = 124;
static const constexpr int kMemoryLimitStatus = 137;

// Writes the program output to out and the error to err, and returns the exit
// status that represents the response.
int Report(capnproto::RunResponse::Reader response, std::ostream& out,
           std::ostream& err);

}  // namespace client

#endif
