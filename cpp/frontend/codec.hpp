#ifndef FRONTEND_CODEC_HPP
#define FRONTEND_CODEC_HPP

#include <cstdint>

#include "capnp/execution.capnp.h"
#include "config/config.hpp"
#include "sandbox/sandbox.hpp"

namespace frontend {

// Applies the default timeout to a request that has none (0) and clamps the
// result to [1, config.max_timeout_millis].
int64_t ClampTimeout(int64_t requested_millis, const config::Config& config);

sandbox::ExecutionRequest FromCapnp(capnproto::ExecutionRequest::Reader reader,
                                    const config::Config& config);

void ToCapnp(const sandbox::ExecutionResult& result,
             capnproto::ExecutionResult::Builder builder);

}  // namespace frontend

#endif
