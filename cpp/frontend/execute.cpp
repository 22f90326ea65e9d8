#include "frontend/execute.hpp"
#include <unistd.h>

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/debug.h>

#include "capnp/execution.capnp.h"
#include "frontend/codec.hpp"
#include "frontend/options.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace frontend {
kj::MainBuilder::Validity ExecuteMain::Run() {
  util::LogManager log_manager(context);
  config::Config config = LoadConfigOrExit(context);

  capnp::JsonCodec codec;
  sandbox::ExecutionRequest request;
  try {
    if (binary) {
      capnp::StreamFdMessageReader reader(STDIN_FILENO);
      request =
          FromCapnp(reader.getRoot<capnproto::ExecutionRequest>(), config);
    } else {
      std::string json = util::File::ReadFd(STDIN_FILENO);
      capnp::MallocMessageBuilder message;
      auto builder = message.initRoot<capnproto::ExecutionRequest>();
      codec.decode(kj::ArrayPtr<const char>(json.data(), json.size()),
                   builder);
      request = FromCapnp(builder.asReader(), config);
    }
  } catch (const kj::Exception& e) {
    context.exitError(kj::str("Invalid request: ", e.getDescription()));
  }
  KJ_LOG(INFO, "Executing", request.code.size(), request.timeout_millis);

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create(config);
  sandbox::ExecutionResult result;
  std::string error_msg;
  if (!sb->Execute(request, &result, &error_msg)) {
    context.exitError(kj::str("Failed to start: ", error_msg.c_str()));
  }

  capnp::MallocMessageBuilder message;
  auto builder = message.initRoot<capnproto::ExecutionResult>();
  ToCapnp(result, builder);
  if (binary) {
    capnp::writeMessageToFd(STDOUT_FILENO, message);
  } else {
    kj::String json = codec.encode(builder.asReader());
    util::File::WriteFd(STDOUT_FILENO, std::string(json.cStr()) + "\n");
  }
  return true;
}

kj::MainFunc ExecuteMain::getMain() {
  kj::MainBuilder builder(context, "wasi-exec execute (" + util::version + ")",
                          "Reads an ExecutionRequest from stdin, runs it and "
                          "writes the ExecutionResult to stdout");
  return AddConfigOptions(builder)
      .addOption({'b', "bin"}, util::setBool(binary),
                 "Read/write the request/result as binary Cap'n Proto "
                 "messages instead of JSON")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace frontend
