#include "server.hpp"

#include <cstdint>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace aegis::runtime {

using observability::IntField;
using observability::StringField;

Server::Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (grpc_server_) return;

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(options_.bind_address, ::grpc::InsecureServerCredentials(), &selected_port_);
  builder.SetMaxReceiveMessageSize(options_.max_message_bytes);
  builder.SetMaxSendMessageSize(options_.max_message_bytes);
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  // BuildAndStart can succeed with no port bound.
  if (grpc_server_ && selected_port_ == 0) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
  if (!grpc_server_) {
    throw util::IOError("admin service cannot listen on " + options_.bind_address);
  }

  AEGIS_LOG_INFO("admin service listening", {StringField("bind_address", options_.bind_address), IntField("port", selected_port_),
                                             IntField("services", static_cast<std::int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (!grpc_server_) return;
  grpc_server_->Shutdown(std::chrono::system_clock::now() + options_.shutdown_grace);
  grpc_server_.reset();
  AEGIS_LOG_DEBUG("admin service stopped");
}

} // namespace aegis::runtime
