#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace aegis::runtime {

struct ServerOptions {
  std::string               bind_address;
  std::chrono::milliseconds shutdown_grace{2000};
  int                       max_message_bytes = 4 * 1024 * 1024;
};

/*
  Hosts the admin services on one insecure listening port.
  Start() throws util::IOError when the address cannot be bound.
*/
class Server {
 public:
  Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  // Rejects new calls and waits up to shutdown_grace for running ones.
  void Stop();

  bool Running() const {
    return grpc_server_ != nullptr;
  }

  // Port actually bound; differs from the request when ":0" was asked for.
  int Port() const {
    return selected_port_;
  }

 private:
  ServerOptions                                 options_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           selected_port_ = 0;
};

} // namespace aegis::runtime
