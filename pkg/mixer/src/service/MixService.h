// Repository: RTMix
// Component: MixControl gRPC Service Implementation
// Purpose: Adapts MixControl RPCs onto the parameter resolver and pipeline orchestrator.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_SERVICE_MIX_SERVICE_H_
#define RTMIX_SERVICE_MIX_SERVICE_H_

#include <optional>
#include <string>

#include <grpcpp/grpcpp.h>

#include "rtmix.grpc.pb.h"
#include "rtmix.pb.h"
#include "rtmix/engine/IDspEngine.hpp"
#include "rtmix/mix/MixerConfig.hpp"
#include "rtmix/pipeline/PipelineOrchestrator.hpp"
#include "rtmix/pipeline/PipelineTypes.hpp"
#include "rtmix/pipeline/WorkArea.hpp"

namespace rtmix::service {

// MixControlImpl is a thin adapter: it materializes uploaded bytes, resolves
// knobs once, runs the pipeline and copies the result into the response.
//
// Pipeline failures (invalid input, engine failure, configuration) are
// reported in the response with grpc::Status::OK. Non-OK status is reserved
// for malformed requests and upload I/O failures.
//
// Clients are not trusted with the daemon's filesystem: every asset path and
// output_path must resolve beneath config.ClientPathRoot(), otherwise the
// call fails with INVALID_ARGUMENT before anything is read or written.
class MixControlImpl final : public rtmix::v1::MixControl::Service {
 public:
  static constexpr const char* kApiVersion = "1.0.0";

  // Both references must outlive the service.
  MixControlImpl(const mix::MixerConfig& config, engine::IDspEngine& engine);
  ~MixControlImpl() override = default;

  MixControlImpl(const MixControlImpl&) = delete;
  MixControlImpl& operator=(const MixControlImpl&) = delete;

  grpc::Status Mix(grpc::ServerContext* context,
                   const rtmix::v1::MixRequest* request,
                   rtmix::v1::MixResponse* response) override;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const rtmix::v1::ApiVersionRequest* request,
                          rtmix::v1::ApiVersion* response) override;

 private:
  // Resolves one AssetSource to a readable path. Byte uploads are written
  // into *uploads (created on first use). Returns false and fills *error on
  // I/O failure.
  // False and *error when `path` is non-empty and outside ClientPathRoot().
  bool CheckClientPath(const char* what, const std::string& path, std::string* error) const;

  bool MaterializeSource(const rtmix::v1::AssetSource& source,
                         pipeline::AssetRole role,
                         std::optional<pipeline::WorkArea>* uploads,
                         std::string* path,
                         std::string* error) const;

  const mix::MixerConfig& config_;
  pipeline::PipelineOrchestrator orchestrator_;
};

}  // namespace rtmix::service

#endif  // RTMIX_SERVICE_MIX_SERVICE_H_
