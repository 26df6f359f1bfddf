// Repository: RTMix
// Component: MixControl gRPC Service Implementation
// Purpose: Adapts MixControl RPCs onto the parameter resolver and pipeline orchestrator.
// Copyright (c) 2025 RetroVue

#include "MixService.h"

#include <sstream>

#include <vector>

#include "rtmix/mix/ParameterResolver.hpp"
#include "rtmix/util/Logger.hpp"

namespace rtmix::service {

namespace {

mix::KnobSource ToKnobSource(const google::protobuf::Map<std::string, std::string>& params) {
  mix::KnobSource out;
  for (const auto& kv : params) {
    out[kv.first] = kv.second;
  }
  return out;
}

}  // namespace

MixControlImpl::MixControlImpl(const mix::MixerConfig& config, engine::IDspEngine& engine)
    : config_(config), orchestrator_(config, engine) {}

bool MixControlImpl::CheckClientPath(const char* what, const std::string& path,
                                     std::string* error) const {
  if (path.empty() || pipeline::WorkArea::IsWithin(path, config_.ClientPathRoot())) {
    return true;
  }
  *error = std::string(what) + " path '" + path + "' is outside " + config_.ClientPathRoot();
  return false;
}

bool MixControlImpl::MaterializeSource(const rtmix::v1::AssetSource& source,
                                       pipeline::AssetRole role,
                                       std::optional<pipeline::WorkArea>* uploads,
                                       std::string* path,
                                       std::string* error) const {
  switch (source.source_case()) {
    case rtmix::v1::AssetSource::kPath:
      *path = source.path();
      return true;
    case rtmix::v1::AssetSource::kData: {
      if (!uploads->has_value()) {
        *uploads = pipeline::WorkArea::Create(config_.work_root, "rtmix_upload",
                                              pipeline::WorkArea::NewRunId(), error);
        if (!uploads->has_value()) return false;
      }
      *path = (*uploads)->WriteFile(std::string(pipeline::ToString(role)) + ".upload",
                                    source.data(), error);
      return !path->empty();
    }
    case rtmix::v1::AssetSource::SOURCE_NOT_SET:
      path->clear();
      return true;
  }
  path->clear();
  return true;
}

grpc::Status MixControlImpl::Mix(grpc::ServerContext* context,
                                 const rtmix::v1::MixRequest* request,
                                 rtmix::v1::MixResponse* response) {
  (void)context;
  if (!request->has_narration() ||
      request->narration().source_case() == rtmix::v1::AssetSource::SOURCE_NOT_SET) {
    util::Logger::Warn("[Mix] rejected: narration missing");
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "narration is required");
  }

  struct NamedSource {
    const rtmix::v1::AssetSource& source;
    pipeline::AssetRole role;
    std::string* path;
  };
  pipeline::MixAssets assets;
  const std::vector<NamedSource> sources = {
      {request->intro_bed(), pipeline::AssetRole::kIntroBed, &assets.intro_bed_path},
      {request->narration(), pipeline::AssetRole::kNarration, &assets.narration_path},
      {request->outro_bed(), pipeline::AssetRole::kOutroBed, &assets.outro_bed_path},
      {request->song_clip(), pipeline::AssetRole::kSongClip, &assets.song_clip_path},
  };

  std::string error;
  bool paths_ok = CheckClientPath("output", request->output_path(), &error);
  for (const auto& s : sources) {
    if (!paths_ok) break;
    if (s.source.source_case() == rtmix::v1::AssetSource::kPath) {
      paths_ok = CheckClientPath(pipeline::ToString(s.role), s.source.path(), &error);
    }
  }
  if (!paths_ok) {
    util::Logger::Warn("[Mix] rejected: " + error);
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, error);
  }

  const mix::MixRequest knobs = mix::ParameterResolver::Resolve(
      ToKnobSource(request->query_params()), ToKnobSource(request->form_params()));
  util::Logger::Info("[Mix] Request received: " + knobs.ToString());

  std::optional<pipeline::WorkArea> uploads;
  bool materialized = true;
  for (const auto& s : sources) {
    materialized = MaterializeSource(s.source, s.role, &uploads, s.path, &error);
    if (!materialized) break;
  }
  if (!materialized) {
    util::Logger::Error("[Mix] upload failed: " + error);
    if (uploads.has_value()) {
      std::string cleanup_error;
      if (!uploads->RemoveAll(&cleanup_error)) util::Logger::Warn("[Mix] " + cleanup_error);
    }
    return grpc::Status(grpc::StatusCode::INTERNAL, "upload failed: " + error);
  }

  pipeline::RunOptions options;
  options.output_path = request->output_path();
  const pipeline::PipelineResult result = orchestrator_.Run(assets, knobs, options);

  if (uploads.has_value() && !config_.retain_artifacts) {
    std::string cleanup_error;
    if (!uploads->RemoveAll(&cleanup_error)) util::Logger::Warn("[Mix] " + cleanup_error);
  }

  response->set_success(result.ok);
  response->set_error(pipeline::ToString(result.error));
  response->set_failed_stage(result.failed_stage);
  response->set_detail(result.detail);
  response->set_output_path(result.output_path);
  response->set_run_id(result.run_id);
  response->set_early_exit(result.early_exit());

  std::ostringstream oss;
  oss << "[Mix] run=" << result.run_id << " success=" << result.ok
      << " error=" << pipeline::ToString(result.error);
  util::Logger::Info(oss.str());
  return grpc::Status::OK;
}

grpc::Status MixControlImpl::GetVersion(grpc::ServerContext* context,
                                        const rtmix::v1::ApiVersionRequest* request,
                                        rtmix::v1::ApiVersion* response) {
  (void)context;
  (void)request;
  response->set_version(kApiVersion);
  return grpc::Status::OK;
}

}  // namespace rtmix::service
