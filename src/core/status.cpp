// src/core/status.cpp
#include "runbox/core/status.hpp"

namespace runbox {

const char* code_name(Status::Code code) noexcept {
  switch (code) {
    case Status::Code::kOk: return "Ok";
    case Status::Code::kInvalidRequest: return "InvalidRequest";
    case Status::Code::kUnauthorized: return "Unauthorized";
    case Status::Code::kNoEntrypoint: return "NoEntrypoint";
    case Status::Code::kWorkspaceCollision: return "WorkspaceCollision";
    case Status::Code::kInvalidArchive: return "InvalidArchive";
    case Status::Code::kDependencyInstallFailed: return "DependencyInstallFailed";
    case Status::Code::kPublishFailed: return "PublishFailed";
    case Status::Code::kNotFound: return "NotFound";
    case Status::Code::kIoError: return "IoError";
    case Status::Code::kParseError: return "ParseError";
    case Status::Code::kInternal: return "UnexpectedInternal";
  }
  return "UnexpectedInternal";
}

}  // namespace runbox
