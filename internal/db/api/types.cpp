#include "internal/db/api/types.hpp"

#include "internal/db/api/result.hpp"

namespace ure::db {

const char* ToString(EntityKind kind) {
  switch (kind) {
    case EntityKind::kDevice:
      return "device";
    case EntityKind::kBehavior:
      return "behavior";
    case EntityKind::kIngestSession:
      return "ingest_session";
    case EntityKind::kUniformResource:
      return "uniform_resource";
    case EntityKind::kUniformResourceTransform:
      return "uniform_resource_transform";
  }
  return "unknown";
}

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "OK";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::AlreadyExists:
      return "AlreadyExists";
    case ErrorCode::Conflict:
      return "Conflict";
    case ErrorCode::Busy:
      return "Busy";
    case ErrorCode::ConstraintViolation:
      return "ConstraintViolation";
    case ErrorCode::ForeignKeyViolation:
      return "ForeignKeyViolation";
    case ErrorCode::SerializationFailure:
      return "SerializationFailure";
    case ErrorCode::IOError:
      return "IOError";
    case ErrorCode::Corruption:
      return "Corruption";
    case ErrorCode::Unsupported:
      return "Unsupported";
    case ErrorCode::InternalError:
      return "InternalError";
  }
  return "Unknown";
}

} // namespace ure::db
