#include "db_errors.hpp"

#include "internal/util/errors.hpp"

namespace ure::core {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::ConstraintViolation:
      throw util::ValidationError(message);
    case db::ErrorCode::ForeignKeyViolation:
      throw util::ReferentialError(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::Busy:
    case db::ErrorCode::SerializationFailure:
      throw util::ConcurrencyConflict(message);
    case db::ErrorCode::IOError:
    case db::ErrorCode::Corruption:
    case db::ErrorCode::Unsupported:
    case db::ErrorCode::InternalError:
    case db::ErrorCode::OK:
      break;
  }
  throw util::StoreFailure(message);
}

} // namespace ure::core
