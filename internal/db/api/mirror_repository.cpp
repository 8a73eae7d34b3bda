#include "internal/db/api/mirror_repository.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace mirrorguard::db {

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + " (" + ToString(result.code) + ")";
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::ConstraintViolation:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace mirrorguard::db
