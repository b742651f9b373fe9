#include "tg/fault.h"

#include <cerrno>
#include <sstream>

namespace tg {

Retryability ClassifyNativeError(int native) noexcept {
  switch (native) {
#if defined(EINTR)
    case EINTR:
#endif
#if defined(EAGAIN)
    case EAGAIN:
#endif
#if defined(EWOULDBLOCK) && (!defined(EAGAIN) || EWOULDBLOCK != EAGAIN)
    case EWOULDBLOCK:
#endif
      return Retryability::kTransient;
#if defined(EBUSY)
    case EBUSY:
      return Retryability::kTransient;
#endif
#if defined(ENOMEM)
    case ENOMEM:
      return Retryability::kTransient;
#endif
    default:
      break;
  }
  return Retryability::kFatal;
}

Fault Fault::InvalidRoot(std::string msg, std::optional<int> native) {
  Fault fault{FaultKind::kInvalidRoot, std::move(msg)};
  fault.native_code = native;
  return fault;
}

Fault Fault::PathTraversal(std::string msg, std::string subject) {
  Fault fault{FaultKind::kPathTraversal, std::move(msg)};
  fault.subject = std::move(subject);
  return fault;
}

Fault Fault::NotFound(std::string msg, std::string subject, std::optional<int> native) {
  Fault fault{FaultKind::kNotFound, std::move(msg)};
  fault.subject = std::move(subject);
  fault.native_code = native;
  return fault;
}

Fault Fault::SpawnFailed(std::string msg, std::optional<int> native) {
  Fault fault{FaultKind::kSpawnFailed, std::move(msg)};
  fault.native_code = native;
  if (native) {
    // A transient fork/pipe error is still surfaced; the class only informs the caller.
    const auto native_class = ClassifyNativeError(*native);
    if (native_class == Retryability::kTransient) {
      fault.retryability = native_class;
    }
  }
  return fault;
}

Fault Fault::NonZeroExit(int code, std::string msg) {
  Fault fault{FaultKind::kNonZeroExit, std::move(msg)};
  fault.exit_code = code;
  return fault;
}

Fault Fault::InvalidConfig(std::string msg, std::string subject) {
  Fault fault{FaultKind::kInvalidConfig, std::move(msg)};
  fault.subject = std::move(subject);
  return fault;
}

Fault Fault::MemoryLockFailed(std::string msg, std::optional<int> native) {
  Fault fault{FaultKind::kMemoryLockFailed, std::move(msg)};
  fault.native_code = native;
  return fault;
}

std::string Fault::Describe() const {
  std::ostringstream oss;
  oss << message;
  for (const auto& entry : context) {
    oss << "\n  while: " << entry;
  }
  return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Fault& fault) {
  os << FaultKindName(fault.kind) << ": " << fault.message;
  if (fault.exit_code) {
    os << " (exit " << *fault.exit_code << ')';
  }
  if (fault.native_code) {
    os << " (errno " << *fault.native_code << ')';
  }
  return os;
}

} // namespace tg
