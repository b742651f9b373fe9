#include "tg/boundary/path_guard.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <system_error>

#include "tg/common.h"

namespace tg::boundary {

namespace {

enum class Utf8ValidationResult {
  kOk,
  kInvalidEncoding,
  kDisallowed,
};

// Invisible, bidi-control and separator lookalike code points. A name that
// renders like "a/b" or reorders on screen is refused outright.
bool IsDisallowedUnicodeCodePoint(char32_t cp) noexcept {
  if (cp == 0x7F) {
    return true;
  }
  if (cp >= 0x80 && cp <= 0x9F) {
    return true;
  }
  if (cp >= 0x200B && cp <= 0x200F) {
    return true;
  }
  if (cp >= 0x202A && cp <= 0x202E) {
    return true;
  }
  if (cp >= 0x2066 && cp <= 0x2069) {
    return true;
  }
  switch (cp) {
    case 0x2024: // one dot leader
    case 0x2028:
    case 0x2029:
    case 0x2044: // fraction slash
    case 0x2060:
    case 0x2215: // division slash
    case 0x29F5:
    case 0x29F8: // big solidus
    case 0xFEFF:
    case 0xFE52:
    case 0xFF0E: // fullwidth full stop
    case 0xFF0F: // fullwidth solidus
    case 0xFF3C: // fullwidth reverse solidus
      return true;
    default:
      return false;
  }
}

bool DecodeNextUtf8CodePoint(std::string_view raw, std::size_t& index, char32_t& cp) noexcept {
  if (index >= raw.size()) {
    return false;
  }
  const unsigned char lead = static_cast<unsigned char>(raw[index]);
  ++index;
  if (lead < 0x80) {
    cp = static_cast<char32_t>(lead);
    return true;
  }
  if ((lead >> 5) == 0x6) {
    if (index >= raw.size()) {
      return false;
    }
    const unsigned char b1 = static_cast<unsigned char>(raw[index]);
    if ((b1 & 0xC0) != 0x80) {
      return false;
    }
    ++index;
    cp = static_cast<char32_t>(((lead & 0x1F) << 6) | (b1 & 0x3F));
    return cp >= 0x80; // overlong
  }
  if ((lead >> 4) == 0xE) {
    if (index + 1 >= raw.size()) {
      return false;
    }
    const unsigned char b1 = static_cast<unsigned char>(raw[index]);
    const unsigned char b2 = static_cast<unsigned char>(raw[index + 1]);
    if ((b1 & 0xC0) != 0x80 || (b2 & 0xC0) != 0x80) {
      return false;
    }
    index += 2;
    cp = static_cast<char32_t>(((lead & 0x0F) << 12) | ((b1 & 0x3F) << 6) | (b2 & 0x3F));
    return cp >= 0x800 && !(cp >= 0xD800 && cp <= 0xDFFF);
  }
  if ((lead >> 3) == 0x1E) {
    if (index + 2 >= raw.size()) {
      return false;
    }
    const unsigned char b1 = static_cast<unsigned char>(raw[index]);
    const unsigned char b2 = static_cast<unsigned char>(raw[index + 1]);
    const unsigned char b3 = static_cast<unsigned char>(raw[index + 2]);
    if ((b1 & 0xC0) != 0x80 || (b2 & 0xC0) != 0x80 || (b3 & 0xC0) != 0x80) {
      return false;
    }
    index += 3;
    cp = static_cast<char32_t>(((lead & 0x07) << 18) | ((b1 & 0x3F) << 12) |
                               ((b2 & 0x3F) << 6) | (b3 & 0x3F));
    return cp >= 0x10000 && cp <= 0x10FFFF;
  }
  return false;
}

Utf8ValidationResult CheckUtf8Safety(std::string_view raw) noexcept {
  std::size_t index = 0;
  while (index < raw.size()) {
    char32_t cp = 0;
    if (!DecodeNextUtf8CodePoint(raw, index, cp)) {
      return Utf8ValidationResult::kInvalidEncoding;
    }
    if (cp <= 0x1F || IsDisallowedUnicodeCodePoint(cp)) {
      return Utf8ValidationResult::kDisallowed;
    }
  }
  return Utf8ValidationResult::kOk;
}

// %2f, %5c and %2e in any case: an encoded separator or dot that a later
// decoding layer could turn into a traversal.
bool ContainsEncodedSeparator(std::string_view raw) noexcept {
  for (std::size_t i = 0; i + 2 < raw.size(); ++i) {
    if (raw[i] != '%') {
      continue;
    }
    const char hi = raw[i + 1];
    const char lo = static_cast<char>(std::tolower(static_cast<unsigned char>(raw[i + 2])));
    if ((hi == '2' && (lo == 'f' || lo == 'e')) || (hi == '5' && lo == 'c')) {
      return true;
    }
  }
  return false;
}

bool HasDrivePrefix(std::string_view raw) noexcept {
  return raw.size() >= 2 && std::isalpha(static_cast<unsigned char>(raw[0])) && raw[1] == ':';
}

bool HasParentSegment(std::string_view raw) noexcept {
  std::size_t start = 0;
  while (start <= raw.size()) {
    const std::size_t end = std::min(raw.find('/', start), raw.size());
    if (raw.substr(start, end - start) == "..") {
      return true;
    }
    start = end + 1;
  }
  return false;
}

// Component-wise prefix test; "/data2" is not inside "/data".
bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& resolved) {
  return std::mismatch(root.begin(), root.end(), resolved.begin(), resolved.end()).first ==
         root.end();
}

} // namespace

std::string ValidatedPath::Utf8() const {
  return PathToUtf8String(path_);
}

Outcome<PathGuard> PathGuard::Create(const std::filesystem::path& root, PathGuardOptions options) {
  if (root.empty()) {
    return Fail(Fault::InvalidRoot("root path is empty"));
  }
  std::error_code ec;
  auto canonical = std::filesystem::canonical(root, ec);
  if (ec) {
    return Fail(Fault::InvalidRoot("root cannot be resolved: " + ec.message(), ec.value()));
  }
  const bool is_dir = std::filesystem::is_directory(canonical, ec);
  if (ec) {
    return Fail(Fault::InvalidRoot("root cannot be inspected: " + ec.message(), ec.value()));
  }
  if (!is_dir) {
    return Fail(Fault::InvalidRoot("root is not a directory", ENOTDIR));
  }
  return PathGuard(std::move(canonical), options);
}

Fault PathGuard::Traversal(std::string message, std::string_view candidate) const {
  return Fault::PathTraversal(std::move(message),
                              TruncateForAudit(candidate, options_.audit_subject_max));
}

std::optional<Fault> PathGuard::CheckLexical(std::string_view candidate) const {
  if (candidate.empty()) {
    return Traversal("empty path", candidate);
  }
  switch (CheckUtf8Safety(candidate)) {
    case Utf8ValidationResult::kOk:
      break;
    case Utf8ValidationResult::kInvalidEncoding:
      return Traversal("path contains invalid UTF-8 encoding", candidate);
    case Utf8ValidationResult::kDisallowed:
      return Traversal("path contains control or lookalike characters", candidate);
  }
  if (candidate.find('\\') != std::string_view::npos) {
    return Traversal("path contains a backslash", candidate);
  }
  if (candidate.front() == '/' || HasDrivePrefix(candidate)) {
    return Traversal("absolute path not allowed", candidate);
  }
  if (ContainsEncodedSeparator(candidate)) {
    return Traversal("path contains an encoded separator or dot", candidate);
  }
  if (HasParentSegment(candidate)) {
    return Traversal("path escape attempt detected", candidate);
  }
  return std::nullopt;
}

bool PathGuard::Contains(const std::filesystem::path& resolved) const {
  return IsWithin(root_, resolved);
}

Outcome<ValidatedPath> PathGuard::Validate(std::string_view candidate) const {
  if (auto fault = CheckLexical(candidate)) {
    return Fail(std::move(*fault));
  }
  std::error_code ec;
  auto resolved = std::filesystem::canonical(root_ / std::filesystem::path(candidate), ec);
  if (ec) {
    return Fail(Fault::NotFound("path cannot be resolved: " + ec.message(),
                                TruncateForAudit(candidate, options_.audit_subject_max),
                                ec.value()));
  }
  if (!Contains(resolved)) {
    return Fail(Traversal("resolved path escapes root", candidate));
  }
  return ValidatedPath(std::move(resolved), root_);
}

Outcome<ValidatedPath> PathGuard::ValidateForCreate(std::string_view candidate) const {
  if (auto fault = CheckLexical(candidate)) {
    return Fail(std::move(*fault));
  }
  auto target = (root_ / std::filesystem::path(candidate)).lexically_normal();
  if (!target.has_filename()) {
    target = target.parent_path();
  }

  std::error_code ec;
  const auto status = std::filesystem::symlink_status(target, ec);
  if (status.type() != std::filesystem::file_type::not_found) {
    if (ec) {
      return Fail(Fault::NotFound("path cannot be inspected: " + ec.message(),
                                  TruncateForAudit(candidate, options_.audit_subject_max),
                                  ec.value()));
    }
    // Existing entries (dangling symlinks included) resolve like Validate.
    return Validate(candidate);
  }

  ec.clear();
  auto parent = std::filesystem::canonical(target.parent_path(), ec);
  if (ec) {
    return Fail(Fault::NotFound("parent directory cannot be resolved: " + ec.message(),
                                TruncateForAudit(candidate, options_.audit_subject_max),
                                ec.value()));
  }
  if (!Contains(parent)) {
    return Fail(Traversal("parent directory escapes root", candidate));
  }
  if (!std::filesystem::is_directory(parent, ec)) {
    return Fail(Fault::NotFound("parent is not a directory",
                                TruncateForAudit(candidate, options_.audit_subject_max),
                                ec ? ec.value() : ENOTDIR));
  }
  return ValidatedPath(parent / target.filename(), root_);
}

} // namespace tg::boundary
