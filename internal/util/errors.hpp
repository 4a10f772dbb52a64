#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace datahub::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DatasetAlreadyExistsError : public AlreadyExists {
 public:
  explicit DatasetAlreadyExistsError(const std::string& name) : AlreadyExists("Dataset " + name + " already exists") {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AuthError : public std::runtime_error {
 public:
  explicit AuthError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Raised by the memory and sqlite backends when a commit loses against a
  concurrent writer. Callers retry the whole transaction.
*/
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------
// Validation (rejected before any storage I/O)
// ---------------------------------------------------------------------

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NameLengthValidationError : public ValidationError {
 public:
  NameLengthValidationError(size_t min_len, size_t max_len)
      : ValidationError("Name must be between " + std::to_string(min_len) + " and " + std::to_string(max_len) + " characters") {
  }
};

class NameCharsValidationError : public ValidationError {
 public:
  NameCharsValidationError() : ValidationError("Name must only contain letters, numbers and hyphens and start with a letter") {
  }
};

class DescriptionLengthValidationError : public ValidationError {
 public:
  DescriptionLengthValidationError(size_t min_len, size_t max_len)
      : ValidationError("Description must be between " + std::to_string(min_len) + " and " + std::to_string(max_len) + " characters") {
  }
};

// ---------------------------------------------------------------------
// Quota
// ---------------------------------------------------------------------

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TierLimitError : public ResourceExhausted {
 public:
  explicit TierLimitError(uint64_t cap)
      : ResourceExhausted("You cannot ingest more than " + std::to_string(cap) + " datasets per day"), cap_(cap) {
  }

  uint64_t cap() const {
    return cap_;
  }

 private:
  uint64_t cap_;
};

// ---------------------------------------------------------------------
// Transfer / finalize
// ---------------------------------------------------------------------

class ChecksumMismatch : public std::runtime_error {
 public:
  ChecksumMismatch(uint32_t part_number, const std::string& expected, const std::string& actual)
      : std::runtime_error("checksum mismatch on part " + std::to_string(part_number) + ": expected " + expected + ", got " + actual),
        part_number_(part_number) {
  }

  uint32_t part_number() const {
    return part_number_;
  }

 private:
  uint32_t part_number_;
};

class StorageBackendError : public std::runtime_error {
 public:
  StorageBackendError(const std::string& msg, bool transient) : std::runtime_error(msg), transient_(transient) {
  }

  bool transient() const {
    return transient_;
  }

 private:
  bool transient_;
};

class FinalizeError : public std::runtime_error {
 public:
  explicit FinalizeError(const std::string& msg, std::vector<uint32_t> missing_parts = {})
      : std::runtime_error(msg), missing_parts_(std::move(missing_parts)) {
  }

  const std::vector<uint32_t>& missing_parts() const {
    return missing_parts_;
  }

 private:
  std::vector<uint32_t> missing_parts_;
};

} // namespace datahub::util
