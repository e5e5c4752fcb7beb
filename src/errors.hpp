#pragma once
#include <stdexcept>
#include <string>

namespace qrsx {

enum class ErrorKind {
  MalformedHeader,
  ConflictingChunk,
  IntegrityMismatch,
  DecryptionFailed,
  MissingPassphrase,
  CapacityExceeded,
  IncompleteSet,
  NoChunks
};

inline const char* kind_name(ErrorKind k){
  switch(k){
    case ErrorKind::MalformedHeader:   return "MalformedHeader";
    case ErrorKind::ConflictingChunk:  return "ConflictingChunk";
    case ErrorKind::IntegrityMismatch: return "IntegrityMismatch";
    case ErrorKind::DecryptionFailed:  return "DecryptionFailed";
    case ErrorKind::MissingPassphrase: return "MissingPassphrase";
    case ErrorKind::CapacityExceeded:  return "CapacityExceeded";
    case ErrorKind::IncompleteSet:     return "IncompleteSet";
    case ErrorKind::NoChunks:          return "NoChunks";
  }
  return "Unknown";
}

class ChunkError : public std::runtime_error {
public:
  ChunkError(ErrorKind k,const std::string& msg) : std::runtime_error(msg), kind_(k) {}
  ErrorKind kind() const { return kind_; }
private:
  ErrorKind kind_;
};

} // namespace qrsx
