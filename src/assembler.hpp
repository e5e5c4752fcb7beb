#pragma once
#include "config.hpp"
#include "errors.hpp"
#include "header.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace qrsx {

class Secret;

struct ChunkInput {
  std::string source;   // file path, image path, or a label
  std::string text;
};

struct Artifact {
  std::string name;
  std::string content_hash;
  uint32_t total=0;
  bool encrypted=false;
  std::vector<unsigned char> bytes;
};

struct IncompleteSet {
  std::string name;
  std::string content_hash;
  uint32_t total=0;
  std::vector<uint32_t> missing;
};

struct RejectedInput {
  std::string source;
  std::string raw_text;
  ErrorKind kind=ErrorKind::MalformedHeader;
  std::string reason;
};

struct FailedArtifact {
  std::string name;
  std::string content_hash;
  ErrorKind kind=ErrorKind::IntegrityMismatch;
  std::string reason;
  std::vector<std::string> sources;  // offending inputs, for conflicts
};

struct AssemblyReport {
  std::vector<Artifact> artifacts;
  std::vector<IncompleteSet> incomplete;
  std::vector<RejectedInput> rejected;
  std::vector<FailedArtifact> failed;
  size_t duplicates=0;
  size_t accepted=0;
  bool clean() const { return incomplete.empty() && failed.empty() && rejected.empty(); }
};

/* Accumulates chunks into ChunkSets keyed by (name, content_hash) as they
   arrive. add() may be called from several threads. */
class ChunkCollector {
public:
  explicit ChunkCollector(const Config& cfg) : cfg_(cfg) {}

  // Parses, decodes and checks the payload hash outside the lock; only the
  // set insertion and the duplicate/conflict check are serialized.
  // Returns false when the input was rejected.
  bool add(const ChunkInput& in);

  // Reconstructs every set and empties the collector. Throws
  // ChunkError(NoChunks) when no input had a parseable header; inputs that
  // parsed but were rejected later are returned under `rejected`.
  AssemblyReport finish(const Secret* passphrase);

  size_t pending_sets() const;
  bool needs_passphrase() const;

private:
  struct Member {
    ChunkHeader h;
    std::string header_line;
    std::vector<unsigned char> raw;
    std::string source;
  };
  struct Set {
    std::string name;
    std::string content_hash;
    uint32_t total=0;
    std::map<uint32_t,Member> members;
    bool conflict=false;
    std::string conflict_reason;
    std::vector<std::string> conflict_sources;
  };

  void reject(const ChunkInput& in,ErrorKind k,const std::string& why);

  Config cfg_;
  mutable std::mutex mu_;
  std::map<std::pair<std::string,std::string>,Set> sets_;
  std::vector<RejectedInput> rejected_;
  size_t seen_=0;
  size_t parsed_=0;   // inputs whose header line parsed
  size_t duplicates_=0;
  size_t accepted_=0;
};

AssemblyReport assemble(const std::vector<ChunkInput>& inputs,const Secret* passphrase,const Config& cfg);
// labels inputs "#1", "#2", ...
AssemblyReport assemble(const std::vector<std::string>& texts,const Secret* passphrase,const Config& cfg);

} // namespace qrsx
