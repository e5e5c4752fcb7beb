#pragma once
#include "config.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace qrsx {

class Secret;

struct SplitSummary {
  std::string name;          // sanitized, as stamped into every header
  uint32_t total=0;
  std::string content_hash;
  bool encrypted=false;
  uint64_t bytes=0;
};

struct SplitResult {
  std::vector<std::string> chunks;  // ordered by index
  SplitSummary summary;
};

// True when the sniffed prefix has no NUL byte and is valid UTF-8.
bool looks_like_text(const std::vector<unsigned char>& bytes,size_t sniff);

// [offset,length) segments covering the input exactly once, in order, each
// at most `capacity` bytes. Text is cut on line ends, binary on capacity.
std::vector<std::pair<size_t,size_t>> segment(const std::vector<unsigned char>& bytes,size_t capacity,bool text);

// Throws ChunkError(CapacityExceeded) when capacity is 0 or the artifact
// needs more than cfg.max_chunks chunks. passphrase may be null.
SplitResult split(const std::vector<unsigned char>& bytes,const std::string& name,size_t capacity,
                  const Secret* passphrase,const Config& cfg);

// name_part_{index}_of_{total}
std::string part_name(const std::string& name,uint32_t index,uint32_t total);

} // namespace qrsx
