#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace qrsx {

/* Chunk header line, format version 1:
     QRSX1|name|index|total|content_hash|payload_hash|P
     QRSX1|name|index|total|content_hash|payload_hash|E|salt|iv
   hashes are 64 lowercase hex chars, salt and iv 32 hex chars each. */
static const char HEADER_MAGIC[]="QRSX1";
static const char HEADER_DELIM='|';
static const size_t MAX_NAME_LEN=255;

struct ChunkHeader {
  std::string name;
  uint32_t index=0;
  uint32_t total=0;
  std::string content_hash;
  std::string payload_hash;
  bool encrypted=false;
  std::vector<unsigned char> salt;
  std::vector<unsigned char> iv;
};

// Drops path components, the delimiter and control characters.
std::string sanitize_name(const std::string& name);

std::string serialize_header(const ChunkHeader& h);

// Throws ChunkError(MalformedHeader). Returns by value only on success.
ChunkHeader parse_header(const std::string& line);
bool try_parse_header(const std::string& line,ChunkHeader& out);

// Longest header line serialize_header can produce for this name.
size_t max_header_len(const std::string& name,bool encrypted,uint32_t max_chunks);

// Splits a chunk text into its header line and payload; surrounding
// whitespace a scanner may add is trimmed.
void split_chunk_text(const std::string& text,std::string& header_line,std::string& payload);

} // namespace qrsx
