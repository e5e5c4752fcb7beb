#pragma once
#include "config.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace qrsx {

enum class InputKind {
  SingleImage,
  SingleChunkText,
  DirectoryImagesOnly,
  DirectoryChunksOnly,
  DirectoryMixed,
  Unknown
};

enum class EntryKind { Image, ChunkText, Other };

struct Classification {
  InputKind kind=InputKind::Unknown;
  size_t images=0;
  size_t chunk_texts=0;
  size_t others=0;
  std::vector<std::string> image_paths;
  std::vector<std::string> chunk_paths;
};

const char* input_kind_name(InputKind k);

bool image_magic(const std::vector<unsigned char>& head);
bool image_extension(const std::string& path);

// Image by magic bytes or extension, chunk-text when the first line parses as a header.
EntryKind classify_entry(const std::string& path,const Config& cfg);

// Looks at a file, or at the top level of a directory. Throws
// std::runtime_error when the path does not exist.
Classification classify(const std::string& path,const Config& cfg);

} // namespace qrsx
