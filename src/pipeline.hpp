#pragma once
#include "assembler.hpp"
#include "classifier.hpp"
#include "config.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace qrsx {

class ImageDecoder;
class Secret;

struct RebuildResult {
  std::vector<Classification> inputs;  // one per path, in order
  size_t images_scanned=0;
  size_t images_skipped=0;             // no decoder, or the decoder failed
  AssemblyReport report;
};

// Asked once, and only when encrypted chunks were collected. May be empty.
// A source that throws std::runtime_error or returns null declines; plain
// artifacts are still rebuilt.
typedef std::function<const Secret*()> PassphraseSource;

// scan -> classify -> gather chunk texts -> assemble. Chunk texts from
// images and from text files of the same artifact go into one batch.
// decoder may be null; images are then reported as skipped.
RebuildResult rebuild(const std::vector<std::string>& paths,const PassphraseSource& passphrase,
                      ImageDecoder* decoder,const Config& cfg);

// Column-aware tab expansion; the column restarts after \n and \r.
std::vector<unsigned char> expand_tabs(const std::vector<unsigned char>& in,unsigned width);

// Writes each artifact as folder/name. Existing files are kept unless
// force is set. Returns the paths written.
std::vector<std::string> write_artifacts(const AssemblyReport& rep,const std::string& folder,
                                         bool force,unsigned tab_width);

} // namespace qrsx
