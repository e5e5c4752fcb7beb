#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace qrsx {

/* Medium limits and run options. Passed explicitly into split/assemble. */
struct Config {
  size_t medium_chars=2953;      // QR version 40-L, byte mode
  double safety_margin=0.8;      // stay under this share of the medium
  uint32_t max_chunks=9999;
  unsigned jobs=0;               // 0: one worker per hardware thread
  uint32_t kdf_iterations=100000;
  size_t sniff_bytes=8192;       // prefix inspected by text detection and the classifier

  // Raw segment budget (bytes before encoding) so that header, newline,
  // base64 expansion and CBC padding all fit the medium. 0 if nothing fits.
  size_t capacity_for_medium(const std::string& name,bool encrypted) const;
  unsigned workers() const;
  std::string describe() const;
};

} // namespace qrsx
