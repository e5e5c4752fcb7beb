#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace qrsx {

std::string b64_encode(const std::vector<unsigned char>& in);
inline size_t b64_len(size_t raw){ return ((raw+2)/3)*4; }

// Strict decode: only the canonical encoding of some byte string is accepted,
// so a single changed character can never decode to the same bytes.
bool b64_decode(const std::string& in,std::vector<unsigned char>& out);

} // namespace qrsx
