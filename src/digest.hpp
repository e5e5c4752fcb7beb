#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <openssl/evp.h>

namespace qrsx {

/* SHA-256 over OpenSSL EVP; the digest is fixed by format version QRSX1 */
class Sha256 {
public:
  static const size_t SIZE=32;
  Sha256();
  ~Sha256();
  Sha256(const Sha256&)=delete;
  Sha256& operator=(const Sha256&)=delete;
  void update(const unsigned char* data,size_t len);
  void finish(unsigned char out[SIZE]);
  static std::vector<unsigned char> hash(const unsigned char* data,size_t len);
  static std::vector<unsigned char> hash(const std::vector<unsigned char>& v){ return hash(v.data(),v.size()); }
private:
  EVP_MD_CTX* ctx_;
};

std::string to_hex(const unsigned char* p,size_t n);
inline std::string to_hex(const std::vector<unsigned char>& v){ return to_hex(v.data(),v.size()); }
// false on odd length or a non-hex character; out is untouched then
bool from_hex(const std::string& s,std::vector<unsigned char>& out);
bool is_hex(const std::string& s,size_t len);

// Integrity verifier used on both sides of the round trip.
std::string hash_hex(const std::vector<unsigned char>& bytes);
bool verify(const std::vector<unsigned char>& bytes,const std::string& expected_hex);

} // namespace qrsx
