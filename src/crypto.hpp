#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace qrsx {

static const size_t KEY_LEN=32;   // AES-256
static const size_t SALT_LEN=16;
static const size_t IV_LEN=16;    // one AES block
static const uint32_t KDF_ITERATIONS=100000;

/* Byte buffer wiped with OPENSSL_cleanse when it dies or is cleared.
   Holds passphrases and derived keys; move-only so no stray copies survive. */
class Secret {
public:
  Secret() {}
  Secret(const unsigned char* p,size_t n) : v_(p,p+n) {}
  explicit Secret(size_t n) : v_(n,0) {}
  ~Secret(){ wipe(); }
  Secret(Secret&& o) noexcept : v_(std::move(o.v_)) { o.v_.clear(); }
  Secret& operator=(Secret&& o) noexcept { if(this!=&o){ wipe(); v_=std::move(o.v_); o.v_.clear(); } return *this; }
  Secret(const Secret&)=delete;
  Secret& operator=(const Secret&)=delete;

  // copies s, then wipes the caller's string
  static Secret take(std::string& s);
  static Secret take(std::vector<unsigned char>& v);

  const unsigned char* data() const { return v_.data(); }
  unsigned char* data() { return v_.data(); }
  size_t size() const { return v_.size(); }
  bool empty() const { return v_.empty(); }
  void wipe();
private:
  std::vector<unsigned char> v_;
};

std::vector<unsigned char> random_bytes(size_t n);

// PBKDF2-HMAC-SHA256, deterministic in (passphrase, salt, iterations).
Secret derive_key(const Secret& passphrase,const std::vector<unsigned char>& salt,uint32_t iterations=KDF_ITERATIONS);

// AES-256-CBC with PKCS#7 padding.
std::vector<unsigned char> encrypt(const std::vector<unsigned char>& plain,const Secret& key,const std::vector<unsigned char>& iv);
// Throws ChunkError(DecryptionFailed) on bad length or bad padding.
std::vector<unsigned char> decrypt(const std::vector<unsigned char>& cipher,const Secret& key,const std::vector<unsigned char>& iv);

} // namespace qrsx
