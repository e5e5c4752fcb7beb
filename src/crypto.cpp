#include "crypto.hpp"
#include "errors.hpp"
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace qrsx {

void Secret::wipe(){
  if(!v_.empty()) OPENSSL_cleanse(v_.data(),v_.size());
  v_.clear();
}
Secret Secret::take(std::string& s){
  Secret out((const unsigned char*)s.data(),s.size());
  if(!s.empty()) OPENSSL_cleanse(&s[0],s.size());
  s.clear();
  return out;
}
Secret Secret::take(std::vector<unsigned char>& v){
  Secret out(v.data(),v.size());
  if(!v.empty()) OPENSSL_cleanse(v.data(),v.size());
  v.clear();
  return out;
}

std::vector<unsigned char> random_bytes(size_t n){
  std::vector<unsigned char> b(n);
  if(n>0 && RAND_bytes(b.data(),(int)n)!=1) throw std::runtime_error("RAND_bytes failed");
  return b;
}

Secret derive_key(const Secret& pw,const std::vector<unsigned char>& salt,uint32_t iterations){
  if(iterations==0) throw std::runtime_error("KDF iterations must be positive");
  Secret key(KEY_LEN);
  if(PKCS5_PBKDF2_HMAC((const char*)pw.data(),(int)pw.size(),salt.data(),(int)salt.size(),
                       (int)iterations,EVP_sha256(),(int)KEY_LEN,key.data())!=1)
    throw std::runtime_error("PBKDF2 failed");
  return key;
}

namespace {
struct CipherCtx{
  EVP_CIPHER_CTX* p;
  CipherCtx() : p(EVP_CIPHER_CTX_new()) { if(!p) throw std::runtime_error("EVP_CIPHER_CTX_new failed"); }
  ~CipherCtx(){ EVP_CIPHER_CTX_free(p); }
};
}

std::vector<unsigned char> encrypt(const std::vector<unsigned char>& plain,const Secret& key,const std::vector<unsigned char>& iv){
  if(key.size()!=KEY_LEN || iv.size()!=IV_LEN) throw std::runtime_error("encrypt: bad key or iv length");
  CipherCtx ctx;
  std::vector<unsigned char> out(plain.size()+IV_LEN); int len=0,outl=0;
  if(EVP_EncryptInit_ex(ctx.p,EVP_aes_256_cbc(),nullptr,key.data(),iv.data())!=1) throw std::runtime_error("EncryptInit failed");
  if(!plain.empty()){
    if(EVP_EncryptUpdate(ctx.p,out.data(),&len,plain.data(),(int)plain.size())!=1) throw std::runtime_error("EncryptUpdate failed");
    outl=len;
  }
  if(EVP_EncryptFinal_ex(ctx.p,out.data()+outl,&len)!=1) throw std::runtime_error("EncryptFinal failed");
  outl+=len; out.resize((size_t)outl);
  return out;
}

std::vector<unsigned char> decrypt(const std::vector<unsigned char>& c,const Secret& key,const std::vector<unsigned char>& iv){
  if(key.size()!=KEY_LEN || iv.size()!=IV_LEN) throw std::runtime_error("decrypt: bad key or iv length");
  if(c.empty() || c.size()%IV_LEN) throw ChunkError(ErrorKind::DecryptionFailed,"ciphertext length is not a multiple of the block size");
  CipherCtx ctx;
  std::vector<unsigned char> out(c.size()+IV_LEN); int len=0,outl=0;
  if(EVP_DecryptInit_ex(ctx.p,EVP_aes_256_cbc(),nullptr,key.data(),iv.data())!=1) throw std::runtime_error("DecryptInit failed");
  if(EVP_DecryptUpdate(ctx.p,out.data(),&len,c.data(),(int)c.size())!=1){
    OPENSSL_cleanse(out.data(),out.size());
    throw ChunkError(ErrorKind::DecryptionFailed,"decryption failed");
  }
  outl=len;
  if(EVP_DecryptFinal_ex(ctx.p,out.data()+outl,&len)!=1){
    OPENSSL_cleanse(out.data(),out.size());
    throw ChunkError(ErrorKind::DecryptionFailed,"bad padding (wrong password or corrupted data)");
  }
  outl+=len; out.resize((size_t)outl);
  return out;
}

} // namespace qrsx
