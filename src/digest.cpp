#include "digest.hpp"
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace qrsx {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if(!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
  if(EVP_DigestInit_ex(ctx_,EVP_sha256(),nullptr)!=1){ EVP_MD_CTX_free(ctx_); throw std::runtime_error("DigestInit failed"); }
}
Sha256::~Sha256(){ EVP_MD_CTX_free(ctx_); }

void Sha256::update(const unsigned char* data,size_t len){
  if(len==0) return;
  if(EVP_DigestUpdate(ctx_,data,len)!=1) throw std::runtime_error("DigestUpdate failed");
}
void Sha256::finish(unsigned char out[SIZE]){
  unsigned int n=0;
  if(EVP_DigestFinal_ex(ctx_,out,&n)!=1 || n!=SIZE) throw std::runtime_error("DigestFinal failed");
}
std::vector<unsigned char> Sha256::hash(const unsigned char* data,size_t len){
  Sha256 s; s.update(data,len); std::vector<unsigned char> out(SIZE); s.finish(out.data()); return out;
}

std::string to_hex(const unsigned char* p,size_t n){
  static const char* X="0123456789abcdef";
  std::string s; s.reserve(n*2);
  for(size_t i=0;i<n;i++){ s.push_back(X[p[i]>>4]); s.push_back(X[p[i]&15]); }
  return s;
}

static int nib(char c){
  if(c>='0'&&c<='9') return c-'0';
  if(c>='a'&&c<='f') return c-'a'+10;
  if(c>='A'&&c<='F') return c-'A'+10;
  return -1;
}
bool from_hex(const std::string& s,std::vector<unsigned char>& out){
  if(s.size()%2) return false;
  std::vector<unsigned char> v(s.size()/2);
  for(size_t i=0;i<v.size();i++){
    int h=nib(s[2*i]), l=nib(s[2*i+1]); if(h<0||l<0) return false;
    v[i]=(unsigned char)((h<<4)|l);
  }
  out.swap(v); return true;
}
bool is_hex(const std::string& s,size_t len){
  if(s.size()!=len) return false;
  for(char c: s) if(!((c>='0'&&c<='9')||(c>='a'&&c<='f'))) return false;
  return true;
}

std::string hash_hex(const std::vector<unsigned char>& bytes){ return to_hex(Sha256::hash(bytes)); }

bool verify(const std::vector<unsigned char>& bytes,const std::string& expected_hex){
  std::vector<unsigned char> want;
  if(!from_hex(expected_hex,want) || want.size()!=Sha256::SIZE) return false;
  auto got=Sha256::hash(bytes);
  return CRYPTO_memcmp(got.data(),want.data(),Sha256::SIZE)==0;
}

} // namespace qrsx
