#include "base64.hpp"
#include <openssl/evp.h>

namespace qrsx {

std::string b64_encode(const std::vector<unsigned char>& in){
  if(in.empty()) return "";
  std::string out(b64_len(in.size())+1,'\0');
  int n=EVP_EncodeBlock((unsigned char*)&out[0],in.data(),(int)in.size());
  out.resize((size_t)n);
  return out;
}

bool b64_decode(const std::string& in,std::vector<unsigned char>& out){
  if(in.empty()){ out.clear(); return true; }
  if(in.size()%4) return false;
  std::vector<unsigned char> v(in.size()/4*3);
  int n=EVP_DecodeBlock(v.data(),(const unsigned char*)in.data(),(int)in.size());
  if(n<0 || (size_t)n!=v.size()) return false;
  // EVP_DecodeBlock keeps the zero bytes standing for '=' padding
  size_t pad=0;
  if(in[in.size()-1]=='='){ pad++; if(in[in.size()-2]=='=') pad++; }
  v.resize(v.size()-pad);
  if(b64_encode(v)!=in) return false;
  out.swap(v);
  return true;
}

} // namespace qrsx
