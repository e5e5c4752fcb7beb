#include "config.hpp"
#include "crypto.hpp"
#include "header.hpp"
#include <cmath>
#include <sstream>
#include <thread>

namespace qrsx {

size_t Config::capacity_for_medium(const std::string& name,bool encrypted) const{
  size_t usable=(size_t)std::floor((double)medium_chars*safety_margin);
  size_t hdr=max_header_len(name,encrypted,max_chunks)+1;
  if(usable<=hdr) return 0;
  size_t raw=(usable-hdr)/4*3;
  // PKCS#7 always adds 1..16 bytes
  if(encrypted) raw=(raw>=IV_LEN)? raw/IV_LEN*IV_LEN-1 : 0;
  return raw;
}

unsigned Config::workers() const{
  if(jobs>0) return jobs;
  unsigned h=std::thread::hardware_concurrency();
  return h? h : 1;
}

std::string Config::describe() const{
  std::ostringstream o;
  o<<"medium_chars   = "<<medium_chars<<"\n"
   <<"safety_margin  = "<<safety_margin<<"\n"
   <<"max_chunks     = "<<max_chunks<<"\n"
   <<"jobs           = "<<jobs<<" ("<<workers()<<" workers)\n"
   <<"kdf_iterations = "<<kdf_iterations<<"\n"
   <<"sniff_bytes    = "<<sniff_bytes<<"\n"
   <<"capacity       = "<<capacity_for_medium("file.bin",false)<<" bytes/chunk plain, "
                      <<capacity_for_medium("file.bin",true)<<" encrypted (8-char name)\n";
  return o.str();
}

} // namespace qrsx
