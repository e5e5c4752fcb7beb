#include "splitter.hpp"
#include "base64.hpp"
#include "crypto.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "header.hpp"
#include "ui.hpp"
#include "workers.hpp"
#include <algorithm>

namespace qrsx {

bool looks_like_text(const std::vector<unsigned char>& b,size_t sniff){
  size_t n=std::min(sniff,b.size());
  size_t i=0;
  while(i<n){
    unsigned char c=b[i];
    if(c==0) return false;
    size_t len= c<0x80?1 : (c>>5)==0x6?2 : (c>>4)==0xE?3 : (c>>3)==0x1E?4 : 0;
    if(len==0) return false;
    if(i+len>n) return n<b.size(); // sequence cut by the sniff window
    for(size_t k=1;k<len;k++) if((b[i+k]&0xC0)!=0x80) return false;
    i+=len;
  }
  return true;
}

// longest cut <= cap that does not split a UTF-8 sequence
static size_t utf8_cut(const std::vector<unsigned char>& b,size_t start,size_t cap){
  size_t cut=cap;
  while(cut>0 && (b[start+cut]&0xC0)==0x80) cut--;
  return cut? cut : cap;
}

std::vector<std::pair<size_t,size_t>> segment(const std::vector<unsigned char>& b,size_t cap,bool text){
  std::vector<std::pair<size_t,size_t>> out;
  const size_t n=b.size();
  if(n==0 || cap==0){ out.emplace_back(0,0); return out; }
  if(!text){
    for(size_t off=0;off<n;off+=cap) out.emplace_back(off,std::min(cap,n-off));
    return out;
  }
  size_t pos=0, cur=0, cur_len=0;
  while(pos<n){
    size_t e=pos; while(e<n && b[e]!='\n') e++;
    if(e<n) e++;
    size_t line=e-pos;
    if(cur_len>0 && cur_len+line>cap){ out.emplace_back(cur,cur_len); cur_len=0; }
    if(cur_len==0) cur=pos;
    if(line>cap){
      // a line longer than a chunk: cut it, keep the tail open for the next lines
      while(e-pos>cap){ size_t c=utf8_cut(b,pos,cap); out.emplace_back(pos,c); pos+=c; }
      cur=pos; cur_len=e-pos;
    }else{
      cur_len+=line;
    }
    pos=e;
  }
  if(cur_len>0) out.emplace_back(cur,cur_len);
  return out;
}

SplitResult split(const std::vector<unsigned char>& bytes,const std::string& name,size_t capacity,
                  const Secret* pw,const Config& cfg){
  if(capacity==0) throw ChunkError(ErrorKind::CapacityExceeded,"chunk capacity is zero; the medium cannot hold a header and any payload");
  bool enc=(pw!=nullptr);
  if(enc && pw->empty()) throw std::runtime_error("Empty password");

  SplitResult r;
  r.summary.name=sanitize_name(name);
  r.summary.content_hash=hash_hex(bytes);
  r.summary.encrypted=enc;
  r.summary.bytes=bytes.size();

  bool text=looks_like_text(bytes,cfg.sniff_bytes);
  auto segs=segment(bytes,capacity,text);
  if(segs.size()>cfg.max_chunks)
    throw ChunkError(ErrorKind::CapacityExceeded,r.summary.name+" needs "+std::to_string(segs.size())+
                     " chunks, the medium supports at most "+std::to_string(cfg.max_chunks));
  const uint32_t total=(uint32_t)segs.size();
  r.summary.total=total;
  ui::info(r.summary.name+": "+std::to_string(bytes.size())+" bytes, "+(text?"text":"binary")+", "+std::to_string(total)+" chunk(s)");

  // one key per run; every chunk carries the salt and its own iv
  std::vector<unsigned char> salt;
  Secret key;
  if(enc){ salt=random_bytes(SALT_LEN); key=derive_key(*pw,salt,cfg.kdf_iterations); }

  r.chunks.resize(total);
  parallel_for(total,cfg.workers(),[&](size_t i){
    std::vector<unsigned char> raw(bytes.begin()+segs[i].first,bytes.begin()+segs[i].first+segs[i].second);
    ChunkHeader h;
    h.name=r.summary.name; h.index=(uint32_t)i+1; h.total=total;
    h.content_hash=r.summary.content_hash;
    if(enc){
      h.encrypted=true; h.salt=salt; h.iv=random_bytes(IV_LEN);
      raw=encrypt(raw,key,h.iv);
    }
    h.payload_hash=hash_hex(raw);
    r.chunks[i]=serialize_header(h)+"\n"+b64_encode(raw);
  });
  return r;
}

std::string part_name(const std::string& name,uint32_t index,uint32_t total){
  return sanitize_name(name)+"_part_"+std::to_string(index)+"_of_"+std::to_string(total);
}

} // namespace qrsx
