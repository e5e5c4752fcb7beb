#include "header.hpp"
#include "crypto.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include <cstring>
#include <stdexcept>
#include <utility>

namespace qrsx {

std::string sanitize_name(const std::string& name){
  std::string b=name;
  auto s=b.find_last_of("/\\"); if(s!=std::string::npos) b=b.substr(s+1);
  std::string out;
  for(unsigned char c: b){
    if(c<0x20 || c==0x7f || c==(unsigned char)HEADER_DELIM) continue;
    out.push_back((char)c);
  }
  if(out.size()>MAX_NAME_LEN) out.resize(MAX_NAME_LEN);
  if(out.empty()||out=="."||out=="..") out="unnamed";
  return out;
}

std::string serialize_header(const ChunkHeader& h){
  if(h.index<1 || h.index>h.total) throw std::runtime_error("serialize_header: index out of range");
  if(!is_hex(h.content_hash,64) || !is_hex(h.payload_hash,64)) throw std::runtime_error("serialize_header: bad digest");
  std::string s=HEADER_MAGIC;
  auto add=[&](const std::string& f){ s.push_back(HEADER_DELIM); s+=f; };
  add(sanitize_name(h.name));
  add(std::to_string(h.index));
  add(std::to_string(h.total));
  add(h.content_hash);
  add(h.payload_hash);
  if(h.encrypted){
    if(h.salt.size()!=SALT_LEN || h.iv.size()!=IV_LEN) throw std::runtime_error("serialize_header: bad salt or iv");
    add("E"); add(to_hex(h.salt)); add(to_hex(h.iv));
  }else{
    add("P");
  }
  return s;
}

static bool parse_count(const std::string& f,uint32_t& out){
  if(f.empty() || f.size()>9) return false;
  uint32_t v=0;
  for(char c: f){ if(c<'0'||c>'9') return false; v=v*10+(uint32_t)(c-'0'); }
  if(v==0) return false;
  out=v; return true;
}

static std::vector<std::string> fields_of(const std::string& line){
  std::vector<std::string> f; size_t start=0;
  for(;;){
    size_t p=line.find(HEADER_DELIM,start);
    if(p==std::string::npos){ f.push_back(line.substr(start)); break; }
    f.push_back(line.substr(start,p-start)); start=p+1;
  }
  return f;
}

static bool parse_into(const std::string& raw,ChunkHeader& h,std::string& why){
  std::string line=raw;
  while(!line.empty() && (line.back()=='\r'||line.back()==' ')) line.pop_back();
  auto f=fields_of(line);
  if(f.empty() || f[0]!=HEADER_MAGIC){ why="missing QRSX1 magic"; return false; }
  if(f.size()!=7 && f.size()!=9){ why="wrong field count ("+std::to_string(f.size())+")"; return false; }
  if(f[1].empty() || f[1]!=sanitize_name(f[1])){ why="invalid name"; return false; }
  if(!parse_count(f[2],h.index) || !parse_count(f[3],h.total)){ why="index/total not positive integers"; return false; }
  if(h.index>h.total){ why="index "+f[2]+" exceeds total "+f[3]; return false; }
  if(!is_hex(f[4],64) || !is_hex(f[5],64)){ why="malformed digest"; return false; }
  h.name=f[1]; h.content_hash=f[4]; h.payload_hash=f[5];
  if(f[6]=="P"){
    if(f.size()!=7){ why="salt/iv present on a plain chunk"; return false; }
    h.encrypted=false;
  }else if(f[6]=="E"){
    if(f.size()!=9){ why="encrypted chunk without salt/iv"; return false; }
    if(!is_hex(f[7],SALT_LEN*2) || !is_hex(f[8],IV_LEN*2) || !from_hex(f[7],h.salt) || !from_hex(f[8],h.iv)){ why="malformed salt/iv"; return false; }
    h.encrypted=true;
  }else{
    why="unknown encryption flag"; return false;
  }
  return true;
}

ChunkHeader parse_header(const std::string& line){
  ChunkHeader h; std::string why;
  if(!parse_into(line,h,why)) throw ChunkError(ErrorKind::MalformedHeader,"malformed header: "+why);
  return h;
}

bool try_parse_header(const std::string& line,ChunkHeader& out){
  ChunkHeader h; std::string why;
  if(!parse_into(line,h,why)) return false;
  out=std::move(h); return true;
}

size_t max_header_len(const std::string& name,bool encrypted,uint32_t max_chunks){
  size_t digits=std::to_string(max_chunks).size();
  size_t n=std::strlen(HEADER_MAGIC)+1+sanitize_name(name).size()+1+digits+1+digits+1+64+1+64+1+1;
  if(encrypted) n+=1+SALT_LEN*2+1+IV_LEN*2;
  return n;
}

void split_chunk_text(const std::string& text,std::string& header_line,std::string& payload){
  size_t b=0; while(b<text.size() && (text[b]=='\n'||text[b]=='\r'||text[b]==' '||text[b]=='\t')) b++;
  size_t nl=text.find('\n',b);
  if(nl==std::string::npos){ header_line=text.substr(b); payload.clear(); }
  else{ header_line=text.substr(b,nl-b); payload=text.substr(nl+1); }
  while(!header_line.empty() && (header_line.back()=='\r'||header_line.back()==' ')) header_line.pop_back();
  while(!payload.empty() && (payload.back()=='\n'||payload.back()=='\r'||payload.back()==' '||payload.back()=='\t')) payload.pop_back();
}

} // namespace qrsx
