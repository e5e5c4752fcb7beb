#include "scanner.hpp"
#include "header.hpp"
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <sys/wait.h>

namespace qrsx {

std::string shell_quote(const std::string& s){
  std::string q="'";
  for(char c: s){ if(c=='\'') q+="'\\''"; else q.push_back(c); }
  q+="'";
  return q;
}

std::vector<std::string> split_scanned_text(const std::string& out){
  std::vector<std::string> chunks;
  const std::string magic=std::string(HEADER_MAGIC)+HEADER_DELIM;
  size_t pos=0;
  while(pos<out.size()){
    size_t e=out.find('\n',pos); if(e==std::string::npos) e=out.size();
    std::string line=out.substr(pos,e-pos);
    if(!line.empty() && line.back()=='\r') line.pop_back();
    if(line.compare(0,magic.size(),magic)==0) chunks.push_back(line);
    else if(!chunks.empty()) chunks.back()+="\n"+line;
    pos=e+1;
  }
  return chunks;
}

std::vector<std::string> ZbarImageDecoder::decode(const std::string& image_path){
  std::string cmd=tool_+" --raw -q "+shell_quote(image_path)+" 2>/dev/null";
  FILE* p=popen(cmd.c_str(),"r"); if(!p) throw std::runtime_error("zbarimg spawn failed");
  std::string out; char b[1<<14];
  for(;;){ size_t n=fread(b,1,sizeof(b),p); if(n>0) out.append(b,n); if(n<sizeof(b)){ if(feof(p)) break; if(ferror(p)){ pclose(p); throw std::runtime_error("zbarimg read error"); } } }
  int rc=pclose(p);
  if(rc==-1) throw std::runtime_error("zbarimg wait failed");
  int code=WIFEXITED(rc)? WEXITSTATUS(rc) : -1;
  // 4: no symbol found
  if(code==4) return {};
  if(code==127) throw std::runtime_error("zbarimg not found (install zbar-tools)");
  if(code!=0) throw std::runtime_error("zbarimg failed on "+image_path);
  return split_scanned_text(out);
}

void QrencodeRenderer::render(const std::string& text,const std::string& png_path){
  std::string cmd=tool_+" -l L -8 -o "+shell_quote(png_path);
  FILE* p=popen(cmd.c_str(),"w"); if(!p) throw std::runtime_error("qrencode spawn failed");
  size_t n=fwrite(text.data(),1,text.size(),p);
  int rc=pclose(p);
  if(n!=text.size()) throw std::runtime_error("qrencode write error");
  if(rc==-1 || !WIFEXITED(rc)) throw std::runtime_error("qrencode wait failed");
  if(WEXITSTATUS(rc)==127) throw std::runtime_error("qrencode not found (install qrencode)");
  if(WEXITSTATUS(rc)!=0) throw std::runtime_error("qrencode failed for "+png_path+" (data too large for one symbol?)");
}

} // namespace qrsx
