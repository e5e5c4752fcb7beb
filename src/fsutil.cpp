#include "fsutil.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <dirent.h>
#include <fcntl.h>
#include <termios.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace qrsx {
namespace fs {

bool is_dir(const std::string& p){ struct stat st{}; return (stat(p.c_str(),&st)==0)&&S_ISDIR(st.st_mode); }
bool exists(const std::string& p){ struct stat st{}; return stat(p.c_str(),&st)==0; }

void ensure_dir(const std::string& dir){
  if(dir.empty() || dir==".") return;
  if(is_dir(dir)) return;
  if(::mkdir(dir.c_str(),0775)!=0){
    // try -p style
    std::string cur;
    for(size_t i=0;i<dir.size();++i){
      if(dir[i]=='/'){ if(!cur.empty() && !is_dir(cur)) ::mkdir(cur.c_str(),0775); }
      cur.push_back(dir[i]);
    }
    if(!is_dir(dir) && ::mkdir(dir.c_str(),0775)!=0 && errno!=EEXIST)
      throw std::runtime_error("Cannot create folder: "+dir);
  }
}

std::string path_basename(const std::string& p){
  std::string s=p; while(s.size()>1 && s.back()=='/') s.pop_back();
  auto i=s.find_last_of("/"); return (i==std::string::npos)? s : s.substr(i+1);
}
std::string path_ext(const std::string& p){
  std::string b=path_basename(p); auto d=b.find_last_of('.');
  if(d==std::string::npos || d==0) return "";
  std::string e=b.substr(d);
  std::transform(e.begin(),e.end(),e.begin(),[](unsigned char c){ return (char)std::tolower(c); });
  return e;
}
std::string join2(const std::string& a,const std::string& b){
  if(a.empty()||a==".") return b;
  if(a.back()=='/') return a+b;
  return a+"/"+b;
}

std::vector<std::string> list_dir(const std::string& dir){
  DIR* d=opendir(dir.c_str()); if(!d) throw std::runtime_error("Cannot open folder: "+dir);
  std::vector<std::string> out;
  while(struct dirent* e=readdir(d)){
    if(std::strcmp(e->d_name,".")==0 || std::strcmp(e->d_name,"..")==0) continue;
    out.push_back(join2(dir,e->d_name));
  }
  closedir(d);
  std::sort(out.begin(),out.end());
  return out;
}

std::vector<unsigned char> read_file(const std::string& path){
  std::ifstream f(path,std::ios::binary); if(!f) throw std::runtime_error("Cannot open: "+path);
  return std::vector<unsigned char>((std::istreambuf_iterator<char>(f)),std::istreambuf_iterator<char>());
}
std::vector<unsigned char> read_head(const std::string& path,size_t n){
  std::ifstream f(path,std::ios::binary); if(!f) throw std::runtime_error("Cannot open: "+path);
  std::vector<unsigned char> out(n);
  f.read((char*)out.data(),(std::streamsize)n);
  out.resize((size_t)f.gcount());
  return out;
}
std::string read_text(const std::string& path){
  auto v=read_file(path); return std::string(v.begin(),v.end());
}
void write_file(const std::string& path,const std::vector<unsigned char>& data){
  std::ofstream f(path,std::ios::binary); if(!f) throw std::runtime_error("Cannot write: "+path);
  f.write((const char*)data.data(),(std::streamsize)data.size());
  if(!f) throw std::runtime_error("Write failed: "+path);
}
void write_text(const std::string& path,const std::string& text){
  std::ofstream f(path,std::ios::binary); if(!f) throw std::runtime_error("Cannot write: "+path);
  f.write(text.data(),(std::streamsize)text.size());
  if(!f) throw std::runtime_error("Write failed: "+path);
}

static std::string read_line_fd(int fd){ std::string s; char ch; while(true){ ssize_t r=read(fd,&ch,1); if(r<=0) break; if(ch=='\n'||ch=='\r') break; s.push_back(ch);} return s; }

std::string prompt_pwd(const char* prompt){
  int tty=open("/dev/tty",O_RDWR);
  if(tty>=0){
    (void)!write(tty,prompt,strlen(prompt));
    termios oldt; if(tcgetattr(tty,&oldt)!=0){ std::string s=read_line_fd(tty); close(tty); if(s.empty()) throw std::runtime_error("Empty password"); return s; }
    termios nt=oldt; nt.c_lflag&=~ECHO; tcsetattr(tty,TCSANOW,&nt);
    std::string s=read_line_fd(tty); (void)!write(tty,"\n",1); tcsetattr(tty,TCSANOW,&oldt); close(tty);
    if(s.empty()) throw std::runtime_error("Empty password"); return s;
  }
  std::cerr<<prompt<<std::flush; std::string a; std::getline(std::cin,a); if(a.empty()) throw std::runtime_error("Empty password"); return a;
}

} // namespace fs
} // namespace qrsx
