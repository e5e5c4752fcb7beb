#include "ui.hpp"
#include <iostream>
#include <mutex>
#include <unistd.h>

namespace qrsx {
namespace ui {
  static const char* R="\x1b[31m"; static const char* G="\x1b[32m"; static const char* Y="\x1b[33m";
  static const char* B="\x1b[34m"; static const char* C="\x1b[36m"; static const char* D="\x1b[2m"; static const char* N="\x1b[0m";
  bool quiet=false;
  bool verbose=false;

  // workers log from several threads
  static std::mutex mu;
  static bool color(){ static const bool c=isatty(STDERR_FILENO)!=0; return c; }
  static void line(const char* col,const char* mark,const std::string& s){
    std::lock_guard<std::mutex> lk(mu);
    if(color()) std::cerr<<col<<mark<<s<<N<<"\n"; else std::cerr<<mark<<s<<"\n";
  }

  void banner(){
    if(quiet) return;
    std::lock_guard<std::mutex> lk(mu);
    if(color()) std::cerr<<B<<"QRStorageX"<<N<<": file transfer through QR chunks\n";
    else std::cerr<<"QRStorageX: file transfer through QR chunks\n";
  }
  void step(const std::string&s){ if(!quiet) line(C,"» ",s); }
  void info(const std::string&s){ if(!quiet && verbose) line(D,"  ",s); }
  void ok(const std::string&s){ if(!quiet) line(G,"✓ ",s); }
  void warn(const std::string&s){ if(!quiet) line(Y,"! ",s); }
  void fail(const std::string&s){ line(R,"✗ ",s); }
}
} // namespace qrsx
