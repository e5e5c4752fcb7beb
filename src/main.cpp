// QRStorageX: split files into QR-sized chunk texts and rebuild them from scans.
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "assembler.hpp"
#include "classifier.hpp"
#include "config.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "fsutil.hpp"
#include "pipeline.hpp"
#include "scanner.hpp"
#include "splitter.hpp"
#include "ui.hpp"

using namespace qrsx;

/* password sources */
static Secret pw_from_file(const std::string& path){
  auto v=fs::read_file(path);
  while(!v.empty() && (v.back()=='\n'||v.back()=='\r')) v.pop_back();
  if(v.empty()) throw std::runtime_error("Empty password file: "+path);
  return Secret::take(v);
}
static Secret pw_from_string(std::string& s){ if(s.empty()) throw std::runtime_error("Empty password"); return Secret::take(s); }
static Secret pw_from_tty(){ std::string s=fs::prompt_pwd("Password: "); return Secret::take(s); }

struct PwSource{
  std::string file, ascii; bool no_tty=false;
  bool given() const { return !file.empty() || !ascii.empty(); }
  Secret get(){
    if(!file.empty()) return pw_from_file(file);
    if(!ascii.empty()) return pw_from_string(ascii);
    if(no_tty) throw std::runtime_error("No password source (--no-tty without --bin/--password)");
    return pw_from_tty();
  }
};

/* split */
static void split_cmd(const std::string& input,const std::string& outdir,PwSource& pws,bool encrypt,
                      size_t capacity,bool png,const Config& cfg){
  ui::banner();
  if(fs::is_dir(input)) throw std::runtime_error("split takes a single file: "+input);
  ui::step("reading input");
  auto plain=fs::read_file(input);
  if(!ui::quiet) std::cerr<<"   size: "<<plain.size()<<" bytes\n";
  std::string name=fs::path_basename(input);

  Secret pw;
  if(encrypt){ pw=pws.get(); ui::step("deriving key (PBKDF2-SHA256, "+std::to_string(cfg.kdf_iterations)+" rounds)"); }

  if(capacity==0) capacity=cfg.capacity_for_medium(name,encrypt);
  if(capacity==0) throw ChunkError(ErrorKind::CapacityExceeded,"medium of "+std::to_string(cfg.medium_chars)+" chars cannot hold a chunk header for "+name);
  ui::info("capacity: "+std::to_string(capacity)+" bytes per chunk");

  SplitResult r=split(plain,name,capacity,encrypt? &pw : nullptr,cfg);
  pw.wipe();
  ui::ok(std::to_string(r.summary.total)+" chunk(s), sha256 "+r.summary.content_hash.substr(0,16)+"…"+(encrypt?" (encrypted)":""));

  fs::ensure_dir(outdir);
  std::unique_ptr<QrRenderer> renderer;
  if(png) renderer=std::make_unique<QrencodeRenderer>();
  for(uint32_t i=1;i<=r.summary.total;i++){
    std::string base=fs::join2(outdir,part_name(r.summary.name,i,r.summary.total));
    ui::info("writing "+base+".txt");
    fs::write_text(base+".txt",r.chunks[i-1]);
    if(renderer) renderer->render(r.chunks[i-1],base+".png");
  }
  ui::ok("done");
}

/* rebuild / verify */
static int rebuild_cmd(const std::vector<std::string>& paths,const std::string& outdir,PwSource& pws,
                       bool write,bool force,unsigned tabs,const Config& cfg){
  ui::banner();
  if(paths.empty()) throw std::runtime_error("No input paths");

  // prompt only once encrypted chunks actually show up
  Secret pw;
  bool have=pws.given();
  if(have) pw=pws.get();
  PassphraseSource ask=[&]()->const Secret*{
    if(!have){ ui::step("encrypted chunks found"); pw=pws.get(); have=true; }
    return &pw;
  };

  ZbarImageDecoder zbar;
  ui::step("scanning inputs");
  RebuildResult res=rebuild(paths,ask,&zbar,cfg);
  pw.wipe();
  const AssemblyReport& rep=res.report;

  for(const auto& a: rep.artifacts)
    ui::ok(a.name+": "+std::to_string(a.bytes.size())+" bytes from "+std::to_string(a.total)+" chunk(s)"+
           (a.encrypted?" (decrypted)":"")+", sha256 verified");
  for(const auto& s: rep.incomplete){
    std::string miss; for(size_t i=0;i<s.missing.size();i++){ if(i) miss+=","; miss+=std::to_string(s.missing[i]); }
    ui::fail(s.name+": incomplete, missing part(s) ["+miss+"] of "+std::to_string(s.total));
  }
  for(const auto& f: rep.failed){
    std::string hint= f.kind==ErrorKind::DecryptionFailed? " (check the password)" :
                      f.kind==ErrorKind::IntegrityMismatch? " (re-scan the chunks)" : "";
    ui::fail(f.name+": "+kind_name(f.kind)+": "+f.reason+hint);
    for(const auto& s: f.sources) ui::fail("   offending input: "+s);
  }
  if(!rep.rejected.empty()) ui::warn(std::to_string(rep.rejected.size())+" input(s) rejected");
  if(rep.duplicates) ui::info(std::to_string(rep.duplicates)+" duplicate chunk(s) ignored");

  if(write) write_artifacts(rep,outdir,force,tabs);
  else if(!rep.artifacts.empty()) ui::ok("verification only, nothing written");

  return (rep.artifacts.empty() || !rep.incomplete.empty() || !rep.failed.empty())? 3 : 0;
}

static void classify_cmd(const std::string& path,const Config& cfg){
  Classification c=classify(path,cfg);
  std::cout<<input_kind_name(c.kind)<<"\n"
           <<"images:      "<<c.images<<"\n"
           <<"chunk texts: "<<c.chunk_texts<<"\n"
           <<"other:       "<<c.others<<"\n";
}

/* CLI */
static void usage(const char* argv0){
  std::cerr<<"Usage:\n"
           <<"  "<<argv0<<" split [--encrypt] [--password <ascii>] [--bin <pwfile>] [--no-tty] [--capacity <bytes>] [--medium <chars>] [--max-chunks <n>] [--jobs <n>] [--png] [--folder <DIR>] [--quiet] [--verbose] <input_file>\n"
           <<"  "<<argv0<<" rebuild [--password <ascii>] [--bin <pwfile>] [--no-tty] [--jobs <n>] [--expand-tabs <n>] [--force] [--folder <DIR>] [--quiet] [--verbose] <path> [path ...]\n"
           <<"  "<<argv0<<" verify [--password <ascii>] [--bin <pwfile>] [--no-tty] [--jobs <n>] [--quiet] [--verbose] <path> [path ...]\n"
           <<"  "<<argv0<<" classify <path>\n"
           <<"  "<<argv0<<" config [--medium <chars>] [--max-chunks <n>] [--jobs <n>]\n";
}

int main(int argc,char** argv){
  try{
    if(argc<2){ usage(argv[0]); return 1; }
    std::string mode=argv[1];
    int i=2; PwSource pws; std::string outdir=".";
    bool encrypt=false, png=false, force=false; size_t capacity=0; unsigned tabs=0;
    Config cfg;

    while(i<argc){
      std::string a=argv[i];
      if(a=="--password"){ if(i+1>=argc){ usage(argv[0]); return 1; } pws.ascii=argv[++i]; ++i; continue; }
      if(a=="--bin"){ if(i+1>=argc){ usage(argv[0]); return 1; } pws.file=argv[++i]; ++i; continue; }
      if(a=="--encrypt"){ encrypt=true; ++i; continue; }
      if(a=="--capacity"){ if(i+1>=argc){ usage(argv[0]); return 1; } capacity=(size_t)std::max(1L,std::atol(argv[++i])); ++i; continue; }
      if(a=="--medium"){ if(i+1>=argc){ usage(argv[0]); return 1; } cfg.medium_chars=(size_t)std::max(1L,std::atol(argv[++i])); ++i; continue; }
      if(a=="--max-chunks"){ if(i+1>=argc){ usage(argv[0]); return 1; } cfg.max_chunks=(uint32_t)std::max(1L,std::atol(argv[++i])); ++i; continue; }
      if(a=="--jobs"){ if(i+1>=argc){ usage(argv[0]); return 1; } cfg.jobs=(unsigned)std::max(0,std::atoi(argv[++i])); ++i; continue; }
      if(a=="--expand-tabs"){ if(i+1>=argc){ usage(argv[0]); return 1; } tabs=(unsigned)std::max(0,std::atoi(argv[++i])); ++i; continue; }
      if(a=="--png"){ png=true; ++i; continue; }
      if(a=="--force"){ force=true; ++i; continue; }
      if(a=="--folder"){ if(i+1>=argc){ usage(argv[0]); return 1; } outdir=argv[++i]; ++i; continue; }
      if(a=="--quiet"){ ui::quiet=true; ++i; continue; }
      if(a=="--verbose"){ ui::verbose=true; ++i; continue; }
      if(a=="--no-tty"){ pws.no_tty=true; ++i; continue; }
      break;
    }
    if(pws.given()) encrypt=true;

    if(mode=="split"){
      if(argc-i!=1){ usage(argv[0]); return 1; }
      split_cmd(argv[i],outdir,pws,encrypt,capacity,png,cfg);
    }else if(mode=="rebuild" || mode=="verify"){
      if(argc-i<1){ usage(argv[0]); return 1; }
      std::vector<std::string> paths(argv+i,argv+argc);
      return rebuild_cmd(paths,outdir,pws,mode=="rebuild",force,tabs,cfg);
    }else if(mode=="classify"){
      if(argc-i!=1){ usage(argv[0]); return 1; }
      classify_cmd(argv[i],cfg);
    }else if(mode=="config"){
      std::cout<<cfg.describe();
    }else{
      usage(argv[0]); return 1;
    }
  }catch(const ChunkError& e){
    ui::fail(std::string(kind_name(e.kind()))+": "+e.what()); return 2;
  }catch(const std::exception& e){
    ui::fail(e.what()); return 2;
  }
  return 0;
}
