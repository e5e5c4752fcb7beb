#include "pipeline.hpp"
#include "fsutil.hpp"
#include "scanner.hpp"
#include "ui.hpp"
#include "workers.hpp"
#include <atomic>
#include <stdexcept>

namespace qrsx {

RebuildResult rebuild(const std::vector<std::string>& paths,const PassphraseSource& passphrase,
                      ImageDecoder* decoder,const Config& cfg){
  RebuildResult r;
  ChunkCollector col(cfg);
  std::vector<std::string> images;

  for(const auto& p: paths){
    Classification c=classify(p,cfg);
    ui::info(p+": "+input_kind_name(c.kind)+" ("+std::to_string(c.images)+" image(s), "+
             std::to_string(c.chunk_texts)+" chunk text(s), "+std::to_string(c.others)+" other)");
    if(c.kind==InputKind::Unknown) ui::warn(p+": no images or chunk texts found");
    for(const auto& t: c.chunk_paths) col.add(ChunkInput{t,fs::read_text(t)});
    images.insert(images.end(),c.image_paths.begin(),c.image_paths.end());
    r.inputs.push_back(std::move(c));
  }

  if(!images.empty() && !decoder){
    ui::warn(std::to_string(images.size())+" image(s) skipped: no image decoder available");
    r.images_skipped=images.size();
  }else if(!images.empty()){
    ui::step("scanning "+std::to_string(images.size())+" image(s)");
    std::atomic<size_t> skipped(0), scanned(0);
    parallel_for(images.size(),cfg.workers(),[&](size_t i){
      std::vector<std::string> texts;
      try{ texts=decoder->decode(images[i]); }
      catch(const std::runtime_error& e){ ui::warn(images[i]+": "+e.what()); skipped++; return; }
      scanned++;
      if(texts.empty()) ui::warn(images[i]+": no QR chunk found");
      for(size_t k=0;k<texts.size();k++)
        col.add(ChunkInput{texts.size()==1? images[i] : images[i]+"#"+std::to_string(k+1),texts[k]});
    });
    r.images_scanned=scanned; r.images_skipped=skipped;
  }

  // without a password only the encrypted sets fail (MissingPassphrase)
  const Secret* pw=nullptr;
  if(col.needs_passphrase() && passphrase){
    try{ pw=passphrase(); }
    catch(const std::runtime_error& e){ ui::warn(std::string("no password: ")+e.what()); pw=nullptr; }
  }
  r.report=col.finish(pw);
  return r;
}

std::vector<unsigned char> expand_tabs(const std::vector<unsigned char>& in,unsigned width){
  if(width==0) return in;
  std::vector<unsigned char> out; out.reserve(in.size());
  size_t col=0;
  for(unsigned char c: in){
    if(c=='\t'){ size_t n=width-(col%width); out.insert(out.end(),n,' '); col+=n; }
    else if(c=='\n'||c=='\r'){ out.push_back(c); col=0; }
    else{ out.push_back(c); col++; }
  }
  return out;
}

std::vector<std::string> write_artifacts(const AssemblyReport& rep,const std::string& folder,
                                         bool force,unsigned tab_width){
  std::vector<std::string> written;
  fs::ensure_dir(folder.empty()? "." : folder);
  for(const auto& a: rep.artifacts){
    std::string out=fs::join2(folder.empty()? "." : folder,a.name);
    if(!force && fs::exists(out)){ ui::warn(out+" exists, not overwritten (use --force)"); continue; }
    ui::step("writing output "+out);
    fs::write_file(out,tab_width? expand_tabs(a.bytes,tab_width) : a.bytes);
    written.push_back(out);
  }
  return written;
}

} // namespace qrsx
