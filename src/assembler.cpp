#include "assembler.hpp"
#include "base64.hpp"
#include "crypto.hpp"
#include "digest.hpp"
#include "ui.hpp"
#include "workers.hpp"

namespace qrsx {

static std::string label(const std::string& name,uint32_t index,uint32_t total){
  return name+" part "+std::to_string(index)+"/"+std::to_string(total);
}

void ChunkCollector::reject(const ChunkInput& in,ErrorKind k,const std::string& why){
  ui::warn("skipping "+in.source+": "+why);
  std::lock_guard<std::mutex> lk(mu_);
  rejected_.push_back(RejectedInput{in.source,in.text,k,why});
}

bool ChunkCollector::add(const ChunkInput& in){
  { std::lock_guard<std::mutex> lk(mu_); seen_++; }

  std::string line,payload;
  split_chunk_text(in.text,line,payload);
  Member m;
  try{ m.h=parse_header(line); }
  catch(const ChunkError& e){ reject(in,e.kind(),e.what()); return false; }
  { std::lock_guard<std::mutex> lk(mu_); parsed_++; }
  // no split run produces more than max_chunks parts
  if(m.h.total>cfg_.max_chunks){
    reject(in,ErrorKind::MalformedHeader,label(m.h.name,m.h.index,m.h.total)+": total exceeds the limit of "+std::to_string(cfg_.max_chunks)+" chunks");
    return false;
  }
  m.header_line=line;
  m.source=in.source;
  if(!b64_decode(payload,m.raw)){ reject(in,ErrorKind::MalformedHeader,label(m.h.name,m.h.index,m.h.total)+": payload is not valid base64"); return false; }
  // checked on the encoded bytes, before any decryption
  if(!verify(m.raw,m.h.payload_hash)){ reject(in,ErrorKind::IntegrityMismatch,label(m.h.name,m.h.index,m.h.total)+": payload hash mismatch (tampered or misread)"); return false; }

  std::lock_guard<std::mutex> lk(mu_);
  auto key=std::make_pair(m.h.name,m.h.content_hash);
  auto it=sets_.find(key);
  if(it==sets_.end()){
    Set s; s.name=m.h.name; s.content_hash=m.h.content_hash; s.total=m.h.total;
    it=sets_.emplace(key,std::move(s)).first;
  }
  Set& s=it->second;
  if(m.h.total!=s.total){
    std::string why=label(m.h.name,m.h.index,m.h.total)+": total disagrees with "+std::to_string(s.total)+" seen before";
    s.conflict=true; if(s.conflict_reason.empty()) s.conflict_reason=why;
    s.conflict_sources.push_back(in.source);
    rejected_.push_back(RejectedInput{in.source,in.text,ErrorKind::ConflictingChunk,why});
    ui::warn("conflict in "+in.source+": "+why);
    return false;
  }
  auto old=s.members.find(m.h.index);
  if(old!=s.members.end()){
    if(old->second.header_line==m.header_line && old->second.raw==m.raw){
      duplicates_++;
      ui::info("duplicate "+label(m.h.name,m.h.index,m.h.total)+" from "+in.source);
      return true;
    }
    std::string why=label(m.h.name,m.h.index,m.h.total)+": differs from the copy in "+old->second.source;
    s.conflict=true; if(s.conflict_reason.empty()) s.conflict_reason=why;
    if(s.conflict_sources.empty()) s.conflict_sources.push_back(old->second.source);
    s.conflict_sources.push_back(in.source);
    rejected_.push_back(RejectedInput{in.source,in.text,ErrorKind::ConflictingChunk,why});
    ui::warn("conflict in "+in.source+": "+why);
    return false;
  }
  accepted_++;
  s.members.emplace(m.h.index,std::move(m));
  return true;
}

size_t ChunkCollector::pending_sets() const{
  std::lock_guard<std::mutex> lk(mu_);
  return sets_.size();
}

bool ChunkCollector::needs_passphrase() const{
  std::lock_guard<std::mutex> lk(mu_);
  for(const auto& kv: sets_)
    for(const auto& m: kv.second.members) if(m.second.h.encrypted) return true;
  return false;
}

namespace {
enum class Outcome { Done, Incomplete, Failed };
struct SetResult {
  Outcome outcome=Outcome::Failed;
  Artifact artifact;
  IncompleteSet incomplete;
  FailedArtifact failed;
};
}

AssemblyReport ChunkCollector::finish(const Secret* pw){
  std::vector<Set> sets;
  AssemblyReport rep;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if(seen_==0) throw ChunkError(ErrorKind::NoChunks,"no chunk inputs given");
    if(parsed_==0) throw ChunkError(ErrorKind::NoChunks,"none of the "+std::to_string(seen_)+" input(s) is a parseable chunk");
    for(auto& kv: sets_) sets.push_back(std::move(kv.second));
    sets_.clear();
    rep.rejected.swap(rejected_);
    rep.duplicates=duplicates_; rep.accepted=accepted_;
    seen_=0; parsed_=0; duplicates_=0; accepted_=0;
  }

  const uint32_t iterations=cfg_.kdf_iterations;
  std::vector<SetResult> results(sets.size());
  parallel_for(sets.size(),cfg_.workers(),[&](size_t si){
    const Set& s=sets[si];
    SetResult& r=results[si];
    auto fail=[&](ErrorKind k,const std::string& why){
      r.outcome=Outcome::Failed;
      r.failed=FailedArtifact{s.name,s.content_hash,k,why,s.conflict_sources};
      ui::warn(s.name+": "+kind_name(k)+": "+why);
    };
    if(s.conflict){ fail(ErrorKind::ConflictingChunk,s.conflict_reason); return; }

    std::vector<uint32_t> missing;
    for(uint32_t i=1;i<=s.total;i++) if(!s.members.count(i)) missing.push_back(i);
    if(!missing.empty()){
      r.outcome=Outcome::Incomplete;
      r.incomplete=IncompleteSet{s.name,s.content_hash,s.total,missing};
      ui::warn(s.name+": "+std::to_string(missing.size())+" of "+std::to_string(s.total)+" chunk(s) missing");
      return;
    }

    bool any_enc=false;
    for(auto& kv: s.members) if(kv.second.h.encrypted) any_enc=true;
    if(any_enc && (!pw || pw->empty())){ fail(ErrorKind::MissingPassphrase,"encrypted chunks present but no password given"); return; }

    std::map<std::string,Secret> keys;  // by salt
    std::vector<unsigned char> out;
    try{
      for(auto& kv: s.members){
        const Member& m=kv.second;
        if(!m.h.encrypted){ out.insert(out.end(),m.raw.begin(),m.raw.end()); continue; }
        std::string salt=to_hex(m.h.salt);
        auto k=keys.find(salt);
        if(k==keys.end()) k=keys.emplace(salt,derive_key(*pw,m.h.salt,iterations)).first;
        std::vector<unsigned char> plain;
        try{ plain=decrypt(m.raw,k->second,m.h.iv); }
        catch(const ChunkError& e){ throw ChunkError(e.kind(),"part "+std::to_string(m.h.index)+": "+e.what()); }
        out.insert(out.end(),plain.begin(),plain.end());
      }
    }catch(const ChunkError& e){
      fail(e.kind(),e.what()); return;
    }

    if(!verify(out,s.content_hash)){
      // payload hashes already vouched for the ciphertext, so a bad whole-file
      // digest after decryption points at the password
      if(any_enc) fail(ErrorKind::DecryptionFailed,"content hash mismatch after decryption (wrong password?)");
      else fail(ErrorKind::IntegrityMismatch,"SHA-256(total) mismatch");
      return;
    }
    r.outcome=Outcome::Done;
    r.artifact.name=s.name; r.artifact.content_hash=s.content_hash;
    r.artifact.total=s.total; r.artifact.encrypted=any_enc;
    r.artifact.bytes.swap(out);
  });

  for(auto& r: results){
    switch(r.outcome){
      case Outcome::Done:       rep.artifacts.push_back(std::move(r.artifact)); break;
      case Outcome::Incomplete: rep.incomplete.push_back(std::move(r.incomplete)); break;
      case Outcome::Failed:     rep.failed.push_back(std::move(r.failed)); break;
    }
  }
  return rep;
}

AssemblyReport assemble(const std::vector<ChunkInput>& inputs,const Secret* pw,const Config& cfg){
  ChunkCollector c(cfg);
  for(const auto& in: inputs) c.add(in);
  return c.finish(pw);
}

AssemblyReport assemble(const std::vector<std::string>& texts,const Secret* pw,const Config& cfg){
  std::vector<ChunkInput> in; in.reserve(texts.size());
  for(size_t i=0;i<texts.size();i++) in.push_back(ChunkInput{"#"+std::to_string(i+1),texts[i]});
  return assemble(in,pw,cfg);
}

} // namespace qrsx
