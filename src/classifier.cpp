#include "classifier.hpp"
#include "fsutil.hpp"
#include "header.hpp"
#include "ui.hpp"
#include <cstring>
#include <stdexcept>

namespace qrsx {

const char* input_kind_name(InputKind k){
  switch(k){
    case InputKind::SingleImage:         return "single_image";
    case InputKind::SingleChunkText:     return "single_chunk_text";
    case InputKind::DirectoryImagesOnly: return "directory_images_only";
    case InputKind::DirectoryChunksOnly: return "directory_chunks_only";
    case InputKind::DirectoryMixed:      return "directory_mixed";
    case InputKind::Unknown:             return "unknown";
  }
  return "unknown";
}

bool image_magic(const std::vector<unsigned char>& h){
  auto has=[&](const char* sig,size_t n,size_t at){ return h.size()>=at+n && std::memcmp(h.data()+at,sig,n)==0; };
  return has("\x89PNG\r\n\x1a\n",8,0)
      || has("\xff\xd8\xff",3,0)
      || has("GIF87a",6,0) || has("GIF89a",6,0)
      || (has("BM",2,0) && has("\0\0\0\0",4,6))
      || has("II*\0",4,0) || has("MM\0*",4,0)
      || (has("RIFF",4,0) && has("WEBP",4,8));
}

bool image_extension(const std::string& path){
  static const char* E[]={".png",".jpg",".jpeg",".bmp",".tif",".tiff",".gif",".webp"};
  std::string e=fs::path_ext(path);
  for(const char* x: E) if(e==x) return true;
  return false;
}

EntryKind classify_entry(const std::string& path,const Config& cfg){
  if(fs::is_dir(path)) return EntryKind::Other;
  auto head=fs::read_head(path,cfg.sniff_bytes);
  if(image_magic(head) || image_extension(path)) return EntryKind::Image;
  std::string text(head.begin(),head.end()), line, payload;
  split_chunk_text(text,line,payload);
  ChunkHeader h;
  if(try_parse_header(line,h)) return EntryKind::ChunkText;
  return EntryKind::Other;
}

Classification classify(const std::string& path,const Config& cfg){
  if(!fs::exists(path)) throw std::runtime_error("No such file or folder: "+path);
  Classification c;
  auto count=[&](const std::string& p){
    EntryKind k=EntryKind::Other;
    try{ k=classify_entry(p,cfg); }
    catch(const std::runtime_error& e){ ui::warn(e.what()); }
    switch(k){
      case EntryKind::Image:     c.images++; c.image_paths.push_back(p); break;
      case EntryKind::ChunkText: c.chunk_texts++; c.chunk_paths.push_back(p); break;
      case EntryKind::Other:     c.others++; break;
    }
  };
  if(!fs::is_dir(path)){
    count(path);
    c.kind= c.images? InputKind::SingleImage : c.chunk_texts? InputKind::SingleChunkText : InputKind::Unknown;
    return c;
  }
  for(const auto& p: fs::list_dir(path)) count(p);
  if(c.images && c.chunk_texts) c.kind=InputKind::DirectoryMixed;
  else if(c.images)             c.kind=InputKind::DirectoryImagesOnly;
  else if(c.chunk_texts)        c.kind=InputKind::DirectoryChunksOnly;
  else                          c.kind=InputKind::Unknown;
  return c;
}

} // namespace qrsx
