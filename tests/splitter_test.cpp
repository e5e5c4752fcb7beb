#include <gtest/gtest.h>
#include <set>
#include "base64.hpp"
#include "crypto.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "header.hpp"
#include "splitter.hpp"
#include "test_util.hpp"

using namespace qrsx;
using qrsx::test::bytes;
using qrsx::test::str;

namespace {

typedef std::vector<std::pair<size_t,size_t>> Segments;

std::vector<std::string> pieces(const std::string& s,const Segments& segs){
  std::vector<std::string> out;
  for(const auto& p: segs) out.push_back(s.substr(p.first,p.second));
  return out;
}

void expect_exact_cover(const std::vector<unsigned char>& b,const Segments& segs,size_t cap){
  size_t off=0;
  for(const auto& p: segs){
    EXPECT_EQ(p.first,off);
    EXPECT_LE(p.second,cap);
    off+=p.second;
  }
  EXPECT_EQ(off,b.size());
}

} // namespace

TEST(Splitter, DetectsText){
  EXPECT_TRUE(looks_like_text(bytes("plain ascii\n"),8192));
  EXPECT_TRUE(looks_like_text(bytes("caf\xc3\xa9 \xe2\x82\xac\n"),8192));
  EXPECT_TRUE(looks_like_text({},8192));
  EXPECT_FALSE(looks_like_text(bytes(std::string("a\0b",3)),8192));
  EXPECT_FALSE(looks_like_text(bytes("\xff\xfe"),8192));
  EXPECT_FALSE(looks_like_text(bytes("\xc3("),8192));
  // a sequence cut by the sniff window is not held against the input
  EXPECT_TRUE(looks_like_text(bytes("ab\xe2\x82\xac"),3));
}

TEST(Splitter, TextIsCutOnLineEnds){
  std::string s="aaa\nbbb\nccc\n";
  auto segs=segment(bytes(s),8,true);
  EXPECT_EQ(pieces(s,segs),(std::vector<std::string>{"aaa\nbbb\n","ccc\n"}));
  expect_exact_cover(bytes(s),segs,8);
}

TEST(Splitter, LongLinesAreCutAndTailStaysOpen){
  std::string s="abcdefghij\nxy\n";
  auto segs=segment(bytes(s),4,true);
  EXPECT_EQ(pieces(s,segs),(std::vector<std::string>{"abcd","efgh","ij\n","xy\n"}));
  expect_exact_cover(bytes(s),segs,4);
}

TEST(Splitter, LongLinesNeverSplitUtf8){
  std::string s="\xe2\x82\xac\xe2\x82\xac\xe2\x82\xac";   // three euro signs, no newline
  auto segs=segment(bytes(s),4,true);
  expect_exact_cover(bytes(s),segs,4);
  for(const auto& p: pieces(s,segs)) EXPECT_TRUE(looks_like_text(bytes(p),8192)) << p;
}

TEST(Splitter, BinaryIsSlicedAtCapacity){
  auto b=qrsx::test::pseudo_random(25,1);
  auto segs=segment(b,10,false);
  ASSERT_EQ(segs.size(),3u);
  EXPECT_EQ(segs[2],std::make_pair((size_t)20,(size_t)5));
  expect_exact_cover(b,segs,10);
}

TEST(Splitter, EmptyInputIsOneEmptySegment){
  auto segs=segment({},10,true);
  ASSERT_EQ(segs.size(),1u);
  EXPECT_EQ(segs[0].second,0u);
}

TEST(Splitter, EmptyFileGivesOneChunk){
  Config cfg=qrsx::test::test_config();
  SplitResult r=split({},"empty.txt",100,nullptr,cfg);
  ASSERT_EQ(r.chunks.size(),1u);
  EXPECT_EQ(r.summary.total,1u);
  EXPECT_EQ(r.summary.content_hash,hash_hex({}));
  ChunkHeader h=parse_header(r.chunks[0].substr(0,r.chunks[0].size()-1));
  EXPECT_EQ(h.index,1u);
  EXPECT_EQ(h.total,1u);
  EXPECT_EQ(r.chunks[0].back(),'\n');
}

TEST(Splitter, ChunksAreOrderedAndSelfDescribing){
  Config cfg=qrsx::test::test_config();
  auto data=qrsx::test::pseudo_random(1000,2);
  SplitResult r=split(data,"dir/blob.bin",64,nullptr,cfg);
  EXPECT_EQ(r.summary.name,"blob.bin");
  EXPECT_EQ(r.summary.total,16u);
  EXPECT_EQ(r.summary.bytes,1000u);
  ASSERT_EQ(r.chunks.size(),16u);
  std::vector<unsigned char> joined;
  for(size_t i=0;i<r.chunks.size();i++){
    std::string line,payload;
    split_chunk_text(r.chunks[i],line,payload);
    ChunkHeader h=parse_header(line);
    EXPECT_EQ(h.name,"blob.bin");
    EXPECT_EQ(h.index,i+1);
    EXPECT_EQ(h.total,16u);
    EXPECT_EQ(h.content_hash,hash_hex(data));
    EXPECT_FALSE(h.encrypted);
    std::vector<unsigned char> raw;
    ASSERT_TRUE(b64_decode(payload,raw));
    EXPECT_LE(raw.size(),64u);
    EXPECT_TRUE(verify(raw,h.payload_hash));
    joined.insert(joined.end(),raw.begin(),raw.end());
  }
  EXPECT_EQ(joined,data);
}

TEST(Splitter, EncryptionSharesSaltWithFreshIvs){
  Config cfg=qrsx::test::test_config();
  std::string p="pw";
  Secret pw=Secret::take(p);
  SplitResult r=split(bytes(std::string(200,'z')),"z.txt",50,&pw,cfg);
  ASSERT_EQ(r.chunks.size(),4u);
  EXPECT_TRUE(r.summary.encrypted);
  std::set<std::string> salts,ivs;
  for(const auto& c: r.chunks){
    std::string line,payload;
    split_chunk_text(c,line,payload);
    ChunkHeader h=parse_header(line);
    EXPECT_TRUE(h.encrypted);
    std::vector<unsigned char> raw;
    ASSERT_TRUE(b64_decode(payload,raw));
    EXPECT_EQ(raw.size()%IV_LEN,0u);
    EXPECT_TRUE(verify(raw,h.payload_hash));   // payload hash covers the ciphertext
    EXPECT_EQ(payload.find("zzzz"),std::string::npos);
    salts.insert(to_hex(h.salt)); ivs.insert(to_hex(h.iv));
  }
  EXPECT_EQ(salts.size(),1u);
  EXPECT_EQ(ivs.size(),4u);
}

TEST(Splitter, CapacityErrors){
  Config cfg=qrsx::test::test_config();
  try{ split(bytes("x"),"a",0,nullptr,cfg); FAIL(); }
  catch(const ChunkError& e){ EXPECT_EQ(e.kind(),ErrorKind::CapacityExceeded); }

  cfg.max_chunks=5;
  EXPECT_EQ(split(qrsx::test::pseudo_random(50,3),"a",10,nullptr,cfg).chunks.size(),5u);
  try{ split(qrsx::test::pseudo_random(51,3),"a",10,nullptr,cfg); FAIL(); }
  catch(const ChunkError& e){ EXPECT_EQ(e.kind(),ErrorKind::CapacityExceeded); }
}

TEST(Splitter, CapacityForMediumFitsTheMedium){
  Config cfg=qrsx::test::test_config();
  cfg.medium_chars=600;
  const size_t usable=(size_t)(cfg.medium_chars*cfg.safety_margin);
  std::string p="pw";
  Secret pw=Secret::take(p);
  for(bool enc: {false,true}){
    size_t cap=cfg.capacity_for_medium("report.bin",enc);
    ASSERT_GT(cap,0u);
    auto r=split(qrsx::test::pseudo_random(5000,4),"report.bin",cap,enc? &pw : nullptr,cfg);
    for(const auto& c: r.chunks) EXPECT_LE(c.size(),usable) << (enc?"encrypted":"plain");
  }
  cfg.medium_chars=100;
  EXPECT_EQ(cfg.capacity_for_medium("report.bin",false),0u);
}

TEST(Splitter, PartNames){
  EXPECT_EQ(part_name("notes.txt",3,12),"notes.txt_part_3_of_12");
  EXPECT_EQ(part_name("../x",1,1),"x_part_1_of_1");
}
