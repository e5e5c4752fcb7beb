#include <gtest/gtest.h>
#include "classifier.hpp"
#include "fsutil.hpp"
#include "splitter.hpp"
#include "test_util.hpp"

using namespace qrsx;
using qrsx::test::TempDir;
using qrsx::test::bytes;

namespace {

const std::string PNG_SIG("\x89PNG\r\n\x1a\n\0\0\0\rIHDR",16);

void write_png(const std::string& path){ fs::write_text(path,PNG_SIG+"fake pixels"); }

std::vector<std::string> sample_chunks(){
  return split(bytes("hello\nworld\n"),"hello.txt",6,nullptr,qrsx::test::test_config()).chunks;
}

} // namespace

TEST(Classifier, ImageMagic){
  EXPECT_TRUE(image_magic(bytes(PNG_SIG)));
  EXPECT_TRUE(image_magic(bytes("\xff\xd8\xff\xe0")));
  EXPECT_TRUE(image_magic(bytes("GIF89a....")));
  EXPECT_TRUE(image_magic(bytes(std::string("RIFF\x10\0\0\0WEBPVP8 ",16))));
  EXPECT_TRUE(image_magic(bytes(std::string("BM\x36\x10\0\0\0\0\0\0",10))));
  EXPECT_FALSE(image_magic(bytes("BMW service invoice\n")));
  EXPECT_FALSE(image_magic(bytes("QRSX1|a|1|1|")));
  EXPECT_FALSE(image_magic({}));
  EXPECT_TRUE(image_extension("scan.JPG"));
  EXPECT_TRUE(image_extension("/tmp/x.tiff"));
  EXPECT_FALSE(image_extension("notes.txt"));
}

TEST(Classifier, DirectoryOfChunkTexts){
  TempDir d;
  auto c=sample_chunks();
  for(size_t i=0;i<c.size();i++) fs::write_text(d.file("part"+std::to_string(i)+".txt"),c[i]);
  Classification r=classify(d.path(),qrsx::test::test_config());
  EXPECT_EQ(r.kind,InputKind::DirectoryChunksOnly);
  EXPECT_EQ(r.chunk_texts,c.size());
  EXPECT_EQ(r.images,0u);
  EXPECT_STREQ(input_kind_name(r.kind),"directory_chunks_only");
}

TEST(Classifier, DirectoryOfImages){
  TempDir d;
  write_png(d.file("a.png"));
  fs::write_text(d.file("b.jpeg"),"jpeg by name only");
  write_png(d.file("no_extension"));
  fs::write_text(d.file("README"),"scanned on tuesday\n");
  Classification r=classify(d.path(),qrsx::test::test_config());
  EXPECT_EQ(r.kind,InputKind::DirectoryImagesOnly);
  EXPECT_EQ(r.images,3u);
  EXPECT_EQ(r.others,1u);
}

TEST(Classifier, MixedDirectory){
  TempDir d;
  auto c=sample_chunks();
  write_png(d.file("scan1.png"));
  fs::write_text(d.file("chunk.txt"),c[0]);
  fs::ensure_dir(d.file("nested"));
  fs::write_text(d.file("nested/deep.txt"),c[1]);
  Classification r=classify(d.path(),qrsx::test::test_config());
  EXPECT_EQ(r.kind,InputKind::DirectoryMixed);
  EXPECT_EQ(r.images,1u);
  EXPECT_EQ(r.chunk_texts,1u);   // top level only
  EXPECT_EQ(r.others,1u);        // the subdirectory
  ASSERT_EQ(r.chunk_paths.size(),1u);
  EXPECT_EQ(r.chunk_paths[0],d.file("chunk.txt"));
}

TEST(Classifier, NothingRecognizableIsUnknown){
  TempDir d;
  EXPECT_EQ(classify(d.path(),qrsx::test::test_config()).kind,InputKind::Unknown);
  fs::write_text(d.file("notes.txt"),"QRSX1 is mentioned here but this is no header\n");
  fs::write_file(d.file("blob.bin"),qrsx::test::pseudo_random(100,21));
  Classification r=classify(d.path(),qrsx::test::test_config());
  EXPECT_EQ(r.kind,InputKind::Unknown);
  EXPECT_EQ(r.others,2u);
}

TEST(Classifier, SingleFiles){
  TempDir d;
  write_png(d.file("one.png"));
  fs::write_text(d.file("one.txt"),"\r\n"+sample_chunks()[0]);
  fs::write_text(d.file("plain.txt"),"just text");
  Config cfg=qrsx::test::test_config();
  EXPECT_EQ(classify(d.file("one.png"),cfg).kind,InputKind::SingleImage);
  EXPECT_EQ(classify(d.file("one.txt"),cfg).kind,InputKind::SingleChunkText);
  EXPECT_EQ(classify(d.file("plain.txt"),cfg).kind,InputKind::Unknown);
  EXPECT_EQ(classify_entry(d.file("one.txt"),cfg),EntryKind::ChunkText);
  EXPECT_EQ(classify_entry(d.path(),cfg),EntryKind::Other);
}

TEST(Classifier, MissingPathThrows){
  TempDir d;
  EXPECT_THROW(classify(d.file("absent"),qrsx::test::test_config()),std::runtime_error);
}
