#include <gtest/gtest.h>
#include "base64.hpp"
#include "test_util.hpp"

using namespace qrsx;
using qrsx::test::bytes;
using qrsx::test::str;

TEST(Base64, EncodesRfc4648Vectors){
  EXPECT_EQ(b64_encode(bytes("")),"");
  EXPECT_EQ(b64_encode(bytes("f")),"Zg==");
  EXPECT_EQ(b64_encode(bytes("fo")),"Zm8=");
  EXPECT_EQ(b64_encode(bytes("foo")),"Zm9v");
  EXPECT_EQ(b64_encode(bytes("foobar")),"Zm9vYmFy");
  EXPECT_EQ(b64_len(0),0u);
  EXPECT_EQ(b64_len(1),4u);
  EXPECT_EQ(b64_len(6),8u);
  EXPECT_EQ(b64_len(7),12u);
}

TEST(Base64, DecodesAndStripsPadding){
  std::vector<unsigned char> out;
  ASSERT_TRUE(b64_decode("Zg==",out));   EXPECT_EQ(str(out),"f");
  ASSERT_TRUE(b64_decode("Zm8=",out));   EXPECT_EQ(str(out),"fo");
  ASSERT_TRUE(b64_decode("Zm9vYmFy",out)); EXPECT_EQ(str(out),"foobar");
  ASSERT_TRUE(b64_decode("",out));       EXPECT_TRUE(out.empty());
}

TEST(Base64, KeepsNulAndHighBytes){
  std::vector<unsigned char> in={0x00,0xff,0x00,0x80,0x7f};
  std::vector<unsigned char> out;
  ASSERT_TRUE(b64_decode(b64_encode(in),out));
  EXPECT_EQ(out,in);
}

TEST(Base64, RejectsNonCanonicalInput){
  std::vector<unsigned char> out={'x'};
  EXPECT_FALSE(b64_decode("Zg=",out));      // length not a multiple of 4
  EXPECT_FALSE(b64_decode("Zh==",out));     // unused bits set
  EXPECT_FALSE(b64_decode("Zm9*",out));
  EXPECT_FALSE(b64_decode(" Zm9v",out));
  EXPECT_FALSE(b64_decode("Zm9v\n",out));
  EXPECT_FALSE(b64_decode("Z===",out));
  EXPECT_EQ(str(out),"x");
}
