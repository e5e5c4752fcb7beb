#include "test_util.hpp"
#include <cstdio>
#include <cstdlib>
#include <random>
#include <stdexcept>
#include <ftw.h>
#include <unistd.h>
#include <gtest/gtest.h>
#include "ui.hpp"

namespace qrsx {
namespace test {

std::vector<unsigned char> bytes(const std::string& s){ return std::vector<unsigned char>(s.begin(),s.end()); }
std::string str(const std::vector<unsigned char>& v){ return std::string(v.begin(),v.end()); }

std::vector<unsigned char> pseudo_random(size_t n,uint32_t seed){
  std::mt19937 rng(seed);
  std::vector<unsigned char> v(n);
  for(auto& b: v) b=(unsigned char)(rng()&0xFF);
  return v;
}

Config test_config(){
  Config c;
  c.jobs=4;
  c.kdf_iterations=1000;
  return c;
}

TempDir::TempDir(){
  const char* base=std::getenv("TMPDIR");
  std::string tmpl=std::string(base&&*base? base : "/tmp")+"/qrsx_test_XXXXXX";
  std::vector<char> buf(tmpl.begin(),tmpl.end()); buf.push_back('\0');
  if(!mkdtemp(buf.data())) throw std::runtime_error("mkdtemp failed");
  path_=buf.data();
}

static int rm_entry(const char* p,const struct stat*,int,struct FTW*){ return ::remove(p); }

TempDir::~TempDir(){
  nftw(path_.c_str(),rm_entry,16,FTW_DEPTH|FTW_PHYS);
}

namespace {
class QuietEnv : public ::testing::Environment {
public:
  void SetUp() override { ui::quiet=true; }
};
::testing::Environment* const quiet_env=::testing::AddGlobalTestEnvironment(new QuietEnv);
}

} // namespace test
} // namespace qrsx
