#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace qrsx {
namespace fs {

bool is_dir(const std::string& p);
bool exists(const std::string& p);
void ensure_dir(const std::string& dir);
std::string path_basename(const std::string& p);
std::string path_ext(const std::string& p); // lowercased, with the dot
std::string join2(const std::string& a,const std::string& b);

// top-level entries of a directory, sorted, without "." and ".."
std::vector<std::string> list_dir(const std::string& dir);

std::vector<unsigned char> read_file(const std::string& path);
std::vector<unsigned char> read_head(const std::string& path,size_t n);
std::string read_text(const std::string& path);
void write_file(const std::string& path,const std::vector<unsigned char>& data);
void write_text(const std::string& path,const std::string& text);

// echo-off prompt on /dev/tty, falls back to stdin
std::string prompt_pwd(const char* prompt);

} // namespace fs
} // namespace qrsx
