#pragma once
#include <string>

/* status lines on stderr */
namespace qrsx {
namespace ui {
  extern bool quiet;
  extern bool verbose;
  void banner();
  void step(const std::string& s);
  void info(const std::string& s);
  void ok(const std::string& s);
  void warn(const std::string& s);
  void fail(const std::string& s);
}
} // namespace qrsx
