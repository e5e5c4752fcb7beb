#pragma once
#include <string>
#include <vector>

namespace qrsx {

/* External collaborators for the visual medium. The core never looks at
   pixels; these only move chunk texts in and out of QR images. */
class ImageDecoder {
public:
  virtual ~ImageDecoder() {}
  // Every chunk text found in one image; empty when none was found.
  virtual std::vector<std::string> decode(const std::string& image_path)=0;
};

class QrRenderer {
public:
  virtual ~QrRenderer() {}
  virtual void render(const std::string& text,const std::string& png_path)=0;
};

// zbarimg(1) from zbar-tools
class ZbarImageDecoder : public ImageDecoder {
public:
  explicit ZbarImageDecoder(const std::string& tool="zbarimg") : tool_(tool) {}
  std::vector<std::string> decode(const std::string& image_path) override;
private:
  std::string tool_;
};

// qrencode(1), error correction L, 8-bit mode
class QrencodeRenderer : public QrRenderer {
public:
  explicit QrencodeRenderer(const std::string& tool="qrencode") : tool_(tool) {}
  void render(const std::string& text,const std::string& png_path) override;
private:
  std::string tool_;
};

std::string shell_quote(const std::string& s);

// zbarimg --raw prints symbols one after another, each followed by a
// newline. A chunk spans several lines, so symbols are regrouped on the
// header magic.
std::vector<std::string> split_scanned_text(const std::string& out);

} // namespace qrsx
