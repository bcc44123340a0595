#include "include/encoding.hpp"
#include "include/csv_reader.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <iconv.h>
#include <string>
#include <unicode/ucsdet.h>
#include <vector>

// --- Detection ---

namespace {

struct DetectorHandle {
  UCharsetDetector *csd = nullptr;
  ~DetectorHandle() {
    if (csd)
      ucsdet_close(csd);
  }
};

const iconv_t kIconvError = reinterpret_cast<iconv_t>(-1);

struct IconvHandle {
  iconv_t cd;
  explicit IconvHandle(iconv_t c) : cd(c) {}
  ~IconvHandle() { iconv_close(cd); }
  IconvHandle(const IconvHandle &) = delete;
  IconvHandle &operator=(const IconvHandle &) = delete;
};

} // namespace

std::optional<std::string>
IcuEncodingDetector::detect(std::string_view bytes) const {
  if (bytes.empty())
    return std::nullopt;
  if (bytes.substr(0, 3) == "\xEF\xBB\xBF")
    return std::string("UTF-8");

  UErrorCode status = U_ZERO_ERROR;
  DetectorHandle h;
  h.csd = ucsdet_open(&status);
  if (U_FAILURE(status))
    return std::nullopt;

  size_t len = std::min(bytes.size(), static_cast<size_t>(INT32_MAX));
  ucsdet_setText(h.csd, bytes.data(), static_cast<int32_t>(len), &status);
  if (U_FAILURE(status))
    return std::nullopt;

  const UCharsetMatch *match = ucsdet_detect(h.csd, &status);
  if (U_FAILURE(status) || !match)
    return std::nullopt;

  const char *name = ucsdet_getName(match, &status);
  if (U_FAILURE(status) || !name || !*name)
    return std::nullopt;
  return std::string(name);
}

// --- Decoding ---

bool is_utf8_name(std::string_view encoding) {
  std::string upper;
  upper.reserve(encoding.size());
  for (char c : encoding)
    upper += static_cast<char>(c >= 'a' && c <= 'z' ? c - 32 : c);
  return upper == "UTF8" || upper == "UTF-8";
}

// UTF-8 goes through iconv too; malformed input is an EncodingError for
// every encoding.
std::string decode_text(std::string_view bytes, const std::string &encoding) {
  const char *from = is_utf8_name(encoding) ? "UTF-8" : encoding.c_str();
  iconv_t raw = iconv_open("UTF-8", from);
  if (raw == kIconvError) {
    if (errno == EINVAL)
      throw EncodingError("Encoding not recognized: '" + encoding + "'");
    throw EncodingError("iconv initialisation failed for '" + encoding + "'");
  }
  IconvHandle handle(raw);

  // iconv wants mutable input pointers.
  std::vector<char> in(bytes.begin(), bytes.end());
  char *inptr = in.data();
  size_t inleft = in.size();

  std::string out;
  std::vector<char> buf(bytes.size() * 4 + 16);

  while (inleft > 0) {
    char *outptr = buf.data();
    size_t outleft = buf.size();
    size_t rc = iconv(handle.cd, &inptr, &inleft, &outptr, &outleft);
    out.append(buf.data(), buf.size() - outleft);
    if (rc != static_cast<size_t>(-1))
      continue;
    if (errno == E2BIG)
      continue;
    size_t offset = static_cast<size_t>(inptr - in.data());
    if (errno == EILSEQ)
      throw EncodingError("Invalid " + encoding + " byte sequence at offset " +
                          std::to_string(offset));
    if (errno == EINVAL)
      throw EncodingError("Truncated " + encoding + " byte sequence at offset " +
                          std::to_string(offset));
    throw EncodingError("Failed to decode " + encoding + " input");
  }

  // Flush any shift state.
  char *outptr = buf.data();
  size_t outleft = buf.size();
  if (iconv(handle.cd, nullptr, nullptr, &outptr, &outleft) ==
      static_cast<size_t>(-1))
    throw EncodingError("Failed to decode " + encoding + " input");
  out.append(buf.data(), buf.size() - outleft);

  return std::string(strip_bom(out));
}

std::string decode_bytes(std::string_view bytes,
                         const EncodingDetector &detector,
                         std::string *encoding_out) {
  std::string encoding = detector.detect(bytes).value_or("UTF-8");
  if (encoding_out)
    *encoding_out = encoding;
  return decode_text(bytes, encoding);
}
