#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

class EncodingError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Guesses the charset of a byte buffer. Returns nullopt when no guess.
class EncodingDetector {
public:
  virtual ~EncodingDetector() = default;
  virtual std::optional<std::string> detect(std::string_view bytes) const = 0;
};

// ICU charset detection (ucsdet).
class IcuEncodingDetector : public EncodingDetector {
public:
  std::optional<std::string> detect(std::string_view bytes) const override;
};

// Always reports the same encoding; used for explicit overrides.
class FixedEncodingDetector : public EncodingDetector {
  std::string name_;

public:
  explicit FixedEncodingDetector(std::string name) : name_(std::move(name)) {}
  std::optional<std::string> detect(std::string_view) const override {
    return name_;
  }
};

bool is_utf8_name(std::string_view encoding);

// Converts `bytes` from `encoding` to UTF-8 and drops a leading BOM.
// Throws EncodingError for unknown encodings or undecodable input.
std::string decode_text(std::string_view bytes, const std::string &encoding);

// detect + decode_text, defaulting to UTF-8. The chosen name is stored in
// *encoding_out when given.
std::string decode_bytes(std::string_view bytes,
                         const EncodingDetector &detector,
                         std::string *encoding_out = nullptr);
