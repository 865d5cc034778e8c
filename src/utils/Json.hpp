#pragma once

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include <yyjson.h>

namespace wb::json {

class Document {
public:
  Document() = default;
  explicit Document(yyjson_doc *doc) : doc_(doc) {}
  Document(Document &&other) noexcept : doc_(other.doc_) { other.doc_ = nullptr; }
  Document &operator=(Document &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  Document(Document const &) = delete;
  Document &operator=(Document const &) = delete;

  ~Document() { reset(); }

  static Document parse(std::string_view payload) {
    if (payload.empty()) {
      return Document();
    }
    return Document(
        yyjson_read(payload.data(), payload.size(), static_cast<yyjson_read_flag>(0)));
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_val *root() const noexcept {
    return doc_ ? yyjson_doc_get_root(doc_) : nullptr;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_doc *doc_ = nullptr;
};

class MutableDocument {
public:
  MutableDocument() : doc_(yyjson_mut_doc_new(nullptr)) {}
  MutableDocument(MutableDocument &&other) noexcept : doc_(other.doc_) {
    other.doc_ = nullptr;
  }
  MutableDocument &operator=(MutableDocument &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  MutableDocument(MutableDocument const &) = delete;
  MutableDocument &operator=(MutableDocument const &) = delete;

  ~MutableDocument() { reset(); }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_mut_doc *doc() const noexcept { return doc_; }
  yyjson_mut_val *root() const noexcept {
    return doc_ ? yyjson_mut_doc_get_root(doc_) : nullptr;
  }

  void set_root(yyjson_mut_val *value) {
    if (doc_) {
      yyjson_mut_doc_set_root(doc_, value);
    }
  }

  // Parses `text` and deep-copies it into this document. Empty or invalid
  // text becomes JSON null.
  yyjson_mut_val *embed(std::string_view text) {
    if (!doc_) {
      return nullptr;
    }
    auto parsed = Document::parse(text);
    if (!parsed.is_valid()) {
      return yyjson_mut_null(doc_);
    }
    auto *copy = yyjson_val_mut_copy(doc_, parsed.root());
    return copy ? copy : yyjson_mut_null(doc_);
  }

  std::string write(char const *fallback = "{}") const {
    if (!doc_) {
      return fallback ? fallback : "{}";
    }
    char *json = yyjson_mut_write(doc_, 0, nullptr);
    std::string result = json ? json : (fallback ? fallback : "{}");
    std::free(json);
    return result;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_mut_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_mut_doc *doc_ = nullptr;
};

inline std::string write_value(yyjson_val *value, char const *fallback = "null") {
  if (value == nullptr) {
    return fallback;
  }
  char *json = yyjson_val_write(value, 0, nullptr);
  std::string result = json ? json : fallback;
  std::free(json);
  return result;
}

inline std::optional<double> get_number(yyjson_val *object, char const *key) {
  auto *value = object ? yyjson_obj_get(object, key) : nullptr;
  if (value == nullptr || !yyjson_is_num(value)) {
    return std::nullopt;
  }
  return yyjson_get_num(value);
}

// yyjson parses non-negative integers as unsigned.
inline std::optional<std::int64_t> as_int64(yyjson_val *value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  if (yyjson_is_sint(value)) {
    return yyjson_get_sint(value);
  }
  if (yyjson_is_uint(value) &&
      yyjson_get_uint(value) <=
          static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    return static_cast<std::int64_t>(yyjson_get_uint(value));
  }
  return std::nullopt;
}

inline std::optional<std::string> get_string(yyjson_val *object, char const *key) {
  auto *value = object ? yyjson_obj_get(object, key) : nullptr;
  if (value == nullptr || !yyjson_is_str(value)) {
    return std::nullopt;
  }
  return std::string(yyjson_get_str(value), yyjson_get_len(value));
}

inline std::optional<bool> get_bool(yyjson_val *object, char const *key) {
  auto *value = object ? yyjson_obj_get(object, key) : nullptr;
  if (value == nullptr || !yyjson_is_bool(value)) {
    return std::nullopt;
  }
  return yyjson_get_bool(value);
}

inline std::string quote(std::string_view text) {
  MutableDocument doc;
  if (!doc.is_valid()) {
    return "\"\"";
  }
  doc.set_root(yyjson_mut_strncpy(doc.doc(), text.data(), text.size()));
  return doc.write("\"\"");
}

} // namespace wb::json
