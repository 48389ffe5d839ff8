#pragma once

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include <yyjson.h>

namespace tl::json {

// Owning wrapper over an immutable yyjson document.
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
    return Document(yyjson_read(payload.data(), payload.size(),
                                static_cast<yyjson_read_flag>(0)));
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

// Owning wrapper over a mutable yyjson document used by the serializers.
class MutableDocument {
public:
  MutableDocument() : doc_(yyjson_mut_doc_new(nullptr)) {}
  MutableDocument(MutableDocument const &) = delete;
  MutableDocument &operator=(MutableDocument const &) = delete;

  ~MutableDocument() {
    if (doc_) {
      yyjson_mut_doc_free(doc_);
    }
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_mut_doc *doc() const noexcept { return doc_; }

  // Creates an object, installs it as the document root and returns it.
  yyjson_mut_val *make_root_object() {
    if (!doc_) {
      return nullptr;
    }
    auto *root = yyjson_mut_obj(doc_);
    yyjson_mut_doc_set_root(doc_, root);
    return root;
  }

  // Copies the string so callers may pass temporaries.
  void add_string(yyjson_mut_val *object, char const *key,
                  std::string_view value) {
    yyjson_mut_obj_add_strncpy(doc_, object, key, value.data(), value.size());
  }

  std::string write(char const *fallback = "{}") const {
    if (!doc_) {
      return fallback;
    }
    char *json = yyjson_mut_write(doc_, 0, nullptr);
    if (json == nullptr) {
      return fallback;
    }
    std::string result(json);
    std::free(json);
    return result;
  }

private:
  yyjson_mut_doc *doc_ = nullptr;
};

inline std::optional<std::string_view> string_member(yyjson_val *object,
                                                     char const *key) {
  auto *value = object ? yyjson_obj_get(object, key) : nullptr;
  if (value == nullptr || !yyjson_is_str(value)) {
    return std::nullopt;
  }
  return std::string_view(yyjson_get_str(value), yyjson_get_len(value));
}

inline std::optional<std::int64_t> integer_member(yyjson_val *object,
                                                  char const *key) {
  auto *value = object ? yyjson_obj_get(object, key) : nullptr;
  if (value == nullptr || !yyjson_is_int(value)) {
    return std::nullopt;
  }
  return yyjson_get_sint(value);
}

} // namespace tl::json
