#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ctb {

// A missing value (nullopt) only appears when a short row is padded.
using FieldValue = std::optional<std::string>;

// Ordered, unique column names with a name -> index lookup.
class Header {
public:
  explicit Header(std::vector<std::string> names);

  const std::vector<std::string>& names() const noexcept { return names_; }
  std::size_t size() const noexcept { return names_.size(); }
  std::optional<std::size_t> index_of(std::string_view name) const;

private:
  std::vector<std::string> names_;
  std::unordered_map<std::string, std::size_t> index_;
};

// Object form: values aligned with a shared key list. Array form: positional values.
// Keys are plain data; no name is treated specially.
class Record {
public:
  Record() = default;

  static Record make_object(std::shared_ptr<const Header> keys, std::vector<FieldValue> values);
  static Record make_array(std::vector<FieldValue> values);

  bool is_object() const noexcept { return keys_ != nullptr; }
  std::size_t size() const noexcept { return values_.size(); }

  const FieldValue& at(std::size_t i) const { return values_.at(i); }
  // Object records only; nullptr when the key is not present.
  const FieldValue* find(std::string_view key) const;
  bool contains(std::string_view key) const { return find(key) != nullptr; }

  const std::vector<std::string>& keys() const;
  const std::vector<FieldValue>& values() const noexcept { return values_; }
  std::vector<std::pair<std::string, FieldValue>> entries() const;

  bool operator==(const Record& o) const;
  bool operator!=(const Record& o) const { return !(*this == o); }

private:
  std::shared_ptr<const Header> keys_;
  std::vector<FieldValue> values_;
};

using RecordCallback = std::function<void(Record&&)>;

}
