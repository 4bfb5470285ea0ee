#include "csv_toolbox/record.hpp"

namespace ctb {

Header::Header(std::vector<std::string> names) : names_(std::move(names)) {
  index_.reserve(names_.size());
  for (std::size_t i = 0; i < names_.size(); ++i) index_.emplace(names_[i], i);
}

std::optional<std::size_t> Header::index_of(std::string_view name) const {
  auto it = index_.find(std::string(name));
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

Record Record::make_object(std::shared_ptr<const Header> keys, std::vector<FieldValue> values) {
  Record r;
  r.keys_ = std::move(keys);
  r.values_ = std::move(values);
  return r;
}

Record Record::make_array(std::vector<FieldValue> values) {
  Record r;
  r.values_ = std::move(values);
  return r;
}

const FieldValue* Record::find(std::string_view key) const {
  if (!keys_) return nullptr;
  auto idx = keys_->index_of(key);
  if (!idx || *idx >= values_.size()) return nullptr;
  return &values_[*idx];
}

const std::vector<std::string>& Record::keys() const {
  static const std::vector<std::string> kNone;
  return keys_ ? keys_->names() : kNone;
}

std::vector<std::pair<std::string, FieldValue>> Record::entries() const {
  std::vector<std::pair<std::string, FieldValue>> out;
  const auto& k = keys();
  out.reserve(k.size());
  for (std::size_t i = 0; i < k.size() && i < values_.size(); ++i) out.emplace_back(k[i], values_[i]);
  return out;
}

bool Record::operator==(const Record& o) const {
  if (is_object() != o.is_object()) return false;
  if (values_ != o.values_) return false;
  if (keys_ == o.keys_) return true;
  return keys() == o.keys();
}

}
