#include <accredit/common/critical.hpp>
#include <accredit/storage/overlay.hpp>

#include <iterator>
#include <utility>

namespace accredit::storage {

overlay::overlay(const backing_t& backing, overlay* parent)
    : backing_{backing}, parent_{parent} {}

std::optional<accredit::schema::bytes_t> overlay::load(
    const accredit::schema::bytes_view_t& key) const {
  auto found = writes_.find(accredit::schema::make_bytes(key));
  if (found != std::end(writes_)) {
    return found->second;
  }
  if (parent_ != nullptr) {
    return parent_->load(key);
  }
  return backing_.load(key);
}

void overlay::store(const accredit::schema::bytes_view_t& key,
                    accredit::schema::bytes_t value) {
  writes_.insert_or_assign(accredit::schema::make_bytes(key), std::move(value));
}

void overlay::merge() {
  if (parent_ == nullptr) {
    accredit::common::critical("cannot merge an overlay without a parent");
  }
  for (auto& [key, value] : writes_) {
    parent_->writes_.insert_or_assign(key, std::move(value));
  }
  writes_.clear();
}

void overlay::discard() {
  writes_.clear();
}

std::vector<key_value_entry_t> overlay::entries() const {
  return std::vector<key_value_entry_t>(std::begin(writes_), std::end(writes_));
}

bool overlay::empty() const {
  return writes_.empty();
}

}  // namespace accredit::storage
