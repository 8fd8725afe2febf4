#include "pd/layout/FocusRing.hpp"

#include <algorithm>

namespace pd {

namespace {
const std::string kNone;
}

void FocusRing::setOrder(const std::vector<std::string>& ids) {
  std::string keep = current();
  ids_.clear();
  for (const auto& id : ids) {
    if (id.empty() || std::find(ids_.begin(), ids_.end(), id) != ids_.end()) continue;
    ids_.push_back(id);
  }
  index_ = 0;
  if (!keep.empty()) setFocus(keep);
}

void FocusRing::clear() {
  ids_.clear();
  index_ = 0;
}

void FocusRing::next() {
  if (ids_.empty()) return;
  index_ = (index_ + 1) % ids_.size();
}

void FocusRing::previous() {
  if (ids_.empty()) return;
  index_ = index_ == 0 ? ids_.size() - 1 : index_ - 1;
}

bool FocusRing::setFocus(const std::string& id) {
  auto it = std::find(ids_.begin(), ids_.end(), id);
  if (it == ids_.end()) return false;
  index_ = static_cast<std::size_t>(it - ids_.begin());
  return true;
}

const std::string& FocusRing::current() const {
  return ids_.empty() ? kNone : ids_[index_];
}

bool FocusRing::isFocused(const std::string& id) const {
  return !id.empty() && !ids_.empty() && ids_[index_] == id;
}

} // namespace pd
