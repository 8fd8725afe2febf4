#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace pd {

// Keyboard focus over an ordered set of panel focus ids. next()/previous()
// wrap around. An empty ring has no focus and current() returns "".
class FocusRing {
public:
  // Replaces the order, keeping the focused id when it is still present.
  // Empty and duplicate ids are dropped.
  void setOrder(const std::vector<std::string>& ids);
  void clear();

  void next();
  void previous();
  bool setFocus(const std::string& id);

  const std::string& current() const;
  bool isFocused(const std::string& id) const;
  std::size_t count() const { return ids_.size(); }
  const std::vector<std::string>& order() const { return ids_; }

private:
  std::vector<std::string> ids_;
  std::size_t index_{0};
};

} // namespace pd
