#include "core/device/model/topic.hpp"

namespace vtob::core::device::model {

static bool IsSeparator(char c) { return c == '.' || c == ':' || c == '-' || c == '_'; }

std::string DeriveTopic(std::string_view address) {
  if (address.empty()) return std::string();

  std::string out(kTopicPrefix);
  out.reserve(kTopicPrefix.size() + address.size() + kTopicSuffix.size() + 4);

  size_t i = 0;
  while (i <= address.size()) {
    size_t j = i;
    while (j < address.size() && !IsSeparator(address[j])) ++j;

    const std::string_view group = address.substr(i, j - i);
    if (group.size() == 1) out.push_back('0');
    out.append(group.data(), group.size());

    if (j >= address.size()) break;
    i = j + 1;
  }

  out.append(kTopicSuffix.data(), kTopicSuffix.size());
  return out;
}

}  // namespace vtob::core::device::model
