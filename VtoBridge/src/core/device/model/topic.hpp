#pragma once

#include <string>
#include <string_view>

namespace vtob::core::device::model {

inline constexpr std::string_view kTopicPrefix = "vto";
inline constexpr std::string_view kTopicSuffix = "006";

// "vto" + address digits + "006". Dotted groups shorter than two digits are
// zero-padded: "172.16.11.1" -> "vto172161101006". Returns an empty string
// for an empty address.
std::string DeriveTopic(std::string_view address);

}  // namespace vtob::core::device::model
