#pragma once

#include <string>

namespace vtob::core::device::protocol_adapters::vto {

// Uppercase hex MD5 of text.
std::string Md5UpperHex(const std::string& text);

// Password proof for the second global.login call:
//   d1 = MD5(user:realm:password), d2 = MD5(user:random:d1)
std::string LoginDigest(const std::string& username, const std::string& realm,
                        const std::string& random, const std::string& password);

}  // namespace vtob::core::device::protocol_adapters::vto
