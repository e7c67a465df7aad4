#include "core/device/protocol_adapters/vto_adapter/vto_digest.hpp"

#include <openssl/evp.h>

namespace vtob::core::device::protocol_adapters::vto {

std::string Md5UpperHex(const std::string& text) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if (EVP_Digest(text.data(), text.size(), md, &md_len, EVP_md5(), nullptr) != 1) {
    return std::string();
  }

  static const char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(md_len * 2);
  for (unsigned int i = 0; i < md_len; ++i) {
    out.push_back(kHex[(md[i] >> 4) & 0x0f]);
    out.push_back(kHex[md[i] & 0x0f]);
  }
  return out;
}

std::string LoginDigest(const std::string& username, const std::string& realm,
                        const std::string& random, const std::string& password) {
  const std::string d1 = Md5UpperHex(username + ":" + realm + ":" + password);
  return Md5UpperHex(username + ":" + random + ":" + d1);
}

}  // namespace vtob::core::device::protocol_adapters::vto
