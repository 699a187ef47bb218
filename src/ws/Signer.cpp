#include "hunt/ws/Signer.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>

namespace hunt::ws {

std::string hmacSha256Base64(const std::string& secret, const std::string& message) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digestLen = 0;

  if (!HMAC(EVP_sha256(),
            secret.data(), static_cast<int>(secret.size()),
            reinterpret_cast<const unsigned char*>(message.data()), message.size(),
            digest, &digestLen)) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }

  BIO* b64 = BIO_new(BIO_f_base64());
  BIO* mem = BIO_new(BIO_s_mem());
  if (!b64 || !mem) {
    BIO_free(b64);
    BIO_free(mem);
    throw std::runtime_error("BIO allocation failed");
  }
  BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
  BIO_push(b64, mem);
  BIO_write(b64, digest, static_cast<int>(digestLen));
  (void)BIO_flush(b64);

  BUF_MEM* buf = nullptr;
  BIO_get_mem_ptr(mem, &buf);
  std::string out = buf ? std::string(buf->data, buf->length) : std::string();
  BIO_free_all(b64);
  return out;
}

std::string loginSignature(const std::string& secret, const std::string& timestampMs) {
  return hmacSha256Base64(secret, timestampMs + "GET" + kLoginVerifyPath);
}

} // namespace hunt::ws
