#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "auxiliary/hash.hpp"

#include <fmt/format.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

namespace ftr::aux
{
Sha1Digest sha1(std::span<const uint8_t> data)
{
  Sha1Digest digest {};
  SHA1(data.data(), data.size(), digest.data());
  return digest;
}

void Sha256::ContextDeleter::operator()(EVP_MD_CTX* context) const
{
  EVP_MD_CTX_free(context);
}

Sha256::Sha256()
    : m_context {EVP_MD_CTX_new()}
{
  if (!m_context || EVP_DigestInit_ex(m_context.get(), EVP_sha256(), nullptr) != 1)
  {
    throw std::runtime_error("Couldn't initialize SHA-256 context");
  }
}

void Sha256::update(std::span<const uint8_t> data)
{
  if (EVP_DigestUpdate(m_context.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("SHA-256 update failed");
  }
}

Sha256Digest Sha256::finish()
{
  Sha256Digest digest {};
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(m_context.get(), digest.data(), &length) != 1
      || length != digest.size())
  {
    throw std::runtime_error("SHA-256 finalize failed");
  }
  return digest;
}

Sha256Digest sha256_file(const std::filesystem::path& path, size_t chunk_size)
{
  std::ifstream file {path, std::ios::binary};
  if (!file) {
    throw std::system_error(
        errno, std::generic_category(), "open " + path.string());
  }

  Sha256 hasher {};
  std::vector<uint8_t> buffer(chunk_size > 0 ? chunk_size : 65536);

  while (file) {
    file.read(reinterpret_cast<char*>(buffer.data()),
              static_cast<std::streamsize>(buffer.size()));
    auto read = static_cast<size_t>(file.gcount());
    if (read == 0) {
      break;
    }
    hasher.update({buffer.data(), read});
  }

  if (file.bad()) {
    throw std::system_error(
        errno, std::generic_category(), "read " + path.string());
  }

  return hasher.finish();
}

std::string to_hex(std::span<const uint8_t> bytes)
{
  std::string result;
  result.reserve(bytes.size() * 2);
  for (uint8_t byte : bytes) {
    result += fmt::format("{:02x}", byte);
  }

  return result;
}

std::optional<Sha256Digest> sha256_from_hex(std::string_view hex)
{
  Sha256Digest digest {};
  if (hex.size() != digest.size() * 2) {
    return std::nullopt;
  }

  auto nibble = [](char c) -> int
  {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  };

  for (size_t i = 0; i < digest.size(); i++) {
    auto high = nibble(hex[2 * i]);
    auto low = nibble(hex[2 * i + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    digest[i] = static_cast<uint8_t>((high << 4) | low);
  }

  return digest;
}
}  // namespace ftr::aux
