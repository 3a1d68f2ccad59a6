#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <openssl/evp.h>

namespace ftr::aux
{
using Sha1Digest = std::array<uint8_t, 20>;
using Sha256Digest = std::array<uint8_t, 32>;

Sha1Digest sha1(std::span<const uint8_t> data);

// Incremental SHA-256 over OpenSSL's EVP interface.
class Sha256
{
  struct ContextDeleter
  {
    void operator()(EVP_MD_CTX* context) const;
  };

  std::unique_ptr<EVP_MD_CTX, ContextDeleter> m_context;

public:
  Sha256();

  void update(std::span<const uint8_t> data);

  Sha256Digest finish();
};

// Hashes a file in `chunk_size` reads. Throws std::system_error when the file
// can't be read.
Sha256Digest sha256_file(const std::filesystem::path& path, size_t chunk_size);

std::string to_hex(std::span<const uint8_t> bytes);

std::optional<Sha256Digest> sha256_from_hex(std::string_view hex);
}  // namespace ftr::aux
