// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "auth/crypto.hpp"

#include <array>
#include <cctype>
#include <functional>
#include <memory>
#include <iostream>
#include <mutex>

#include <gflags/gflags.h>
#include <libbcrypt/bcrypt.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <nlohmann/json.hpp>

#include "auth/exceptions.hpp"
#include "utils/enum.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

namespace {
using namespace std::literals;

constexpr auto kHashAlgo = "hash_algo";
constexpr auto kPasswordHash = "password_hash";

inline constexpr std::array password_hash_mappings{
    std::pair{"bcrypt"sv, predacl::auth::PasswordHashAlgorithm::BCRYPT},
    std::pair{"sha256"sv, predacl::auth::PasswordHashAlgorithm::SHA256},
    std::pair{"sha256-multiple"sv, predacl::auth::PasswordHashAlgorithm::SHA256_MULTIPLE}};

inline constexpr uint64_t ONE_SHA_ITERATION = 1;
inline constexpr uint64_t MULTIPLE_SHA_ITERATIONS = 1024;
}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables,misc-unused-parameters)
DEFINE_VALIDATED_string(password_encryption_algorithm, "bcrypt",
                        "The password encryption algorithm used for stored user passwords.", {
                          const auto error = predacl::utils::ValidateEnumValueString(value, password_hash_mappings);
                          if (!error) return true;
                          switch (*error) {
                            case predacl::utils::ValidationError::EmptyValue: {
                              std::cout << "Password encryption algorithm cannot be empty." << std::endl;
                              break;
                            }
                            case predacl::utils::ValidationError::InvalidValue: {
                              std::cout << "Invalid value for password encryption algorithm. Allowed values: "
                                        << predacl::utils::GetAllowedEnumValuesString(password_hash_mappings)
                                        << std::endl;
                              break;
                            }
                          }
                          return false;
                        });

namespace predacl::auth {
namespace BCrypt {
std::string HashPassword(const std::string &password) {
  char salt[BCRYPT_HASHSIZE];
  char hash[BCRYPT_HASHSIZE];

  // We use `-1` as the workfactor for `bcrypt_gensalt` to let it fall back to
  // its default value of `12`.
  if (bcrypt_gensalt(-1, salt) != 0) {
    throw AuthException("Couldn't generate hashing salt!");
  }

  if (bcrypt_hashpw(password.c_str(), salt, hash) != 0) {
    throw AuthException("Couldn't hash password!");
  }

  return {hash};
}

bool VerifyPassword(const std::string &password, const std::string &hash) {
  int ret = bcrypt_checkpw(password.c_str(), hash.c_str());
  if (ret == -1) {
    throw AuthException("Couldn't check password!");
  }
  return ret == 0;
}
}  // namespace BCrypt

namespace SHA {
namespace {

constexpr auto SHA_LENGTH = 64U;
constexpr auto SALT_SIZE = 16U;
constexpr auto SALT_SIZE_DURABLE = SALT_SIZE * 2;

// Result is hex(salt) followed by hex(sha256(salt + password * iterations)).
std::string HashPassword(std::string_view password, const uint64_t number_of_iterations, std::string_view salt) {
  std::array<unsigned char, SHA256_DIGEST_LENGTH> hash{};

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw AuthException("Couldn't initialize the SHA256 digest!");
  }
  if (!salt.empty()) {
    DPA_ASSERT(salt.size() == SALT_SIZE);
    EVP_DigestUpdate(ctx.get(), salt.data(), salt.size());
  }
  for (uint64_t i = 0; i < number_of_iterations; ++i) {
    EVP_DigestUpdate(ctx.get(), password.data(), password.size());
  }
  if (EVP_DigestFinal_ex(ctx.get(), hash.data(), nullptr) != 1) {
    throw AuthException("Couldn't hash password!");
  }

  return ToHex(salt) + ToHex({reinterpret_cast<const char *>(hash.data()), hash.size()});
}

std::optional<std::array<char, SALT_SIZE>> ExtractSalt(std::string_view salt_durable) {
  static_assert(SALT_SIZE_DURABLE / 2 == SALT_SIZE);
  if (salt_durable.size() != SALT_SIZE_DURABLE) return std::nullopt;

  auto const toval = [](char a) -> std::optional<uint8_t> {
    if ('0' <= a && a <= '9') return a - '0';
    if ('a' <= a && a <= 'f') return 10 + (a - 'a');
    return std::nullopt;
  };

  auto salt = std::array<char, SALT_SIZE>{};
  for (size_t i = 0; i < SALT_SIZE; ++i) {
    auto hi = toval(salt_durable[2 * i]);
    auto lo = toval(salt_durable[2 * i + 1]);
    if (!hi || !lo) return std::nullopt;
    salt[i] = static_cast<char>(static_cast<uint8_t>(*hi << 4U) | *lo);
  }
  return salt;
}

bool VerifyPassword(std::string_view password, std::string_view hash, const uint64_t number_of_iterations) {
  if (hash.size() == SHA_LENGTH) {
    // Unsalted hash
    return SecureEquals(HashPassword(password, number_of_iterations, {}), hash);
  }
  if (hash.size() != SHA_LENGTH + SALT_SIZE_DURABLE) {
    throw AuthException("Corrupt password hash, unexpected length {}.", hash.size());
  }
  const auto salt = ExtractSalt(hash.substr(0, SALT_SIZE_DURABLE));
  if (!salt) throw AuthException("Corrupt password hash, can't extract salt.");
  return SecureEquals(HashPassword(password, number_of_iterations, {salt->data(), salt->size()}), hash);
}

}  // namespace
}  // namespace SHA

HashedPassword HashPassword(const std::string &password, std::optional<PasswordHashAlgorithm> override_algo) {
  auto const hash_algo = override_algo.value_or(CurrentHashAlgorithm());
  auto password_hash = std::invoke([&] {
    switch (hash_algo) {
      case PasswordHashAlgorithm::BCRYPT: {
        return BCrypt::HashPassword(password);
      }
      case PasswordHashAlgorithm::SHA256:
      case PasswordHashAlgorithm::SHA256_MULTIPLE: {
        const auto salt = RandomBytes(SHA::SALT_SIZE);
        auto iterations = (hash_algo == PasswordHashAlgorithm::SHA256) ? ONE_SHA_ITERATION : MULTIPLE_SHA_ITERATIONS;
        return SHA::HashPassword(password, iterations, salt);
      }
    }
    throw AuthException("Unknown password hash algorithm!");
  });
  return HashedPassword{hash_algo, std::move(password_hash)};
}

namespace {

auto InternalParseHashAlgorithm(std::string_view algo) -> PasswordHashAlgorithm {
  auto maybe_parsed = utils::StringToEnum<PasswordHashAlgorithm>(algo, password_hash_mappings);
  if (!maybe_parsed) {
    throw AuthException("Invalid password encryption '{}'!", algo);
  }
  return *maybe_parsed;
}

PasswordHashAlgorithm &InternalCurrentHashAlgorithm() {
  static auto current = PasswordHashAlgorithm::BCRYPT;
  static std::once_flag flag;
  std::call_once(flag, [] { current = InternalParseHashAlgorithm(FLAGS_password_encryption_algorithm); });
  return current;
}
}  // namespace

auto CurrentHashAlgorithm() -> PasswordHashAlgorithm { return InternalCurrentHashAlgorithm(); }

void SetHashAlgorithm(std::string_view algo) {
  auto &current = InternalCurrentHashAlgorithm();
  current = InternalParseHashAlgorithm(algo);
}

auto AsString(PasswordHashAlgorithm hash_algo) -> std::string_view {
  return *utils::EnumToString<PasswordHashAlgorithm>(hash_algo, password_hash_mappings);
}

bool HashedPassword::VerifyPassword(const std::string &password) const {
  switch (hash_algo) {
    case PasswordHashAlgorithm::BCRYPT:
      return BCrypt::VerifyPassword(password, password_hash);
    case PasswordHashAlgorithm::SHA256:
      return SHA::VerifyPassword(password, password_hash, ONE_SHA_ITERATION);
    case PasswordHashAlgorithm::SHA256_MULTIPLE:
      return SHA::VerifyPassword(password, password_hash, MULTIPLE_SHA_ITERATIONS);
  }
  return false;
}

void to_json(nlohmann::json &j, const HashedPassword &p) {
  j = nlohmann::json{{kHashAlgo, p.hash_algo}, {kPasswordHash, p.password_hash}};
}

void from_json(const nlohmann::json &j, HashedPassword &p) {
  // NOLINTNEXTLINE(cppcoreguidelines-init-variables)
  PasswordHashAlgorithm hash_algo;
  j.at(kHashAlgo).get_to(hash_algo);
  auto password_hash = j.value(kPasswordHash, std::string());
  p = HashedPassword{hash_algo, std::move(password_hash)};
}

std::string HmacSha256(std::string_view key, std::string_view message) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_size = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
           reinterpret_cast<const unsigned char *>(message.data()), message.size(), digest.data(),
           &digest_size) == nullptr) {
    throw AuthException("Couldn't compute HMAC-SHA256!");
  }
  return {reinterpret_cast<const char *>(digest.data()), digest_size};
}

bool SecureEquals(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) return false;
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

std::string RandomBytes(size_t size) {
  std::string result(size, '\0');
  if (size == 0) return result;
  if (RAND_bytes(reinterpret_cast<unsigned char *>(result.data()), static_cast<int>(size)) != 1) {
    throw AuthException("Couldn't generate random bytes!");
  }
  return result;
}

std::string Base64UrlEncode(std::string_view data) {
  // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a terminating NUL.
  std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
  const auto written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(encoded.data()),
                                       reinterpret_cast<const unsigned char *>(data.data()), static_cast<int>(data.size()));
  encoded.resize(written);
  while (!encoded.empty() && encoded.back() == '=') encoded.pop_back();
  for (auto &c : encoded) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  return encoded;
}

std::optional<std::string> Base64UrlDecode(std::string_view data) {
  if (data.size() % 4 == 1) return std::nullopt;
  std::string standard;
  standard.reserve(data.size() + 3);
  for (auto c : data) {
    if (c == '-') {
      standard.push_back('+');
    } else if (c == '_') {
      standard.push_back('/');
    } else if (std::isalnum(static_cast<unsigned char>(c))) {
      standard.push_back(c);
    } else {
      return std::nullopt;
    }
  }
  size_t padding = 0;
  while (standard.size() % 4 != 0) {
    standard.push_back('=');
    ++padding;
  }
  std::string decoded(standard.size() / 4 * 3, '\0');
  const auto written =
      EVP_DecodeBlock(reinterpret_cast<unsigned char *>(decoded.data()),
                      reinterpret_cast<const unsigned char *>(standard.data()), static_cast<int>(standard.size()));
  if (written < 0) return std::nullopt;
  // EVP_DecodeBlock doesn't strip the bytes that correspond to padding.
  decoded.resize(static_cast<size_t>(written) - padding);
  return decoded;
}

std::string ToHex(std::string_view data) {
  static constexpr auto kDigits = "0123456789abcdef"sv;
  std::string result;
  result.reserve(data.size() * 2);
  for (auto c : data) {
    const auto byte = static_cast<uint8_t>(c);
    result.push_back(kDigits[byte >> 4U]);
    result.push_back(kDigits[byte & 0xFU]);
  }
  return result;
}

}  // namespace predacl::auth
