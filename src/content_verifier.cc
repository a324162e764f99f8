#include "rmdup/content_verifier.hh"

#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>

#include "rmdup/cancel.hh"
#include "rmdup/config.hh"
#include "rmdup/oss.hh"

namespace rmdup {

inline namespace detail_v1 {

namespace {

// RAII wrapper for libcrypto digest context.
class hasher_t {
  EVP_MD_CTX *_ctx;
  const EVP_MD *_md;

 public:
  explicit hasher_t(const EVP_MD *md) : _ctx(EVP_MD_CTX_new()), _md(md) {
    if (_ctx == nullptr) {
      throw std::runtime_error("EVP_MD_CTX_new failed");
    }
  }
  ~hasher_t() noexcept { EVP_MD_CTX_free(_ctx); }

  hasher_t(const hasher_t &rhs) = delete;
  hasher_t(hasher_t &&rhs) = delete;
  hasher_t &operator=(const hasher_t &rhs) = delete;
  hasher_t &operator=(hasher_t &&rhs) = delete;

  void reset() {
    if (EVP_DigestInit_ex(_ctx, _md, nullptr) != 1) {
      throw std::runtime_error("EVP_DigestInit_ex failed");
    }
  }
  void update(const char *data, const std::size_t size) {
    if (EVP_DigestUpdate(_ctx, data, size) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }
  digest_t digest() {
    unsigned char buf[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(_ctx, buf, &len) != 1) {
      throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return digest_t(buf, buf + len);
  }
};

}  // namespace

std::string to_hex(const digest_t &digest) {
  static constexpr char hex_digits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(digest.size() * 2);
  for (auto byte : digest) {
    hex += hex_digits[byte >> 4];
    hex += hex_digits[byte & 0x0f];
  }
  return hex;
}

std::optional<digest_t> digest_file(const std::filesystem::path &path,
                                    const EVP_MD *md) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    oss(std::cerr) << "[warn] skip file: " << path << " - open failed\n";
    return std::nullopt;
  }
  hasher_t hasher(md);
  hasher.reset();

  std::vector<char> buf(chunk_sz);
  while (ifs.read(buf.data(), (std::streamsize)buf.size()) ||
         ifs.gcount() > 0) {
    hasher.update(buf.data(), (std::size_t)ifs.gcount());
  }
  if (ifs.bad()) {
    oss(std::cerr) << "[warn] skip file: " << path << " - read failed\n";
    return std::nullopt;
  }
  return hasher.digest();
}

std::vector<dupe_set_t> verify_content(std::span<const file_entry_t> file_list,
                                       const EVP_MD *md,
                                       const std::atomic<bool> *stop) {
  std::map<digest_t, file_group_t> digest_map;
  for (const auto &file : file_list) {
    throw_if_stopped(stop);
    auto digest = digest_file(file.path(), md);
    if (!digest) {
      continue;
    }
    digest_map[std::move(*digest)].push_back(file);
  }

  std::vector<dupe_set_t> dupe_list;
  for (auto &[digest, group] : digest_map) {
    if (group.size() > 1) {
      dupe_list.emplace_back(std::move(group));
    }
  }
  return dupe_list;
}

}  // namespace detail_v1

}  // namespace rmdup
