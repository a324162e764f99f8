#pragma once

#include <openssl/evp.h>

#include <atomic>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "file_entry.hh"

namespace rmdup {

inline namespace detail_v1 {

// raw digest bytes, 16 for md5
using digest_t = std::vector<unsigned char>;

/**
 * @brief lower case hex form of a digest
 */
std::string to_hex(const digest_t &digest);

/**
 * @brief digest a whole file, streamed in chunk_sz blocks
 *
 * @param path file to hash
 * @param md digest algorithm, e.g. EVP_md5()
 * @return std::optional<digest_t> nullopt on open or read error
 * @throws std::runtime_error if the EVP context fails
 */
std::optional<digest_t> digest_file(const std::filesystem::path &path,
                                    const EVP_MD *md);

/**
 * @brief confirm duplicates by full content digest.
 * digest equality is taken as content equality.
 *
 * @param file_list candidate files, same size and prefix
 * @param md digest algorithm
 * @param stop polled between files, may be null
 * @return vector[dupe_set_t] sets ordered by digest, files in input order
 * @throws cancelled_error if stop is set
 */
std::vector<dupe_set_t> verify_content(std::span<const file_entry_t> file_list,
                                       const EVP_MD *md,
                                       const std::atomic<bool> *stop = nullptr);

}  // namespace detail_v1

}  // namespace rmdup
