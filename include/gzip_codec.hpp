/**
 * @file gzip_codec.hpp
 * @brief Gzip compression and decompression of backup artifacts.
 *
 * @note Requires zlib.
 */

#ifndef GZIP_CODEC_HPP
#define GZIP_CODEC_HPP

#include <cstdint>
#include <expected>
#include <string>
#include "backup_types.hpp"

/**
 * @brief Compresses a file into gzip format.
 *
 * The destination is removed if any read, write or close fails.
 *
 * @param sourcePath Uncompressed input.
 * @param destPath Gzip output; overwritten if present.
 * @param level zlib compression level (1-9).
 * @return std::expected<std::uint64_t, BackupError> Size of the compressed file, or CompressionFailed.
 */
std::expected<std::uint64_t, BackupError> compressFile(const std::string& sourcePath, const std::string& destPath,
                                                       int level = 9);

/**
 * @brief Decompresses a gzip file.
 *
 * The destination is removed if the stream is truncated, fails its CRC check, or cannot be written.
 *
 * @param sourcePath Gzip input.
 * @param destPath Uncompressed output; overwritten if present.
 * @return std::expected<std::uint64_t, BackupError> Size of the decompressed file, or CorruptArchive.
 */
std::expected<std::uint64_t, BackupError> decompressFile(const std::string& sourcePath, const std::string& destPath);

/**
 * @brief Decodes a gzip file without writing the output, checking its CRC and length trailer.
 *
 * @param path Gzip input.
 * @return std::expected<std::uint64_t, BackupError> Decompressed size, or CorruptArchive.
 */
std::expected<std::uint64_t, BackupError> verifyGzipFile(const std::string& path);

#endif // GZIP_CODEC_HPP
