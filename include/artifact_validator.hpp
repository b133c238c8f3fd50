/**
 * @file artifact_validator.hpp
 * @brief Structural and integrity checks for backup artifacts.
 *
 * The same checks run at several points of an artifact's life: on the raw export before
 * compression, on the committed slot file after the move into retention, and again at
 * restore time before anything is imported.
 *
 * @note Requires libarchive for gzip stream verification.
 */

#ifndef ARTIFACT_VALIDATOR_HPP
#define ARTIFACT_VALIDATOR_HPP

#include <expected>
#include <string>
#include "backup_types.hpp"

/**
 * @brief Validates raw exports and compressed artifacts.
 */
class ArtifactValidator {
public:
    /**
     * @brief Constructs a validator.
     *
     * @param transactionMarker Token a well-formed export must contain (e.g., "BEGIN TRANSACTION").
     */
    explicit ArtifactValidator(std::string transactionMarker);

    virtual ~ArtifactValidator() = default;

    /**
     * @brief Checks a raw text export.
     *
     * The file is scanned in fixed-size chunks, so the marker is found even when it
     * straddles a chunk boundary and large exports are never loaded whole.
     *
     * @param path Export file.
     * @return std::expected<void, BackupError> Success, EmptyArtifact for a zero-byte file, or
     *         MalformedArtifact if the file is missing, unreadable, or lacks the marker.
     */
    virtual std::expected<void, BackupError> validateExport(const std::string& path) const;

    /**
     * @brief Checks a gzip artifact.
     *
     * libarchive identifies the gzip header; zlib then decodes the whole stream once.
     *
     * @param path Compressed file.
     * @return std::expected<void, BackupError> Success, or CorruptArchive if the file is missing, empty,
     *         not gzip, truncated, or fails its CRC check.
     */
    virtual std::expected<void, BackupError> validateCompressed(const std::string& path) const;

    const std::string& transactionMarker() const { return marker; }

private:
    std::string marker; ///< Token searched for by validateExport().
};

#endif // ARTIFACT_VALIDATOR_HPP
