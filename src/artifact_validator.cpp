#include "artifact_validator.hpp"
#include "gzip_codec.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

ArtifactValidator::ArtifactValidator(std::string transactionMarker) : marker(std::move(transactionMarker)) {
    if (marker.empty()) {
        throw std::invalid_argument("Transaction marker must not be empty");
    }
}

std::expected<void, BackupError> ArtifactValidator::validateExport(const std::string& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::unexpected(BackupError{BackupErrorCode::MalformedArtifact,
            fmt::format("Export file does not exist: {}", path)});
    }
    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::unexpected(BackupError{BackupErrorCode::MalformedArtifact,
            fmt::format("Failed to stat export file: {} ({})", path, ec.message())});
    }
    if (size == 0) {
        return std::unexpected(BackupError{BackupErrorCode::EmptyArtifact,
            fmt::format("Export file is empty: {}", path)});
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected(BackupError{BackupErrorCode::MalformedArtifact,
            fmt::format("Failed to open export file: {}", path)});
    }

    // Keep the last marker.size() - 1 bytes of each chunk so a split marker is still found.
    const std::size_t overlap = marker.size() - 1;
    std::string window;
    char buf[65536];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize count = in.gcount();
        if (count <= 0) {
            break;
        }
        window.append(buf, static_cast<std::size_t>(count));
        if (window.find(marker) != std::string::npos) {
            return {};
        }
        if (window.size() > overlap) {
            window.erase(0, window.size() - overlap);
        }
    }
    if (in.bad()) {
        return std::unexpected(BackupError{BackupErrorCode::MalformedArtifact,
            fmt::format("Failed to read export file: {}", path)});
    }
    return std::unexpected(BackupError{BackupErrorCode::MalformedArtifact,
        fmt::format("Export file does not contain \"{}\": {}", marker, path)});
}

std::expected<void, BackupError> ArtifactValidator::validateCompressed(const std::string& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::unexpected(BackupError{BackupErrorCode::CorruptArchive,
            fmt::format("Compressed file does not exist: {}", path)});
    }
    auto size = fs::file_size(path, ec);
    if (ec || size == 0) {
        return std::unexpected(BackupError{BackupErrorCode::CorruptArchive,
            fmt::format("Compressed file is empty: {}", path)});
    }

    struct archive* a = archive_read_new();
    archive_read_support_filter_gzip(a);
    archive_read_support_format_raw(a);
    if (archive_read_open_filename(a, path.c_str(), 10240) != ARCHIVE_OK) {
        std::string errorMsg = fmt::format("Failed to open archive for verification: {} ({})",
                                           path, archive_error_string(a) ? archive_error_string(a) : "unknown error");
        archive_read_free(a);
        return std::unexpected(BackupError{BackupErrorCode::CorruptArchive, errorMsg});
    }

    // With only the gzip filter registered, anything else is read through the pass-through filter.
    if (archive_filter_code(a, 0) != ARCHIVE_FILTER_GZIP) {
        archive_read_free(a);
        return std::unexpected(BackupError{BackupErrorCode::CorruptArchive, fmt::format("Not a gzip file: {}", path)});
    }

    struct archive_entry* entry;
    int r = archive_read_next_header(a, &entry);
    if (r != ARCHIVE_OK) {
        std::string errorMsg = fmt::format("Failed to read gzip stream: {} ({})",
                                           path, archive_error_string(a) ? archive_error_string(a) : "no data");
        archive_read_free(a);
        return std::unexpected(BackupError{BackupErrorCode::CorruptArchive, errorMsg});
    }

    archive_read_close(a);
    archive_read_free(a);

    // The stream is decoded once, by zlib, which also checks the CRC and length trailer.
    auto crc = verifyGzipFile(path);
    if (!crc) {
        return std::unexpected(crc.error());
    }
    return {};
}
