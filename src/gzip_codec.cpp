#include "gzip_codec.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <functional>
#include <zlib.h>

namespace fs = std::filesystem;

namespace {

std::string gzErrorText(gzFile file) {
    int errnum = Z_OK;
    const char* text = gzerror(file, &errnum);
    if (errnum == Z_ERRNO) {
        return std::strerror(errno);
    }
    return text ? text : "unknown zlib error";
}

// Decodes the whole gzip stream into sink; zlib verifies the trailer CRC and length.
std::expected<std::uint64_t, BackupError> readGzip(const std::string& sourcePath,
                                                   const std::function<bool(const char*, std::size_t)>& sink) {
    std::error_code sizeEc;
    auto compressedSize = fs::file_size(sourcePath, sizeEc);
    if (sizeEc || compressedSize == 0) {
        return std::unexpected(BackupError{BackupErrorCode::CorruptArchive,
            fmt::format("Gzip file is missing or empty: {}", sourcePath)});
    }

    gzFile inFile = gzopen(sourcePath.c_str(), "rb");
    if (!inFile) {
        return std::unexpected(BackupError{BackupErrorCode::CorruptArchive,
            fmt::format("Failed to open gzip file: {}", sourcePath)});
    }
    // zlib passes non-gzip input through unchanged; refuse it instead.
    if (gzdirect(inFile)) {
        gzclose(inFile);
        return std::unexpected(BackupError{BackupErrorCode::CorruptArchive,
            fmt::format("Not a gzip file: {}", sourcePath)});
    }

    std::uint64_t total = 0;
    char buf[65536];
    for (;;) {
        int count = gzread(inFile, buf, sizeof(buf));
        if (count < 0) {
            std::string reason = gzErrorText(inFile);
            gzclose(inFile);
            return std::unexpected(BackupError{BackupErrorCode::CorruptArchive,
                fmt::format("Failed to decompress {}: {}", sourcePath, reason)});
        }
        if (count == 0) {
            break;
        }
        if (!sink(buf, static_cast<std::size_t>(count))) {
            gzclose(inFile);
            return std::unexpected(BackupError{BackupErrorCode::CorruptArchive, "Failed to write decompressed data"});
        }
        total += static_cast<std::uint64_t>(count);
    }

    // gzread returns 0 on a truncated stream as well; the error state tells them apart.
    int errnum = Z_OK;
    gzerror(inFile, &errnum);
    int closeResult = gzclose(inFile);
    if (errnum != Z_OK || closeResult != Z_OK) {
        return std::unexpected(BackupError{BackupErrorCode::CorruptArchive,
            fmt::format("Gzip stream is truncated or corrupt: {}", sourcePath)});
    }
    return total;
}

} // namespace

std::expected<std::uint64_t, BackupError> compressFile(const std::string& sourcePath, const std::string& destPath,
                                                       int level) {
    auto fail = [&destPath](const std::string& message) -> std::expected<std::uint64_t, BackupError> {
        std::error_code ec;
        fs::remove(destPath, ec);
        return std::unexpected(BackupError{BackupErrorCode::CompressionFailed, message});
    };

    std::ifstream inFile(sourcePath, std::ios::binary);
    if (!inFile.is_open()) {
        return std::unexpected(BackupError{BackupErrorCode::CompressionFailed,
            fmt::format("Failed to open input: {}", sourcePath)});
    }

    std::string mode = fmt::format("wb{}", level);
    gzFile outFile = gzopen(destPath.c_str(), mode.c_str());
    if (!outFile) {
        return fail(fmt::format("Failed to open gzip file for writing: {}", destPath));
    }

    char buf[65536];
    while (inFile) {
        inFile.read(buf, sizeof(buf));
        std::streamsize count = inFile.gcount();
        if (count > 0 && gzwrite(outFile, buf, static_cast<unsigned>(count)) != static_cast<int>(count)) {
            std::string reason = gzErrorText(outFile);
            gzclose(outFile);
            return fail(fmt::format("Failed to write gzip data: {}", reason));
        }
    }
    if (inFile.bad()) {
        gzclose(outFile);
        return fail(fmt::format("Failed to read input: {}", sourcePath));
    }
    if (gzclose(outFile) != Z_OK) {
        return fail(fmt::format("Failed to finalize gzip file: {}", destPath));
    }

    std::error_code ec;
    auto size = fs::file_size(destPath, ec);
    if (ec) {
        return fail(fmt::format("Failed to stat compressed file: {}", ec.message()));
    }
    return size;
}

std::expected<std::uint64_t, BackupError> decompressFile(const std::string& sourcePath, const std::string& destPath) {
    std::ofstream outFile(destPath, std::ios::binary | std::ios::trunc);
    if (!outFile.is_open()) {
        return std::unexpected(BackupError{BackupErrorCode::CorruptArchive,
            fmt::format("Failed to open output: {}", destPath)});
    }

    auto result = readGzip(sourcePath, [&outFile](const char* data, std::size_t size) {
        outFile.write(data, static_cast<std::streamsize>(size));
        return static_cast<bool>(outFile);
    });
    outFile.close();
    if (result && !outFile) {
        result = std::unexpected(BackupError{BackupErrorCode::CorruptArchive,
            fmt::format("Failed to flush output: {}", destPath)});
    }
    if (!result) {
        std::error_code ec;
        fs::remove(destPath, ec);
    }
    return result;
}

std::expected<std::uint64_t, BackupError> verifyGzipFile(const std::string& path) {
    return readGzip(path, [](const char*, std::size_t) { return true; });
}
