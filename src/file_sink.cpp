#include "resumable/byte_sink.hpp"

#include "resumable/errors.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <unistd.h>

namespace resumable {

namespace {

[[noreturn]] void throwStorage(const std::string& what, const std::filesystem::path& path) {
    throw TransferError(ErrorKind::Storage,
                        fmt::format("{} '{}': {}", what, path.string(), std::strerror(errno)));
}

} // namespace

FileSink::FileSink(std::filesystem::path path, std::uint64_t offset) : path_(std::move(path)) {
    std::error_code ec;
    const bool exists = std::filesystem::exists(path_, ec);
    file_.reset(std::fopen(path_.c_str(), exists ? "r+b" : "w+b"));
    if (!file_) {
        throwStorage("Cannot open partial file", path_);
    }

    const auto current = exists ? std::filesystem::file_size(path_, ec) : 0;
    if (ec) {
        throw TransferError(ErrorKind::Storage,
                            fmt::format("Cannot stat partial file '{}': {}", path_.string(), ec.message()));
    }
    if (current < offset) {
        throw TransferError(ErrorKind::Storage,
                            fmt::format("Partial file '{}' holds {} bytes, cannot resume at {}",
                                        path_.string(), current, offset));
    }
    if (current > offset && ftruncate(fileno(file_.get()), static_cast<off_t>(offset)) == -1) {
        throwStorage("Cannot truncate partial file", path_);
    }
    if (fseeko(file_.get(), static_cast<off_t>(offset), SEEK_SET) != 0) {
        throwStorage("Failed to seek partial file", path_);
    }
    position_ = offset;
}

void FileSink::write(const char* data, std::size_t size) {
    if (!file_) {
        throw TransferError(ErrorKind::Storage, fmt::format("Partial file '{}' is closed", path_.string()));
    }
    const size_t written = std::fwrite(data, 1, size, file_.get());
    position_ += written;
    if (written != size) {
        throwStorage("Failed to write partial file", path_);
    }
}

void FileSink::flush() {
    if (!file_) {
        return;
    }
    if (std::fflush(file_.get()) != 0) {
        throwStorage("Failed to flush partial file", path_);
    }
    if (fsync(fileno(file_.get())) != 0) {
        throwStorage("Failed to sync partial file", path_);
    }
}

void FileSink::discard() {
    if (!file_) {
        return;
    }
    if (std::fflush(file_.get()) != 0 || ftruncate(fileno(file_.get()), 0) == -1) {
        throwStorage("Cannot truncate partial file", path_);
    }
    if (fseeko(file_.get(), 0, SEEK_SET) != 0) {
        throwStorage("Failed to seek partial file", path_);
    }
    position_ = 0;
}

void FileSink::close() {
    if (!file_) {
        return;
    }
    flush();
    FILE* fp = file_.release();
    if (std::fclose(fp) != 0) {
        throwStorage("Failed to close partial file", path_);
    }
}

} // namespace resumable
