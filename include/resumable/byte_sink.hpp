#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>

namespace resumable {

// Write target of a fetch. Failures are reported as TransferError(ErrorKind::Storage).
class ByteSink {
public:
    virtual ~ByteSink() = default;

    virtual void write(const char* data, std::size_t size) = 0;
    // Makes every byte written so far durable.
    virtual void flush() = 0;
    // Drops all content and rewinds to offset 0.
    virtual void discard() = 0;
    [[nodiscard]] virtual std::uint64_t size() const = 0;
};

// Partial download file, opened at a given offset; anything past the offset is cut off.
class FileSink final : public ByteSink {
public:
    FileSink(std::filesystem::path path, std::uint64_t offset);
    ~FileSink() override = default;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(const char* data, std::size_t size) override;
    void flush() override;
    void discard() override;
    [[nodiscard]] std::uint64_t size() const override { return position_; }

    void close();
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    std::filesystem::path path_;
    std::unique_ptr<FILE, FileDeleter> file_{};
    std::uint64_t position_{0};
};

} // namespace resumable
