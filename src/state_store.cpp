#include "resumable/state_store.hpp"

#include "resumable/errors.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace resumable {

void to_json(nlohmann::json& j, const TransferState& state) {
    j = nlohmann::json{
        {"format", StateStore::kFormatVersion},
        {"bytes_completed", state.bytes_completed},
        {"status", std::string{toString(state.status)}},
    };
    j["total_size"] = state.total_size ? nlohmann::json(*state.total_size) : nlohmann::json(nullptr);
    j["validator"] = state.validator ? nlohmann::json(*state.validator) : nlohmann::json(nullptr);
    if (state.file_name) {
        j["file_name"] = *state.file_name;
    }
}

void from_json(const nlohmann::json& j, TransferState& state) {
    state.bytes_completed = j.at("bytes_completed").get<std::uint64_t>();

    const auto& total = j.at("total_size");
    state.total_size = total.is_null() ? std::nullopt : std::optional<std::uint64_t>{total.get<std::uint64_t>()};

    const auto& validator = j.at("validator");
    state.validator = validator.is_null() ? std::nullopt : std::optional<std::string>{validator.get<std::string>()};

    if (const auto it = j.find("file_name"); it != j.end() && !it->is_null()) {
        state.file_name = it->get<std::string>();
    }

    const auto status = parseStatus(j.at("status").get<std::string>());
    if (!status) {
        throw std::invalid_argument("unknown transfer status");
    }
    state.status = *status;
}

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

[[noreturn]] void throwStorage(const std::string& what, const std::filesystem::path& path) {
    throw TransferError(ErrorKind::Storage,
                        fmt::format("{} '{}': {}", what, path.string(), std::strerror(errno)));
}

void syncDirectory(const std::filesystem::path& directory) {
    const int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd == -1) {
        throwStorage("Cannot open state directory", directory);
    }
    const int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) {
        throwStorage("Failed to sync state directory", directory);
    }
}

} // namespace

StateStore::StateStore(std::filesystem::path directory) : directory_(std::move(directory)) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw TransferError(ErrorKind::Storage, fmt::format("Failed to create state directory: {} - {}",
                                                            directory_.string(), ec.message()));
    }
}

std::filesystem::path StateStore::recordPath(const std::string& key) const {
    return directory_ / (key + ".json");
}

std::shared_ptr<std::mutex> StateStore::mutexFor(const std::string& key) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& slot = key_mutexes_[key];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

std::optional<TransferState> StateStore::load(const std::string& key) const {
    const auto key_mutex = mutexFor(key);
    std::lock_guard<std::mutex> lock(*key_mutex);

    const auto path = recordPath(key);
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }

    try {
        const auto j = nlohmann::json::parse(in);
        const int format = j.value("format", 0);
        if (format != kFormatVersion) {
            spdlog::warn("Ignoring state record {} with unsupported format {}", path.string(), format);
            return std::nullopt;
        }
        auto state = j.get<TransferState>();
        if (state.total_size && state.bytes_completed > *state.total_size) {
            spdlog::warn("Ignoring state record {}: {} bytes completed of {}", path.string(),
                         state.bytes_completed, *state.total_size);
            return std::nullopt;
        }
        return state;
    } catch (const nlohmann::json::exception& ex) {
        spdlog::warn("Ignoring unreadable state record {}: {}", path.string(), ex.what());
        return std::nullopt;
    } catch (const std::invalid_argument& ex) {
        spdlog::warn("Ignoring state record {}: {}", path.string(), ex.what());
        return std::nullopt;
    }
}

void StateStore::save(const std::string& key, const TransferState& state) {
    const auto key_mutex = mutexFor(key);
    std::lock_guard<std::mutex> lock(*key_mutex);

    const auto path = recordPath(key);
    auto temp_path = path;
    temp_path += ".tmp";

    // Validators come straight from response headers and may not be valid UTF-8.
    const std::string payload = nlohmann::json(state).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    {
        std::unique_ptr<FILE, FileDeleter> file{std::fopen(temp_path.c_str(), "wb")};
        if (!file) {
            throwStorage("Cannot create state record", temp_path);
        }
        if (std::fwrite(payload.data(), 1, payload.size(), file.get()) != payload.size() ||
            std::fflush(file.get()) != 0 || ::fsync(fileno(file.get())) != 0) {
            throwStorage("Failed to write state record", temp_path);
        }
        FILE* fp = file.release();
        if (std::fclose(fp) != 0) {
            throwStorage("Failed to close state record", temp_path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        throw TransferError(ErrorKind::Storage,
                            fmt::format("Failed to replace state record {}: {}", path.string(), ec.message()));
    }
    syncDirectory(directory_);
}

void StateStore::remove(const std::string& key) {
    const auto key_mutex = mutexFor(key);
    std::lock_guard<std::mutex> lock(*key_mutex);

    std::error_code ec;
    std::filesystem::remove(recordPath(key), ec);
    if (ec) {
        throw TransferError(ErrorKind::Storage,
                            fmt::format("Failed to remove state record {}: {}", recordPath(key).string(), ec.message()));
    }
}

} // namespace resumable
