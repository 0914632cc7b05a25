#pragma once

#include "transfer_state.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace resumable {

// One JSON record per transfer key under a state directory. Records are replaced
// atomically (temp file, fsync, rename), so a crash leaves either the old or the new one.
class StateStore {
public:
    static constexpr int kFormatVersion = 1;

    explicit StateStore(std::filesystem::path directory);

    [[nodiscard]] std::optional<TransferState> load(const std::string& key) const;
    void save(const std::string& key, const TransferState& state);
    void remove(const std::string& key);

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }
    [[nodiscard]] std::filesystem::path recordPath(const std::string& key) const;

private:
    std::shared_ptr<std::mutex> mutexFor(const std::string& key) const;

    std::filesystem::path directory_;
    mutable std::mutex registry_mutex_;
    mutable std::unordered_map<std::string, std::shared_ptr<std::mutex>> key_mutexes_;
};

using StateStorePtr = std::shared_ptr<StateStore>;

} // namespace resumable
