#pragma once

#include "progress.hpp"
#include "transfer_request.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace resumable {

// Redraws a progress panel in place on stdout from the scheduler's feed.
class ConsoleView {
public:
    explicit ConsoleView(const std::vector<TransferRequest>& requests);

    void update(const ProgressUpdate& update);
    void finish(const RunSummary& summary);

    static std::string humanSize(std::uint64_t bytes);

private:
    struct Row {
        std::string name;
        ProgressEvent last;
        bool seen{false};
    };

    std::string buildProgressPanel() const;
    static std::string formatTaskLine(const Row& row);
    void draw();

    std::vector<Row> rows_;
    AggregateProgress aggregate_{};
    std::size_t drawn_lines_{0};
    Clock::time_point last_draw_{};
};

} // namespace resumable
