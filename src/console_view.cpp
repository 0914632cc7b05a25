#include "resumable/console_view.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <iterator>

#include <fmt/format.h>

namespace resumable {

ConsoleView::ConsoleView(const std::vector<TransferRequest>& requests) {
    rows_.reserve(requests.size());
    for (const auto& request : requests) {
        Row row;
        row.name = request.destination.filename().string();
        if (row.name.size() > 20) {
            row.name = row.name.substr(0, 20);
        }
        if (row.name.empty()) {
            row.name = "(unnamed)";
        }
        rows_.push_back(std::move(row));
    }
}

void ConsoleView::update(const ProgressUpdate& update) {
    if (update.event.transfer_id < rows_.size()) {
        auto& row = rows_[update.event.transfer_id];
        row.last = update.event;
        row.seen = true;
    }
    aggregate_ = update.aggregate;

    const auto now = Clock::now();
    if (isTerminal(update.event.status) || now - last_draw_ >= std::chrono::milliseconds(200)) {
        draw();
        last_draw_ = now;
    }
}

void ConsoleView::finish(const RunSummary& summary) {
    draw();
    std::cout << fmt::format("{} completed, {} failed, {} paused\n", summary.completed, summary.failed,
                             summary.paused);
    for (const auto& failure : summary.failures) {
        std::cerr << fmt::format("Download failed: {}  ({})\n", failure.url, failure.cause.describe());
    }
    std::cout << std::flush;
}

std::string ConsoleView::buildProgressPanel() const {
    std::string panel;
    panel.reserve(rows_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("resumable ({} transfers, {} active, {} queued)\n", rows_.size(), aggregate_.active_count,
                         aggregate_.pending_count);
    panel.append("--------------------------------------------------\n");

    for (const auto& row : rows_) {
        panel += formatTaskLine(row);
        panel.push_back('\n');
    }

    panel.append("--------------------------------------------------\n");
    if (aggregate_.total_bytes_known > 0) {
        const double ratio = std::min(1.0, static_cast<double>(aggregate_.total_bytes_completed) /
                                               static_cast<double>(aggregate_.total_bytes_known));
        panel += fmt::format("Overall: {}{:>3}% ({}/{})", aggregate_.total_is_lower_bound ? "~" : "",
                             static_cast<int>(ratio * 100.0), humanSize(aggregate_.total_bytes_completed),
                             humanSize(aggregate_.total_bytes_known));
    } else {
        panel += fmt::format("Overall: {}", humanSize(aggregate_.total_bytes_completed));
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string ConsoleView::formatTaskLine(const Row& row) {
    if (!row.seen) {
        return fmt::format("{:<20} [Queued]", row.name);
    }

    const auto& event = row.last;
    std::string line;
    line.reserve(256);

    if (event.total_size && *event.total_size > 0) {
        const double ratio = static_cast<double>(event.bytes_completed) / static_cast<double>(*event.total_size);
        const int percent = static_cast<int>(ratio * 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? u8"█" : u8"░";
        }

        line += fmt::format("{:<20} [{}] {:>3}% ({}/{})", row.name, bar, percent,
                            humanSize(event.bytes_completed), humanSize(*event.total_size));
    } else if (event.bytes_completed > 0) {
        line += fmt::format("{:<20} {}", row.name, humanSize(event.bytes_completed));
    } else {
        line += fmt::format("{:<20} [Connecting...]", row.name);
    }

    switch (event.status) {
    case TransferStatus::Completed:
        line.append("  ✅ Done");
        break;
    case TransferStatus::Failed:
        line += fmt::format("  ❌ {}", event.cause ? event.cause->describe() : std::string{"failed"});
        break;
    case TransferStatus::Paused:
        line.append("  ⏸ Paused");
        break;
    default:
        break;
    }
    return line;
}

std::string ConsoleView::humanSize(std::uint64_t bytes) {
    static constexpr const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, units[unit]);
}

// Moves back over the previous frame and rewrites it line by line.
void ConsoleView::draw() {
    const auto panel = buildProgressPanel();
    std::string frame;
    if (drawn_lines_ > 0) {
        frame += fmt::format("\033[{}A", drawn_lines_);
    }
    std::size_t lines = 0;
    std::size_t begin = 0;
    while (begin < panel.size()) {
        const auto end = panel.find('\n', begin);
        const auto stop = end == std::string::npos ? panel.size() : end;
        frame += "\r\033[2K";
        frame.append(panel, begin, stop - begin);
        frame.push_back('\n');
        ++lines;
        begin = stop + 1;
    }
    // Rows never disappear, so a frame is never shorter than the one before.
    std::cout << frame << std::flush;
    drawn_lines_ = lines;
}

} // namespace resumable
