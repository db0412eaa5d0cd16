#pragma once
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

class Item {
public:
    Item() = default;
    Item(std::uint64_t id, const std::string& question, const std::string& answer,
         const std::string& deck, std::time_t created_at);

    // Basic fields
    std::uint64_t id = 0;    // Assigned by Scheduler, unique per collection
    std::string question;
    std::string answer;
    std::string deck = "default";

    // Scheduler state
    std::size_t step = 0;                       // Index into IntervalTable
    std::time_t due_at = 0;                     // Seconds since epoch
    std::optional<std::time_t> last_reviewed_at; // Absent until first review

    // Review statistics (display only)
    int recalled = 0;
    int forgot = 0;
    std::string history;     // 'o' recalled, 'x' forgot, oldest first

    bool isDue(std::time_t now) const { return due_at <= now; }

    // Last n history marks, newest first, padded with '-' to n
    std::string recentHistory(std::size_t n) const;

    static constexpr char kRecalledMark = 'o';
    static constexpr char kForgotMark = 'x';
};
