#include <csignal>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <sodium.h>

#include "../utils/logging.hpp"
#include "../core/IntervalTable.hpp"
#include "../core/Scheduler.hpp"
#include "../importer/CsvImporter.hpp"
#include "../storage/Storage.hpp"
#include "Options.hpp"
#include "ReviewSession.hpp"

namespace {

const int kExitOk = 0;
const int kExitRuntime = 1;
const int kExitUsage = 2;

void showIntervals(const IntervalTable& table) {
    std::cout << "[";
    const auto& d = table.durations();
    for (std::size_t i = 0; i < d.size(); ++i) {
        if (i) std::cout << ", ";
        std::cout << d[i];
    }
    std::cout << "]\n";
}

std::string formatTime(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%a %b %e %H:%M:%S %Y");
    return oss.str();
}

int addFiles(const Options& opts, const IntervalTable& table) {
    CsvImporter importer(opts.delimiter);

    // Parse everything first so a bad file adds nothing
    std::vector<Scheduler::QAPair> pairs;
    for (const auto& file : opts.files) {
        std::vector<CsvImporter::QAPair> parsed;
        std::string error;
        if (!importer.parseFile(file, parsed, error)) {
            std::cerr << "Import failed: " << error << "\nNothing was added.\n";
            return kExitRuntime;
        }
        pairs.insert(pairs.end(), parsed.begin(), parsed.end());
    }

    std::vector<Item> items;
    if (!Storage::loadItems(items, opts.db_path)) {
        std::cerr << "Cannot load '" << opts.db_path << "'. See the log for details.\n";
        return kExitRuntime;
    }

    Scheduler scheduler(table, std::move(items));
    auto created = scheduler.addItems(pairs, std::time(nullptr), opts.deck);

    if (!Storage::saveItems(scheduler.items(), opts.db_path)) {
        std::cerr << "Error saving items to '" << opts.db_path << "'.\n";
        return kExitRuntime;
    }

    std::cout << "Added " << created.size() << " item(s) to deck '" << opts.deck << "'.\n";
    return kExitOk;
}

int review(const Options& opts, const IntervalTable& table) {
    std::vector<Item> items;
    if (!Storage::loadItems(items, opts.db_path)) {
        std::cerr << "Cannot load '" << opts.db_path << "'. See the log for details.\n";
        return kExitRuntime;
    }

    Scheduler scheduler(table, std::move(items));
    if (!scheduler.nextDueAt(opts.decks)) {
        std::cout << "No cards scheduled for review.  Use the `add` sub-command to add some.\n";
        return kExitOk;
    }

    ReviewSession session(scheduler, std::cin, std::cout);
    session.setDecks(opts.decks);
    session.setTtsCommand(opts.tts_command);
    session.setCheckpoint([&scheduler, &opts] {
        return Storage::saveItems(scheduler.items(), opts.db_path);
    });

    ReviewSession::Summary summary = session.run();
    if (summary.aborted) {
        std::cerr << "Error saving items to '" << opts.db_path << "'; session aborted.\n";
        return kExitRuntime;
    }

    if (summary.reviewed > 0) {
        std::cout << "Reviewed " << summary.reviewed << " item(s): "
            << summary.recalled << " recalled, " << summary.forgot << " forgot.\n";
    }

    if (auto next = scheduler.nextDueAt(opts.decks)) {
        std::cout << "Next review scheduled for " << formatTime(*next) << ".\n";
    }
    return kExitOk;
}

}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    Options opts;
    std::string error;
    if (!parseOptions(args, opts, error)) {
        std::cerr << "drillbox: " << error << "\n\n" << usage();
        return kExitUsage;
    }
    if (opts.command == Command::HELP) {
        std::cout << usage();
        return kExitOk;
    }

    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return kExitRuntime;
    }

    if (!Log::init(opts.log_file, opts.verbose)) {
        spdlog::warn("Log file '{}' unavailable; logging to console", opts.log_file);
    }
    spdlog::info("drillbox started: db='{}'", opts.db_path);

    // A TTS command that exits early must not kill us on write
    std::signal(SIGPIPE, SIG_IGN);

    std::optional<IntervalTable> table;
    try {
        table.emplace(buildIntervalTable(opts));
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "drillbox: " << e.what() << "\n";
        return kExitUsage;
    }

    switch (opts.command) {
    case Command::SHOW_INTERVALS:
        showIntervals(*table);
        return kExitOk;
    case Command::ADD:
        return addFiles(opts, *table);
    default:
        return review(opts, *table);
    }
}
