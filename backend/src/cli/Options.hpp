#pragma once
#include <optional>
#include <string>
#include <vector>
#include "../core/IntervalTable.hpp"

enum class Command {
    REVIEW,
    ADD,
    SHOW_INTERVALS,
    HELP
};

struct Options {
    Command command = Command::REVIEW;
    std::vector<std::string> files;    // add <file>...

    std::string db_path;               // empty -> defaultDataDir()/drillbox.dat
    std::string log_file;              // empty -> defaultDataDir()/drillbox.log

    char delimiter = ',';
    std::string deck = "default";
    std::vector<std::string> decks;    // review filter, empty = all

    // Interval table growth; when neither is set the literal default table is used
    std::optional<int> param_steps;
    std::optional<double> param_max_hours;

    std::string tts_command;
    bool verbose = false;
};

// Accepts "--name=value" and "--name value". Fills in default paths.
// On failure returns false and sets `error`.
bool parseOptions(const std::vector<std::string>& args, Options& opts, std::string& error);

// $XDG_CONFIG_HOME/drillbox, else $HOME/.config/drillbox, else ./.drillbox
std::string defaultDataDir();

// Throws std::invalid_argument for parameters IntervalTable rejects
IntervalTable buildIntervalTable(const Options& opts);

std::string usage();
