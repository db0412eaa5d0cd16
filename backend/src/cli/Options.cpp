#include "Options.hpp"
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include "../importer/CsvImporter.hpp"

namespace {

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> splitList(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream iss(line);
    std::string t;
    while (std::getline(iss, t, ',')) {
        while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
        while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
        if (!t.empty()) out.push_back(t);
    }
    return out;
}

template <typename T>
bool parseValue(const std::string& s, T& out) {
    std::istringstream iss(s);
    T v{};
    if (!(iss >> v)) return false;
    iss >> std::ws;
    if (!iss.eof()) return false;
    out = v;
    return true;
}

}

std::string defaultDataDir() {
    namespace fs = std::filesystem;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return (fs::path(xdg) / "drillbox").string();
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (fs::path(home) / ".config" / "drillbox").string();
    }
    return (fs::path(".drillbox")).string();
}

bool parseOptions(const std::vector<std::string>& args, Options& opts, std::string& error) {
    opts = Options{};
    bool show_intervals = false;
    bool help = false;
    bool add = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") { help = true; continue; }
        if (arg == "--show-intervals") { show_intervals = true; continue; }
        if (arg == "--verbose") { opts.verbose = true; continue; }

        if (!startsWith(arg, "-") || arg == "-") {
            if (!add && arg == "add") { add = true; continue; }
            if (!add) {
                error = "unknown command '" + arg + "'";
                return false;
            }
            opts.files.push_back(arg);
            continue;
        }

        // Split "--name=value"; otherwise the value is the next argument
        std::string name = arg;
        std::string value;
        bool has_value = false;
        auto eq = arg.find('=');
        if (startsWith(arg, "--") && eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
            has_value = true;
        }

        static const char* const valued[] = {
            "--db-path", "--log-file", "--delimiter", "-d", "--deck", "--decks",
            "--param-steps", "--param-max-hours", "--tts"
        };
        bool known = false;
        for (const char* v : valued) known = known || name == v;
        if (!known) {
            error = "unknown option '" + name + "'";
            return false;
        }

        if (!has_value) {
            if (i + 1 >= args.size()) {
                error = "option '" + name + "' needs a value";
                return false;
            }
            value = args[++i];
        }

        if (name == "--db-path") {
            opts.db_path = value;
        }
        else if (name == "--log-file") {
            opts.log_file = value;
        }
        else if (name == "--delimiter" || name == "-d") {
            if (!CsvImporter::parseDelimiter(value, opts.delimiter)) {
                error = "delimiter must be a single character other than '\"' or a line break, got '" + value + "'";
                return false;
            }
        }
        else if (name == "--deck") {
            if (value.empty()) {
                error = "deck name must not be empty";
                return false;
            }
            opts.deck = value;
        }
        else if (name == "--decks") {
            opts.decks = splitList(value);
        }
        else if (name == "--param-steps") {
            int steps = 0;
            if (!parseValue(value, steps) || steps < 1 || steps > IntervalTable::kMaxSteps) {
                error = "--param-steps needs an integer in [1, " + std::to_string(IntervalTable::kMaxSteps)
                    + "], got '" + value + "'";
                return false;
            }
            opts.param_steps = steps;
        }
        else if (name == "--param-max-hours") {
            double hours = 0;
            if (!parseValue(value, hours) || !(hours >= 0.0) || hours > 1.0e7) {
                error = "--param-max-hours needs a number in [0, 1e7], got '" + value + "'";
                return false;
            }
            opts.param_max_hours = hours;
        }
        else if (name == "--tts") {
            opts.tts_command = value;
        }
    }

    if (add && opts.files.empty()) {
        error = "add needs at least one file";
        return false;
    }

    if (help) opts.command = Command::HELP;
    else if (show_intervals) opts.command = Command::SHOW_INTERVALS;
    else if (add) opts.command = Command::ADD;
    else opts.command = Command::REVIEW;

    if (opts.db_path.empty() || opts.log_file.empty()) {
        std::filesystem::path dir = defaultDataDir();
        if (opts.db_path.empty()) opts.db_path = (dir / "drillbox.dat").string();
        if (opts.log_file.empty()) opts.log_file = (dir / "drillbox.log").string();
    }
    return true;
}

IntervalTable buildIntervalTable(const Options& opts) {
    if (!opts.param_steps && !opts.param_max_hours) {
        return IntervalTable::defaults();
    }
    return IntervalTable::fromGrowth(
        opts.param_steps.value_or(IntervalTable::kDefaultSteps),
        opts.param_max_hours.value_or(IntervalTable::kDefaultMaxHours));
}

std::string usage() {
    return
        "drillbox - spaced repetition drills in the terminal\n"
        "\n"
        "Usage:\n"
        "  drillbox [options]              review the items that are due\n"
        "  drillbox add <file>... [options] import question,answer records\n"
        "\n"
        "Each correct answer moves an item one step along the interval table,\n"
        "a wrong answer moves it back to step 0 (due again right away).\n"
        "\n"
        "Options:\n"
        "  --db-path=<file>         data file (default " + (std::filesystem::path(defaultDataDir()) / "drillbox.dat").string() + ")\n"
        "  -d, --delimiter=<char>   import field delimiter (default ','; '\\t' for tab)\n"
        "  --deck=<name>            deck for imported items (default 'default')\n"
        "  --decks=<a,b,...>        review only these decks (default all)\n"
        "  --param-steps=<N>        interval table length (growth table)\n"
        "  --param-max-hours=<H>    last interval in hours (growth table)\n"
        "                           table[n] = exp(n * ln(H + 1) / (N - 1)) - 1 hours\n"
        "  --show-intervals         print the interval table in seconds and exit\n"
        "  --tts=<command>          pipe questions and answers to a text-to-speech command\n"
        "  --log-file=<file>        log file (default drillbox.log in the same directory)\n"
        "  --verbose                debug logging\n"
        "  -h, --help               this text\n";
}
