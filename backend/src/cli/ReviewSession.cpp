#include "ReviewSession.hpp"
#include <iostream>
#include <sstream>
#include <spdlog/spdlog.h>
#include "Speech.hpp"

namespace {
const std::size_t kHistoryShown = 5;

std::string trimmed(const std::string& s) {
    std::size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    std::size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}
}

ReviewSession::ReviewSession(Scheduler& scheduler, std::istream& in, std::ostream& out)
    : scheduler_(scheduler), in_(in), out_(out),
    clock_([] { return std::time(nullptr); })
{
}

ReviewSession::Summary ReviewSession::run() {
    Summary summary;
    int pass = 0;

    while (true) {
        // One clock read per pass
        std::time_t now = clock_();
        auto due = scheduler_.dueItems(now, decks_);
        if (due.empty()) break;

        ++pass;
        spdlog::info("Review pass {}: {} items due", pass, due.size());

        for (const Item* item : due) {
            Answer a = ask(*item);
            if (a == Answer::QUIT) {
                spdlog::info("Session ended by operator after {} reviews", summary.reviewed);
                summary.quit = true;
                finish(summary);
                return summary;
            }

            ReviewOutcome outcome = (a == Answer::RECALLED) ? ReviewOutcome::CORRECT : ReviewOutcome::INCORRECT;
            if (!scheduler_.review(*item, outcome, clock_())) {
                out_ << "Item could not be reviewed; skipped.\n\n";
                continue;
            }

            summary.reviewed++;
            if (outcome == ReviewOutcome::CORRECT) summary.recalled++;
            else summary.forgot++;

            if (checkpoint_ && !checkpoint_()) {
                spdlog::error("Checkpoint failed; aborting session");
                summary.aborted = true;
                return summary;
            }
            out_ << "\n";
        }
    }

    if (finish(summary)) {
        spdlog::info("Session complete: reviewed={}, recalled={}, forgot={}",
            summary.reviewed, summary.recalled, summary.forgot);
    }
    return summary;
}

bool ReviewSession::finish(Summary& summary) {
    if (checkpoint_ && !checkpoint_()) {
        spdlog::error("Final checkpoint failed after {} reviews", summary.reviewed);
        summary.aborted = true;
        return false;
    }
    return true;
}

ReviewSession::Answer ReviewSession::ask(const Item& item) {
    std::ostringstream q;
    q << item.recalled << "/" << (item.recalled + item.forgot) << " "
      << item.recentHistory(kHistoryShown) << "\n"
      << "Q: " << item.question << "\n"
      << "reveal [a]nswer, [q]uit: ";
    const std::string q_prompt = q.str();
    const std::string a_prompt = "A: " + item.answer + "\n[r]ecalled, [f]orgot: ";

    std::string reply;
    while (true) {
        if (!prompt(q_prompt, item.question, reply) || reply == "q") return Answer::QUIT;
        if (reply != "a") continue;

        while (true) {
            if (!prompt(a_prompt, item.answer, reply)) return Answer::QUIT;
            if (reply == "r") return Answer::RECALLED;
            if (reply == "f") return Answer::FORGOT;
        }
    }
}

// false at end of input
bool ReviewSession::prompt(const std::string& text, const std::string& spoken, std::string& reply) {
    out_ << text;
    out_.flush();
    if (!speak(tts_command_, spoken)) {
        out_ << "\n(text-to-speech failed; continuing without it)\n";
        tts_command_.clear();
    }

    std::string line;
    if (!std::getline(in_, line)) {
        out_ << "\n";
        return false;
    }
    reply = trimmed(line);
    return true;
}
