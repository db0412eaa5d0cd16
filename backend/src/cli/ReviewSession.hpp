#pragma once
#include <ctime>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>
#include "../core/Scheduler.hpp"

/*
  Interactive review loop over a Scheduler.

  For each due item:
      <recalled>/<reviews> <last five marks, newest first>
      Q: <question>
      reveal [a]nswer, [q]uit:
      A: <answer>
      [r]ecalled, [f]orgot:

  A pass walks the items due at one instant. When it finishes the due set is
  computed again, so lapsed items come back in the same session. The session
  ends when nothing is due, on 'q', or at end of input.
*/

class ReviewSession {
public:
    struct Summary {
        int reviewed = 0;
        int recalled = 0;
        int forgot = 0;
        bool quit = false;      // operator quit or input ended
        bool aborted = false;   // checkpoint failed
    };

    using Clock = std::function<std::time_t()>;
    using Checkpoint = std::function<bool()>;

    ReviewSession(Scheduler& scheduler, std::istream& in, std::ostream& out);

    void setDecks(std::vector<std::string> decks) { decks_ = std::move(decks); }
    void setTtsCommand(std::string command) { tts_command_ = std::move(command); }
    void setClock(Clock clock) { clock_ = std::move(clock); }

    // Runs after every review and once when the session ends (also on quit,
    // so load-time repairs are saved even if nothing was reviewed).
    // Returning false aborts the session.
    void setCheckpoint(Checkpoint checkpoint) { checkpoint_ = std::move(checkpoint); }

    Summary run();

private:
    enum class Answer { RECALLED, FORGOT, QUIT };

    Scheduler& scheduler_;
    std::istream& in_;
    std::ostream& out_;
    std::vector<std::string> decks_;
    std::string tts_command_;
    Clock clock_;
    Checkpoint checkpoint_;

    Answer ask(const Item& item);
    bool finish(Summary& summary);
    bool prompt(const std::string& text, const std::string& spoken, std::string& reply);
};
