#include "../src/cli/ReviewSession.hpp"
#include "../src/cli/Speech.hpp"
#include "TestSuite.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

namespace {

const std::time_t kHour = 60 * 60;

std::size_t count(const std::string& haystack, const std::string& needle) {
    std::size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) ++n;
    return n;
}

void test_pass_and_relapse(TestSuite& suite) {
    IntervalTable table = IntervalTable::defaults();
    Scheduler s(table);
    auto created = s.addItems({ { "2+2", "4" }, { "3+3", "6" } }, 0);
    const Item* first = created[0];
    const Item* second = created[1];

    // first: junk, reveal, recalled
    // second: reveal, forgot; comes back in the next pass: reveal, junk, recalled
    std::istringstream in("x\na\nr\na\nf\na\n?\nr\n");
    std::ostringstream out;

    int checkpoints = 0;
    ReviewSession session(s, in, out);
    session.setClock([] { return static_cast<std::time_t>(0); });
    session.setCheckpoint([&checkpoints] { ++checkpoints; return true; });

    ReviewSession::Summary summary = session.run();
    const std::string text = out.str();

    suite.require(!summary.quit && !summary.aborted, "session ran to completion");
    suite.require(summary.reviewed == 3 && summary.recalled == 2 && summary.forgot == 1, "summary counts");
    suite.require(checkpoints == 4, "checkpoint after every review and at the end");

    suite.require(first->step == 1 && first->due_at == kHour, "first item advanced");
    suite.require(second->step == 1 && second->history == "xo", "second item lapsed then recalled");
    suite.require(s.dueItems(0).empty(), "nothing left due");

    suite.require(text.find("0/0 -----\nQ: 2+2\nreveal [a]nswer, [q]uit: ") != std::string::npos,
        "question prompt with empty status");
    suite.require(text.find("A: 4\n[r]ecalled, [f]orgot: ") != std::string::npos, "answer prompt");
    suite.require(text.find("0/1 x----\nQ: 3+3") != std::string::npos, "status shows the lapse on the second pass");
    suite.require(count(text, "Q: 2+2") == 2, "invalid input re-prompts the question");
    suite.require(count(text, "A: 6") == 3, "invalid input re-prompts the answer");
}

void test_quit_keeps_progress(TestSuite& suite) {
    IntervalTable table = IntervalTable::defaults();
    Scheduler s(table);
    auto created = s.addItems({ { "a", "1" }, { "b", "2" }, { "c", "3" } }, 100);

    std::istringstream in("a\nr\nq\n");
    std::ostringstream out;
    ReviewSession session(s, in, out);
    session.setClock([] { return static_cast<std::time_t>(200); });

    ReviewSession::Summary summary = session.run();
    suite.require(summary.quit && summary.reviewed == 1, "quit after one review");
    suite.require(created[0]->step == 1 && created[0]->due_at == 200 + kHour, "reviewed item kept");
    suite.require(created[1]->step == 0 && created[1]->due_at == 100 && !created[1]->last_reviewed_at,
        "unreached item unchanged");
    suite.require(s.dueItems(200).size() == 2, "unreached items remain due");
}

void test_final_checkpoint(TestSuite& suite) {
    IntervalTable table = IntervalTable::defaults();
    Scheduler s(table);
    s.addItems({ { "a", "1" }, { "b", "2" } }, 1000);

    // nothing due: no reviews, still one save at the end
    {
        std::istringstream in("");
        std::ostringstream out;
        int checkpoints = 0;
        ReviewSession session(s, in, out);
        session.setClock([] { return static_cast<std::time_t>(10); });
        session.setCheckpoint([&checkpoints] { ++checkpoints; return true; });
        ReviewSession::Summary summary = session.run();
        suite.require(summary.reviewed == 0 && !summary.aborted, "empty session completes");
        suite.require(checkpoints == 1, "session end saves even without reviews");
    }

    // quit after one review: one per review plus the final one
    {
        std::istringstream in("a\nr\nq\n");
        std::ostringstream out;
        int checkpoints = 0;
        ReviewSession session(s, in, out);
        session.setClock([] { return static_cast<std::time_t>(1000); });
        session.setCheckpoint([&checkpoints] { ++checkpoints; return true; });
        ReviewSession::Summary summary = session.run();
        suite.require(summary.quit && summary.reviewed == 1, "quit after one review");
        suite.require(checkpoints == 2, "quit still saves at the end");
    }

    // failing final save is reported
    {
        std::istringstream in("");
        std::ostringstream out;
        ReviewSession session(s, in, out);
        session.setClock([] { return static_cast<std::time_t>(10); });
        session.setCheckpoint([] { return false; });
        ReviewSession::Summary summary = session.run();
        suite.require(summary.aborted, "failed final save aborts");
    }
}

void test_end_of_input(TestSuite& suite) {
    IntervalTable table = IntervalTable::defaults();
    Scheduler s(table);
    auto created = s.addItems({ { "a", "1" } }, 0);

    std::istringstream in("a\n");
    std::ostringstream out;
    ReviewSession session(s, in, out);
    session.setClock([] { return static_cast<std::time_t>(0); });

    ReviewSession::Summary summary = session.run();
    suite.require(summary.quit && summary.reviewed == 0, "end of input ends the session");
    suite.require(created[0]->step == 0 && !created[0]->last_reviewed_at, "unanswered item unchanged");
}

void test_checkpoint_failure(TestSuite& suite) {
    IntervalTable table = IntervalTable::defaults();
    Scheduler s(table);
    auto created = s.addItems({ { "a", "1" }, { "b", "2" } }, 0);

    std::istringstream in("a\nr\na\nr\n");
    std::ostringstream out;
    ReviewSession session(s, in, out);
    session.setClock([] { return static_cast<std::time_t>(0); });
    session.setCheckpoint([] { return false; });

    ReviewSession::Summary summary = session.run();
    suite.require(summary.aborted && summary.reviewed == 1, "failed checkpoint aborts after the first review");
    suite.require(created[1]->step == 0, "second item not reviewed");
}

void test_deck_filter(TestSuite& suite) {
    IntervalTable table = IntervalTable::defaults();
    Scheduler s(table);
    s.addItems({ { "bonjour", "hello" } }, 0, "french");
    s.addItems({ { "hallo", "hello" } }, 0, "german");

    std::istringstream in("a\nr\n");
    std::ostringstream out;
    ReviewSession session(s, in, out);
    session.setClock([] { return static_cast<std::time_t>(0); });
    session.setDecks({ "german" });

    ReviewSession::Summary summary = session.run();
    suite.require(summary.reviewed == 1, "only the selected deck is reviewed");
    suite.require(out.str().find("bonjour") == std::string::npos, "other decks not shown");
    suite.require(s.dueItems(0).size() == 1 && s.dueItems(0)[0]->deck == "french", "french item still due");
}

void test_nothing_due(TestSuite& suite) {
    IntervalTable table = IntervalTable::defaults();
    Scheduler s(table);
    s.addItems({ { "a", "1" } }, 1000);

    std::istringstream in("");
    std::ostringstream out;
    ReviewSession session(s, in, out);
    session.setClock([] { return static_cast<std::time_t>(10); });

    ReviewSession::Summary summary = session.run();
    suite.require(!summary.quit && summary.reviewed == 0, "nothing due, nothing asked");
    suite.require(out.str().empty(), "no prompts printed");
}

namespace fs = std::filesystem;

// Reads the whole input and exits non-zero, so the pipe never breaks mid-write
const char* kFailingTts = "cat > /dev/null; exit 3";

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void test_speak(TestSuite& suite, const fs::path& dir) {
    fs::path spoken = dir / "speak.txt";
    suite.require(speak("", "ignored"), "empty command is a no-op");
    suite.require(speak("cat >> '" + spoken.string() + "'", "bonjour"), "command receives text");
    suite.require(readFile(spoken) == "bonjour", "text piped to the command");
    suite.require(!speak(kFailingTts, "hello"), "non-zero exit reported as failure");
}

void test_tts_reads_prompts(TestSuite& suite, const fs::path& dir) {
    fs::path spoken = dir / "session.txt";
    IntervalTable table = IntervalTable::defaults();
    Scheduler s(table);
    auto created = s.addItems({ { "capital of France", "Paris" } }, 0);

    std::istringstream in("a\nr\n");
    std::ostringstream out;
    ReviewSession session(s, in, out);
    session.setClock([] { return static_cast<std::time_t>(0); });
    session.setTtsCommand("cat >> '" + spoken.string() + "'");

    ReviewSession::Summary summary = session.run();
    suite.require(summary.reviewed == 1 && created[0]->step == 1, "review with tts completes");
    suite.require(readFile(spoken) == "capital of FranceParis", "question then answer spoken");
    suite.require(out.str().find("text-to-speech failed") == std::string::npos, "no failure notice");
}

void test_tts_failure_fallback(TestSuite& suite) {
    IntervalTable table = IntervalTable::defaults();
    Scheduler s(table);
    auto created = s.addItems({ { "a", "1" }, { "b", "2" } }, 0);

    std::istringstream in("a\nr\na\nf\na\nr\n");
    std::ostringstream out;
    ReviewSession session(s, in, out);
    session.setClock([] { return static_cast<std::time_t>(0); });
    session.setTtsCommand(kFailingTts);

    ReviewSession::Summary summary = session.run();
    const std::string text = out.str();
    suite.require(!summary.quit && !summary.aborted, "session keeps going without tts");
    suite.require(summary.reviewed == 3 && summary.recalled == 2 && summary.forgot == 1, "all reviews counted");
    suite.require(count(text, "(text-to-speech failed; continuing without it)") == 1,
        "failure notice printed once, tts then disabled");
    suite.require(created[0]->step == 1 && created[1]->step == 1, "both items end up recalled");
}

}

int main() {
    TestSuite suite;
    test_pass_and_relapse(suite);
    test_quit_keeps_progress(suite);
    test_final_checkpoint(suite);
    test_end_of_input(suite);
    test_checkpoint_failure(suite);
    test_deck_filter(suite);
    test_nothing_due(suite);

    fs::path dir = fs::temp_directory_path() / "drillbox_tts_test";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir);
    test_speak(suite, dir);
    test_tts_reads_prompts(suite, dir);
    test_tts_failure_fallback(suite);
    fs::remove_all(dir, ec);
    return suite.finish("ReviewSession");
}
