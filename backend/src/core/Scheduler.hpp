#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "Item.hpp"
#include "IntervalTable.hpp"

enum class ReviewOutcome {
    CORRECT,
    INCORRECT
};

/*
  Owns the item collection for one session.
   - dueItems: items with due_at <= now, earliest first, ties in insertion order
   - review: the only transition of step/due_at/last_reviewed_at
       CORRECT   -> step = min(step + 1, last step)
       INCORRECT -> step = 0
       due_at = now + table[step]
   - addItems: batch import, every new item due at the same instant

  Pointers handed out stay valid until the next addItems call.
*/

class Scheduler {
public:
    using QAPair = std::pair<std::string, std::string>;

    // Steps beyond the table's last index are clamped to it
    explicit Scheduler(const IntervalTable& table, std::vector<Item> items = {});
    // The table is held by reference and must outlive the scheduler
    Scheduler(IntervalTable&& table, std::vector<Item> items = {}) = delete;

    std::vector<const Item*> dueItems(std::time_t now,
        const std::vector<std::string>& decks = {}) const;

    // item must be an element of items(); anything else (a copy, an item of
    // another scheduler) returns false and changes nothing
    bool review(const Item& item, ReviewOutcome outcome, std::time_t now);

    std::vector<const Item*> addItems(const std::vector<QAPair>& pairs, std::time_t now,
        const std::string& deck = kDefaultDeck);

    // Earliest due_at among the (deck-filtered) items, if any
    std::optional<std::time_t> nextDueAt(const std::vector<std::string>& decks = {}) const;

    const std::vector<Item>& items() const { return items_; }
    const IntervalTable& table() const { return table_; }

    static const std::string kDefaultDeck;

private:
    const IntervalTable& table_;
    std::vector<Item> items_;
    std::uint64_t next_id_ = 1;

    Item* find(const Item& item);
    static bool inDecks(const Item& item, const std::vector<std::string>& decks);
};
