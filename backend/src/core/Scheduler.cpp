#include "Scheduler.hpp"
#include <algorithm>
#include <unordered_set>
#include <spdlog/spdlog.h>

const std::string Scheduler::kDefaultDeck = "default";

Scheduler::Scheduler(const IntervalTable& table, std::vector<Item> items)
    : table_(table), items_(std::move(items))
{
    std::uint64_t max_id = 0;
    for (const auto& it : items_) max_id = std::max(max_id, it.id);
    next_id_ = max_id + 1;

    std::unordered_set<std::uint64_t> seen;
    for (auto& it : items_) {
        if (it.id == 0 || !seen.insert(it.id).second) {
            std::uint64_t fresh = next_id_++;
            spdlog::warn("Item '{}' had missing or duplicate id {}; reassigned {}", it.question, it.id, fresh);
            it.id = fresh;
            seen.insert(fresh);
        }

        // A table built with fewer steps than the one the item was reviewed under
        if (it.step > table_.lastStep()) {
            spdlog::warn("Item ID={} step {} beyond last step {}; clamped", it.id, it.step, table_.lastStep());
            it.step = table_.lastStep();
        }
    }

    spdlog::info("Scheduler initialized: {} items, {} interval steps", items_.size(), table_.length());
}

/*
  Items with due_at <= now, ordered by due_at ascending.
  stable_sort keeps collection (insertion) order among equal due_at.
*/
std::vector<const Item*> Scheduler::dueItems(std::time_t now, const std::vector<std::string>& decks) const {
    std::vector<const Item*> due;
    due.reserve(items_.size() / 4 + 8);

    for (const auto& item : items_) {
        if (item.isDue(now) && inDecks(item, decks)) {
            due.push_back(&item);
        }
    }

    std::stable_sort(due.begin(), due.end(),
        [](const Item* a, const Item* b) {
            return a->due_at < b->due_at;
        });

    spdlog::debug("dueItems(now={}): {} of {} due", now, due.size(), items_.size());
    return due;
}

bool Scheduler::review(const Item& item, ReviewOutcome outcome, std::time_t now) {
    Item* target = find(item);
    if (!target) {
        spdlog::warn("Review rejected: item ID={} is not in this collection", item.id);
        return false;
    }

    // Compute everything first; durationAt may throw and must leave the item untouched
    std::size_t new_step = 0;
    if (outcome == ReviewOutcome::CORRECT) {
        new_step = std::min(target->step + 1, table_.lastStep());
    }
    std::time_t new_due = now + table_.durationAt(new_step);

    std::size_t old_step = target->step;
    target->step = new_step;
    target->last_reviewed_at = now;
    target->due_at = new_due;

    if (outcome == ReviewOutcome::CORRECT) {
        target->recalled++;
        target->history.push_back(Item::kRecalledMark);
        spdlog::info("Review Item ID={} recalled: step {} -> {}, due_at={}", target->id, old_step, new_step, new_due);
    }
    else {
        target->forgot++;
        target->history.push_back(Item::kForgotMark);
        spdlog::warn("Item ID={} lapsed: step {} -> 0, due_at={}", target->id, old_step, new_due);
    }
    return true;
}

std::vector<const Item*> Scheduler::addItems(const std::vector<QAPair>& pairs, std::time_t now,
    const std::string& deck)
{
    // Reserve up front so earlier pointers survive the rest of the batch
    items_.reserve(items_.size() + pairs.size());

    std::vector<const Item*> created;
    created.reserve(pairs.size());
    for (const auto& p : pairs) {
        items_.emplace_back(next_id_++, p.first, p.second, deck, now);
        created.push_back(&items_.back());
    }

    spdlog::info("Added {} items to deck '{}' (due_at={})", created.size(), deck, now);
    return created;
}

std::optional<std::time_t> Scheduler::nextDueAt(const std::vector<std::string>& decks) const {
    std::optional<std::time_t> next;
    for (const auto& item : items_) {
        if (!inDecks(item, decks)) continue;
        if (!next || item.due_at < *next) next = item.due_at;
    }
    return next;
}

// Identity is the element itself; ids repeat across collections
Item* Scheduler::find(const Item& item) {
    auto it = std::find_if(items_.begin(), items_.end(),
        [&item](const Item& i) { return &i == &item; });
    return it == items_.end() ? nullptr : &*it;
}

bool Scheduler::inDecks(const Item& item, const std::vector<std::string>& decks) {
    if (decks.empty()) return true;
    return std::find(decks.begin(), decks.end(), item.deck) != decks.end();
}
