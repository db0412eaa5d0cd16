#pragma once
#include <string>
#include <vector>
#include "../core/Item.hpp"

// Storage handles the item data file.
//
// Layout (text):
//   Header:   9 bytes ASCII "DBXDATA1\n" (magic + version)
//   Checksum: hex BLAKE2b-256 (crypto_generichash) of the body, then "\n"
//   Body:     per item the lines
//               id, deck, question, answer, step, due_at,
//               last_reviewed_at ("-" if never reviewed),
//               recalled, forgot, history ("-" if empty), "---"
//             text fields escape '\\' '\n' '\r' as \\ \n \r
//
// saveItems writes a temporary file beside the target and renames it into
// place, so an interrupted save leaves the previous file intact.
// loadItems treats a missing file as an empty collection; any other
// problem (bad header, checksum mismatch, malformed record) returns false
// and leaves `items` empty.

class Storage {
public:
    static bool saveItems(const std::vector<Item>& items, const std::string& filename);
    static bool loadItems(std::vector<Item>& items, const std::string& filename);

    // Exposed for tests
    static std::string serializeItems(const std::vector<Item>& items);
    static bool parseItems(const std::string& body, std::vector<Item>& items);
};
