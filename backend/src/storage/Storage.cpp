#include "Storage.hpp"
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unordered_set>
#include <sodium.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

static const char MAGIC_HDR[] = "DBXDATA1\n";
static const char RECORD_SEP[] = "---";
static const char ABSENT[] = "-";

static bool ensureSodium() {
    // 1 means already initialized
    if (sodium_init() < 0) {
        spdlog::error("Failed to initialize libsodium");
        return false;
    }
    return true;
}

static std::string checksumHex(const std::string& body) {
    unsigned char hash[crypto_generichash_BYTES];
    crypto_generichash(hash, sizeof(hash),
        reinterpret_cast<const unsigned char*>(body.data()), body.size(),
        nullptr, 0);

    char hex[2 * crypto_generichash_BYTES + 1];
    sodium_bin2hex(hex, sizeof(hex), hash, sizeof(hash));
    return std::string(hex);
}

static std::string escapeField(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        default: out += c; break;
        }
    }
    return out;
}

static bool unescapeField(const std::string& s, std::string& out) {
    out.clear();
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\') {
            out += s[i];
            continue;
        }
        if (++i == s.size()) return false;
        switch (s[i]) {
        case '\\': out += '\\'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        default: return false;
        }
    }
    return true;
}

// Whole-line decimal parse; rejects signs, blanks and trailing junk
template <typename T>
static bool parseUnsigned(const std::string& s, T& out) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) return false;
    std::istringstream iss(s);
    T v{};
    if (!(iss >> v)) return false;
    out = v;
    return true;
}

static bool parseTime(const std::string& s, std::time_t& out) {
    if (s.empty()) return false;
    std::size_t digits = (s[0] == '-') ? 1 : 0;
    if (digits == s.size() || s.find_first_not_of("0123456789", digits) != std::string::npos) return false;
    std::istringstream iss(s);
    long long v = 0;
    if (!(iss >> v)) return false;
    out = static_cast<std::time_t>(v);
    return true;
}

std::string Storage::serializeItems(const std::vector<Item>& items) {
    std::ostringstream oss;

    for (const auto& it : items) {
        oss << it.id << "\n"
            << escapeField(it.deck) << "\n"
            << escapeField(it.question) << "\n"
            << escapeField(it.answer) << "\n"
            << it.step << "\n"
            << static_cast<long long>(it.due_at) << "\n";

        if (it.last_reviewed_at) oss << static_cast<long long>(*it.last_reviewed_at) << "\n";
        else oss << ABSENT << "\n";

        oss << it.recalled << "\n"
            << it.forgot << "\n"
            << (it.history.empty() ? std::string(ABSENT) : it.history) << "\n";

        oss << RECORD_SEP << "\n";
    }

    return oss.str();
}

bool Storage::parseItems(const std::string& body, std::vector<Item>& items) {
    std::istringstream iss(body);
    std::vector<Item> parsed;
    std::unordered_set<std::uint64_t> ids;
    std::size_t record = 0;

    auto fail = [&record](const char* what) {
        spdlog::error("Malformed item record #{}: {}", record, what);
        return false;
    };

    std::string line;
    while (std::getline(iss, line)) {
        ++record;
        Item it;

        if (!parseUnsigned(line, it.id) || it.id == 0) return fail("id");
        if (!ids.insert(it.id).second) return fail("duplicate id");

        std::string raw;
        if (!std::getline(iss, raw) || !unescapeField(raw, it.deck)) return fail("deck");
        if (!std::getline(iss, raw) || !unescapeField(raw, it.question)) return fail("question");
        if (!std::getline(iss, raw) || !unescapeField(raw, it.answer)) return fail("answer");

        if (!std::getline(iss, line) || !parseUnsigned(line, it.step)) return fail("step");
        if (!std::getline(iss, line) || !parseTime(line, it.due_at)) return fail("due_at");

        if (!std::getline(iss, line)) return fail("last_reviewed_at");
        if (line == ABSENT) {
            it.last_reviewed_at.reset();
        }
        else {
            std::time_t t = 0;
            if (!parseTime(line, t)) return fail("last_reviewed_at");
            it.last_reviewed_at = t;
        }

        if (!std::getline(iss, line) || !parseUnsigned(line, it.recalled)) return fail("recalled");
        if (!std::getline(iss, line) || !parseUnsigned(line, it.forgot)) return fail("forgot");

        if (!std::getline(iss, line)) return fail("history");
        if (line != ABSENT) {
            if (line.find_first_not_of(std::string{ Item::kRecalledMark, Item::kForgotMark }) != std::string::npos)
                return fail("history");
            it.history = line;
        }

        if (!std::getline(iss, line) || line != RECORD_SEP) return fail("record separator");

        parsed.push_back(std::move(it));
    }

    items = std::move(parsed);
    return true;
}

bool Storage::saveItems(const std::vector<Item>& items, const std::string& filename) {
    spdlog::info("Saving {} items to '{}'", items.size(), filename);
    if (!ensureSodium()) return false;

    std::string body = serializeItems(items);
    std::string sum = checksumHex(body);

    fs::path finalPath = filename;
    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            spdlog::error("Failed to create directory '{}': {}", finalPath.parent_path().string(), ec.message());
            return false;
        }
    }

    // filename.<random>.tmp in the same directory, so rename stays on one filesystem
    unsigned char suffix[8];
    randombytes_buf(suffix, sizeof(suffix));
    char suffix_hex[2 * sizeof(suffix) + 1];
    sodium_bin2hex(suffix_hex, sizeof(suffix_hex), suffix, sizeof(suffix));
    fs::path tempPath = finalPath;
    tempPath += std::string(".") + suffix_hex + ".tmp";

    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for writing", tempPath.string());
            return false;
        }

        out.write(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
        out << sum << "\n";
        out.write(body.data(), static_cast<std::streamsize>(body.size()));
        out.flush();
        if (!out) {
            spdlog::error("Write to '{}' failed", tempPath.string());
            out.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        spdlog::error("Failed to move '{}' into place: {}", tempPath.string(), ec.message());
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

bool Storage::loadItems(std::vector<Item>& items, const std::string& filename) {
    spdlog::info("Loading items from '{}'", filename);
    items.clear();

    std::error_code ec;
    if (!fs::exists(filename, ec)) {
        if (ec) {
            spdlog::error("Cannot stat '{}': {}", filename, ec.message());
            return false;
        }
        spdlog::warn("Item file '{}' not found; treating as empty", filename);
        return true;
    }

    if (!ensureSodium()) return false;

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::error("Failed to open '{}' for reading", filename);
        return false;
    }

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != static_cast<std::streamsize>(sizeof(hdr)) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header in '{}'", filename);
        return false;
    }

    std::string stored_sum;
    if (!std::getline(in, stored_sum) || stored_sum.size() != 2 * crypto_generichash_BYTES) {
        spdlog::error("Missing checksum in '{}'", filename);
        return false;
    }

    std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        spdlog::error("Read error on '{}'", filename);
        return false;
    }

    if (checksumHex(body) != stored_sum) {
        spdlog::error("Checksum mismatch in '{}'; file is corrupt", filename);
        return false;
    }

    std::vector<Item> parsed;
    if (!parseItems(body, parsed)) {
        spdlog::error("Failed to parse '{}'", filename);
        return false;
    }

    items = std::move(parsed);
    spdlog::info("Loaded {} items", items.size());
    return true;
}
