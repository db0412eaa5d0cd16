#include "CsvImporter.hpp"
#include <fstream>
#include <iterator>
#include <sstream>
#include <spdlog/spdlog.h>

namespace {
const char kQuote = '"';
const std::string kUtf8Bom = "\xEF\xBB\xBF";

std::string located(const std::string& source, std::size_t line, const std::string& what) {
    std::ostringstream oss;
    oss << source << ":" << line << ": " << what;
    return oss.str();
}
}

CsvImporter::CsvImporter(char delimiter)
    : delimiter_(delimiter)
{
}

bool CsvImporter::parseDelimiter(const std::string& text, char& out) {
    if (text == "\\t" || text == "tab") {
        out = '\t';
        return true;
    }
    if (text.size() != 1) return false;
    char c = text[0];
    if (c == kQuote || c == '\n' || c == '\r') return false;
    out = c;
    return true;
}

bool CsvImporter::parseText(const std::string& text, const std::string& source,
                            std::vector<QAPair>& out, std::string& error) const
{
    out.clear();

    std::vector<QAPair> pairs;
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;
    bool after_quote = false;   // closing quote seen, only delimiter or newline may follow
    bool record_empty = true;
    std::size_t line = 1;
    std::size_t record_line = 1;

    auto finishRecord = [&]() -> bool {
        if (record_empty) return true; // blank line
        fields.push_back(std::move(field));
        field.clear();
        if (fields.size() != 2) {
            error = located(source, record_line,
                "expected 2 fields, got " + std::to_string(fields.size()));
            return false;
        }
        pairs.emplace_back(std::move(fields[0]), std::move(fields[1]));
        fields.clear();
        record_empty = true;
        after_quote = false;
        return true;
    };

    std::size_t start = text.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0 ? kUtf8Bom.size() : 0;
    for (std::size_t i = start; i < text.size(); ++i) {
        char c = text[i];

        if (in_quotes) {
            if (c == kQuote) {
                if (i + 1 < text.size() && text[i + 1] == kQuote) {
                    field += kQuote;
                    ++i;
                }
                else {
                    in_quotes = false;
                    after_quote = true;
                }
            }
            else {
                if (c == '\n') ++line;
                field += c;
            }
            continue;
        }

        if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') continue;

        if (c == '\n') {
            if (!finishRecord()) return false;
            ++line;
            record_line = line;
            continue;
        }

        if (c == delimiter_) {
            fields.push_back(std::move(field));
            field.clear();
            after_quote = false;
            record_empty = false;
            continue;
        }

        if (after_quote) {
            error = located(source, line, "unexpected character after closing quote");
            return false;
        }

        if (c == kQuote && field.empty()) {
            in_quotes = true;
            record_empty = false;
            continue;
        }

        field += c;
        record_empty = false;
    }

    if (in_quotes) {
        error = located(source, record_line, "unterminated quoted field");
        return false;
    }
    if (!finishRecord()) return false;

    spdlog::debug("Parsed {} records from '{}'", pairs.size(), source);
    out = std::move(pairs);
    return true;
}

bool CsvImporter::parseFile(const std::string& filename,
                            std::vector<QAPair>& out, std::string& error) const
{
    spdlog::info("Importing '{}' (delimiter '{}')", filename, delimiter_);
    out.clear();

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        error = filename + ": cannot open file";
        spdlog::error("Failed to open import file '{}'", filename);
        return false;
    }

    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = filename + ": read error";
        spdlog::error("Failed to read import file '{}'", filename);
        return false;
    }

    if (!parseText(text, filename, out, error)) {
        spdlog::error("Import of '{}' rejected: {}", filename, error);
        return false;
    }
    return true;
}
