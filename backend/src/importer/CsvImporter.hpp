#pragma once
#include <string>
#include <utility>
#include <vector>

// Reads question/answer pairs from delimited text.
//
// Format: one record per line, exactly two fields, no header row.
// A field may be wrapped in double quotes; inside quotes the delimiter and
// line breaks are literal and "" stands for one quote. Blank lines are skipped.
//
// Parsing is all-or-nothing: on the first malformed record the functions
// return false, leave `out` empty and describe the problem in `error`
// as "<source>:<line>: <reason>".

class CsvImporter {
public:
    using QAPair = std::pair<std::string, std::string>;

    explicit CsvImporter(char delimiter = ',');

    bool parseText(const std::string& text, const std::string& source,
                   std::vector<QAPair>& out, std::string& error) const;
    bool parseFile(const std::string& filename,
                   std::vector<QAPair>& out, std::string& error) const;

    char delimiter() const { return delimiter_; }

    // Accepts a single character, or "\t" / "tab" for a tab
    static bool parseDelimiter(const std::string& text, char& out);

private:
    char delimiter_;
};
