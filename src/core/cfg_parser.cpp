#include "core/cfg_parser.h"

#include <cctype>
#include <charconv>
#include <fstream>
#include <system_error>

namespace skirmish::core::cfg {
namespace {

bool IsSpace(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

std::string_view WithoutComment(std::string_view line) {
    bool in_quotes = false;
    for (std::size_t index = 0; index < line.size(); ++index) {
        if (line[index] == '"') {
            in_quotes = !in_quotes;
        } else if (line[index] == '#' && !in_quotes) {
            return line.substr(0, index);
        }
    }
    return line;
}

template <typename Integer>
bool ParseInteger(std::string_view value, Integer& out_value) {
    const std::string trimmed = Trim(value);
    if (trimmed.empty()) {
        return false;
    }

    Integer parsed{};
    const char* end = trimmed.data() + trimmed.size();
    const auto [ptr, ec] = std::from_chars(trimmed.data(), end, parsed);
    if (ec != std::errc() || ptr != end) {
        return false;
    }

    out_value = parsed;
    return true;
}

std::string AtLine(int line_number) {
    return ": line " + std::to_string(line_number);
}

}  // namespace

std::string Trim(std::string_view text) {
    while (!text.empty() && IsSpace(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && IsSpace(text.back())) {
        text.remove_suffix(1);
    }
    return std::string(text);
}

bool ParseFile(
    const std::filesystem::path& file_path,
    std::vector<KeyValueLine>& out_lines,
    std::string& out_error) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        out_error = "Cannot open config file: " + file_path.string();
        return false;
    }

    std::vector<KeyValueLine> lines;
    std::string raw_line;
    int line_number = 0;
    while (std::getline(file, raw_line)) {
        ++line_number;
        const std::string line = Trim(WithoutComment(raw_line));
        if (line.empty()) {
            continue;
        }

        // Section headers group keys for readers only.
        if (line.front() == '[') {
            if (line.back() != ']') {
                out_error = "Unterminated section header" + AtLine(line_number);
                return false;
            }
            continue;
        }

        const std::size_t equal_pos = line.find('=');
        if (equal_pos == std::string::npos) {
            out_error = "Expected 'key = value'" + AtLine(line_number);
            return false;
        }

        KeyValueLine entry{};
        entry.key = Trim(std::string_view(line).substr(0, equal_pos));
        entry.value = Trim(std::string_view(line).substr(equal_pos + 1));
        entry.line_number = line_number;
        if (entry.key.empty()) {
            out_error = "Missing key before '='" + AtLine(line_number);
            return false;
        }
        lines.push_back(std::move(entry));
    }

    out_lines = std::move(lines);
    out_error.clear();
    return true;
}

bool ParseQuotedString(std::string_view value, std::string& out_text) {
    const std::string trimmed = Trim(value);
    if (trimmed.size() < 2 || trimmed.front() != '"' || trimmed.back() != '"') {
        return false;
    }
    out_text = trimmed.substr(1, trimmed.size() - 2);
    return true;
}

bool ParseBool(std::string_view value, bool& out_value) {
    const std::string trimmed = Trim(value);
    if (trimmed == "true" || trimmed == "1") {
        out_value = true;
        return true;
    }
    if (trimmed == "false" || trimmed == "0") {
        out_value = false;
        return true;
    }
    return false;
}

bool ParseInt(std::string_view value, int& out_value) {
    return ParseInteger(value, out_value);
}

bool ParseUInt64(std::string_view value, std::uint64_t& out_value) {
    return ParseInteger(value, out_value);
}

}  // namespace skirmish::core::cfg
