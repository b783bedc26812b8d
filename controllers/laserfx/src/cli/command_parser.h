/**
 * @file command_parser.h
 * @brief Utility class for parsing CLI commands
 *
 * Reduces boilerplate in command handlers by providing:
 * - Case-insensitive command matching
 * - Automatic flag extraction (--json, -j)
 * - Argument parsing with type conversion
 * - Keyword values ("feed 1200", "x -5")
 *
 * Tokens that start with '-' followed by a digit or '.' are numbers,
 * not flags, so "jog x -10" keeps its argument.
 */

#ifndef COMMAND_PARSER_H
#define COMMAND_PARSER_H

#include <ctype.h>
#include <stdlib.h>
#include <strings.h>
#include <optional>
#include <string>
#include <vector>

/**
 * Parsed command result with easy access to parts
 */
class CommandParser {
public:
    explicit CommandParser(const std::string& cmd) : _original(cmd) {
        parse();
    }

    // ---- Command Matching ----

    /** Check if the base command matches exactly */
    bool is(const char* command) const {
        return strcasecmp(_base.c_str(), command) == 0;
    }

    /** Check if command is "base subcommand" (e.g., "ovr feed") */
    bool matches(const char* base, const char* subcommand = nullptr) const {
        if (!is(base)) return false;
        if (!subcommand) return true;
        return strcasecmp(_subcommand.c_str(), subcommand) == 0;
    }

    // ---- Flag Detection ----

    /** Check if --json or -j flag is present */
    bool jsonRequested() const { return _jsonFlag; }

    /** Check for any flag (e.g., "--verbose", "-v") */
    bool hasFlag(const char* longForm, const char* shortForm = nullptr) const {
        for (const std::string& flag : _flags) {
            if (flag == longForm) return true;
            if (shortForm && flag == shortForm) return true;
        }
        return false;
    }

    // ---- Argument Access ----

    /** Get number of arguments (excluding flags, base and subcommand) */
    size_t argCount() const { return _args.size(); }

    /** Get argument by index (0-based, after command/subcommand) */
    std::string arg(size_t index) const {
        return (index < _args.size()) ? _args[index] : "";
    }

    /** Get argument as integer */
    int argInt(size_t index, int defaultVal = 0) const {
        long value = 0;
        return (index < _args.size() && toLong(_args[index], value)) ? (int)value : defaultVal;
    }

    /** Get argument as double */
    double argDouble(size_t index, double defaultVal = 0.0) const {
        double value = 0.0;
        return (index < _args.size() && toDouble(_args[index], value)) ? value : defaultVal;
    }

    /** Get the base command (first word) */
    const std::string& base() const { return _base; }

    /** Get subcommand (second word, if present) */
    const std::string& subcommand() const { return _subcommand; }

    /** All words after the base command (flags excluded) */
    const std::vector<std::string>& words() const { return _words; }

    const std::string& original() const { return _original; }

    // ---- Named Arguments ----

    /** Get the word after a keyword (e.g., "feed 1200" -> "1200") */
    std::string valueAfter(const char* keyword) const {
        for (size_t i = 0; i + 1 < _words.size(); i++) {
            if (strcasecmp(_words[i].c_str(), keyword) == 0) {
                return _words[i + 1];
            }
        }
        return "";
    }

    std::optional<double> valueAfterDouble(const char* keyword) const {
        double value = 0.0;
        if (toDouble(valueAfter(keyword), value)) return value;
        return std::nullopt;
    }

    std::optional<long> valueAfterLong(const char* keyword) const {
        long value = 0;
        if (toLong(valueAfter(keyword), value)) return value;
        return std::nullopt;
    }

    /** Check if a bare keyword is present (e.g., "abs") */
    bool hasWord(const char* keyword) const {
        for (const std::string& word : _words) {
            if (strcasecmp(word.c_str(), keyword) == 0) return true;
        }
        return false;
    }

    // ---- Conversion ----

    static bool toDouble(const std::string& text, double& out) {
        if (text.empty()) return false;
        char* end = nullptr;
        double value = strtod(text.c_str(), &end);
        if (end == text.c_str() || *end != '\0') return false;
        out = value;
        return true;
    }

    static bool toLong(const std::string& text, long& out) {
        if (text.empty()) return false;
        char* end = nullptr;
        long value = strtol(text.c_str(), &end, 10);
        if (end == text.c_str() || *end != '\0') return false;
        out = value;
        return true;
    }

private:
    static bool isFlag(const std::string& token) {
        if (token.size() < 2 || token[0] != '-') return false;
        return !(isdigit((unsigned char)token[1]) || token[1] == '.');
    }

    void parse() {
        // Split into parts
        std::vector<std::string> parts;
        size_t start = 0;
        for (size_t i = 0; i <= _original.size(); i++) {
            if (i == _original.size() || isspace((unsigned char)_original[i])) {
                if (i > start) {
                    parts.push_back(_original.substr(start, i - start));
                }
                start = i + 1;
            }
        }

        // Extract flags
        std::vector<std::string> clean;
        for (const std::string& part : parts) {
            if (isFlag(part)) {
                _flags.push_back(part);
                if (part == "--json" || part == "-j") {
                    _jsonFlag = true;
                }
            } else {
                clean.push_back(part);
            }
        }

        // Extract base command and subcommand
        if (clean.size() > 0) {
            _base = clean[0];
        }
        if (clean.size() > 1) {
            _subcommand = clean[1];
        }

        for (size_t i = 1; i < clean.size(); i++) {
            _words.push_back(clean[i]);
        }

        // Arguments are everything after base and subcommand
        for (size_t i = 2; i < clean.size(); i++) {
            _args.push_back(clean[i]);
        }
    }

    std::string _original;
    std::string _base;
    std::string _subcommand;
    std::vector<std::string> _words;
    std::vector<std::string> _args;
    std::vector<std::string> _flags;
    bool _jsonFlag = false;
};

#endif // COMMAND_PARSER_H
