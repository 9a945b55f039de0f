/*
 * memguard - Credential Scrubber
 * 
 * Redacts secrets from text using a fixed, built-in catalog of patterns.
 * Patterns run in catalog order; more specific shapes come before the
 * generic long-token detector so they claim their matches first.
 * 
 * Unbounded shapes (PEM blocks, long opaque tokens) are matched by linear
 * scanners and the regex rules use bounded repetition, so stack use does
 * not grow with the size of the record.
 */
#ifndef MEMGUARD_SECURITY_SCRUBBER_HPP
#define MEMGUARD_SECURITY_SCRUBBER_HPP

#include <memguard/memory/types.hpp>
#include <cstddef>
#include <string>
#include <vector>
#include <regex>

namespace memguard {

// Half-open byte range [begin, end) of a match
struct ScrubSpan {
    size_t begin;
    size_t end;
    
    ScrubSpan(size_t b, size_t e) : begin(b), end(e) {}
};

// Appends non-overlapping spans in ascending order
typedef void (*ScrubScanner)(const std::string& text, std::vector<ScrubSpan>& spans);

// A catalog entry is either a linear scanner or a regex. Regex rules only use
// bounded repetition, and only run when one of their trigger literals occurs
// in the text.
struct ScrubPattern {
    std::string name;
    std::string replacement;
    ScrubScanner scanner;
    std::regex rule;
    std::vector<std::string> triggers;
    bool icase_triggers;
    
    ScrubPattern(const std::string& n, ScrubScanner scan, const std::string& repl)
        : name(n), replacement(repl), scanner(scan), icase_triggers(false) {}
    
    // 'trigger_list' is comma separated
    ScrubPattern(const std::string& n, const std::string& expr, const std::string& repl,
                 const std::string& trigger_list,
                 std::regex::flag_type flags = std::regex::ECMAScript);
    
    void find(const std::string& text, std::vector<ScrubSpan>& spans) const;
};

struct ScrubResult {
    std::string text;
    std::vector<std::string> fired;   // Pattern names in catalog order, each at most once
    
    bool changed() const { return !fired.empty(); }
};

enum class SensitivityLevel {
    LOW,
    HIGH
};

struct SensitivityTags {
    bool contains_credentials;
    bool contains_api_key;
    bool contains_password;
    SensitivityLevel level;
    std::vector<std::string> patterns;
    
    SensitivityTags()
        : contains_credentials(false)
        , contains_api_key(false)
        , contains_password(false)
        , level(SensitivityLevel::LOW) {}
};

// Pattern names in the built-in catalog
extern const char* const PATTERN_PRIVATE_KEY;
extern const char* const PATTERN_AWS_ACCESS_KEY;
extern const char* const PATTERN_GITHUB_TOKEN;
extern const char* const PATTERN_JWT;
extern const char* const PATTERN_CONNECTION_STRING;
extern const char* const PATTERN_LABELED_SECRET;
extern const char* const PATTERN_GENERIC_TOKEN;

// Metadata keys written by scrub_record()
extern const char* const META_SENSITIVITY;
extern const char* const META_CONTAINS_CREDENTIALS;
extern const char* const META_CONTAINS_API_KEY;
extern const char* const META_CONTAINS_PASSWORD;
extern const char* const META_SCRUBBED_PATTERNS;

class CredentialScrubber {
public:
    // Compiles the built-in catalog
    CredentialScrubber();
    
    ScrubResult scrub(const std::string& text) const;
    
    // Reports what scrub() would find without changing anything
    SensitivityTags classify_sensitivity(const std::string& text) const;
    
    // Classifies title+content, redacts both and writes the tags into metadata.
    // Returns the names of the patterns that fired.
    std::vector<std::string> scrub_record(MemoryRecord& record) const;
    
    const std::vector<ScrubPattern>& patterns() const { return patterns_; }

private:
    std::vector<ScrubPattern> patterns_;
};

// True when the record's metadata marks it sensitivity-high
bool is_high_sensitivity(const MemoryRecord& record);

std::string sensitivity_to_string(SensitivityLevel level);

} // namespace memguard

#endif // MEMGUARD_SECURITY_SCRUBBER_HPP
