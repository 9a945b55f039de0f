#include <memguard/security/scrubber.hpp>
#include <memguard/core/utils.hpp>
#include <algorithm>
#include <cctype>

namespace memguard {

const char* const PATTERN_PRIVATE_KEY = "private_key";
const char* const PATTERN_AWS_ACCESS_KEY = "aws_access_key";
const char* const PATTERN_GITHUB_TOKEN = "github_token";
const char* const PATTERN_JWT = "jwt";
const char* const PATTERN_CONNECTION_STRING = "connection_string";
const char* const PATTERN_LABELED_SECRET = "labeled_secret";
const char* const PATTERN_GENERIC_TOKEN = "generic_token";

const char* const META_SENSITIVITY = "sensitivity";
const char* const META_CONTAINS_CREDENTIALS = "contains_credentials";
const char* const META_CONTAINS_API_KEY = "contains_api_key";
const char* const META_CONTAINS_PASSWORD = "contains_password";
const char* const META_SCRUBBED_PATTERNS = "scrubbed_patterns";

namespace {

bool is_api_key_pattern(const std::string& name) {
    return name == PATTERN_AWS_ACCESS_KEY || name == PATTERN_GITHUB_TOKEN ||
           name == PATTERN_JWT || name == PATTERN_GENERIC_TOKEN;
}

bool is_password_pattern(const std::string& name) {
    return name == PATTERN_LABELED_SECRET || name == PATTERN_CONNECTION_STRING;
}

void add_unique(std::vector<std::string>& names, const std::string& name) {
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
    }
}

bool is_pem_label_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == ' ';
}

// Matches "<marker>[A-Z0-9 ]*PRIVATE KEY-----" at 'pos' and returns the
// offset just past it, or npos
size_t match_pem_line(const std::string& text, size_t pos, const std::string& marker) {
    static const std::string SUFFIX = "PRIVATE KEY";
    static const std::string DASHES = "-----";
    
    if (text.compare(pos, marker.size(), marker) != 0) {
        return std::string::npos;
    }
    size_t label = pos + marker.size();
    size_t i = label;
    while (i < text.size() && is_pem_label_char(text[i])) ++i;
    if (i - label < SUFFIX.size() ||
        text.compare(i - SUFFIX.size(), SUFFIX.size(), SUFFIX) != 0 ||
        text.compare(i, DASHES.size(), DASHES) != 0) {
        return std::string::npos;
    }
    return i + DASHES.size();
}

// BEGIN line through the first matching END line. A block with no END line
// is redacted to the end of the text.
void scan_private_keys(const std::string& text, std::vector<ScrubSpan>& spans) {
    static const std::string BEGIN = "-----BEGIN ";
    static const std::string END = "-----END ";
    
    size_t pos = text.find(BEGIN);
    while (pos != std::string::npos) {
        size_t header_end = match_pem_line(text, pos, BEGIN);
        if (header_end == std::string::npos) {
            pos = text.find(BEGIN, pos + 1);
            continue;
        }
        
        size_t block_end = text.size();
        size_t end = text.find(END, header_end);
        while (end != std::string::npos) {
            size_t footer_end = match_pem_line(text, end, END);
            if (footer_end != std::string::npos) {
                block_end = footer_end;
                break;
            }
            end = text.find(END, end + 1);
        }
        
        spans.push_back(ScrubSpan(pos, block_end));
        pos = text.find(BEGIN, block_end);
    }
}

bool is_token_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

// Runs of [A-Za-z0-9_-] at least GENERIC_TOKEN_MIN_LENGTH long that mix
// letters and digits. Leading and trailing dashes are not part of the token.
void scan_generic_tokens(const std::string& text, std::vector<ScrubSpan>& spans) {
    static const size_t GENERIC_TOKEN_MIN_LENGTH = 40;
    
    size_t i = 0;
    while (i < text.size()) {
        if (!is_token_char(text[i])) {
            ++i;
            continue;
        }
        size_t begin = i;
        while (i < text.size() && is_token_char(text[i])) ++i;
        size_t end = i;
        while (begin < end && text[begin] == '-') ++begin;
        while (end > begin && text[end - 1] == '-') --end;
        if (end - begin < GENERIC_TOKEN_MIN_LENGTH) continue;
        
        bool digit = false;
        bool alpha = false;
        for (size_t j = begin; j < end && !(digit && alpha); ++j) {
            unsigned char c = static_cast<unsigned char>(text[j]);
            if (std::isdigit(c)) digit = true;
            else if (std::isalpha(c)) alpha = true;
        }
        if (digit && alpha) {
            spans.push_back(ScrubSpan(begin, end));
        }
    }
}

} // namespace

ScrubPattern::ScrubPattern(const std::string& n, const std::string& expr,
                           const std::string& repl, const std::string& trigger_list,
                           std::regex::flag_type flags)
    : name(n)
    , replacement(repl)
    , scanner(NULL)
    , rule(expr, flags)
    , triggers(split(trigger_list, ','))
    , icase_triggers((flags & std::regex::icase) == std::regex::icase) {}

void ScrubPattern::find(const std::string& text, std::vector<ScrubSpan>& spans) const {
    if (scanner) {
        scanner(text, spans);
        return;
    }
    
    if (!triggers.empty()) {
        std::string lowered;
        if (icase_triggers) {
            lowered = to_lower(text);
        }
        const std::string& haystack = icase_triggers ? lowered : text;
        bool present = false;
        for (size_t i = 0; i < triggers.size() && !present; ++i) {
            present = haystack.find(triggers[i]) != std::string::npos;
        }
        if (!present) {
            return;
        }
    }
    
    std::sregex_iterator it(text.begin(), text.end(), rule);
    std::sregex_iterator end;
    for (; it != end; ++it) {
        size_t begin = static_cast<size_t>(it->position());
        spans.push_back(ScrubSpan(begin, begin + static_cast<size_t>(it->length())));
    }
}

std::string sensitivity_to_string(SensitivityLevel level) {
    return level == SensitivityLevel::HIGH ? "high" : "low";
}

CredentialScrubber::CredentialScrubber() {
    // Replacement tokens contain no characters any rule can consume as a secret,
    // so scrubbing its own output is a no-op.
    patterns_.push_back(ScrubPattern(PATTERN_PRIVATE_KEY, scan_private_keys,
        "[REDACTED-PRIVATE-KEY]"));
    
    patterns_.push_back(ScrubPattern(PATTERN_AWS_ACCESS_KEY,
        "\\b(?:AKIA|ASIA|AGPA|AIDA|AROA)[0-9A-Z]{16}\\b",
        "[REDACTED-AWS-KEY]",
        "AKIA,ASIA,AGPA,AIDA,AROA"));
    
    patterns_.push_back(ScrubPattern(PATTERN_GITHUB_TOKEN,
        "\\b(?:gh[pousr]_[A-Za-z0-9]{36,255}|github_pat_[A-Za-z0-9_]{22,255})\\b",
        "[REDACTED-GITHUB-TOKEN]",
        "ghp_,gho_,ghu_,ghs_,ghr_,github_pat_"));
    
    patterns_.push_back(ScrubPattern(PATTERN_JWT,
        "\\beyJ[A-Za-z0-9_-]{5,256}\\.eyJ[A-Za-z0-9_-]{5,1024}\\.[A-Za-z0-9_-]{5,512}",
        "[REDACTED-JWT]",
        "eyJ"));
    
    patterns_.push_back(ScrubPattern(PATTERN_CONNECTION_STRING,
        "\\b[A-Za-z][A-Za-z0-9+.-]{0,31}://[^\\s:/@]{1,128}:[^\\s@/]{1,256}@[^\\s/\"'<>]{1,256}",
        "[REDACTED-CONNECTION-STRING]",
        "://"));
    
    patterns_.push_back(ScrubPattern(PATTERN_LABELED_SECRET,
        "\\b(?:password|passwd|pwd|secret|secret[_-]?key|token|api[_-]?key|access[_-]?key|"
        "auth[_-]?token|client[_-]?secret|private[_-]?key)\\s{0,8}[:=]\\s{0,8}[\"']?"
        "[^\\s\"',;\\[\\]]{1,512}[\"']?",
        "[REDACTED-SECRET]",
        "passw,pwd,secret,token,key",
        std::regex::ECMAScript | std::regex::icase));
    
    patterns_.push_back(ScrubPattern(PATTERN_GENERIC_TOKEN, scan_generic_tokens,
        "[REDACTED-TOKEN]"));
}

ScrubResult CredentialScrubber::scrub(const std::string& text) const {
    ScrubResult result;
    result.text = text;
    std::vector<ScrubSpan> spans;
    for (size_t i = 0; i < patterns_.size(); ++i) {
        const ScrubPattern& p = patterns_[i];
        spans.clear();
        p.find(result.text, spans);
        if (spans.empty()) continue;
        
        std::string out;
        out.reserve(result.text.size());
        size_t last = 0;
        for (size_t j = 0; j < spans.size(); ++j) {
            out.append(result.text, last, spans[j].begin - last);
            out += p.replacement;
            last = spans[j].end;
        }
        out.append(result.text, last, std::string::npos);
        result.text.swap(out);
        result.fired.push_back(p.name);
    }
    return result;
}

namespace {

SensitivityTags tags_for(const std::vector<std::string>& fired) {
    SensitivityTags tags;
    for (size_t i = 0; i < fired.size(); ++i) {
        tags.patterns.push_back(fired[i]);
        tags.contains_credentials = true;
        if (is_api_key_pattern(fired[i])) tags.contains_api_key = true;
        if (is_password_pattern(fired[i])) tags.contains_password = true;
    }
    tags.level = tags.patterns.empty() ? SensitivityLevel::LOW : SensitivityLevel::HIGH;
    return tags;
}

} // namespace

SensitivityTags CredentialScrubber::classify_sensitivity(const std::string& text) const {
    // Same pass as scrub(), so both always agree on what fires
    return tags_for(scrub(text).fired);
}

std::vector<std::string> CredentialScrubber::scrub_record(MemoryRecord& record) const {
    ScrubResult title = scrub(record.title);
    ScrubResult content = scrub(record.content);
    record.title = title.text;
    record.content = content.text;
    
    // Catalog order, each name once
    std::vector<std::string> fired;
    for (size_t i = 0; i < patterns_.size(); ++i) {
        const std::string& name = patterns_[i].name;
        if (std::find(title.fired.begin(), title.fired.end(), name) != title.fired.end() ||
            std::find(content.fired.begin(), content.fired.end(), name) != content.fired.end()) {
            add_unique(fired, name);
        }
    }
    SensitivityTags tags = tags_for(fired);
    
    if (!record.metadata.is_object()) {
        record.metadata = Json::object();
    }
    // A record already marked high stays high
    bool high = tags.level == SensitivityLevel::HIGH || is_high_sensitivity(record);
    record.metadata.set(META_SENSITIVITY,
                        sensitivity_to_string(high ? SensitivityLevel::HIGH : SensitivityLevel::LOW));
    record.metadata.set(META_CONTAINS_CREDENTIALS,
        tags.contains_credentials || record.metadata.get_bool(META_CONTAINS_CREDENTIALS));
    record.metadata.set(META_CONTAINS_API_KEY,
        tags.contains_api_key || record.metadata.get_bool(META_CONTAINS_API_KEY));
    record.metadata.set(META_CONTAINS_PASSWORD,
        tags.contains_password || record.metadata.get_bool(META_CONTAINS_PASSWORD));
    if (!fired.empty()) {
        Json names = Json::array();
        for (size_t i = 0; i < fired.size(); ++i) {
            names.push(fired[i]);
        }
        record.metadata.set(META_SCRUBBED_PATTERNS, names);
    }
    return fired;
}

bool is_high_sensitivity(const MemoryRecord& record) {
    return record.metadata.get_string(META_SENSITIVITY) ==
           sensitivity_to_string(SensitivityLevel::HIGH);
}

} // namespace memguard
