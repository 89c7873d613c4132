#include "excelcsv/core/DateWhitelist.hpp"
#include "excelcsv/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace excelcsv {
namespace core {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n\v\f");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n\v\f");
    return text.substr(start, end - start + 1);
}

std::vector<std::string> splitTokens(const std::string& text) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (true) {
        size_t comma = text.find(',', start);
        tokens.push_back(trim(text.substr(start, comma == std::string::npos ? std::string::npos : comma - start)));
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return tokens;
}

} // namespace

DateWhitelist DateWhitelist::parse(const std::string& raw) {
    const std::string normalized = toLower(raw);
    const std::string whole = trim(normalized);

    if (whole == "all") {
        CORE_DEBUG("Date whitelist mode: all");
        return DateWhitelist(Mode::All, {});
    }
    if (whole == "none") {
        CORE_DEBUG("Date whitelist mode: none");
        return DateWhitelist(Mode::None, {});
    }

    std::vector<std::string> tokens = splitTokens(normalized);

    bool all_indices = std::all_of(tokens.begin(), tokens.end(), isColumnIndexToken);
    if (all_indices) {
        std::sort(tokens.begin(), tokens.end());
        CORE_DEBUG("Date whitelist mode: column indices ({} entries)", tokens.size());
        return DateWhitelist(Mode::IndexSet, std::move(tokens));
    }

    CORE_DEBUG("Date whitelist mode: header patterns ({} entries)", tokens.size());
    return DateWhitelist(Mode::PatternSet, std::move(tokens));
}

std::vector<bool> DateWhitelist::classify(const std::vector<std::string>& header) const {
    std::vector<bool> flags(header.size(), false);

    switch (mode_) {
        case Mode::All:
            std::fill(flags.begin(), flags.end(), true);
            break;

        case Mode::None:
            break;

        case Mode::IndexSet:
            for (size_t col = 0; col < header.size(); ++col) {
                // 集合按字符串排序，查找键同样使用字符串
                flags[col] = std::binary_search(tokens_.begin(), tokens_.end(), std::to_string(col));
            }
            break;

        case Mode::PatternSet:
            for (size_t col = 0; col < header.size(); ++col) {
                const std::string lowered = toLower(header[col]);
                for (const auto& pattern : tokens_) {
                    if (lowered.find(pattern) != std::string::npos) {
                        CORE_INFO("Date column {} \"{}\" matched whitelist pattern \"{}\"", col, header[col], pattern);
                        flags[col] = true;
                        break;
                    }
                }
            }
            break;
    }

    return flags;
}

const char* DateWhitelist::modeName(Mode mode) noexcept {
    switch (mode) {
        case Mode::All:        return "all";
        case Mode::None:       return "none";
        case Mode::IndexSet:   return "index-set";
        case Mode::PatternSet: return "pattern-set";
    }
    return "unknown";
}

bool DateWhitelist::isColumnIndexToken(const std::string& token) noexcept {
    if (token.empty() || token.size() > 5) {
        return false;
    }
    uint32_t value = 0;
    for (char c : token) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }
    return value <= 65535;
}

}} // namespace excelcsv::core
