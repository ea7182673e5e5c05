#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace hoya::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item.erase(item.begin(), std::find_if(item.begin(), item.end(), [](unsigned char c) {
            return !std::isspace(c);
        }));
        item.erase(std::find_if(item.rbegin(), item.rend(), [](unsigned char c) {
            return !std::isspace(c);
        }).base(), item.end());
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

inline std::string ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return value;
}

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

// 2024-05-01T12:00:00.123Z
inline std::string FormatIso8601(std::chrono::system_clock::time_point time) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()) % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    ::gmtime_r(&seconds, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

// Replaces every invalid UTF-8 sequence with U+FFFD.
inline std::string SanitizeUtf8(std::string_view input) {
    static constexpr const char* kReplacement = "\xEF\xBF\xBD";
    std::string output;
    output.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        const auto lead = static_cast<unsigned char>(input[i]);
        std::size_t length = 0;
        unsigned int min_code = 0;
        unsigned int code = 0;
        if (lead < 0x80) {
            output.push_back(static_cast<char>(lead));
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            min_code = 0x80;
            code = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            min_code = 0x800;
            code = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            min_code = 0x10000;
            code = lead & 0x07;
        } else {
            output += kReplacement;
            ++i;
            continue;
        }
        if (i + length > input.size()) {
            output += kReplacement;
            ++i;
            continue;
        }
        bool valid = true;
        for (std::size_t j = 1; j < length; ++j) {
            const auto cont = static_cast<unsigned char>(input[i + j]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            code = (code << 6) | (cont & 0x3F);
        }
        if (!valid || code < min_code || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
            output += kReplacement;
            ++i;
            continue;
        }
        output.append(input.substr(i, length));
        i += length;
    }
    return output;
}

}  // namespace hoya::utils
