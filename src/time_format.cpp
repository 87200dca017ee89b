#include "time_format.h"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace runscope {

namespace {

// Splits off a trailing "Z" or "+HH:MM"/"-HH:MM"; returns the offset east of UTC in seconds.
auto StripZone(std::string& s) -> std::optional<long> {
    if (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) {
        s.pop_back();
        return 0;
    }
    if (s.size() > 6) {
        auto tail = s.substr(s.size() - 6);
        if ((tail[0] == '+' || tail[0] == '-') && tail[3] == ':' && std::isdigit(static_cast<unsigned char>(tail[1])) &&
            std::isdigit(static_cast<unsigned char>(tail[2])) && std::isdigit(static_cast<unsigned char>(tail[4])) &&
            std::isdigit(static_cast<unsigned char>(tail[5]))) {
            long hours = std::stol(tail.substr(1, 2));
            long minutes = std::stol(tail.substr(4, 2));
            if (hours > 23 || minutes > 59) {
                return std::nullopt;
            }
            s.erase(s.size() - 6);
            long offset = hours * 3600 + minutes * 60;
            return tail[0] == '+' ? offset : -offset;
        }
    }
    return 0;
}

} // namespace

auto ParseIsoTime(const std::string& iso) -> std::optional<std::chrono::system_clock::time_point> {
    if (iso.size() < 19) {
        return std::nullopt;
    }
    std::string trimmed = iso;
    auto offset = StripZone(trimmed);
    if (!offset.has_value()) {
        return std::nullopt;
    }
    auto dot = trimmed.find('.', 19);
    if (dot != std::string::npos) {
        trimmed.erase(dot);
    }
    if (trimmed.size() != 19 || (trimmed[10] != 'T' && trimmed[10] != ' ')) {
        return std::nullopt;
    }
    trimmed[10] = 'T';

    std::tm tm{};
    std::istringstream ss(trimmed);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
#if defined(_WIN32)
    std::time_t tt = _mkgmtime(&tm);
#else
    std::time_t tt = timegm(&tm);
#endif
    return std::chrono::system_clock::from_time_t(tt) - std::chrono::seconds(*offset);
}

auto FormatIsoTime(std::chrono::system_clock::time_point tp) -> std::string {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}Z", tm);
}

} // namespace runscope
