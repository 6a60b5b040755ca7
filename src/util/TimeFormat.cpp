#include "TimeFormat.hpp"
#include <algorithm>
#include <charconv>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace babel::timefmt {

std::string formatTimestamp(Duration t) {
    i64 n = std::max<i64>(0, t.count());
    return fmt::format("{}:{:02}:{:02}.{:03}",
                       n / 3'600'000,
                       (n / 60'000) % 60,
                       (n / 1'000) % 60,
                       n % 1'000);
}

std::string formatTotal(std::optional<Duration> t) {
    if (!t)
        return "???";
    return formatTimestamp(*t);
}

namespace {
bool parseInt(std::string_view s, i64& out) {
    if (s.empty())
        return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size() && out >= 0;
}
} // namespace

std::optional<Duration> parseTimestamp(std::string_view text) {
    while (!text.empty() && text.front() == ' ')
        text.remove_prefix(1);
    while (!text.empty() && text.back() == ' ')
        text.remove_suffix(1);
    if (text.empty())
        return std::nullopt;

    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        auto pos = text.find(':', start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    if (parts.size() > 3)
        return std::nullopt;

    std::string_view secPart = parts.back();
    i64 millis = 0;
    if (auto dot = secPart.find('.'); dot != std::string_view::npos) {
        auto frac = secPart.substr(dot + 1);
        secPart = secPart.substr(0, dot);
        if (frac.empty() || frac.size() > 3 || !parseInt(frac, millis))
            return std::nullopt;
        for (size_t i = frac.size(); i < 3; ++i)
            millis *= 10;
    }

    i64 seconds = 0;
    if (!parseInt(secPart, seconds))
        return std::nullopt;

    i64 total = seconds * 1000 + millis;
    i64 scale = 60'000;
    for (int i = static_cast<int>(parts.size()) - 2; i >= 0; --i) {
        i64 v = 0;
        if (!parseInt(parts[i], v))
            return std::nullopt;
        total += v * scale;
        scale *= 60;
    }
    return Duration(total);
}

MinSecMs split(Duration t) {
    i64 n = std::max<i64>(0, t.count());
    return {n / 60'000, (n / 1'000) % 60, n % 1'000};
}

Duration join(const MinSecMs& parts) {
    return Duration(parts.minutes * 60'000 + parts.seconds * 1'000 +
                    parts.millis);
}

std::string formatMiB(u64 bytes) {
    return fmt::format("{:.2f} MiB",
                       static_cast<f64>(bytes) / (1024.0 * 1024.0));
}

} // namespace babel::timefmt
