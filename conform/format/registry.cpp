#include "registry.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "conform/error/exception.hpp"
#include "conform/log/logger.hpp"

namespace conform::format {

namespace {
constexpr const char* kIpv4Pattern =
    R"((?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3}(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?))";

// IPv6 in all its compressed forms, with an optional embedded IPv4 tail.
auto ipv6Pattern() -> std::string {
    const std::string h = "[0-9a-fA-F]{1,4}";
    const std::string v4 = kIpv4Pattern;
    return "^(?:"
           "(?:" + h + ":){7}" + h +
           "|(?:" + h + ":){1,7}:"
           "|(?:" + h + ":){1,6}:" + h +
           "|(?:" + h + ":){1,5}(?::" + h + "){1,2}"
           "|(?:" + h + ":){1,4}(?::" + h + "){1,3}"
           "|(?:" + h + ":){1,3}(?::" + h + "){1,4}"
           "|(?:" + h + ":){1,2}(?::" + h + "){1,5}"
           "|" + h + ":(?::" + h + "){1,6}"
           "|:(?:(?::" + h + "){1,7}|:)"
           "|(?:" + h + ":){6}" + v4 +
           "|::(?:ffff(?::0{1,4})?:)?" + v4 +
           "|(?:" + h + ":){1,4}:" + v4 +
           ")$";
}
}  // namespace

auto Format::matches(std::string_view text) const -> bool {
    if (text.size() > max_length) {
        return false;
    }
    return std::regex_search(text.begin(), text.end(), pattern);
}

FormatRegistry::FormatRegistry() {
    add("date-time",
        R"(^\d{4}-\d\d-\d\d[Tt ]\d\d:\d\d:\d\d(\.\d+)?([Zz]|[+-]\d\d:\d\d)?$)",
        64);
    add("date", R"(^\d{4}-\d\d-\d\d$)", 10);
    add("time", R"(^\d\d:\d\d:\d\d(\.\d+)?$)", 32);
    add("email", R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)", 254);
    add("hostname",
        R"(^[a-zA-Z0-9](?:[a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?(?:\.[a-zA-Z0-9](?:[a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?)*$)",
        253);
    add("ipv4", std::string("^") + kIpv4Pattern + "$", 15);
    add("ipv6", ipv6Pattern(), 45);
    add("uri",
        R"(^[a-zA-Z][a-zA-Z0-9+.-]*:(?:[a-zA-Z0-9\-._~!$&'()*+,;=:@/?#\[\]]|%[0-9a-fA-F]{2})*$)",
        4096);
    add("uuid",
        R"(^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$)",
        36);

    log::getLogger()->debug("Format registry initialized with {} formats",
                            formats_.size());
}

void FormatRegistry::add(std::string name, const std::string& pattern,
                         std::size_t maxLength) {
    formats_.emplace(std::move(name), Format{std::regex(pattern), maxLength});
}

auto FormatRegistry::instance() -> const FormatRegistry& {
    static const FormatRegistry registry;
    return registry;
}

auto FormatRegistry::find(std::string_view name) const noexcept
    -> const Format* {
    auto it = formats_.find(std::string(name));
    return it == formats_.end() ? nullptr : &it->second;
}

auto FormatRegistry::contains(std::string_view name) const noexcept -> bool {
    return find(name) != nullptr;
}

auto FormatRegistry::matches(std::string_view name,
                             std::string_view text) const -> bool {
    const Format* format = find(name);
    if (format == nullptr) {
        THROW_INVALID_ARGUMENT("Unknown format: {}", name);
    }
    return format->matches(text);
}

auto FormatRegistry::names() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(formats_.size());
    for (const auto& [key, format] : formats_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

}  // namespace conform::format
