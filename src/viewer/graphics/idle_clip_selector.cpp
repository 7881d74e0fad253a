#include "viewer/graphics/idle_clip_selector.h"
#include "common/util/strings.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

namespace CVW {
namespace Graphics {

namespace {

const std::regex& anmSuffix()
{
    static const std::regex re("\\.anm$", std::regex::icase);
    return re;
}

const std::regex& loopSuffix()
{
    static const std::regex re("_loop(\\.anm)?$", std::regex::icase);
    return re;
}

// Most preferred first. The order is part of the behavior.
const std::vector<std::regex>& idlePatterns()
{
    static const std::vector<std::regex> patterns = {
        std::regex("^idle_?base(\\.anm)?$", std::regex::icase),
        std::regex("^idle\\d?_base(\\.anm)?$", std::regex::icase),
        std::regex("^idle_?1(\\.anm)?$", std::regex::icase),
        std::regex("^idle_?01(\\.anm)?$", std::regex::icase),
        std::regex("(?:^|_)idle_?01_loop(\\.anm)?$", std::regex::icase),
        std::regex("idle_loop(\\.anm)?$", std::regex::icase),
        std::regex("(?:^|_)idle(?:\\d{0,2})?(\\.anm)?$", std::regex::icase),
        std::regex("idle", std::regex::icase),
    };
    return patterns;
}

std::optional<std::string> firstByPattern(const std::vector<std::string>& names)
{
    for (const auto& pattern : idlePatterns()) {
        for (const auto& name : names) {
            if (std::regex_search(name, pattern)) {
                return name;
            }
        }
    }
    return std::nullopt;
}

} // namespace

bool IdleClipSelector::isIdleClip(const std::string& name)
{
    static const std::regex idle("idle", std::regex::icase);
    static const std::regex idleIn("idle[_-]?in\\d*(?:[_-]|$)", std::regex::icase);
    static const std::regex toState("[_-]to[_-]|to[_-]idle", std::regex::icase);

    const std::string stem = std::regex_replace(name, anmSuffix(), "");
    if (!std::regex_search(stem, idle)) {
        return false;
    }
    if (std::regex_search(stem, idleIn)) {
        return false;
    }
    return !std::regex_search(stem, toState);
}

std::optional<std::string> IdleClipSelector::findIdleName(const std::vector<std::string>& names,
                                                          const std::optional<std::string>& preferred)
{
    std::vector<std::string> wanted;
    if (preferred) {
        wanted.push_back(*preferred);
    }
    return findIdleName(names, wanted);
}

std::optional<std::string> IdleClipSelector::findIdleName(const std::vector<std::string>& names,
                                                          const std::vector<std::string>& preferred)
{
    for (const auto& name : preferred) {
        if (std::find(names.begin(), names.end(), name) != names.end()) {
            return name;
        }
    }

    std::vector<std::string> idles;
    std::copy_if(names.begin(), names.end(), std::back_inserter(idles), &IdleClipSelector::isIdleClip);
    if (!idles.empty()) {
        if (auto match = firstByPattern(idles)) {
            return match;
        }
        return idles.front();
    }

    if (auto match = firstByPattern(names)) {
        return match;
    }
    if (!names.empty()) {
        return names.front();
    }
    return std::nullopt;
}

std::vector<std::string> IdleClipSelector::findAllIdleNames(const std::vector<std::string>& names)
{
    std::vector<std::string> idles;
    std::copy_if(names.begin(), names.end(), std::back_inserter(idles), &IdleClipSelector::isIdleClip);
    if (idles.empty()) {
        static const std::regex startsIdle("^idle", std::regex::icase);
        for (const auto& n : names) {
            if (std::regex_search(n, startsIdle)) {
                idles.push_back(n);
            }
        }
    }
    if (idles.empty()) {
        return {};
    }

    std::set<std::string> looped;
    for (const auto& n : idles) {
        if (std::regex_search(n, loopSuffix())) {
            looped.insert(Strings::ToLower(std::regex_replace(n, loopSuffix(), "")));
        }
    }

    std::vector<std::string> filtered;
    for (const auto& n : idles) {
        if (std::regex_search(n, loopSuffix()) ||
            looped.count(Strings::ToLower(std::regex_replace(n, anmSuffix(), ""))) == 0) {
            filtered.push_back(n);
        }
    }

    std::sort(filtered.begin(), filtered.end(), &IdleClipSelector::naturalLess);
    return filtered.empty() ? idles : filtered;
}

bool IdleClipSelector::naturalLess(const std::string& a, const std::string& b)
{
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        const unsigned char ca = static_cast<unsigned char>(a[i]);
        const unsigned char cb = static_cast<unsigned char>(b[j]);

        if (std::isdigit(ca) && std::isdigit(cb)) {
            size_t ei = i;
            size_t ej = j;
            while (ei < a.size() && std::isdigit(static_cast<unsigned char>(a[ei]))) ++ei;
            while (ej < b.size() && std::isdigit(static_cast<unsigned char>(b[ej]))) ++ej;

            std::string na = a.substr(i, ei - i);
            std::string nb = b.substr(j, ej - j);
            na.erase(0, std::min(na.find_first_not_of('0'), na.size()));
            nb.erase(0, std::min(nb.find_first_not_of('0'), nb.size()));
            if (na.size() != nb.size()) {
                return na.size() < nb.size();
            }
            if (na != nb) {
                return na < nb;
            }
            i = ei;
            j = ej;
            continue;
        }

        const int la = std::tolower(ca);
        const int lb = std::tolower(cb);
        if (la != lb) {
            return la < lb;
        }
        ++i;
        ++j;
    }
    return (a.size() - i) < (b.size() - j);
}

} // namespace Graphics
} // namespace CVW
