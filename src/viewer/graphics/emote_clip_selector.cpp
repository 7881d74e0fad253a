#include "viewer/graphics/emote_clip_selector.h"
#include "common/util/strings.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace CVW {
namespace Graphics {

namespace {

// First name equal to one of the lowercase candidates, ignoring case
std::optional<std::string> findExact(const std::vector<std::string>& names,
                                     std::initializer_list<std::string> lowered)
{
    for (const auto& name : names) {
        const std::string l = Strings::ToLower(name);
        if (std::find(lowered.begin(), lowered.end(), l) != lowered.end()) {
            return name;
        }
    }
    return std::nullopt;
}

// Digits right after a case-insensitive prefix, empty if there are none
std::string takeNumber(const std::string& name, const std::string& loweredPrefix)
{
    if (name.size() <= loweredPrefix.size() ||
        Strings::ToLower(name.substr(0, loweredPrefix.size())) != loweredPrefix) {
        return {};
    }
    size_t end = loweredPrefix.size();
    while (end < name.size() && std::isdigit(static_cast<unsigned char>(name[end]))) {
        ++end;
    }
    return name.substr(loweredPrefix.size(), end - loweredPrefix.size());
}

} // namespace

const char* emoteTypeName(EmoteType type)
{
    switch (type) {
        case EmoteType::Joke: return "joke";
        case EmoteType::Taunt: return "taunt";
        case EmoteType::Dance: return "dance";
        case EmoteType::Laugh: return "laugh";
    }
    return "unknown";
}

std::vector<EmoteVariant> EmoteClipSelector::findEmoteVariants(const std::vector<std::string>& names,
                                                               EmoteType type)
{
    const std::string base = emoteTypeName(type);

    std::vector<std::string> takes = {""};
    for (const auto& name : names) {
        const std::string number = takeNumber(name, base);
        if (!number.empty() && std::find(takes.begin(), takes.end(), number) == takes.end()) {
            takes.push_back(number);
        }
    }

    std::vector<EmoteVariant> variants;
    for (const auto& take : takes) {
        const std::string p = base + take;
        const auto intro = findExact(names, {p + "_in", p + "_into", p + "_intro"});
        const auto loop = findExact(names, {p + "_loop"});
        const auto outro = findExact(names, {p + "_out", p + "_outro"});
        const auto main = findExact(names, {p});

        EmoteVariant v;
        if (loop) {
            v.intro = intro ? intro : main;
            v.main = *loop;
            v.loops = true;
        } else if (main) {
            v.intro = intro;
            v.main = *main;
            v.outro = outro;
        } else if (intro) {
            v.main = *intro;
            v.outro = outro;
        } else {
            continue;
        }
        variants.push_back(std::move(v));
    }
    return variants;
}

std::vector<std::pair<EmoteType, std::vector<EmoteVariant>>> EmoteClipSelector::availableEmotes(
    const std::vector<std::string>& names)
{
    std::vector<std::pair<EmoteType, std::vector<EmoteVariant>>> out;
    for (EmoteType type : {EmoteType::Joke, EmoteType::Taunt, EmoteType::Dance, EmoteType::Laugh}) {
        std::vector<EmoteVariant> variants = findEmoteVariants(names, type);
        if (!variants.empty()) {
            out.emplace_back(type, std::move(variants));
        }
    }
    return out;
}

std::vector<EmotePhase> EmoteClipSelector::phases(const EmoteVariant& variant)
{
    std::vector<EmotePhase> out;
    if (variant.intro && *variant.intro != variant.main) {
        out.push_back({*variant.intro, false});
    }
    out.push_back({variant.main, variant.loops});
    if (!variant.loops && variant.outro) {
        out.push_back({*variant.outro, false});
    }
    return out;
}

} // namespace Graphics
} // namespace CVW
