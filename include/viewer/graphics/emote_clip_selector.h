#ifndef CVW_GRAPHICS_EMOTE_CLIP_SELECTOR_H
#define CVW_GRAPHICS_EMOTE_CLIP_SELECTOR_H

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace CVW {
namespace Graphics {

enum class EmoteType { Joke, Taunt, Dance, Laugh };

const char* emoteTypeName(EmoteType type);

/**
 * One playable take of an emote. A looping take plays its intro once and
 * then repeats main until stopped; a one-shot plays intro, main and outro
 * once each and hands back to idle.
 */
struct EmoteVariant {
    std::optional<std::string> intro;
    std::string main;
    std::optional<std::string> outro;
    bool loops = false;

    bool operator==(const EmoteVariant& other) const
    {
        return intro == other.intro && main == other.main && outro == other.outro && loops == other.loops;
    }
};

struct EmotePhase {
    std::string clip;
    bool loop = false;
};

/**
 * Finds emote clips among a model's clip names.
 *
 * For "joke" the takes are "Joke", "Joke2", "Joke3"... and each take may
 * come as "{take}_In"/"_Into"/"_Intro", "{take}_Loop", "{take}_Out"/"_Outro"
 * or the bare "{take}". Matching is case-insensitive and exact; clips keep
 * their original spelling.
 */
class EmoteClipSelector {
public:
    // Takes in the order their numbers first appear, the bare take first
    static std::vector<EmoteVariant> findEmoteVariants(const std::vector<std::string>& names, EmoteType type);

    // Emote types with at least one take, in Joke, Taunt, Dance, Laugh order
    static std::vector<std::pair<EmoteType, std::vector<EmoteVariant>>> availableEmotes(
        const std::vector<std::string>& names);

    // Clips to play in order. A distinct intro comes first; a looping take
    // ends on its repeating main and never plays the outro.
    static std::vector<EmotePhase> phases(const EmoteVariant& variant);
};

} // namespace Graphics
} // namespace CVW

#endif // CVW_GRAPHICS_EMOTE_CLIP_SELECTOR_H
