#ifndef CVW_GRAPHICS_IDLE_CLIP_SELECTOR_H
#define CVW_GRAPHICS_IDLE_CLIP_SELECTOR_H

#include <optional>
#include <string>
#include <vector>

namespace CVW {
namespace Graphics {

/**
 * Picks idle animation clips out of the clip names a model ships with.
 *
 * Names are matched case-insensitively with an optional ".anm" suffix.
 * Transitions into idle ("Idle_In", "Idle-In2", "Run_to_Idle", "Idle-to-Run") are never
 * idle clips.
 */
class IdleClipSelector {
public:
    static bool isIdleClip(const std::string& name);

    // Best idle clip: preferred (exact name) if present, then the ranked
    // pattern table over idle clips, then the first idle clip, then the
    // table over every clip, then the first clip. nullopt only when there
    // are no clips at all.
    static std::optional<std::string> findIdleName(const std::vector<std::string>& names,
                                                   const std::optional<std::string>& preferred = std::nullopt);

    // Same, trying each preferred name in order before the pattern table
    static std::optional<std::string> findIdleName(const std::vector<std::string>& names,
                                                   const std::vector<std::string>& preferred);

    // Every distinct idle clip for cycling, naturally sorted. When both "X"
    // and "X_Loop" exist only the loop is listed.
    static std::vector<std::string> findAllIdleNames(const std::vector<std::string>& names);

    // Case-insensitive comparison that orders digit runs by value
    static bool naturalLess(const std::string& a, const std::string& b);
};

} // namespace Graphics
} // namespace CVW

#endif // CVW_GRAPHICS_IDLE_CLIP_SELECTOR_H
