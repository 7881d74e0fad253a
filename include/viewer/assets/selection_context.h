#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace CVW {
namespace Assets {

/**
 * SubjectRef - A catalog entry: the string id ("Annie", "MonkeyKing") and
 * the numeric key (1, 62). The alias used in asset paths is the lower-cased id.
 */
struct SubjectRef {
    std::string id;
    uint32_t key = 0;

    std::string alias() const;
    bool empty() const { return id.empty(); }

    bool operator==(const SubjectRef& other) const { return id == other.id && key == other.key; }
    bool operator!=(const SubjectRef& other) const { return !(*this == other); }
};

// skinId = key * 1000 + skinNumber
inline uint32_t makeSkinId(uint32_t key, uint32_t skinNumber) { return key * 1000 + skinNumber; }
inline uint32_t skinNumberOf(uint32_t skinId) { return skinId % 1000; }
inline uint32_t baseSkinIdOf(uint32_t skinId) { return skinId - skinId % 1000; }

// ========== Variant axis ==========

struct NoVariant {
    bool operator==(const NoVariant&) const { return true; }
};

struct ChromaVariant {
    uint32_t chromaId = 0;
    bool operator==(const ChromaVariant& o) const { return chromaId == o.chromaId; }
};

struct AlternateFormVariant {
    bool active = false;
    bool operator==(const AlternateFormVariant& o) const { return active == o.active; }
};

// Index into the subject's configured version list (0-based). The viewer's
// "current model" slot is represented by NoVariant, not by an index.
struct HistoricalVersionVariant {
    uint32_t index = 0;
    bool operator==(const HistoricalVersionVariant& o) const { return index == o.index; }
};

struct ExtraModelVariant {
    std::vector<std::string> aliases;
    bool operator==(const ExtraModelVariant& o) const { return aliases == o.aliases; }
};

using VariantAxis = std::variant<NoVariant, ChromaVariant, AlternateFormVariant,
                                 HistoricalVersionVariant, ExtraModelVariant>;

/**
 * SelectionContext - Immutable description of what one resolution axis should
 * look for. Two contexts are the same request exactly when every field is equal.
 */
struct SelectionContext {
    SubjectRef subject;
    uint32_t skinId = 0;
    VariantAxis variant = NoVariant{};
    std::optional<std::string> companionAlias;

    uint32_t skinNumber() const { return skinNumberOf(skinId); }
    uint32_t baseSkinId() const { return baseSkinIdOf(skinId); }

    bool empty() const { return subject.empty(); }

    // True when the variant axis selects something that needs resolving.
    // A chroma, an active alternate form, a version or an alias set does;
    // NoVariant and an inactive form do not.
    bool hasSelectedVariant() const;

    bool operator==(const SelectionContext& other) const {
        return subject == other.subject && skinId == other.skinId &&
               variant == other.variant && companionAlias == other.companionAlias;
    }
    bool operator!=(const SelectionContext& other) const { return !(*this == other); }
};

std::string describe(const SelectionContext& ctx);

} // namespace Assets
} // namespace CVW
