#pragma once

#include "viewer/assets/asset_family.h"
#include "viewer/assets/cancellation.h"
#include "viewer/assets/candidate_generator.h"
#include "viewer/assets/probe_resolver.h"
#include "viewer/assets/selection_context.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace CVW {
namespace Assets {

enum class ResolutionStatus {
    Idle,       // nothing selected on this axis, no network work
    Pending,
    Resolved,
    Exhausted
};

const char* resolutionStatusName(ResolutionStatus status);

struct ResolutionResult {
    uint64_t generation = 0;
    ResolutionStatus status = ResolutionStatus::Idle;
    std::optional<std::string> resolvedUrl;

    bool isSettled() const { return status != ResolutionStatus::Pending; }
};

/**
 * ResolutionStateMachine - One resolution axis (one asset family for one
 * slot of the render snapshot).
 *
 * Every submit bumps the generation and cancels the previous lookup. A
 * lookup that finishes under an older generation is dropped, so only the
 * last submitted selection can ever become visible. Submitting a context
 * equal to the current one changes nothing.
 */
class ResolutionStateMachine {
public:
    using Listener = std::function<void(const ResolutionResult&)>;

    ResolutionStateMachine(AssetFamily family, const CandidateGenerator& generator, ProbeResolver& resolver);
    ~ResolutionStateMachine();

    ResolutionStateMachine(const ResolutionStateMachine&) = delete;
    ResolutionStateMachine& operator=(const ResolutionStateMachine&) = delete;

    void submit(const SelectionContext& ctx);

    // Resolve an explicit list with no context attached.
    void submit(const CandidateList& candidates);

    // Install a URL known to be good for ctx as a new resolved generation.
    void settle(const SelectionContext& ctx, const std::string& url);

    // Back to Idle; any lookup in flight is abandoned.
    void clear();

    const ResolutionResult& current() const { return m_result; }
    const std::optional<SelectionContext>& context() const { return m_context; }
    AssetFamily family() const { return m_family; }

    // Called on every state change of the live generation.
    void setListener(Listener listener) { m_listener = std::move(listener); }

private:
    void beginGeneration();
    void startLookup(const CandidateList& candidates, const std::optional<ListingFallback>& fallback);
    void publish();

    AssetFamily m_family;
    const CandidateGenerator& m_generator;
    ProbeResolver& m_resolver;

    uint64_t m_generation = 0;
    CancelSource m_cancel;
    std::optional<SelectionContext> m_context;
    ResolutionResult m_result;
    Listener m_listener;
};

} // namespace Assets
} // namespace CVW
