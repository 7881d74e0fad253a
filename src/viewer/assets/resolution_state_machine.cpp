#include "viewer/assets/resolution_state_machine.h"
#include "common/logging.h"

namespace CVW {
namespace Assets {

const char* resolutionStatusName(ResolutionStatus status)
{
    switch (status) {
        case ResolutionStatus::Idle: return "idle";
        case ResolutionStatus::Pending: return "pending";
        case ResolutionStatus::Resolved: return "resolved";
        case ResolutionStatus::Exhausted: return "exhausted";
    }
    return "unknown";
}

ResolutionStateMachine::ResolutionStateMachine(AssetFamily family, const CandidateGenerator& generator,
                                               ProbeResolver& resolver)
    : m_family(family), m_generator(generator), m_resolver(resolver)
{
}

ResolutionStateMachine::~ResolutionStateMachine()
{
    m_cancel.cancel();
}

void ResolutionStateMachine::beginGeneration()
{
    m_cancel.cancel();
    m_cancel = CancelSource();
    ++m_generation;
    m_result = ResolutionResult{};
    m_result.generation = m_generation;
}

void ResolutionStateMachine::submit(const SelectionContext& ctx)
{
    if (m_context && *m_context == ctx) {
        return;
    }

    beginGeneration();
    m_context = ctx;

    if (!ctx.hasSelectedVariant()) {
        LOG_TRACE(MOD_RESOLVE, "{} gen {}: nothing selected for {}", assetFamilyName(m_family),
                  m_generation, describe(ctx));
        m_result.status = ResolutionStatus::Idle;
        publish();
        return;
    }

    startLookup(m_generator.generate(ctx, m_family), m_generator.listingFallback(ctx, m_family));
}

void ResolutionStateMachine::submit(const CandidateList& candidates)
{
    beginGeneration();
    m_context.reset();
    startLookup(candidates, std::nullopt);
}

void ResolutionStateMachine::startLookup(const CandidateList& candidates,
                                         const std::optional<ListingFallback>& fallback)
{
    const bool canList = fallback.has_value() && m_resolver.canList();
    if (candidates.empty() && !canList) {
        LOG_DEBUG(MOD_RESOLVE, "{} gen {}: no candidates", assetFamilyName(m_family), m_generation);
        m_result.status = ResolutionStatus::Exhausted;
        publish();
        return;
    }

    m_result.status = ResolutionStatus::Pending;
    publish();

    const uint64_t generation = m_generation;
    m_resolver.resolve(candidates, canList ? fallback : std::nullopt, m_cancel.token(),
                       [this, generation](std::optional<std::string> url) {
        if (generation != m_generation) {
            LOG_TRACE(MOD_RESOLVE, "{}: dropping result of stale gen {} (live {})",
                      assetFamilyName(m_family), generation, m_generation);
            return;
        }
        if (url) {
            LOG_DEBUG(MOD_RESOLVE, "{} gen {}: resolved {}", assetFamilyName(m_family), generation, *url);
            m_result.status = ResolutionStatus::Resolved;
            m_result.resolvedUrl = std::move(url);
        } else {
            LOG_DEBUG(MOD_RESOLVE, "{} gen {}: exhausted", assetFamilyName(m_family), generation);
            m_result.status = ResolutionStatus::Exhausted;
        }
        publish();
    });
}

void ResolutionStateMachine::settle(const SelectionContext& ctx, const std::string& url)
{
    beginGeneration();
    m_context = ctx;
    m_result.status = ResolutionStatus::Resolved;
    m_result.resolvedUrl = url;
    LOG_TRACE(MOD_RESOLVE, "{} gen {}: settled {}", assetFamilyName(m_family), m_generation, url);
    publish();
}

void ResolutionStateMachine::clear()
{
    beginGeneration();
    m_context.reset();
    publish();
}

void ResolutionStateMachine::publish()
{
    if (m_listener) {
        m_listener(m_result);
    }
}

} // namespace Assets
} // namespace CVW
