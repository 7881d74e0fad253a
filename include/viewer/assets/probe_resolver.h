#pragma once

#include "viewer/assets/asset_prober.h"
#include "viewer/assets/cancellation.h"
#include "viewer/assets/candidate_list.h"
#include "viewer/assets/directory_lister.h"

#include <functional>
#include <optional>
#include <string>

namespace CVW {
namespace Assets {

/**
 * ProbeResolver - Walks a CandidateList strictly in order and reports the
 * first URL that exists, or nullopt once every candidate has missed.
 *
 * The token is checked before each probe and again when a probe answers.
 * Once it is cancelled the completion never runs and no further probes are
 * issued; an answer already in flight is discarded.
 *
 * With a lister and a ListingFallback, a fully missed list is followed by
 * one directory listing. Listed files are taken as existing without a probe.
 */
class ProbeResolver {
public:
    using Completion = std::function<void(std::optional<std::string>)>;

    explicit ProbeResolver(IAssetProber& prober, IDirectoryLister* lister = nullptr)
        : m_prober(prober), m_lister(lister) {}

    void resolve(const CandidateList& candidates, CancelToken token, Completion done);
    void resolve(const CandidateList& candidates, const std::optional<ListingFallback>& fallback,
                 CancelToken token, Completion done);

    bool canList() const { return m_lister != nullptr; }

private:
    IAssetProber& m_prober;
    IDirectoryLister* m_lister;
};

} // namespace Assets
} // namespace CVW
