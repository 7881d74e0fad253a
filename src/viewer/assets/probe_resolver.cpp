#include "viewer/assets/probe_resolver.h"
#include "common/logging.h"

#include <memory>

namespace CVW {
namespace Assets {

namespace {

struct ProbeChain : std::enable_shared_from_this<ProbeChain> {
    IAssetProber* prober = nullptr;
    IDirectoryLister* lister = nullptr;
    std::optional<ListingFallback> fallback;
    std::vector<std::string> urls;
    size_t index = 0;
    CancelToken token;
    ProbeResolver::Completion done;

    void step()
    {
        if (token.isCancelled()) {
            LOG_TRACE(MOD_PROBE, "Probe chain cancelled at candidate {}", index);
            return;
        }
        if (index >= urls.size()) {
            if (lister && fallback && fallback->pick) {
                list();
                return;
            }
            LOG_DEBUG(MOD_PROBE, "All {} candidates missed", urls.size());
            done(std::nullopt);
            return;
        }

        auto self = shared_from_this();
        const std::string url = urls[index];
        prober->probe(url, [self, url](ProbeOutcome outcome) {
            if (self->token.isCancelled()) {
                LOG_TRACE(MOD_PROBE, "Discarding answer for {} from a cancelled chain", url);
                return;
            }
            if (outcome == ProbeOutcome::Found) {
                self->done(url);
                return;
            }
            LOG_TRACE(MOD_PROBE, "Miss {}", url);
            ++self->index;
            self->step();
        });
    }

    void list()
    {
        LOG_DEBUG(MOD_PROBE, "All {} candidates missed, listing {}", urls.size(), fallback->directoryUrl);
        auto self = shared_from_this();
        lister->list(fallback->directoryUrl, [self](std::vector<std::string> files) {
            if (self->token.isCancelled()) {
                LOG_TRACE(MOD_PROBE, "Discarding listing of {} for a cancelled chain", self->fallback->directoryUrl);
                return;
            }
            std::optional<std::string> file = self->fallback->pick(files);
            if (!file) {
                LOG_DEBUG(MOD_PROBE, "Nothing usable among {} listed files", files.size());
                self->done(std::nullopt);
                return;
            }
            self->done(self->fallback->directoryUrl + *file);
        });
    }
};

} // namespace

void ProbeResolver::resolve(const CandidateList& candidates, CancelToken token, Completion done)
{
    resolve(candidates, std::nullopt, std::move(token), std::move(done));
}

void ProbeResolver::resolve(const CandidateList& candidates, const std::optional<ListingFallback>& fallback,
                            CancelToken token, Completion done)
{
    auto chain = std::make_shared<ProbeChain>();
    chain->prober = &m_prober;
    chain->lister = m_lister;
    chain->fallback = fallback;
    chain->urls = candidates.urls();
    chain->token = std::move(token);
    chain->done = std::move(done);
    chain->step();
}

} // namespace Assets
} // namespace CVW
