#pragma once

#include "viewer/assets/asset_catalog.h"
#include "viewer/assets/asset_family.h"
#include "viewer/assets/asset_urls.h"
#include "viewer/assets/candidate_list.h"
#include "viewer/assets/directory_lister.h"
#include "viewer/assets/selection_context.h"

namespace CVW {
namespace Assets {

/**
 * CandidateGenerator - Turns a selection into the ordered list of URLs that
 * may hold the requested asset, most specific first.
 *
 * Pure and synchronous: the same context and family always give the same
 * list. A context that does not carry the variant a family needs (a chroma
 * family without a chroma, a companion family without a companion) gives an
 * empty list.
 */
class CandidateGenerator {
public:
    CandidateGenerator(const AssetCatalog& catalog, const AssetUrls& urls)
        : m_catalog(catalog), m_urls(urls) {}

    CandidateList generate(const SelectionContext& ctx, AssetFamily family) const;

    // Directory to list when every candidate misses. Only chroma families
    // have one.
    std::optional<ListingFallback> listingFallback(const SelectionContext& ctx, AssetFamily family) const;

    // Plain model URL with no probing, used for the default model.
    std::string modelUrl(const std::string& alias, uint32_t skinId) const;

    const AssetCatalog& catalog() const { return m_catalog; }
    const AssetUrls& urls() const { return m_urls; }

private:
    void chromaCandidates(CandidateList& out, const std::string& alias, uint32_t chromaId) const;
    void aliasModelCandidates(CandidateList& out, const std::vector<std::string>& aliases,
                              uint32_t skinId) const;
    void artCandidates(CandidateList& out, const SelectionContext& ctx, const std::string& primary,
                       const std::string& mirror) const;

    const AssetCatalog& m_catalog;
    const AssetUrls& m_urls;
};

} // namespace Assets
} // namespace CVW
