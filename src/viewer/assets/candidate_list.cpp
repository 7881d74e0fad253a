#include "viewer/assets/candidate_list.h"

#include <algorithm>

namespace CVW {
namespace Assets {

CandidateList::CandidateList(const std::vector<std::string>& raw)
{
    for (const auto& url : raw) {
        push(url);
    }
}

CandidateList::CandidateList(std::initializer_list<std::string> raw)
{
    for (const auto& url : raw) {
        push(url);
    }
}

void CandidateList::push(const std::string& url)
{
    size_t index = m_rawCount++;
    if (url.empty()) {
        return;
    }
    auto same = [&url](const Entry& e) { return e.url == url; };
    if (std::find_if(m_entries.begin(), m_entries.end(), same) != m_entries.end()) {
        return;
    }
    m_entries.push_back({url, index});
}

std::vector<std::string> CandidateList::urls() const
{
    std::vector<std::string> out;
    out.reserve(m_entries.size());
    for (const auto& e : m_entries) {
        out.push_back(e.url);
    }
    return out;
}

} // namespace Assets
} // namespace CVW
