#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

namespace CVW {
namespace Assets {

/**
 * CandidateList - Ordered, de-duplicated URL list.
 *
 * Entries are unique by value and keep first-seen order. Each entry remembers
 * the position it had in the raw input so callers can tell which template
 * produced it. Empty strings are dropped.
 */
class CandidateList {
public:
    struct Entry {
        std::string url;
        size_t sourceIndex = 0;

        bool operator==(const Entry& o) const { return url == o.url && sourceIndex == o.sourceIndex; }
    };

    CandidateList() = default;
    explicit CandidateList(const std::vector<std::string>& raw);
    CandidateList(std::initializer_list<std::string> raw);

    // Appends url at raw position rawIndex(). Duplicates and empty strings
    // still consume a raw position but add no entry.
    void push(const std::string& url);

    const std::vector<Entry>& entries() const { return m_entries; }
    std::vector<std::string> urls() const;

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }
    const Entry& operator[](size_t i) const { return m_entries[i]; }

    size_t rawIndex() const { return m_rawCount; }

    bool operator==(const CandidateList& o) const { return urls() == o.urls(); }
    bool operator!=(const CandidateList& o) const { return !(*this == o); }

private:
    std::vector<Entry> m_entries;
    size_t m_rawCount = 0;
};

} // namespace Assets
} // namespace CVW
