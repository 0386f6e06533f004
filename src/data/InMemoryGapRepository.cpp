#include "planner/data/InMemoryGapRepository.hpp"

#include <QMutexLocker>

#include <algorithm>

namespace planner {
namespace data {

InMemoryGapRepository::InMemoryGapRepository() = default;
InMemoryGapRepository::~InMemoryGapRepository() = default;

std::vector<Gap> InMemoryGapRepository::gapsForDate(const QDate &date) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_gaps.find(date);
    return it == m_gaps.end() ? std::vector<Gap>{} : it->second;
}

std::vector<Gap> InMemoryGapRepository::allGaps() const
{
    QMutexLocker locker(&m_mutex);
    std::vector<Gap> result;
    for (const auto &entry : m_gaps) {
        result.insert(result.end(), entry.second.begin(), entry.second.end());
    }
    return result;
}

std::vector<QDate> InMemoryGapRepository::dates() const
{
    QMutexLocker locker(&m_mutex);
    std::vector<QDate> result;
    result.reserve(m_gaps.size());
    for (const auto &entry : m_gaps) {
        result.push_back(entry.first);
    }
    return result;
}

bool InMemoryGapRepository::replaceGapsForDate(const QDate &date, const std::vector<Gap> &gaps)
{
    QMutexLocker locker(&m_mutex);
    if (gaps.empty()) {
        m_gaps.erase(date);
        return true;
    }
    auto sorted = gaps;
    std::sort(sorted.begin(), sorted.end(), [](const Gap &lhs, const Gap &rhs) { return lhs.start < rhs.start; });
    m_gaps[date] = std::move(sorted);
    return true;
}

int InMemoryGapRepository::removeOutside(const core::DateRange &window)
{
    QMutexLocker locker(&m_mutex);
    int removed = 0;
    for (auto it = m_gaps.begin(); it != m_gaps.end();) {
        if (window.contains(it->first)) {
            ++it;
            continue;
        }
        removed += static_cast<int>(it->second.size());
        it = m_gaps.erase(it);
    }
    return removed;
}

} // namespace data
} // namespace planner
