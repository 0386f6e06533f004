#include "planner/data/FileGapRepository.hpp"

namespace planner {
namespace data {

FileGapRepository::FileGapRepository(std::shared_ptr<FileDataStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<Gap> FileGapRepository::gapsForDate(const QDate &date) const
{
    return m_storage ? m_storage->gaps(date) : std::vector<Gap>{};
}

std::vector<Gap> FileGapRepository::allGaps() const
{
    return m_storage ? m_storage->allGaps() : std::vector<Gap>{};
}

std::vector<QDate> FileGapRepository::dates() const
{
    return m_storage ? m_storage->gapDates() : std::vector<QDate>{};
}

bool FileGapRepository::replaceGapsForDate(const QDate &date, const std::vector<Gap> &gaps)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->replaceGaps(date, gaps);
}

int FileGapRepository::removeOutside(const core::DateRange &window)
{
    return m_storage ? m_storage->removeGapsOutside(window) : 0;
}

} // namespace data
} // namespace planner
