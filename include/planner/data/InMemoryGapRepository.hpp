#pragma once

#include <map>

#include <QMutex>

#include "planner/data/GapRepository.hpp"

namespace planner {
namespace data {

class InMemoryGapRepository : public GapRepository
{
public:
    InMemoryGapRepository();
    ~InMemoryGapRepository() override;

    std::vector<Gap> gapsForDate(const QDate &date) const override;
    std::vector<Gap> allGaps() const override;
    std::vector<QDate> dates() const override;
    bool replaceGapsForDate(const QDate &date, const std::vector<Gap> &gaps) override;
    int removeOutside(const core::DateRange &window) override;

private:
    mutable QMutex m_mutex;
    std::map<QDate, std::vector<Gap>> m_gaps;
};

} // namespace data
} // namespace planner
