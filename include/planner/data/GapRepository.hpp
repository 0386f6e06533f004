#pragma once

#include <vector>

#include <QDate>

#include "planner/core/RollingWindow.hpp"
#include "planner/data/Gap.hpp"

namespace planner {
namespace data {

class GapRepository
{
public:
    virtual ~GapRepository() = default;

    virtual std::vector<Gap> gapsForDate(const QDate &date) const = 0;
    virtual std::vector<Gap> allGaps() const = 0;
    virtual std::vector<QDate> dates() const = 0;
    // Replaces the stored gaps of a date wholesale; an empty list clears the date.
    virtual bool replaceGapsForDate(const QDate &date, const std::vector<Gap> &gaps) = 0;
    virtual int removeOutside(const core::DateRange &window) = 0;
};

} // namespace data
} // namespace planner
