#pragma once

#include "planner/data/FileDataStorage.hpp"
#include "planner/data/GapRepository.hpp"

#include <memory>

namespace planner {
namespace data {

class FileGapRepository : public GapRepository
{
public:
    explicit FileGapRepository(std::shared_ptr<FileDataStorage> storage);
    ~FileGapRepository() override = default;

    std::vector<Gap> gapsForDate(const QDate &date) const override;
    std::vector<Gap> allGaps() const override;
    std::vector<QDate> dates() const override;
    bool replaceGapsForDate(const QDate &date, const std::vector<Gap> &gaps) override;
    int removeOutside(const core::DateRange &window) override;

private:
    std::shared_ptr<FileDataStorage> m_storage;
};

} // namespace data
} // namespace planner
