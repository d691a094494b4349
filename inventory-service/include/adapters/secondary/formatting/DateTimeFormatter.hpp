#pragma once

#include "ports/output/IDateFormatter.hpp"
#include "settings/InventorySettings.hpp"
#include <memory>
#include <string>

namespace inventory::adapters::secondary {

/**
 * @brief Форматирует даты по шаблону из InventorySettings
 */
class DateTimeFormatter : public ports::output::IDateFormatter {
public:
    explicit DateTimeFormatter(std::shared_ptr<settings::InventorySettings> settings)
        : pattern_(settings->getDateFormat()) {}

    std::string format(const domain::Timestamp& date) const override {
        return date.format(pattern_);
    }

private:
    std::string pattern_;
};

} // namespace inventory::adapters::secondary
