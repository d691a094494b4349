#pragma once

#include "enums/ValidationErrorKind.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <optional>
#include <sstream>

namespace inventory::domain {

/**
 * @brief Ошибка валидации движения товара
 *
 * Единственный тип ошибки ядра. Различается по kind(); для ошибок
 * остатков несёт товар, склад, партию, дату и величину нехватки,
 * чтобы вызывающая сторона могла показать понятное сообщение.
 *
 * Ошибка всегда исправима: поправить запрос и отправить заново.
 */
class StockValidationError : public std::runtime_error {
public:
    StockValidationError(ValidationErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ValidationErrorKind kind() const { return kind_; }

    const std::optional<std::string>& item() const { return item_; }
    const std::optional<std::string>& location() const { return location_; }
    const std::optional<std::string>& batch() const { return batch_; }
    const std::optional<std::string>& formattedDate() const { return formattedDate_; }
    const std::optional<double>& shortfall() const { return shortfall_; }

    // ============================================
    // ФАБРИКИ
    // ============================================

    static StockValidationError quantityNotSet() {
        return StockValidationError(ValidationErrorKind::QUANTITY_NOT_SET,
                                    "Quantity needs to be set");
    }

    static StockValidationError nonPositiveQuantity(double quantity) {
        return StockValidationError(ValidationErrorKind::NON_POSITIVE_QUANTITY,
            "Quantity (" + formatNumber(quantity) + ") has to be greater than zero");
    }

    static StockValidationError rateNotSet() {
        return StockValidationError(ValidationErrorKind::RATE_NOT_SET,
                                    "Rate needs to be set");
    }

    static StockValidationError nonPositiveRate(double rate) {
        return StockValidationError(ValidationErrorKind::NON_POSITIVE_RATE,
            "Rate (" + formatNumber(rate) + ") has to be greater than zero");
    }

    static StockValidationError noLocation() {
        return StockValidationError(ValidationErrorKind::NO_LOCATION,
                                    "Both From and To Location cannot be undefined");
    }

    /**
     * @brief Остатка на дату движения не хватает
     * @param shortfall quantity - quantityBefore
     */
    static StockValidationError insufficientQuantity(
        double shortfall,
        const std::string& item,
        const std::string& location,
        const std::optional<std::string>& batch,
        const std::string& formattedDate)
    {
        std::string message = "Insufficient Quantity.\n" +
            shortageDetails(shortfall, item, location, batch, formattedDate);

        StockValidationError error(ValidationErrorKind::INSUFFICIENT_QUANTITY, message);
        error.attach(shortfall, item, location, batch, formattedDate);
        return error;
    }

    /**
     * @brief Движение делает отрицательными уже записанные будущие остатки
     * @param shortfall quantityAfter - quantityRemaining
     */
    static StockValidationError futureNegativeStock(
        double shortfall,
        const std::string& item,
        const std::string& location,
        const std::optional<std::string>& batch,
        const std::string& formattedDate)
    {
        std::string message = "Insufficient Quantity.\n"
            "Transfer will cause future entries to have negative stock.\n" +
            shortageDetails(shortfall, item, location, batch, formattedDate);

        StockValidationError error(ValidationErrorKind::FUTURE_NEGATIVE_STOCK, message);
        error.attach(shortfall, item, location, batch, formattedDate);
        return error;
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["kind"] = toString(kind_);
        j["message"] = what();
        if (item_) j["item"] = *item_;
        if (location_) j["location"] = *location_;
        if (batch_) j["batch"] = *batch_;
        if (formattedDate_) j["date"] = *formattedDate_;
        if (shortfall_) j["shortfall"] = *shortfall_;
        return j;
    }

    static std::string formatNumber(double value) {
        std::ostringstream ss;
        ss << value;
        return ss.str();
    }

private:
    ValidationErrorKind kind_;
    std::optional<std::string> item_;
    std::optional<std::string> location_;
    std::optional<std::string> batch_;
    std::optional<std::string> formattedDate_;
    std::optional<double> shortfall_;

    void attach(
        double shortfall,
        const std::string& item,
        const std::string& location,
        const std::optional<std::string>& batch,
        const std::string& formattedDate)
    {
        shortfall_ = shortfall;
        item_ = item;
        location_ = location;
        batch_ = batch;
        formattedDate_ = formattedDate;
    }

    static std::string shortageDetails(
        double shortfall,
        const std::string& item,
        const std::string& location,
        const std::optional<std::string>& batch,
        const std::string& formattedDate)
    {
        std::string batchMessage = batch ? " in Batch " + *batch : "";
        return "Additional quantity (" + formatNumber(shortfall) + ") required" +
               batchMessage + " to make outward transfer of item " + item +
               " from " + location + " on " + formattedDate;
    }
};

} // namespace inventory::domain
