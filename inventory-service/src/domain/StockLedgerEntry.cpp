#include "domain/StockLedgerEntry.hpp"

namespace inventory::domain {

nlohmann::json StockLedgerEntry::toJson() const {
    nlohmann::json j;
    j["item"] = item;
    j["location"] = location;
    j["batch"] = batch ? nlohmann::json(*batch) : nlohmann::json(nullptr);
    j["quantity"] = quantity;
    j["rate"] = {
        {"units", rate.units},
        {"nano", rate.nano},
        {"currency", rate.currency}
    };
    j["date"] = date.toString();
    j["referenceType"] = referenceType;
    j["referenceName"] = referenceName;
    return j;
}

} // namespace inventory::domain
