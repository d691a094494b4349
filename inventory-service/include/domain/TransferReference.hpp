#pragma once

#include <string>

namespace inventory::domain {

/**
 * @brief Ссылка на документ-владелец пакета движений
 *
 * Например: type = "StockMovement", name = "SM-0001".
 * Все записи журнала пакета несут эту ссылку, по ней же
 * выполняется отмена.
 */
struct TransferReference {
    std::string type;   ///< Тип документа
    std::string name;   ///< Идентификатор документа

    TransferReference() = default;

    TransferReference(const std::string& type, const std::string& name)
        : type(type), name(name) {}

    bool operator==(const TransferReference& other) const {
        return type == other.type && name == other.name;
    }

    std::string toString() const {
        return type + "/" + name;
    }
};

} // namespace inventory::domain
