#pragma once

#include "ports/input/IStockTransferServiceFactory.hpp"
#include "domain/StockValidationError.hpp"
#include "domain/TransferRequest.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>
#include <iostream>

namespace inventory::adapters::primary
{

    /**
     * @brief Обработчик JSON-команд над документом движения
     *
     * Команды:
     * - submit           → createTransfers
     * - validate         → validateTransfers
     * - validate_cancel  → validateCancel (isCancelled = true)
     * - cancel           → validateCancel + cancelTransfers (isCancelled = true)
     *
     * Ответ: {"status": "ok" | "rejected" | "error", ...}
     */
    class TransferCommandHandler
    {
    public:
        explicit TransferCommandHandler(
            std::shared_ptr<ports::input::IStockTransferServiceFactory> serviceFactory)
            : serviceFactory_(std::move(serviceFactory))
        {
            std::cout << "[TransferCommandHandler] Created" << std::endl;
        }

        nlohmann::json handle(const std::string &body)
        {
            nlohmann::json request;
            try
            {
                request = nlohmann::json::parse(body);
            }
            catch (const nlohmann::json::exception &)
            {
                return error("Invalid JSON");
            }

            try
            {
                std::string command = request.value("command", "");

                domain::TransferReference reference(
                    request.value("referenceType", ""),
                    request.value("referenceName", ""));

                if (reference.type.empty() || reference.name.empty())
                {
                    return error("referenceType and referenceName are required");
                }

                auto transfers = parseTransfers(request);

                if (command == "submit")
                {
                    auto service = serviceFactory_->create(reference, request.value("cancelled", false));
                    auto entries = service->createTransfers(transfers);

                    nlohmann::json response = ok(command, reference);
                    response["entries"] = nlohmann::json::array();
                    for (const auto &entry : entries)
                    {
                        response["entries"].push_back(entry.toJson());
                    }
                    return response;
                }

                if (command == "validate")
                {
                    auto service = serviceFactory_->create(reference, request.value("cancelled", false));
                    service->validateTransfers(transfers);
                    return ok(command, reference);
                }

                if (command == "validate_cancel")
                {
                    auto service = serviceFactory_->create(reference, true);
                    service->validateCancel(transfers);
                    return ok(command, reference);
                }

                if (command == "cancel")
                {
                    auto service = serviceFactory_->create(reference, true);
                    service->validateCancel(transfers);
                    auto removed = service->cancelTransfers();

                    nlohmann::json response = ok(command, reference);
                    response["removed"] = removed;
                    return response;
                }

                return error("Unknown command: " + command);
            }
            catch (const domain::StockValidationError &e)
            {
                nlohmann::json response;
                response["status"] = "rejected";
                response["error"] = e.toJson();
                return response;
            }
            catch (const nlohmann::json::exception &e)
            {
                return error(std::string("Invalid transfer document: ") + e.what());
            }
            catch (const std::invalid_argument &e)
            {
                return error(e.what());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[TransferCommandHandler] Error: " << e.what() << std::endl;
                return error(std::string("Internal error: ") + e.what());
            }
        }

        /**
         * @brief Код завершения процесса по статусу ответа
         */
        static int exitCode(const nlohmann::json &response)
        {
            std::string status = response.value("status", "error");
            if (status == "ok")
                return 0;
            if (status == "rejected")
                return 2;
            return 1;
        }

    private:
        std::shared_ptr<ports::input::IStockTransferServiceFactory> serviceFactory_;

        /**
         * @brief Разобрать строки документа
         *
         * Дата строки по умолчанию берётся из документа.
         */
        std::vector<domain::TransferRequest> parseTransfers(const nlohmann::json &request)
        {
            std::vector<domain::TransferRequest> transfers;

            std::string documentDate = request.value("date", "");

            for (const auto &t : request.value("transfers", nlohmann::json::array()))
            {
                domain::TransferRequest transfer;
                transfer.item = t.value("item", "");

                if (t.contains("quantity") && !t["quantity"].is_null())
                {
                    transfer.quantity = t["quantity"].get<double>();
                }

                if (t.contains("rate") && !t["rate"].is_null())
                {
                    transfer.rate = domain::Money::fromDouble(
                        t["rate"].get<double>(),
                        t.value("currency", "USD"));
                }

                std::string date = t.contains("date") && !t["date"].is_null()
                                       ? t["date"].get<std::string>()
                                       : documentDate;
                transfer.date = date.empty() ? domain::Timestamp::now()
                                             : domain::Timestamp::fromString(date);

                transfer.fromLocation = optionalString(t, "fromLocation");
                transfer.toLocation = optionalString(t, "toLocation");
                transfer.batch = optionalString(t, "batch");

                transfers.push_back(std::move(transfer));
            }

            return transfers;
        }

        static std::optional<std::string> optionalString(const nlohmann::json &j, const char *key)
        {
            if (!j.contains(key) || j[key].is_null())
            {
                return std::nullopt;
            }
            auto value = j[key].get<std::string>();
            if (value.empty())
            {
                return std::nullopt;
            }
            return value;
        }

        static nlohmann::json ok(const std::string &command, const domain::TransferReference &reference)
        {
            nlohmann::json response;
            response["status"] = "ok";
            response["command"] = command;
            response["referenceType"] = reference.type;
            response["referenceName"] = reference.name;
            return response;
        }

        static nlohmann::json error(const std::string &message)
        {
            nlohmann::json response;
            response["status"] = "error";
            response["error"] = message;
            return response;
        }
    };

} // namespace inventory::adapters::primary
