#pragma once

#include "domain/BankInvoice.hpp"
#include <string>
#include <sstream>

namespace payment::application {

/**
 * @brief Генератор текстового счёта для банковского перевода
 *
 * Детерминирован: одинаковый BankInvoice даёт побайтово одинаковый документ.
 */
class InvoiceGenerator {
public:
    std::string render(const domain::BankInvoice& invoice) const {
        std::ostringstream doc;
        doc << "BANK PAYMENT INVOICE\n"
            << "===================\n"
            << "\n"
            << "User ID: " << invoice.customerId << "\n"
            << "Order ID: " << invoice.orderId << "\n"
            << "Creation Date: " << invoice.createdAt.toDisplayString() << "\n"
            << "Valid Until: " << invoice.validUntil.toDisplayString() << "\n"
            << "Amount: " << currencySymbol(invoice.amount.currency) << invoice.amount.toString() << "\n"
            << "\n"
            << "Please use this invoice to complete your bank payment.\n"
            << "This invoice is only valid until the specified date.\n";
        return doc.str();
    }

    static std::string fileName(const std::string& orderId) {
        return "invoice_" + orderId + ".txt";
    }

private:
    static std::string currencySymbol(const std::string& currency) {
        if (currency == "USD") return "$";
        return currency + " ";
    }
};

} // namespace payment::application
