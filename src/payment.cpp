#include "payment.hpp"
#include "spora/errors.hpp"
#include "spora/log.hpp"
#include <algorithm>

namespace spora {

const char* to_string(PaymentPurpose purpose) {
    switch (purpose) {
        case PaymentPurpose::storage: return "storage";
        case PaymentPurpose::retrieval: return "retrieval";
        case PaymentPurpose::maintenance: return "maintenance";
    }
    return "unknown";
}

BudgetOracle::BudgetOracle(double balance, double reserve)
    : balance_(balance), reserve_(reserve) {}

double BudgetOracle::available_capacity() const {
    return std::max(0.0, balance_ - reserve_);
}

bool BudgetOracle::can_afford(double cost) const {
    return balance_ - reserve_ >= cost;
}

void BudgetOracle::charge(const std::string& node_id, double amount, PaymentPurpose purpose) {
    if (amount < 0.0) {
        throw InvalidInputError("Charge amount must not be negative");
    }
    balance_ -= amount;
    charges_.push_back(ChargeRecord{node_id, amount, purpose, Clock::now()});

    if (balance_ < reserve_) {
        log::warn("Service") << "Budget below reserve after " << to_string(purpose)
                             << " charge to " << node_id << ": " << balance_;
    }
}

void BudgetOracle::deposit(double amount) {
    if (amount < 0.0) {
        throw InvalidInputError("Deposit amount must not be negative");
    }
    balance_ += amount;
}

double BudgetOracle::total_charged(PaymentPurpose purpose) const {
    double total = 0.0;
    for (const auto& record : charges_) {
        if (record.purpose == purpose) {
            total += record.amount;
        }
    }
    return total;
}

} // namespace spora
