#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace spora {

enum class PaymentPurpose { storage, retrieval, maintenance };

const char* to_string(PaymentPurpose purpose);

// What the network can spend. The planner only asks; StorageService and
// RecoveryCoordinator charge once a placement is committed.
class PaymentOracle {
public:
    virtual ~PaymentOracle() = default;

    virtual double available_capacity() const = 0;
    virtual bool can_afford(double cost) const = 0;
    virtual void charge(const std::string& node_id, double amount, PaymentPurpose purpose) = 0;
};

struct ChargeRecord {
    std::string node_id;
    double amount = 0.0;
    PaymentPurpose purpose = PaymentPurpose::storage;
    TimePoint at{};
};

// Fixed budget with a reserve that is never offered for new placements.
class BudgetOracle : public PaymentOracle {
public:
    explicit BudgetOracle(double balance, double reserve = 0.0);

    double available_capacity() const override;
    bool can_afford(double cost) const override;

    // Deducts from the balance even past the reserve (the placement is already
    // committed). Throws InvalidInputError on a negative amount.
    void charge(const std::string& node_id, double amount, PaymentPurpose purpose) override;

    void deposit(double amount);

    double balance() const { return balance_; }
    double reserve() const { return reserve_; }
    double total_charged(PaymentPurpose purpose) const;
    const std::vector<ChargeRecord>& charges() const { return charges_; }

private:
    double balance_;
    double reserve_;
    std::vector<ChargeRecord> charges_;
};

} // namespace spora
