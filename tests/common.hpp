#pragma once
#include "nexus/Date.hpp"
#include "nexus/Money.hpp"
#include "nexus/Transaction.hpp"
#include <boost/date_time/gregorian/gregorian.hpp>
#include <string>

// Helpers shared by the nexus tests.

inline nexus::Date D(const std::string &iso) { return nexus::parse_date(iso); }

inline nexus::Money M(const std::string &amount) { return nexus::Money::parse(amount); }

inline nexus::TransactionRecord txn(const std::string &id, const std::string &date, const std::string &amount,
        nexus::Channel channel = nexus::Channel::direct, const std::string &jurisdiction = "XX") {
    nexus::TransactionRecord t;
    t.id = id;
    t.date = D(date);
    t.jurisdiction = jurisdiction;
    t.amount = M(amount);
    t.channel = channel;
    return t;
}
