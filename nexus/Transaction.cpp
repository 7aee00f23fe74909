#include "nexus/Transaction.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace nexus {

Channel parse_channel(const std::string &name) {
    std::string lc(name);
    std::transform(lc.begin(), lc.end(), lc.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lc == "direct") return Channel::direct;
    if (lc == "marketplace") return Channel::marketplace;
    throw std::invalid_argument("Invalid sales channel `" + name + "': expected `direct' or `marketplace'");
}

void sort_chronologically(std::vector<TransactionRecord> &transactions) {
    std::stable_sort(transactions.begin(), transactions.end(),
            [](const TransactionRecord &a, const TransactionRecord &b) { return a.date < b.date; });
}

}
