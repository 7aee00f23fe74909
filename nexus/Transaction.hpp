#pragma once
#include "nexus/Date.hpp"
#include "nexus/Money.hpp"
#include <string>
#include <vector>

namespace nexus {

/// The sales channel through which a transaction was made.
enum class Channel {
    direct,     ///< Sold directly by the seller
    marketplace ///< Sold through a marketplace facilitator
};

/** Parses a channel name: "direct" or "marketplace" (case-insensitive).
 *
 * \throws std::invalid_argument for any other value.
 */
Channel parse_channel(const std::string &name);

/// A single sale attributed to one jurisdiction.
struct TransactionRecord {
    std::string id;           ///< Opaque identifier of the transaction
    Date date;                ///< The date of the sale
    std::string jurisdiction; ///< Jurisdiction code, such as "CA"
    Money amount;             ///< Sale amount; never negative
    Channel channel = Channel::direct; ///< Sales channel
};

/// Iterator type used for ranges of a jurisdiction's chronological history.
typedef std::vector<TransactionRecord>::const_iterator TransactionIterator;

/** Stable-sorts transactions by date.  Transactions sharing a date keep their relative input
 * order.
 */
void sort_chronologically(std::vector<TransactionRecord> &transactions);

}
