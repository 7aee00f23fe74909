#include "nexus/data/CSVParser.hpp"
#include <regex>
#include <sstream>
#include <stdexcept>

namespace nexus { namespace data {

CSVParser::CSVParser(const std::string &filename) : filename_(filename) {

    f_.exceptions(f_.badbit);
    f_.open(filename, std::ios_base::in);
    if (not f_.is_open())
        throw std::ios_base::failure("Unable to open `" + filename + "'");

    std::string header;
    lineno_ = 1;
    if (not std::getline(f_, header))
        throw std::invalid_argument(filename + ": file is empty (expected a header line)");
    header_ = split(header);

    for (size_t i = 0; i < header_.size(); i++) field_pos_.emplace(header_[i], i);
}

bool CSVParser::readRow() {
    std::string row;
    while (true) {
        if (not std::getline(f_, row)) return false;
        lineno_++;
        if (not row.empty() and row.back() == '\r') row.pop_back();
        // Skip commented and blank rows:
        if (row.empty() or row[0] == '#') continue;
        if (std::regex_match(row, std::regex("\\s*"))) continue;
        break;
    }

    auto fields = split(row);
    if (fields.size() > header_.size())
        throw std::invalid_argument(where() + "number of fields (" + std::to_string(fields.size())
                + ") exceeds that of the header (" + std::to_string(header_.size()) + ")");
    fields.resize(header_.size());

    row_ = std::move(fields);
    return true;
}

bool CSVParser::hasField(const std::string &name) const {
    return field_pos_.count(name) > 0;
}

const std::string& CSVParser::field(const std::string &name) const {
    static const std::string empty;
    if (row_.empty()) throw std::logic_error("CSVParser::field: no current row");
    auto it = field_pos_.find(name);
    return it == field_pos_.end() ? empty : row_[it->second];
}

const std::string& CSVParser::required(const std::string &name) const {
    if (not hasField(name))
        throw std::invalid_argument(filename_ + ": required column `" + name + "' is missing from the header");
    const std::string &value = field(name);
    if (value.empty())
        throw std::invalid_argument(where() + "required field `" + name + "' is empty");
    return value;
}

std::string CSVParser::where() const {
    return filename_ + ", line " + std::to_string(lineno_) + ": ";
}

CSVParser::iterator CSVParser::begin() {
    return iterator(*this, false);
}

CSVParser::iterator CSVParser::end() {
    return iterator(*this, true);
}

std::vector<std::string> CSVParser::split(const std::string &csr) {
    static const std::regex trim("^\\s+|\\s+$");
    std::vector<std::string> results;
    std::stringstream ss(csr);
    std::string val;
    while (std::getline(ss, val, ',')) {
        results.push_back(std::regex_replace(val, trim, ""));
    }
    // getline drops a trailing empty field
    if (not csr.empty() and csr.back() == ',') results.emplace_back();
    return results;
}

}}
