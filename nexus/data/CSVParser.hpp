#pragma once
#include <eris/noncopyable.hpp>
#include <cstddef>
#include <fstream>
#include <iterator>
#include <string>
#include <unordered_map>
#include <vector>

namespace nexus { namespace data {

/** Primitive comma-separated-value file parser.  This is far from a complete CSV parser: it does
 * not handle quoted fields, for example; it is intended for the simple normalized input files read
 * by nexus-cli.  Fields are returned as strings with surrounding whitespace removed.
 *
 * The intended basic usage is:
 *
 *     CSVParser csv("filename.csv");
 *     while (csv.readRow()) {
 *         // Do something with csv.field("name")
 *     }
 *
 * or, equivalently:
 *
 *     CSVParser csv("filename.csv");
 *     for (auto &row : csv) {
 *         // Do something with row (which is a `const std::vector<std::string>`)
 *     }
 *
 * One non-standard extension is that this allows comment lines beginning with # in the file: any
 * such line (and any blank line) will be skipped.
 */
class CSVParser : private eris::noncopyable {
    public:
        /// Not default constructible
        CSVParser() = delete;

        /** Opens a csv file for parsing and reads its header line.
         *
         * \param filename the file to read
         * \throws std::ios_base::failure for underlying IO errors
         * \throws std::invalid_argument if the file has no header line
         */
        explicit CSVParser(const std::string &filename);

        /// The file name given to the constructor
        const std::string& filename() const { return filename_; }

        /** Returns the vector of header names read during construction. */
        const std::vector<std::string>& header() const { return header_; }

        /** Reads the next line of the CSV file, storing it in row(), replacing what was previously
         * stored there.  Returns true if a row was read, false if the end of the file was hit.  A
         * row may have fewer fields than the header: missing trailing fields are empty.
         *
         * \throws std::ios_base::failure if a read error occurs
         * \throws std::invalid_argument if the row has more fields than the header.
         */
        bool readRow();

        /** Accesses the most-recently-read row of the file.  If no row has yet been read, this will
         * be an empty vector.
         */
        const std::vector<std::string>& row() const { return row_; }

        /// The line number of the most-recently-read row
        size_t lineno() const { return lineno_; }

        /// Returns true if the header contains the given field name.
        bool hasField(const std::string &name) const;

        /** Returns the value of the named field in the current row, or an empty string if the
         * header does not contain the field.
         *
         * \throws std::logic_error if no row has been read
         */
        const std::string& field(const std::string &name) const;

        /** Returns the value of the named field in the current row.
         *
         * \throws std::invalid_argument if the header does not contain the field or the value is
         * empty
         */
        const std::string& required(const std::string &name) const;

        /** Returns a message prefix identifying the current file and line, such as
         * "transactions.csv, line 4: ".
         */
        std::string where() const;

        // forward declaration
        class iterator;

        /// Returns an iterator that reads through the file
        iterator begin();

        /// Returns a past-the-end iterator
        iterator end();

    private:
        // Split a string by , and return a vector of trimmed elements
        static std::vector<std::string> split(const std::string &csr);

        std::string filename_;
        std::vector<std::string> header_; // the header read from the file
        std::unordered_map<std::string, size_t> field_pos_; // header name to position
        std::fstream f_;
        size_t lineno_; // Tracks the current line number
        std::vector<std::string> row_; // The most-recently-read row (reused)
};

/** Iterator class that allows iterating through the file.  The iterator satisfies the requirements
 * of an InputIterator. */
class CSVParser::iterator final : public std::iterator<std::input_iterator_tag, const std::vector<std::string>, long> {
    public:
        /// Dereferences the iterator, returning the current CSVParser row.
        reference operator*() { return csv_.row(); }

        /// Dereferences the iterator, returning the current CSVParser row pointer.
        pointer operator->() { return &csv_.row(); }

        /** Increments the iterator, reading the next row of the file.  Previous iterators are
         * invalidated.
         */
        iterator& operator++() { end_ = not csv_.readRow(); return *this; }

        /** Return true if the given object is a reference to the current object, or if the current
         * object is at the end of file and the given object is a special end iterator for the same
         * CSVParser object.
         */
        bool operator==(const iterator &other) {
            return &csv_ == &(other.csv_) and end_ == other.end_;
        }

        /** Returns the negation of the == operator. */
        bool operator!=(const iterator &other) { return !(*this == other); }

    private:
        iterator() = delete;
        CSVParser &csv_;
        bool end_; // true if this is a past-the-end iterator
        iterator(CSVParser &csv, bool end) : csv_(csv), end_(end) { if (!end_) end_ = not csv_.readRow(); }
        friend class CSVParser;
};

}}
