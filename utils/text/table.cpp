// Copyright 2015 Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
// * Redistributions of source code must retain the above copyright
//   notice, this list of conditions and the following disclaimer.
// * Redistributions in binary form must reproduce the above copyright
//   notice, this list of conditions and the following disclaimer in the
//   documentation and/or other materials provided with the distribution.
// * Neither the name of Google Inc. nor the names of its contributors
//   may be used to endorse or promote products derived from this software
//   without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "utils/text/table.hpp"

#include "utils/sanity.hpp"
#include "utils/text/operations.ipp"

namespace text = utils::text;


namespace {


/// Colletion of widths of the columns of a table.
typedef std::vector< std::size_t > widths_vector;


/// Calculates the maximum widths of the columns of a table.
///
/// \param table The table from which to calculate the column widths.
///
/// \return A vector with the widths of the columns of the input table.
static widths_vector
column_widths(const text::table& table)
{
    widths_vector widths(table.ncolumns(), 0);

    for (text::table::const_iterator iter = table.begin(); iter != table.end();
         ++iter) {
        const text::table_row& row = *iter;
        INV(row.size() == table.ncolumns());
        for (text::table_row::size_type i = 0; i < row.size(); ++i)
            if (widths[i] < row[i].size())
                widths[i] = row[i].size();
    }

    return widths;
}


}  // anonymous namespace


/// Constructs a new table.
///
/// \param ncolumns_ The number of columns that the table will have.
text::table::table(const table_row::size_type ncolumns_) :
    _ncolumns(ncolumns_)
{
    PRE(ncolumns_ > 0);
}


/// \return The number of columns in the table.
text::table_row::size_type
text::table::ncolumns(void) const
{
    return _ncolumns;
}


/// \return True if the table has no rows.
bool
text::table::empty(void) const
{
    return _rows.empty();
}


/// Adds a row to the table.
///
/// \param row The row to be added.  This row must have the same amount of
///     columns as defined during the construction of the table.
void
text::table::add_row(const table_row& row)
{
    PRE(row.size() == _ncolumns);
    _rows.push_back(row);
}


/// \return An iterator to the first row of the table.
text::table::const_iterator
text::table::begin(void) const
{
    return _rows.begin();
}


/// \return An iterator past the last row of the table.
text::table::const_iterator
text::table::end(void) const
{
    return _rows.end();
}


/// Formats a table into a collection of textual lines.
///
/// Every cell is right-padded with spaces up to the width of its column,
/// except for the cells of the last column, which are left untouched to avoid
/// trailing whitespace.
///
/// \param t Table to format.
/// \param separator The separator to place between cells.
///
/// \return A collection of textual lines, one per row.
std::vector< std::string >
text::format_table(const table& t, const std::string& separator)
{
    const widths_vector widths = column_widths(t);

    std::vector< std::string > lines;
    for (table::const_iterator iter = t.begin(); iter != t.end(); ++iter) {
        table_row padded;
        for (table_row::size_type i = 0; i < (*iter).size(); ++i) {
            const std::string& cell = (*iter)[i];
            if (i == (*iter).size() - 1 || cell.length() >= widths[i])
                padded.push_back(cell);
            else
                padded.push_back(cell + std::string(widths[i] - cell.length(),
                                                    ' '));
        }
        lines.push_back(text::join(padded, separator));
    }
    return lines;
}
