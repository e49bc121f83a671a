#ifndef _PSMFILE_HPP
#define	_PSMFILE_HPP

#include <iostream>
#include <fstream>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include "LocalizationError.hpp"
#include "SearchResult.hpp"

using namespace std;

namespace bfs = boost::filesystem;

/**
 * Tab-separated PSM table (a Sage PIN file). The header names the columns;
 * scannr, expmass, calcmass, charge and peptide must be present. Rows may
 * carry more fields than the header (PIN puts all proteins of a peptide in
 * the last column, tab-separated); those are kept and written back as read.
 */
class PsmFile {
public:
    string pinFile;
    vector<string> header;
    vector<PsmRecord> records;
    vector<LocalizationFailure> readFailures; // rows whose fields could not be read

    PsmFile();
    // throws std::runtime_error if the file can't be opened or a column is missing
    explicit PsmFile(const string &pin_file);

    void read(istream &in);

    // results[i] belongs to records[i]; rows that were not localized are left out
    void writeLocalized(ostream &out, const vector<LocalizationResult> &results) const;
    string writeLocalized(const string &output_dir, const vector<LocalizationResult> &results) const;

    static void writeFailures(ostream &out, const vector<LocalizationFailure> &failures);
    static string outputPath(const string &pin_file, const string &output_dir, const string &suffix);

private:
    int _scanCol;
    int _expMassCol;
    int _calcMassCol;
    int _chargeCol;
    int _peptideCol;

    int findColumn(const string &name) const;
    PsmRecord parseRecord(const vector<string> &fields, size_t row_index) const;
};

#endif	/* _PSMFILE_HPP */

