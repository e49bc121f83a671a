#ifndef _SEARCHRESULT_HPP
#define	_SEARCHRESULT_HPP

#include <string>
#include <vector>

using namespace std;

/**
 * One PSM from the open search: which peptide, which scan, and the two
 * precursor masses whose difference is the mass shift to localize.
 */
class PsmRecord {
public:
    size_t rowIndex;
    string scanId;
    string peptide;
    int charge;
    double expMass;
    double calcMass;
    vector<string> fields; // the raw table row, written back untouched

    PsmRecord() : rowIndex(0), charge(0), expMass(0.0), calcMass(0.0) {}
    PsmRecord(const string &scan_id, const string &pep, int z, double exp_mass, double calc_mass)
        : rowIndex(0), scanId(scan_id), peptide(pep), charge(z), expMass(exp_mass), calcMass(calc_mass) {}

    double getDeltaMass () const {
        return expMass - calcMass;
    }

    string getRecordId() const;
};

class LocalizationResult {
public:
    int position;       // 0-based residue index
    double score;
    double deltaScore;  // over the runner-up position, >= 0
    vector<double> positionScores; // residue order

    LocalizationResult() : position(-1), score(0.0), deltaScore(0.0) {}

    bool isLocalized () const {
        return position >= 0;
    }

    string getOutputString() const;
    static string getHeaderString();
};

// a record that could not be localized, as written to the failure report
class LocalizationFailure {
public:
    size_t rowIndex;
    string scanId;
    string kind;
    string message;
    bool fatal;

    LocalizationFailure() : rowIndex(0), fatal(true) {}
    LocalizationFailure(size_t row_index, const string &scan_id, const string &k, const string &msg, bool is_fatal)
        : rowIndex(row_index), scanId(scan_id), kind(k), message(msg), fatal(is_fatal) {}

    bool operator< (const LocalizationFailure &rhs) const {
        return rowIndex < rhs.rowIndex;
    }

    string getOutputString() const;
    static string getHeaderString();
};

#endif	/* _SEARCHRESULT_HPP */

