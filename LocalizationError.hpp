#ifndef _LOCALIZATIONERROR_HPP
#define	_LOCALIZATIONERROR_HPP

#include <string>
#include <stdexcept>

using namespace std;

/**
 * Per-record failures. The batch runner catches these, reports them against
 * the record and keeps going; nothing below the runner swallows them.
 */
class LocalizationError : public std::runtime_error {
public:
    LocalizationError (const string &kind, const string &record_id, const string &msg)
        : std::runtime_error(msg + (record_id.empty() ? "" : " [record " + record_id + "]")),
          _kind(kind), _recordId(record_id), _detail(msg) {
    }
    virtual ~LocalizationError() throw() {}

    const string & kind () const { return _kind; }
    const string & recordId () const { return _recordId; }
    const string & detail () const { return _detail; }

    // true for errors that should make a batch run end with a failing status
    virtual bool isFatal () const { return true; }

    // the driver knows the record, the parser usually doesn't
    void setRecordId (const string &record_id) {
        _recordId = record_id;
        _what = _detail + " [record " + record_id + "]";
    }

    virtual const char * what () const throw() {
        return _what.empty() ? std::runtime_error::what() : _what.c_str();
    }

private:
    string _kind;
    string _recordId;
    string _detail;
    string _what;
};

class MalformedPeptideError : public LocalizationError {
public:
    string peptide;

    MalformedPeptideError (const string &pep, const string &msg, const string &record_id = "")
        : LocalizationError("MalformedPeptide", record_id, msg + ": '" + pep + "'"), peptide(pep) {
    }
    virtual ~MalformedPeptideError() throw() {}
};

class SpectrumNotFoundError : public LocalizationError {
public:
    string scanId;

    SpectrumNotFoundError (const string &scan_id, const string &record_id = "")
        : LocalizationError("SpectrumNotFound", record_id, "No spectrum found for scan '" + scan_id + "'"), scanId(scan_id) {
    }
    virtual ~SpectrumNotFoundError() throw() {}
};

class DegenerateLadderError : public LocalizationError {
public:
    string peptide;
    size_t numResidues;

    DegenerateLadderError (const string &pep, size_t n_res, const string &record_id = "")
        : LocalizationError("DegenerateLadder", record_id, "Peptide '" + pep + "' is too short to fragment"),
          peptide(pep), numResidues(n_res) {
    }
    virtual ~DegenerateLadderError() throw() {}

    bool isFatal () const { return false; }
};

class MalformedRecordError : public LocalizationError {
public:
    MalformedRecordError (const string &msg, const string &record_id = "")
        : LocalizationError("MalformedRecord", record_id, msg) {
    }
    virtual ~MalformedRecordError() throw() {}
};

#endif	/* _LOCALIZATIONERROR_HPP */

