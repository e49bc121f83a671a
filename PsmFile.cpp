#include <stdexcept>

#include <boost/lexical_cast.hpp>
#include <boost/math/special_functions/fpclassify.hpp>
#include <boost/algorithm/string.hpp>

#include "PsmFile.hpp"
#include "Util.hpp"

PsmFile::PsmFile() : _scanCol(-1), _expMassCol(-1), _calcMassCol(-1), _chargeCol(-1), _peptideCol(-1) {
}

PsmFile::PsmFile(const string &pin_file)
    : pinFile(pin_file), _scanCol(-1), _expMassCol(-1), _calcMassCol(-1), _chargeCol(-1), _peptideCol(-1) {
    ifstream in(pin_file.c_str());
    if (!in.is_open()) {
        throw std::runtime_error("Error opening PSM file " + pin_file);
    }
    cout << "...Reading " << pin_file << endl;
    read(in);
    in.close();
    cout << "...  read " << records.size() << " PSMs";
    if (!readFailures.empty()) {
        cout << ", " << readFailures.size() << " unreadable";
    }
    cout << endl;
}

void PsmFile::read(istream &in) {
    header.clear();
    records.clear();
    readFailures.clear();

    string line;
    while (getline(in, line)) {
        boost::trim_right_if(line, boost::is_any_of("\r\n"));
        if (!line.empty())
            break;
    }
    if (line.empty()) {
        throw std::runtime_error("PSM file " + pinFile + " has no header line");
    }
    boost::split(header, line, boost::is_any_of("\t"));

    _scanCol = findColumn("scannr");
    _expMassCol = findColumn("expmass");
    _calcMassCol = findColumn("calcmass");
    _chargeCol = findColumn("charge");
    _peptideCol = findColumn("peptide");

    size_t row_index = 0;
    while (getline(in, line)) {
        boost::trim_right_if(line, boost::is_any_of("\r\n"));
        if (line.empty())
            continue;

        vector<string> fields;
        boost::split(fields, line, boost::is_any_of("\t"));
        try {
            records.push_back(parseRecord(fields, row_index));
        } catch (const MalformedRecordError &e) {
            string scan_id = (int) fields.size() > _scanCol ? fields[_scanCol] : "";
            readFailures.push_back(LocalizationFailure(row_index, scan_id, e.kind(), e.detail(), e.isFatal()));
        }
        row_index++;
    }
    return;
}

int PsmFile::findColumn(const string &name) const {
    for (size_t i = 0; i < header.size(); i++) {
        if (boost::trim_copy(header[i]) == name)
            return (int) i;
    }
    throw std::runtime_error("PSM file " + pinFile + " is missing the required column '" + name + "'");
}

PsmRecord PsmFile::parseRecord(const vector<string> &fields, size_t row_index) const {
    string record_id = "row " + toStr(row_index);
    if (fields.size() < header.size()) {
        throw MalformedRecordError("Expected " + toStr(header.size()) + " fields, found " + toStr(fields.size()), record_id);
    }

    PsmRecord psm;
    psm.rowIndex = row_index;
    psm.scanId = boost::trim_copy(fields[_scanCol]);
    psm.peptide = boost::trim_copy(fields[_peptideCol]);
    psm.fields = fields;

    const int cols[] = {_expMassCol, _calcMassCol, _chargeCol};
    for (int i = 0; i < 3; i++) {
        string value = boost::trim_copy(fields[cols[i]]);
        try {
            if (cols[i] == _chargeCol) {
                psm.charge = boost::lexical_cast<int>(value);
            } else {
                // lexical_cast takes "nan" and "inf", neither is a mass
                double mass = boost::lexical_cast<double>(value);
                if (!(boost::math::isfinite)(mass)) {
                    throw boost::bad_lexical_cast();
                }
                if (cols[i] == _expMassCol)
                    psm.expMass = mass;
                else
                    psm.calcMass = mass;
            }
        } catch (const boost::bad_lexical_cast &) {
            throw MalformedRecordError("Can't read " + header[cols[i]] + " value '" + value + "'", psm.getRecordId());
        }
    }
    return psm;
}

/*
 * Each row is written as its header-width fields, the three localization
 * columns, then any surplus fields the row came with.
 */
void PsmFile::writeLocalized(ostream &out, const vector<LocalizationResult> &results) const {
    if (results.size() != records.size()) {
        throw std::invalid_argument("Got " + toStr(results.size()) + " results for " + toStr(records.size()) + " PSMs");
    }

    out << boost::join(header, "\t") << "\t" << LocalizationResult::getHeaderString() << "\n";
    for (size_t i = 0; i < records.size(); i++) {
        if (!results[i].isLocalized())
            continue;

        const vector<string> &fields = records[i].fields;
        vector<string> row(fields.begin(), fields.begin() + header.size());
        row.push_back(results[i].getOutputString());
        row.insert(row.end(), fields.begin() + header.size(), fields.end());
        out << boost::join(row, "\t") << "\n";
    }
    return;
}

string PsmFile::writeLocalized(const string &output_dir, const vector<LocalizationResult> &results) const {
    string out_file = outputPath(pinFile, output_dir, ".localized.pin");
    ofstream out(out_file.c_str());
    if (!out.is_open()) {
        throw std::runtime_error("Error opening output file " + out_file);
    }
    writeLocalized(out, results);
    out.close();
    return out_file;
}

void PsmFile::writeFailures(ostream &out, const vector<LocalizationFailure> &failures) {
    out << LocalizationFailure::getHeaderString() << "\n";
    for (vector<LocalizationFailure>::const_iterator fIt = failures.begin(); fIt != failures.end(); fIt++) {
        out << fIt->getOutputString() << "\n";
    }
    return;
}

string PsmFile::outputPath(const string &pin_file, const string &output_dir, const string &suffix) {
    bfs::path out_path = bfs::path(output_dir) / (bfs::path(pin_file).stem().string() + suffix);
    return out_path.string();
}
