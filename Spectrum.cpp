#include <stdexcept>

#include <boost/regex.hpp>
#include <boost/lexical_cast.hpp>

#include "Spectrum.hpp"

Spectrum::Spectrum() {
    _firstScanNum = 0;
}

Spectrum::Spectrum(const string &file) {
    _firstScanNum = 0;
    readDta(file);
}

Spectrum::Spectrum(const string &id, const vector<double> &mz, const vector<double> &ity) {
    if (mz.size() != ity.size()) {
        throw std::invalid_argument("Spectrum " + id + ": " + boost::lexical_cast<string>(mz.size()) + " m/z values but "
                                    + boost::lexical_cast<string>(ity.size()) + " intensities");
    }
    _id = id;
    _firstScanNum = 0;
    _mzVector = mz;
    _ityVector = ity;
}

// Read dta file: "M+H charge" on the first line, then "m/z intensity" per peak.
// Only the peaks are kept, the precursor line is checked for shape.
void Spectrum::readDta (const string &file) {
    ifstream dtafile (file.c_str());
    if (! dtafile.is_open()) {
        throw std::runtime_error("Error opening dta file " + file);
    }
    string line;
    int line_count = 0;
    while (getline(dtafile, line)) {
        boost::trim(line);
        if (line == "")
            break;
        vector<string> tokens;
        boost::split(tokens, line, boost::is_any_of(" \t"), boost::token_compress_on);
        if (tokens.size() < 2 || tokens.size() > 3) {
            throw std::runtime_error(file + " does not appear to be a dta file");
        }
        if (line_count > 0) {
            addPeak(atof(tokens[0].c_str()), atof(tokens[1].c_str()));
        }
        line_count++;
    }
    dtafile.close();

    _dtaPath = file;
    setFirstScan();
    _id = boost::lexical_cast<string>(_firstScanNum);
    return;
}

void Spectrum::addPeak(double m_z, double ity) {
    _mzVector.push_back(m_z);
    _ityVector.push_back(ity);
}

// dta names look like <run>.<first scan>.<last scan>.<charge>.dta
void Spectrum::setFirstScan() {
    const boost::regex re("^.+\\.(\\d+)\\.(\\d+)\\.(\\d+)\\.dta$");
    boost::smatch m;
    string file_name = boost::filesystem::path(_dtaPath).filename().string();
    if (boost::regex_match(file_name, m, re)) {
        _firstScanNum = boost::lexical_cast<unsigned int>(m[1]);
    } else {
        _firstScanNum = 0;
    }
    return;
}
