#ifndef _SPECTRUM_HPP
#define	_SPECTRUM_HPP

#include <stdio.h>
#include <stdlib.h>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <sstream>
#include <math.h>

#include <boost/filesystem.hpp>
#include <boost/algorithm/string.hpp>

using namespace std;

/**
 * An observed MS/MS peak list. m/z and intensity are kept as two parallel
 * contiguous arrays; peak order is whatever the source file had.
 */
class Spectrum {
public:
    string _id;
    string _dtaPath;
    unsigned int _firstScanNum;
    vector<double> _mzVector;
    vector<double> _ityVector;

    Spectrum();
    // throws std::runtime_error when the file can't be read
    explicit Spectrum(const string &file);
    // throws std::invalid_argument when the arrays differ in length
    Spectrum(const string &id, const vector<double> &mz, const vector<double> &ity);

    void readDta(const string &dtafile);
    void addPeak(double m_z, double ity);

    size_t size () const {
        return _mzVector.size();
    }

    bool empty () const {
        return _mzVector.empty();
    }

    void setFirstScan();
};

/**
 * Where the localizer gets its spectra from. Implementations return NULL when
 * nothing matches the identifier.
 */
class SpectrumLookup {
public:
    virtual ~SpectrumLookup() {}
    virtual const Spectrum * findSpectrum(const string &scan_id) const = 0;
};

#endif	/* _SPECTRUM_HPP */

