#ifndef _RUN_HPP
#define	_RUN_HPP

#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/regex.hpp>
#include <boost/thread/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/bind.hpp>

#include "Spectrum.hpp"
#include "LocalizeOptions.hpp"

namespace bfs = boost::filesystem;

/**
 * All MS/MS spectra of one run, keyed by identifier. Spectra come from a
 * directory of dta files or from a single MGF file. Lookups accept either the
 * stored identifier or anything a scan number can be pulled out of, such as
 * a native id "controllerType=0 controllerNumber=1 scan=1234".
 */
class Run : public SpectrumLookup {
public:
    vector<string> msnSpectraPaths;
    map<string, Spectrum> msnSpectra;

    Run ();
    // throws std::runtime_error if the path is neither a directory nor an MGF file
    explicit Run (const string &spectra_path);

    void loadAllSpectra();
    void loadMgf(const string &mgf_file);
    bool addSpectrum(const Spectrum &dta);

    const Spectrum * findSpectrum(const string &scan_id) const;

    size_t size () const {
        return msnSpectra.size();
    }

    static bool parseScanNumber(const string &scan_id, unsigned int &scan_num);

private:
    map<unsigned int, string> _scanIndex;
    boost::shared_ptr<boost::mutex> _write_mutex;

    void findSpectra(const bfs::path &dir);
    void loadAllSpectraMT(int cur_thread_num = 0);
};

#endif	/* _RUN_HPP */

