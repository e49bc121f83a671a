#include <ctype.h>
#include <stdexcept>

#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>

#include "Run.hpp"

Run::Run () : _write_mutex(new boost::mutex()) {
}

Run::Run (const string &spectra_path) : _write_mutex(new boost::mutex()) {
    bfs::path p(spectra_path);
    if (!bfs::exists(p)) {
        throw std::runtime_error(spectra_path + " does not exist");
    }
    if (bfs::is_directory(p)) {
        findSpectra(p);
        loadAllSpectra();
    } else if (boost::iequals(p.extension().string(), ".mgf")) {
        loadMgf(spectra_path);
    } else {
        throw std::runtime_error(spectra_path + " is neither a dta directory nor an MGF file");
    }
    if (msnSpectra.empty()) {
        throw std::runtime_error("No spectra loaded from " + spectra_path);
    }
    cout << "... loaded " << msnSpectra.size() << " spectra" << endl;
}

void Run::findSpectra(const bfs::path &p) {
    const boost::regex re("^\\w+\\.\\d+\\.\\d+\\.\\d+\\.dta$");
    cout << "In spectrum directory " << p << " \n";
    try {
        bfs::directory_iterator dIt(p), dIt_end;
        for (; dIt != dIt_end; dIt++) {
            if (boost::regex_match(dIt->path().filename().string(), re)) {
                if (bfs::is_regular_file(*dIt)) {
                    msnSpectraPaths.push_back( dIt->path().string() );
                } else {
                    cerr << "WARNING: " << *dIt << " doesn't appear to be a regular file" << endl;
                }
            }
        }
    } catch (const bfs::filesystem_error& ex) {
        throw std::runtime_error(ex.what());
    }
    cout << "...  found " << msnSpectraPaths.size() << " spectra" << endl;
    return;
}

// external wrapper around loadAllSpectraMT
void Run::loadAllSpectra() {
    cout << "...Loading spectra" << endl;
    if (LocalizeOptions::maxNumThreads == 1) { // Parallelization overhead is pretty small (~5-10%) but it's nice to avoid it
        loadAllSpectraMT();
    } else {
        boost::thread_group btg;
        for (int i = 0; i < LocalizeOptions::maxNumThreads; i++) {
            if (LocalizeOptions::verbose) {
                cout << "... starting thread # " << i << endl;
            }
            btg.add_thread(new boost::thread(boost::bind(&Run::loadAllSpectraMT, this, i)));
        }
        btg.join_all();
    }
    msnSpectraPaths.clear();
    return;
}

void Run::loadAllSpectraMT(int cur_thread_num) {
    int local_cnt = 0;
    for (vector<string>::iterator vecIt = msnSpectraPaths.begin(); vecIt != msnSpectraPaths.end(); vecIt++) {
        local_cnt++;
        if ((local_cnt - cur_thread_num - 1) % LocalizeOptions::maxNumThreads != 0)
            continue;

        try {
            Spectrum dta(*vecIt);
            addSpectrum(dta);
        } catch (const std::runtime_error &e) {
            cerr << "WARNING: skipping spectrum: " << e.what() << endl;
        }
    }
    return;
}

/*
 * MGF blocks are BEGIN IONS ... END IONS. The identifier is SCANS= when given,
 * otherwise the scan number found in TITLE=, otherwise the whole title.
 */
void Run::loadMgf(const string &mgf_file) {
    ifstream mgf(mgf_file.c_str());
    if (!mgf.is_open()) {
        throw std::runtime_error("Error opening MGF file " + mgf_file);
    }
    cout << "...Loading spectra from " << mgf_file << endl;

    string line;
    bool in_ions = false;
    int block_cnt = 0;
    Spectrum dta;
    string title, scans;
    while (getline(mgf, line)) {
        boost::trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        if (line == "BEGIN IONS") {
            in_ions = true;
            dta = Spectrum();
            title.clear();
            scans.clear();
            continue;
        }
        if (!in_ions)
            continue;
        if (line == "END IONS") {
            in_ions = false;
            block_cnt++;
            unsigned int scan_num;
            if (!scans.empty()) {
                dta._id = scans;
            } else if (parseScanNumber(title, scan_num)) {
                dta._id = boost::lexical_cast<string>(scan_num);
            } else if (!title.empty()) {
                dta._id = title;
            } else {
                dta._id = boost::lexical_cast<string>(block_cnt);
            }
            if (parseScanNumber(dta._id, scan_num)) {
                dta._firstScanNum = scan_num;
            }
            dta._dtaPath = mgf_file;
            addSpectrum(dta);
            continue;
        }

        size_t eq = line.find('=');
        if (eq != string::npos && isalpha((unsigned char) line[0])) {
            string key = boost::to_upper_copy(line.substr(0, eq));
            string value = line.substr(eq + 1);
            if (key == "TITLE") {
                title = value;
            } else if (key == "SCANS") {
                scans = value;
            }
            // PEPMASS, CHARGE and the rest of the header aren't needed
            continue;
        }

        vector<string> tokens;
        boost::split(tokens, line, boost::is_any_of(" \t"), boost::token_compress_on);
        if (tokens.size() < 2) {
            cerr << "WARNING: unreadable peak line in " << mgf_file << ": " << line << endl;
            continue;
        }
        dta.addPeak(atof(tokens[0].c_str()), atof(tokens[1].c_str()));
    }
    mgf.close();
    return;
}

bool Run::addSpectrum(const Spectrum &dta) {
    boost::mutex::scoped_lock lock(*_write_mutex);
    pair<map<string, Spectrum>::iterator, bool> ins = msnSpectra.insert(pair<string, Spectrum>(dta._id, dta));
    if (!ins.second) {
        cerr << "WARNING: duplicate spectrum identifier " << dta._id << ", keeping the first one" << endl;
        return false;
    }
    unsigned int scan_num;
    if (dta._firstScanNum > 0) {
        _scanIndex.insert(pair<unsigned int, string>(dta._firstScanNum, dta._id));
    } else if (parseScanNumber(dta._id, scan_num)) {
        _scanIndex.insert(pair<unsigned int, string>(scan_num, dta._id));
    }
    return true;
}

const Spectrum * Run::findSpectrum(const string &scan_id) const {
    map<string, Spectrum>::const_iterator msIt = msnSpectra.find(scan_id);
    if (msIt != msnSpectra.end()) {
        return &(msIt->second);
    }
    unsigned int scan_num;
    if (parseScanNumber(scan_id, scan_num)) {
        map<unsigned int, string>::const_iterator siIt = _scanIndex.find(scan_num);
        if (siIt != _scanIndex.end()) {
            msIt = msnSpectra.find(siIt->second);
            if (msIt != msnSpectra.end()) {
                return &(msIt->second);
            }
        }
    }
    return NULL;
}

/*
 * Recognizes a bare number, "... scan=1234 ..." native ids and
 * "run.1234.1234.2" style titles.
 */
bool Run::parseScanNumber(const string &scan_id, unsigned int &scan_num) {
    static const boost::regex re_plain("^\\s*(\\d+)\\s*$");
    static const boost::regex re_native("(?:^|\\s)scan=(\\d+)");
    static const boost::regex re_dta("\\.(\\d+)\\.\\d+\\.\\d+(?:\\.dta)?(?:\\s|$)");
    boost::smatch m;
    try {
        if (boost::regex_match(scan_id, m, re_plain) || boost::regex_search(scan_id, m, re_native)
            || boost::regex_search(scan_id, m, re_dta)) {
            scan_num = boost::lexical_cast<unsigned int>(m[1]);
            return true;
        }
    } catch (const boost::bad_lexical_cast &) {
        cerr << "WARNING: scan number out of range in '" << scan_id << "'" << endl;
    }
    return false;
}
