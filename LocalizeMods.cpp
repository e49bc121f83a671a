#include <stdio.h>
#include <stdlib.h>
#include <time.h>
#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <algorithm>

#include <boost/shared_ptr.hpp>

#include "LocalizeOptions.hpp"
#include "PsmFile.hpp"
#include "Run.hpp"
#include "Localizer.hpp"
#include "Search.hpp"
#include "Util.hpp"

using namespace std;

int main(int argc, char *argv[]) {
    time_t start = time(NULL);
    LocalizeOptions opts(argc, argv);

    boost::shared_ptr<PsmFile> pin;
    boost::shared_ptr<Run> run;
    try {
        pin.reset(new PsmFile(LocalizeOptions::pinFile));
        run.reset(new Run(LocalizeOptions::spectraPath));
    } catch (const std::runtime_error &e) {
        cerr << "ERROR: " << e.what() << endl;
        return LocalizeOptions::errorExitStatus;
    }

    Localizer localizer(*run, LocalizeOptions::getFragmentTolerance());
    Search search(localizer, pin->records);
    search.run();

    vector<LocalizationFailure> failures(pin->readFailures);
    failures.insert(failures.end(), search.failures.begin(), search.failures.end());
    sort(failures.begin(), failures.end());

    try {
        cout << "...Writing new PIN file" << endl;
        string out_file = pin->writeLocalized(LocalizeOptions::outputDir, search.results);
        cout << "...  wrote " << out_file << endl;

        if (!failures.empty()) {
            string failed_file = PsmFile::outputPath(LocalizeOptions::pinFile, LocalizeOptions::outputDir, ".failed.tsv");
            ofstream out(failed_file.c_str());
            if (!out.is_open()) {
                throw std::runtime_error("Error opening output file " + failed_file);
            }
            PsmFile::writeFailures(out, failures);
            out.close();
            cout << "...  wrote " << failures.size() << " failed PSMs to " << failed_file << endl;
        }
    } catch (const std::runtime_error &e) {
        cerr << "ERROR: " << e.what() << endl;
        return LocalizeOptions::errorExitStatus;
    }

    SearchSummary summary = search.summarize();
    summary.numRecords += pin->readFailures.size();
    summary.numFailed += pin->readFailures.size();
    summary.print(cout);

    double vm, rss;
    procMemUsage(vm, rss);
    cout << "VM: " << vm << "; RSS: " << rss << endl;
    cout << "DONE! Completed in " << toStr(difftime(time(NULL), start) / 60.0, 2) << " min." << endl;

    if (!pin->readFailures.empty() || search.hasFatalFailures()) {
        return 1;
    }
    return 0;
}
