#include <algorithm>

#include <gsl/gsl_histogram.h>
#include <gsl/gsl_statistics_double.h>

#include "Search.hpp"
#include "Util.hpp"

const int SearchSummary::numPositionBins;

Search::Search(const Localizer &localizer, const vector<PsmRecord> &records, int num_threads)
    : _localizer(&localizer), _records(&records), _numThreads(num_threads < 1 ? 1 : num_threads),
      _numDone(0), _cancelled(false), _write_mutex(new boost::mutex()) {
    results.resize(records.size());
}

void Search::run() {
    double vm, rss;
    cout << "...Localizing modifications on " << _records->size() << " PSMs" << endl;

    if (_numThreads == 1) { // Parallelization overhead is pretty small (~5-10%) but it's nice to avoid it
        localizeMT(0);
    } else {
        {
            boost::mutex::scoped_lock lock(*_write_mutex);
            if (_cancelled)
                return;
            _btg.reset(new boost::thread_group());
            for (int i = 0; i < _numThreads; i++) {
                if (LocalizeOptions::verbose) {
                    cout << "... starting thread # " << i << endl;
                }
                _btg->add_thread(new boost::thread(boost::bind(&Search::localizeMT, this, i)));
            }
        }
        _btg->join_all();
    }
    sort(failures.begin(), failures.end());

    if (LocalizeOptions::verbose) {
        procMemUsage(vm, rss);
        cout << "VM: " << vm << "; RSS: " << rss << endl;
    }
    return;
}

void Search::localizeMT(int cur_thread_num) {
    int local_cnt = 0;
    for (vector<PsmRecord>::const_iterator psmIt = _records->begin(); psmIt != _records->end(); psmIt++) {
        local_cnt++;
        if ((local_cnt - cur_thread_num - 1) % _numThreads != 0)
            continue;

        boost::this_thread::interruption_point();
        if (isCancelled())
            return;

        try {
            results[local_cnt - 1] = _localizer->localize(*psmIt);
        } catch (const LocalizationError &e) {
            addFailure(*psmIt, e);
        }
        countDone();
    }
    return;
}

void Search::addFailure(const PsmRecord &psm, const LocalizationError &e) {
    boost::mutex::scoped_lock lock(*_write_mutex);
    failures.push_back(LocalizationFailure(psm.rowIndex, psm.scanId, e.kind(), e.detail(), e.isFatal()));
    if (LocalizeOptions::verbose || e.isFatal()) {
        cerr << "WARNING: " << e.what() << endl;
    }
}

void Search::countDone() {
    boost::mutex::scoped_lock lock(*_write_mutex);
    _numDone++;
    if (LocalizeOptions::progressInterval > 0 && _numDone % LocalizeOptions::progressInterval == 0) {
        cout << "...  " << (int) (_numDone * 100.0 / _records->size()) << "%" << endl;
    }
}

void Search::cancel() {
    boost::mutex::scoped_lock lock(*_write_mutex);
    _cancelled = true;
    if (_btg) {
        _btg->interrupt_all();
    }
}

bool Search::isCancelled() const {
    boost::mutex::scoped_lock lock(*_write_mutex);
    return _cancelled;
}

bool Search::hasFatalFailures() const {
    for (vector<LocalizationFailure>::const_iterator fIt = failures.begin(); fIt != failures.end(); fIt++) {
        if (fIt->fatal)
            return true;
    }
    return false;
}

SearchSummary Search::summarize() const {
    SearchSummary summary;
    summary.numRecords = _records->size();
    summary.numFailed = failures.size();
    for (vector<LocalizationFailure>::const_iterator fIt = failures.begin(); fIt != failures.end(); fIt++) {
        if (!fIt->fatal)
            summary.numDegenerate++;
    }

    vector<double> delta_scores;
    gsl_histogram * pos_hist = gsl_histogram_alloc(SearchSummary::numPositionBins);
    gsl_histogram_set_ranges_uniform(pos_hist, 0.0, 1.0);
    for (vector<LocalizationResult>::const_iterator rIt = results.begin(); rIt != results.end(); rIt++) {
        if (!rIt->isLocalized())
            continue;
        delta_scores.push_back(rIt->deltaScore);

        double rel_pos = (double) rIt->position / (rIt->positionScores.size() - 1);
        if (rel_pos >= 1.0) { // upper range is exclusive, C-terminal residue goes in the last bin
            rel_pos = 1.0 - 0.5 / SearchSummary::numPositionBins;
        }
        gsl_histogram_increment(pos_hist, rel_pos);
    }
    for (int i = 0; i < SearchSummary::numPositionBins; i++) {
        summary.positionHistogram[i] = (size_t) gsl_histogram_get(pos_hist, i);
    }
    gsl_histogram_free(pos_hist);

    summary.numLocalized = delta_scores.size();
    if (delta_scores.size() > 0) {
        summary.meanDeltaScore = gsl_stats_mean(&delta_scores[0], 1, delta_scores.size());
    }
    if (delta_scores.size() > 1) {
        summary.sdDeltaScore = gsl_stats_sd_m(&delta_scores[0], 1, delta_scores.size(), summary.meanDeltaScore);
    }
    return summary;
}

void SearchSummary::print(ostream &out) const {
    out << endl;
    out << numLocalized << " of " << numRecords << " PSMs localized";
    if (numFailed > 0) {
        out << ", " << numFailed << " failed (" << numDegenerate << " too short to fragment)";
    }
    out << endl;
    out << "delta_shifted_hyperscore mean = " << toStr(meanDeltaScore, 4) << "; sd = " << toStr(sdDeltaScore, 4) << endl;
    out << "relative mod position:" << endl;
    for (int i = 0; i < numPositionBins; i++) {
        out << "  [" << toStr((double) i / numPositionBins, 1) << ", " << toStr((double) (i + 1) / numPositionBins, 1)
            << (i + 1 == numPositionBins ? "]" : ")") << "\t" << positionHistogram[i] << endl;
    }
}
