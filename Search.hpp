#ifndef _SEARCH_HPP
#define	_SEARCH_HPP

#include <stdio.h>
#include <stdlib.h>
#include <iostream>
#include <vector>
#include <string>

#include <boost/thread/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/bind.hpp>
#include <boost/shared_ptr.hpp>

#include "LocalizeOptions.hpp"
#include "Localizer.hpp"
#include "SearchResult.hpp"

/**
 * Batch statistics over one run: how many PSMs were localized, how sure the
 * localizations were (delta score) and where on the peptide the shift landed
 * (relative position, 0 = N-terminal residue, 1 = C-terminal residue).
 */
class SearchSummary {
public:
    static const int numPositionBins = 10;

    size_t numRecords;
    size_t numLocalized;
    size_t numFailed;
    size_t numDegenerate;
    double meanDeltaScore;
    double sdDeltaScore;
    vector<size_t> positionHistogram;

    SearchSummary() : numRecords(0), numLocalized(0), numFailed(0), numDegenerate(0),
                      meanDeltaScore(0.0), sdDeltaScore(0.0), positionHistogram(numPositionBins, 0) {}

    void print(ostream &out) const;
};

/**
 * Localizes a table of PSMs over LocalizeOptions::maxNumThreads threads.
 * Thread t takes records t, t + N, t + 2N, ... and writes each result into its
 * own slot, so results[i] always belongs to records[i]. Records that fail are
 * collected in failures with their error kind; results[i] then stays
 * unlocalized.
 */
class Search {
public:
    vector<LocalizationResult> results;
    vector<LocalizationFailure> failures;

    Search(const Localizer &localizer, const vector<PsmRecord> &records, int num_threads = LocalizeOptions::maxNumThreads);

    void run();
    // stops the workers after the record each is on; safe to call from another thread
    void cancel();
    bool isCancelled() const;

    bool hasFatalFailures() const;
    SearchSummary summarize() const;

private:
    const Localizer * _localizer;
    const vector<PsmRecord> * _records;
    int _numThreads;
    size_t _numDone;
    bool _cancelled;
    boost::shared_ptr<boost::mutex> _write_mutex;
    boost::shared_ptr<boost::thread_group> _btg;

    void localizeMT(int cur_thread_num = 0);
    void addFailure(const PsmRecord &psm, const LocalizationError &e);
    void countDone();
};

#endif	/* _SEARCH_HPP */

