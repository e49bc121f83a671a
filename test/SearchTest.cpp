#include <cmath>
#include <limits>

#include <gtest/gtest.h>

#include "Search.hpp"
#include "Run.hpp"

namespace {

Spectrum ladderSpectrum(const string &id, const string &pep, int charge) {
    FragmentTable ft(Peptide(pep), charge);
    Spectrum dta;
    dta._id = id;
    for (int c = 0; c < ft.max_charge; c++) {
        for (int i = 0; i < ft.getNumFragments(); i++) {
            dta.addPeak(ft.b[c][i], 4.0);
            dta.addPeak(ft.y[c][i], 4.0);
        }
    }
    return dta;
}

class SearchTest : public ::testing::Test {
protected:
    ::Run run;
    vector<PsmRecord> records;

    virtual void SetUp() {
        run.addSpectrum(ladderSpectrum("1", "LES[+79]LIEK", 2));
        run.addSpectrum(ladderSpectrum("3", "LESLIEK", 2));
        run.addSpectrum(ladderSpectrum("5", "PEPTIDEK[+14]", 2));

        addRecord("1", "LESLIEK", 1079.0, 1000.0);
        addRecord("3", "LESLIEK", 1000.0, 1000.0);
        addRecord("99", "LESLIEK", 1079.0, 1000.0);
        addRecord("1", "K", 1079.0, 1000.0);
        addRecord("1", "LESXIEK", 1079.0, 1000.0);
        addRecord("5", "PEPTIDEK", 1014.0, 1000.0);
    }

    virtual void TearDown() {
        LocalizeOptions::progressInterval = 10000;
    }

    void addRecord(const string &scan_id, const string &pep, double exp_mass, double calc_mass) {
        PsmRecord psm(scan_id, pep, 2, exp_mass, calc_mass);
        psm.rowIndex = records.size();
        records.push_back(psm);
    }
};

}

TEST_F(SearchTest, ResultsLineUpWithRecords) {
    Localizer localizer(run, FragmentTolerance(-10, 10));
    Search search(localizer, records, 1);
    search.run();

    ASSERT_EQ(records.size(), search.results.size());
    EXPECT_EQ(2, search.results[0].position);
    EXPECT_EQ(0, search.results[1].position);
    EXPECT_FALSE(search.results[2].isLocalized());
    EXPECT_FALSE(search.results[3].isLocalized());
    EXPECT_FALSE(search.results[4].isLocalized());
    EXPECT_EQ(7, search.results[5].position);
}

TEST_F(SearchTest, FailuresAreCollectedInRowOrder) {
    Localizer localizer(run, FragmentTolerance(-10, 10));
    Search search(localizer, records, 3);
    search.run();

    ASSERT_EQ(3u, search.failures.size());
    EXPECT_EQ(2u, search.failures[0].rowIndex);
    EXPECT_EQ("SpectrumNotFound", search.failures[0].kind);
    EXPECT_EQ("99", search.failures[0].scanId);
    EXPECT_EQ(3u, search.failures[1].rowIndex);
    EXPECT_EQ("DegenerateLadder", search.failures[1].kind);
    EXPECT_FALSE(search.failures[1].fatal);
    EXPECT_EQ(4u, search.failures[2].rowIndex);
    EXPECT_EQ("MalformedPeptide", search.failures[2].kind);
    EXPECT_TRUE(search.hasFatalFailures());
}

TEST_F(SearchTest, DegeneratePeptidesAreNotFatal) {
    vector<PsmRecord> short_only(1, records[3]);
    Localizer localizer(run, FragmentTolerance(-10, 10));
    Search search(localizer, short_only, 1);
    search.run();
    ASSERT_EQ(1u, search.failures.size());
    EXPECT_FALSE(search.hasFatalFailures());
}

TEST_F(SearchTest, ThreadCountDoesNotChangeResults) {
    Localizer localizer(run, FragmentTolerance(-10, 10));
    Search single(localizer, records, 1);
    single.run();
    Search multi(localizer, records, 4);
    multi.run();

    ASSERT_EQ(single.results.size(), multi.results.size());
    for (size_t i = 0; i < single.results.size(); i++) {
        EXPECT_EQ(single.results[i].position, multi.results[i].position);
        EXPECT_EQ(single.results[i].score, multi.results[i].score);
        EXPECT_EQ(single.results[i].deltaScore, multi.results[i].deltaScore);
    }
    ASSERT_EQ(single.failures.size(), multi.failures.size());
    for (size_t i = 0; i < single.failures.size(); i++) {
        EXPECT_EQ(single.failures[i].rowIndex, multi.failures[i].rowIndex);
    }
}

TEST_F(SearchTest, NonFiniteShiftFailsOnlyItsRecord) {
    addRecord("1", "LESLIEK", std::numeric_limits<double>::quiet_NaN(), 1000.0);
    Localizer localizer(run, FragmentTolerance(-10, 10));
    Search search(localizer, records, 2);
    search.run();

    ASSERT_EQ(records.size(), search.results.size());
    EXPECT_EQ(2, search.results[0].position);
    EXPECT_FALSE(search.results.back().isLocalized());
    ASSERT_FALSE(search.failures.empty());
    EXPECT_EQ(records.size() - 1, search.failures.back().rowIndex);
    EXPECT_EQ("MalformedRecord", search.failures.back().kind);
}

TEST_F(SearchTest, Summary) {
    LocalizeOptions::progressInterval = 1;
    Localizer localizer(run, FragmentTolerance(-10, 10));
    Search search(localizer, records, 2);
    search.run();
    SearchSummary summary = search.summarize();

    EXPECT_EQ(6u, summary.numRecords);
    EXPECT_EQ(3u, summary.numLocalized);
    EXPECT_EQ(3u, summary.numFailed);
    EXPECT_EQ(1u, summary.numDegenerate);

    double d0 = search.results[0].deltaScore;
    double d5 = search.results[5].deltaScore;
    double mean = (d0 + 0.0 + d5) / 3.0;
    EXPECT_NEAR(mean, summary.meanDeltaScore, 1e-9);
    double var = ((d0 - mean) * (d0 - mean) + mean * mean + (d5 - mean) * (d5 - mean)) / 2.0;
    EXPECT_NEAR(sqrt(var), summary.sdDeltaScore, 1e-9);

    // positions 2 of 7, 0 of 7 and 7 of 8 residues
    ASSERT_EQ(10u, summary.positionHistogram.size());
    EXPECT_EQ(1u, summary.positionHistogram[0]);
    EXPECT_EQ(1u, summary.positionHistogram[3]);
    EXPECT_EQ(1u, summary.positionHistogram[9]);

    stringstream ss;
    summary.print(ss);
    EXPECT_NE(string::npos, ss.str().find("3 of 6 PSMs localized"));
}

TEST_F(SearchTest, ProgressCountsFailedRecordsToo) {
    LocalizeOptions::progressInterval = 2;
    Localizer localizer(run, FragmentTolerance(-10, 10));
    Search search(localizer, records, 1);
    ::testing::internal::CaptureStdout();
    search.run();
    string progress = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(string::npos, progress.find("...  33%"));
    EXPECT_NE(string::npos, progress.find("...  66%"));
    EXPECT_NE(string::npos, progress.find("...  100%"));
}

TEST_F(SearchTest, EmptySummary) {
    vector<PsmRecord> none;
    Localizer localizer(run, FragmentTolerance(-10, 10));
    Search search(localizer, none, 2);
    search.run();
    SearchSummary summary = search.summarize();
    EXPECT_EQ(0u, summary.numLocalized);
    EXPECT_EQ(0.0, summary.meanDeltaScore);
    EXPECT_EQ(0.0, summary.sdDeltaScore);
}

TEST_F(SearchTest, CancelledSearchLocalizesNothing) {
    Localizer localizer(run, FragmentTolerance(-10, 10));
    for (int n_threads = 1; n_threads <= 2; n_threads++) {
        Search search(localizer, records, n_threads);
        search.cancel();
        EXPECT_TRUE(search.isCancelled());
        search.run();
        for (size_t i = 0; i < search.results.size(); i++) {
            EXPECT_FALSE(search.results[i].isLocalized());
        }
        EXPECT_TRUE(search.failures.empty());
    }
}
