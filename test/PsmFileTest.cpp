#include <math.h>
#include <stdlib.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <boost/algorithm/string.hpp>
#include <gtest/gtest.h>

#include "PsmFile.hpp"

namespace {

const char * kPin =
    "SpecId\tLabel\tscannr\texpmass\tcalcmass\tcharge\tpeptide\tproteins\n"
    "a_1\t1\t101\t1000.5\t921.5\t2\tLESLIEK\tsp|P1\n"
    "a_2\t-1\t102\t800.25\t800.25\t3\tPEPTIDE\tsp|P2\tsp|P3\tsp|P4\r\n"
    "\n"
    "a_3\t1\t103\tnan-ish\t700.0\t2\tPEPK\tsp|P5\n"
    "a_4\t1\t104\t600.0\t600.0\n"
    "a_5\t1\t105\t500.0\t421.0\t1\tGGK\tsp|P6\n";

LocalizationResult localizedAt(int position, double score, double delta) {
    LocalizationResult result;
    result.position = position;
    result.score = score;
    result.deltaScore = delta;
    return result;
}

}

TEST(PsmFileTest, ReadsRecords) {
    PsmFile pin;
    stringstream ss(kPin);
    pin.read(ss);

    ASSERT_EQ(8u, pin.header.size());
    ASSERT_EQ(3u, pin.records.size());

    const PsmRecord &first = pin.records[0];
    EXPECT_EQ(0u, first.rowIndex);
    EXPECT_EQ("101", first.scanId);
    EXPECT_EQ("LESLIEK", first.peptide);
    EXPECT_EQ(2, first.charge);
    EXPECT_DOUBLE_EQ(79.0, first.getDeltaMass());

    const PsmRecord &ragged = pin.records[1];
    EXPECT_EQ(1u, ragged.rowIndex);
    EXPECT_EQ(3, ragged.charge);
    ASSERT_EQ(10u, ragged.fields.size());
    EXPECT_EQ("sp|P4", ragged.fields.back());

    EXPECT_EQ(4u, pin.records[2].rowIndex);
    EXPECT_EQ("GGK", pin.records[2].peptide);
}

TEST(PsmFileTest, UnreadableRowsAreReported) {
    PsmFile pin;
    stringstream ss(kPin);
    pin.read(ss);

    ASSERT_EQ(2u, pin.readFailures.size());
    EXPECT_EQ(2u, pin.readFailures[0].rowIndex);
    EXPECT_EQ("103", pin.readFailures[0].scanId);
    EXPECT_EQ("MalformedRecord", pin.readFailures[0].kind);
    EXPECT_NE(string::npos, pin.readFailures[0].message.find("expmass"));
    EXPECT_TRUE(pin.readFailures[0].fatal);

    EXPECT_EQ(3u, pin.readFailures[1].rowIndex);
    EXPECT_EQ("104", pin.readFailures[1].scanId);
}

TEST(PsmFileTest, NonFiniteMassesAreMalformed) {
    PsmFile pin;
    stringstream ss(
        "scannr\texpmass\tcalcmass\tcharge\tpeptide\n"
        "1\tnan\t1000.0\t2\tLESLIEK\n"
        "2\t1079.0\tinf\t2\tLESLIEK\n"
        "3\t-infinity\t1000.0\t2\tLESLIEK\n"
        "4\t1079.0\t1000.0\t2\tLESLIEK\n");
    pin.read(ss);

    ASSERT_EQ(1u, pin.records.size());
    EXPECT_EQ("4", pin.records[0].scanId);

    ASSERT_EQ(3u, pin.readFailures.size());
    EXPECT_EQ("1", pin.readFailures[0].scanId);
    EXPECT_EQ("MalformedRecord", pin.readFailures[0].kind);
    EXPECT_NE(string::npos, pin.readFailures[0].message.find("expmass"));
    EXPECT_NE(string::npos, pin.readFailures[1].message.find("calcmass"));
    EXPECT_EQ(2u, pin.readFailures[2].rowIndex);
}

TEST(PsmFileTest, MissingColumnThrows) {
    PsmFile pin;
    stringstream ss("scannr\texpmass\tcalcmass\tcharge\tPeptide\n1\t1.0\t1.0\t2\tPEPK\n");
    EXPECT_THROW(pin.read(ss), std::runtime_error);

    stringstream empty("");
    EXPECT_THROW(pin.read(empty), std::runtime_error);
}

TEST(PsmFileTest, WritesLocalizedRowsInInputOrder) {
    PsmFile pin;
    stringstream in(kPin);
    pin.read(in);

    vector<LocalizationResult> results(pin.records.size());
    results[0] = localizedAt(2, 9.352, 0.694);
    results[2] = localizedAt(0, 1.5, 0.0);

    stringstream out;
    pin.writeLocalized(out, results);

    string line;
    ASSERT_TRUE(getline(out, line));
    EXPECT_EQ("SpecId\tLabel\tscannr\texpmass\tcalcmass\tcharge\tpeptide\tproteins"
              "\tmod_position\tshifted_hyperscore\tdelta_shifted_hyperscore", line);
    ASSERT_TRUE(getline(out, line));
    EXPECT_EQ("a_1\t1\t101\t1000.5\t921.5\t2\tLESLIEK\tsp|P1\t2\t9.352\t0.694", line);
    ASSERT_TRUE(getline(out, line));
    EXPECT_EQ("a_5\t1\t105\t500.0\t421.0\t1\tGGK\tsp|P6\t0\t1.5\t0", line);
    EXPECT_FALSE(getline(out, line));
}

TEST(PsmFileTest, ScoresKeepFullPrecision) {
    LocalizationResult result = localizedAt(2, log(8.0) + log(2.0) + log(720.0), 1.0 / 3.0);
    vector<string> fields;
    string output = result.getOutputString();
    boost::split(fields, output, boost::is_any_of("\t"));
    ASSERT_EQ(3u, fields.size());
    EXPECT_EQ("2", fields[0]);
    EXPECT_EQ(result.score, strtod(fields[1].c_str(), NULL));
    EXPECT_EQ(result.deltaScore, strtod(fields[2].c_str(), NULL));
}

TEST(PsmFileTest, SurplusFieldsFollowTheNewColumns) {
    PsmFile pin;
    stringstream in(kPin);
    pin.read(in);

    vector<LocalizationResult> results(pin.records.size());
    results[1] = localizedAt(4, 3.0, 1.0);

    stringstream out;
    pin.writeLocalized(out, results);
    string line;
    getline(out, line);
    ASSERT_TRUE(getline(out, line));
    EXPECT_EQ("a_2\t-1\t102\t800.25\t800.25\t3\tPEPTIDE\tsp|P2\t4\t3\t1\tsp|P3\tsp|P4", line);
}

TEST(PsmFileTest, ResultCountMustMatch) {
    PsmFile pin;
    stringstream in(kPin);
    pin.read(in);
    stringstream out;
    EXPECT_THROW(pin.writeLocalized(out, vector<LocalizationResult> (1)), std::invalid_argument);
}

TEST(PsmFileTest, FailureReport) {
    vector<LocalizationFailure> failures;
    failures.push_back(LocalizationFailure(4, "105", "SpectrumNotFound", "No spectrum found for scan '105'", true));
    stringstream out;
    PsmFile::writeFailures(out, failures);
    EXPECT_EQ("row\tscannr\terror\tmessage\n4\t105\tSpectrumNotFound\tNo spectrum found for scan '105'\n", out.str());
}

TEST(PsmFileTest, OutputPathUsesInputStem) {
    EXPECT_EQ((bfs::path("out") / "run01.localized.pin").string(),
              PsmFile::outputPath("/data/sage/run01.pin", "out", ".localized.pin"));
    EXPECT_EQ((bfs::path(".") / "run01.failed.tsv").string(),
              PsmFile::outputPath("run01.pin", ".", ".failed.tsv"));
}

TEST(PsmFileTest, FileRoundTrip) {
    bfs::path tmp_dir = bfs::temp_directory_path() / bfs::unique_path("localizemods-pin-%%%%-%%%%");
    bfs::create_directories(tmp_dir);
    string pin_path = (tmp_dir / "results.sage.pin").string();
    {
        ofstream out(pin_path.c_str());
        out << kPin;
    }

    PsmFile pin(pin_path);
    EXPECT_EQ(3u, pin.records.size());
    vector<LocalizationResult> results(pin.records.size(), localizedAt(1, 2.0, 0.5));
    string out_file = pin.writeLocalized(tmp_dir.string(), results);
    EXPECT_EQ((tmp_dir / "results.sage.localized.pin").string(), out_file);
    EXPECT_TRUE(bfs::exists(out_file));

    PsmFile localized(out_file);
    EXPECT_EQ(3u, localized.records.size());
    EXPECT_EQ(11u, localized.header.size());

    EXPECT_THROW(PsmFile((tmp_dir / "missing.pin").string()), std::runtime_error);
    bfs::remove_all(tmp_dir);
}
