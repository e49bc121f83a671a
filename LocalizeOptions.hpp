#ifndef _LOCALIZEOPTIONS_HPP
#define	_LOCALIZEOPTIONS_HPP

#include <stdio.h>
#include <stdlib.h>
#include <iostream>
#include <iterator>
#include <fstream>
#include <sstream>
#include <vector>
#include <string>
#include <exception>

#include "Util.hpp"
using namespace std;

#include <boost/program_options.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/bind.hpp>
#include <boost/algorithm/string.hpp>

#include "Match.hpp"

namespace po = boost::program_options;

/**
 * Encapsulate the localization options into a class, reading them in from
 * cmdline/config file with boost::program_options. The config file is either
 * the Sage JSON configuration of the search that produced the PSMs, from which
 * only the fragment tolerance is taken, or a key = value parameter file with
 * the options below.
 */
class LocalizeOptions {
public:
    // General Options
    static bool verbose;
    static int maxNumThreads;
    static string pinFile;
    static string spectraPath;
    static string configFile;

    // Localize Options
    static double fragmentTolLow;
    static double fragmentTolHigh;
    static string outputDir;
    static int progressInterval;

    static const int errorExitStatus = 2;

    LocalizeOptions(int ac, char *av[]);

    static FragmentTolerance getFragmentTolerance();

    void printParams();
    void parseNumThreads (const int &input_num_th);
    void parseFragmentTolerance(const string &tolerance_input);
    void readSageConfig(const string &json_file);
    virtual ~LocalizeOptions();

private:
    bool _fragmentTolOnCmdline;

    void parseProgramOptions(int ac, char *av[]);
};

#endif	/* _LOCALIZEOPTIONS_HPP */

