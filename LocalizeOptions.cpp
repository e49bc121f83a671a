#include <math.h>

#include "LocalizeOptions.hpp"

// Default General Options
bool LocalizeOptions::verbose = false;
int LocalizeOptions::maxNumThreads = 1;
string LocalizeOptions::pinFile = "";
string LocalizeOptions::spectraPath = "";
string LocalizeOptions::configFile = "";

// Default Localize Options
double LocalizeOptions::fragmentTolLow = -10.0;
double LocalizeOptions::fragmentTolHigh = 10.0;
string LocalizeOptions::outputDir = ".";
int LocalizeOptions::progressInterval = 10000;

const int LocalizeOptions::errorExitStatus;

LocalizeOptions::LocalizeOptions(int ac, char *av[]) : _fragmentTolOnCmdline(false) {
    parseProgramOptions(ac, av);
    printParams();
}

FragmentTolerance LocalizeOptions::getFragmentTolerance() {
    return FragmentTolerance(fragmentTolLow, fragmentTolHigh);
}

void LocalizeOptions::parseNumThreads (const int &input_num_th) {
    int numCPU = sysconf( _SC_NPROCESSORS_ONLN );
    if (input_num_th < 1)
        maxNumThreads = 1;
    else if (input_num_th > numCPU)
        maxNumThreads = numCPU;
    else
        maxNumThreads = input_num_th;
    return;
}

// "LOW HIGH ppm", or "X ppm" for a symmetric window
void LocalizeOptions::parseFragmentTolerance(const string &tolerance_input) {
    string buf;
    stringstream ss(tolerance_input);
    vector<string> tokens; // vector to hold tokens
    while (ss >> buf) {
        tokens.push_back(buf);
    }
    if (tokens.size() != 2 && tokens.size() != 3) {
        cerr << "ERROR: Fragment tolerance specified incorrectly" << endl;
        exit(errorExitStatus);
    }

    string unit = boost::to_upper_copy(tokens.back());
    if (unit.compare("PPM") != 0) {
        cerr << "ERROR: Fragment tolerance must be given in ppm" << endl;
        exit(errorExitStatus);
    }
    if (tokens.size() == 2) {
        fragmentTolHigh = fabs(atof(tokens[0].c_str()));
        fragmentTolLow = -fragmentTolHigh;
    } else {
        fragmentTolLow = atof(tokens[0].c_str());
        fragmentTolHigh = atof(tokens[1].c_str());
    }
    if (fragmentTolLow > fragmentTolHigh) {
        cerr << "ERROR: Fragment tolerance lower bound " << fragmentTolLow << " is above upper bound " << fragmentTolHigh << endl;
        exit(errorExitStatus);
    }
    return;
}

/*
 * Sage keeps the fragment window as "fragment_tol": {"ppm": [low, high]}.
 * Nothing else in its configuration matters here.
 */
void LocalizeOptions::readSageConfig(const string &json_file) {
    boost::property_tree::ptree pt;
    try {
        boost::property_tree::read_json(json_file, pt);
    } catch (const boost::property_tree::json_parser_error &e) {
        cerr << "ERROR: Can't read Sage configuration: " << e.what() << endl;
        exit(errorExitStatus);
    }

    if (_fragmentTolOnCmdline)
        return;

    boost::optional<boost::property_tree::ptree&> ppm_tol = pt.get_child_optional("fragment_tol.ppm");
    if (!ppm_tol) {
        if (pt.get_child_optional("fragment_tol.da")) {
            cerr << "ERROR: Sage fragment_tol is given in Da, only ppm windows are supported" << endl;
            exit(errorExitStatus);
        }
        cerr << "WARNING: no fragment_tol.ppm in " << json_file << ", using ["
             << fragmentTolLow << ", " << fragmentTolHigh << "] ppm" << endl;
        return;
    }

    vector<double> bounds;
    try {
        for (boost::property_tree::ptree::const_iterator ptIt = ppm_tol->begin(); ptIt != ppm_tol->end(); ptIt++) {
            bounds.push_back(ptIt->second.get_value<double>());
        }
    } catch (const boost::property_tree::ptree_bad_data &e) {
        cerr << "ERROR: Sage fragment_tol.ppm is not numeric: " << e.what() << endl;
        exit(errorExitStatus);
    }
    if (bounds.size() != 2 || bounds[0] > bounds[1]) {
        cerr << "ERROR: Sage fragment_tol.ppm must be [low, high]" << endl;
        exit(errorExitStatus);
    }
    fragmentTolLow = bounds[0];
    fragmentTolHigh = bounds[1];
    return;
}

void LocalizeOptions::printParams() {
    cout << "verbose                      = " << verbose << endl;
    cout << "maxNumThreads                = " << maxNumThreads << endl;
    cout << "pinFile                      = " << pinFile << endl;
    cout << "spectraPath                  = " << spectraPath << endl;
    cout << "configFile                   = " << configFile << endl;

    cout << endl;

    cout << "Localize.fragmentTol         = " << fragmentTolLow << " " << fragmentTolHigh << " ppm" << endl;
    cout << "Localize.outputDir           = " << outputDir << endl;
    cout << "Localize.progressInterval    = " << progressInterval << endl;

    cout << endl;
}

void LocalizeOptions::parseProgramOptions(int ac, char *av[]) {
    try {
        // Declare a group of options that will be
        // allowed only on command line
        po::options_description general("General options");
        general.add_options()
                ("version",                                                                                          "print current version")
                ("verbose,v",                 po::bool_switch(&verbose),                                             "verbose output")
                ("help,h",                                                                                           "print this help message")
                ("maxNumThreads,t",           po::value<int>()->notifier(
                                                     boost::bind(&LocalizeOptions::parseNumThreads, this, _1) ),     "maximum threads to use [1]")
                ;

        // Declare a group of options that will be
        // allowed both on command line and in
        // config file
        po::options_description localize("Localize Options");
        localize.add_options()
                ("Localize.fragmentTol",      po::value<string>()->notifier(
                                                     boost::bind(&LocalizeOptions::parseFragmentTolerance, this, _1) ), "fragment ion tolerance ('LOW HIGH ppm' or 'X ppm'), overrides the Sage configuration")
                ("Localize.outputDir,o",      po::value<string>(&outputDir)       ->default_value(outputDir),        "directory for the localized PIN file")
                ("Localize.progressInterval", po::value<int>(&progressInterval)   ->default_value(progressInterval), "report progress every N PSMs")
                ;

        po::options_description hidden("Hidden options");
        hidden.add_options()
                ("pin-file",                  po::value<string>(&pinFile),                                           "PSM table (PIN)")
                ("spectra",                   po::value<string>(&spectraPath),                                       "dta directory or MGF file")
                ("config-file",               po::value<string>(&configFile),                                        "Sage JSON configuration or parameter file")
                ;

        po::options_description cmdline_options;
        cmdline_options.add(general).add(localize).add(hidden);

        po::options_description config_file_options;
        config_file_options.add(localize);

        po::options_description visible("Usage: localizemods [options] PIN_FILE SPECTRA CONFIG_FILE");
        visible.add(general).add(localize);

        po::positional_options_description p;
        p.add("pin-file", 1);
        p.add("spectra", 1);
        p.add("config-file", 1);

        po::variables_map vm;
        po::parsed_options parsed = po::command_line_parser(ac, av).
                options(cmdline_options).positional(p).run();
        po::store(parsed, vm);

        if (vm.count("help")) {
            cout << visible << "\n";
            exit(0);
        }

        if (vm.count("version")) {
            cout << "localizemods, version 0.1" << endl;
            exit(0);
        }

        po::notify(vm);
        _fragmentTolOnCmdline = vm.count("Localize.fragmentTol") > 0;

        if (vm.count("pin-file") == 0 || vm.count("spectra") == 0 || vm.count("config-file") == 0) {
            cerr << "ERROR: PIN_FILE, SPECTRA and CONFIG_FILE are all required" << endl;
            cerr << visible << "\n";
            exit(errorExitStatus);
        }

        if (boost::iends_with(configFile, ".json")) {
            readSageConfig(configFile);
        } else {
            ifstream ifs(configFile.c_str());
            if (!ifs.is_open()) {
                cerr << "ERROR: Error opening parameter file " << configFile << endl;
                exit(errorExitStatus);
            }
            po::parsed_options parsed_cfg = po::parse_config_file(ifs, config_file_options, true);
            po::store(parsed_cfg, vm);
            po::notify(vm);
        }

    } catch (std::exception& e) {
        cerr << "ERROR: " << e.what() << "\n";
        exit(errorExitStatus);
    }

    return;
}

LocalizeOptions::~LocalizeOptions() {
}
