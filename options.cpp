#include "mascpcr.h"
#include "errors.h"

#include <stdlib.h>
#include <getopt.h>
#include <ctype.h>

#include <iostream>
#include <sstream>

using namespace std;

Options::Verbosity parse_verbosity(const string &m_buffer);
Options::SearchMode parse_search_mode(const string &m_buffer);
Options::StrandSelection parse_strand_selection(const string &m_buffer);
bool parse_weights(const string &m_buffer, vector<float> &m_weights);

Options::Options()
{
	// Set the default options
	output_filter = VERBOSE;
	output_format = TEXT_OUTPUT;

	search_mode = BOTH_SEARCH;
	strand_selection = STRAND_BOTH;

	// An anchor_stop < 0 scans to the end of the mutant genome
	anchor_start = 0;
	anchor_stop = -1;
	anchor_step = DEFAULT_ANCHOR_STEP;

	// A max_thread of 0 uses all available threads
	max_thread = 0;

	quit = false;
}

void Options::load(int argc, char *argv[])
{
	bool print_usage = (argc <= 1);

	// Command line options:
	// --mut <mutant (recoded) genome in fasta format>
	// --ref <reference (wildtype) genome in fasta format>
	// --idx-lut <mutant to reference coordinate table>
	// [--edges <mutant coordinates that border an edit>]
	// [--mismatches <mutant coordinates that carry a designed mismatch>]
	// -o <output file>
	// [--o.text (output results as text)]
	// [--o.json (output results in JSON format)]
	// [--mode <discriminatory, common, both> (default is both)]
	// [--strand <plus, minus, both> (default is both)]
	// [--start <first anchor coordinate> (default is 0)]
	// [--stop <last anchor coordinate> (default is the end of the genome)]
	// [--step <anchor increment> (default is 1)]
	// [--primer.size.min <minimum primer length> (default is 18)]
	// [--primer.size.max <maximum primer length> (default is 30)]
	// [--primer.tm.min <minimum primer melting temperature>]
	// [--primer.tm.max <maximum primer melting temperature>]
	// [--primer.clip <hairpin and homodimer Tm cutoff>]
	// [--primer.strand <primer concentration>]
	// [--salt <salt concentration>]
	// [--mismatch.min <minimum number of designed mismatches in a discriminatory primer>]
	// [--mismatch.weights <comma separated weights, starting at the primer 3' end>]
	// [--lenient (skip the discriminatory GC clamp and structure checks)]
	// [--thread <maximum number of OpenMP threads> (default is all)]
	// [-v <verbosity level: silent, verbose, everything>]

	const char* options = "o:v:?h";
	int config_opt = 0;
	int long_index = 0;

	struct option long_opts[] = {
		{"mut", true, &config_opt, 1},
		{"ref", true, &config_opt, 2},
		{"idx-lut", true, &config_opt, 3},
		{"edges", true, &config_opt, 4},
		{"mismatches", true, &config_opt, 5},
		{"mode", true, &config_opt, 6},
		{"strand", true, &config_opt, 7},
		{"start", true, &config_opt, 8},
		{"stop", true, &config_opt, 9},
		{"step", true, &config_opt, 10},
		{"primer.size.min", true, &config_opt, 11},
		{"primer.size.max", true, &config_opt, 12},
		{"primer.tm.min", true, &config_opt, 13},
		{"primer.tm.max", true, &config_opt, 14},
		{"primer.clip", true, &config_opt, 15},
		{"primer.strand", true, &config_opt, 16},
		{"salt", true, &config_opt, 17},
		{"mismatch.min", true, &config_opt, 18},
		{"mismatch.weights", true, &config_opt, 19},
		{"lenient", false, &config_opt, 20},
		{"thread", true, &config_opt, 21},
		{"o.text", false, &config_opt, 22},
		{"o.json", false, &config_opt, 23},
		{0,0,0,0} // Terminate options list
	};

	int opt_code;
	opterr = 0;

	while( (opt_code = getopt_long( argc, argv, options, long_opts, &long_index) ) != EOF ){

		switch( opt_code ){
			case 0:

				if(config_opt == 1){ // mut

					mut_filename = optarg;
					break;
				}

				if(config_opt == 2){ // ref

					ref_filename = optarg;
					break;
				}

				if(config_opt == 3){ // idx-lut

					idx_lut_filename = optarg;
					break;
				}

				if(config_opt == 4){ // edges

					edge_filename = optarg;
					break;
				}

				if(config_opt == 5){ // mismatches

					mismatch_filename = optarg;
					break;
				}

				if(config_opt == 6){ // mode

					search_mode = parse_search_mode(optarg);

					if(search_mode == UNKNOWN_SEARCH){
						throw ValidationError("Please enter a valid search mode: \"discriminatory\", \"common\", \"both\"");
					}

					break;
				}

				if(config_opt == 7){ // strand

					strand_selection = parse_strand_selection(optarg);

					if(strand_selection == STRAND_UNKNOWN){
						throw ValidationError("Please enter a valid strand: \"plus\", \"minus\", \"both\"");
					}

					break;
				}

				if(config_opt == 8){ // start

					anchor_start = atoi(optarg);

					if(anchor_start < 0){
						throw ValidationError("Please specify a start >= 0");
					}

					break;
				}

				if(config_opt == 9){ // stop

					anchor_stop = atoi(optarg);

					if(anchor_stop < 0){
						throw ValidationError("Please specify a stop >= 0");
					}

					break;
				}

				if(config_opt == 10){ // step

					const int step = atoi(optarg);

					if(step <= 0){
						throw ValidationError("Please specify a step > 0");
					}

					anchor_step = step;
					break;
				}

				if(config_opt == 11){ // primer.size.min

					param.size_range.first = atoi(optarg);
					break;
				}

				if(config_opt == 12){ // primer.size.max

					param.size_range.second = atoi(optarg);
					break;
				}

				if(config_opt == 13){ // primer.tm.min

					param.tm_range.first = atof(optarg);
					break;
				}

				if(config_opt == 14){ // primer.tm.max

					param.tm_range.second = atof(optarg);
					break;
				}

				if(config_opt == 15){ // primer.clip

					param.spurious_tm_clip = atof(optarg);
					break;
				}

				if(config_opt == 16){ // primer.strand

					param.thermo.primer_strand = atof(optarg);
					break;
				}

				if(config_opt == 17){ // salt

					param.thermo.salt = atof(optarg);
					break;
				}

				if(config_opt == 18){ // mismatch.min

					param.min_num_mismatches = atoi(optarg);
					break;
				}

				if(config_opt == 19){ // mismatch.weights

					if( !parse_weights(optarg, param.mismatch_weights) ){
						throw ValidationError("Please specify a comma separated list of mismatch weights");
					}

					break;
				}

				if(config_opt == 20){ // lenient

					param.lenient_mode = true;
					break;
				}

				if(config_opt == 21){ // thread

					max_thread = abs( atoi(optarg) );
					break;
				}

				if(config_opt == 22){ // o.text

					output_format = TEXT_OUTPUT;
					break;
				}

				if(config_opt == 23){ // o.json

					output_format = JSON_OUTPUT;
					break;
				}

				throw ValidationError("Unknown command line flag!");

			case 'o':
				output_filename = optarg;
				break;
			case 'v':
				output_filter = parse_verbosity(optarg);

				if(output_filter == UNKNOWN_VERBOSITY){
					throw ValidationError("Please enter a valid verbosity flag: \"silent\", \"verbose\", \"everything\"");
				}

				break;
			case 'h':
			case '?':
				print_usage = true;
				break;
			default:
				{
					stringstream ssout;

					ssout << '\"' << (char)opt_code << "\" is not a valid option!";

					throw ValidationError( ssout.str() );
				}
		};
	}

	if(print_usage){

		cerr << "mascpcr version "
			<< MASCPCR_MAJOR_VERSION << "."
			<< MASCPCR_MINOR_VERSION << endl;
		cerr << "Usage:" << endl;
		cerr << "\t--mut <mutant (recoded) genome fasta file>" << endl;
		cerr << "\t--ref <reference (wildtype) genome fasta file>" << endl;
		cerr << "\t--idx-lut <mutant to reference coordinate table>" << endl;
		cerr << "\t[--edges <file of mutant coordinates that border an edit>]" << endl;
		cerr << "\t[--mismatches <file of mutant coordinates that carry a designed mismatch>]" << endl;
		cerr << "\t-o <output file>" << endl;
		cerr << "\t[--o.text (output results as text; default)]" << endl;
		cerr << "\t[--o.json (output results in JSON format)]" << endl;
		cerr << "\t[--mode <discriminatory, common, both> (default is both)]" << endl;
		cerr << "\t[--strand <plus, minus, both> (default is both)]" << endl;
		cerr << "\t[--start <first anchor coordinate> (default is 0)]" << endl;
		cerr << "\t[--stop <last anchor coordinate> (default is the end of the genome)]" << endl;
		cerr << "\t[--step <anchor increment> (default is " << DEFAULT_ANCHOR_STEP << ")]" << endl;
		cerr << "\t[--primer.size.min <minimum primer length> (default is " << DEFAULT_MIN_PRIMER << ")]" << endl;
		cerr << "\t[--primer.size.max <maximum primer length> (default is " << DEFAULT_MAX_PRIMER << ")]" << endl;
		cerr << "\t[--primer.tm.min <minimum primer melting temperature> (default is " << DEFAULT_MIN_PRIMER_TM << ")]" << endl;
		cerr << "\t[--primer.tm.max <maximum primer melting temperature> (default is " << DEFAULT_MAX_PRIMER_TM << ")]" << endl;
		cerr << "\t[--primer.clip <max hairpin and homodimer Tm> (default is " << DEFAULT_SPURIOUS_TM_CLIP << ")]" << endl;
		cerr << "\t[--primer.strand <primer strand concentration> (default is " << DEFAULT_PRIMER_STRAND << ")]" << endl;
		cerr << "\t[--salt <salt concentration> (default is " << DEFAULT_SALT << ")]" << endl;
		cerr << "\t[--mismatch.min <minimum number of designed mismatches> (default is " << DEFAULT_MIN_NUM_MISMATCHES << ")]" << endl;
		cerr << "\t[--mismatch.weights <comma separated weights from the 3' end> (default is 5,4,4,3,3,2,1)]" << endl;
		cerr << "\t[--lenient (skip the GC clamp and structure checks for discriminatory primers)]" << endl;
		cerr << "\t[--thread <maximum number of OpenMP threads> (default is all)]" << endl;
		cerr << "\t[-v <verbosity level: silent, verbose, everything>]" << endl;

		// Printing the usage is not an error
		quit = true;
		return;
	}

	if( mut_filename.empty() ){
		throw ValidationError("Please specify a mutant genome (--mut)");
	}

	if( ref_filename.empty() ){
		throw ValidationError("Please specify a reference genome (--ref)");
	}

	if( idx_lut_filename.empty() ){
		throw ValidationError("Please specify a mutant to reference index table (--idx-lut)");
	}

	if( output_filename.empty() ){
		throw ValidationError("Please specify an output filename (-o)");
	}

	if( (anchor_stop >= 0) && (anchor_stop < anchor_start) ){
		throw ValidationError("The stop coordinate must be >= the start coordinate");
	}

	param.validate();
}

Options::Verbosity parse_verbosity(const string &m_buffer)
{
	const string buffer = tolower(m_buffer);

	if(buffer == "silent"){
		return Options::SILENT;
	}

	if(buffer == "verbose"){
		return Options::VERBOSE;
	}

	if(buffer == "everything"){
		return Options::EVERYTHING;
	}

	return Options::UNKNOWN_VERBOSITY;
}

Options::SearchMode parse_search_mode(const string &m_buffer)
{
	const string buffer = tolower(m_buffer);

	if( (buffer == "discriminatory") || (buffer == "disc") ){
		return Options::DISCRIMINATORY_SEARCH;
	}

	if(buffer == "common"){
		return Options::COMMON_SEARCH;
	}

	if(buffer == "both"){
		return Options::BOTH_SEARCH;
	}

	return Options::UNKNOWN_SEARCH;
}

Options::StrandSelection parse_strand_selection(const string &m_buffer)
{
	const string buffer = tolower(m_buffer);

	if( (buffer == "plus") || (buffer == "+") || (buffer == "1") ){
		return Options::STRAND_PLUS;
	}

	if( (buffer == "minus") || (buffer == "-") || (buffer == "-1") ){
		return Options::STRAND_MINUS;
	}

	if(buffer == "both"){
		return Options::STRAND_BOTH;
	}

	return Options::STRAND_UNKNOWN;
}

// Parse "5,4,4,3" into a list of weights. Returns false if the list is empty
// or contains anything that is not a number.
bool parse_weights(const string &m_buffer, vector<float> &m_weights)
{
	vector<float> weights;

	stringstream ssin(m_buffer);
	string token;

	while( getline(ssin, token, ',') ){

		char* end = NULL;
		const float w = strtof(token.c_str(), &end);

		if( token.empty() || (end == NULL) || (*end != '\0') ){
			return false;
		}

		weights.push_back(w);
	}

	if( weights.empty() ){
		return false;
	}

	m_weights.swap(weights);

	return true;
}

string tolower(const string &m_str)
{
	string ret(m_str);

	for(string::iterator i = ret.begin();i != ret.end();++i){
		*i = ::tolower( (unsigned char)(*i) );
	}

	return ret;
}
