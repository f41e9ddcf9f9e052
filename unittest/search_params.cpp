/// \file search_params.cpp
///
/// unit tests for search parameter defaults, validation and command line options
///
#include <string>
#include <vector>

#include <getopt.h>

#include "mascpcr.h"
#include "errors.h"
#include <catch2/catch.hpp>

using namespace std;

TEST_CASE("Search parameter defaults", "[search_params]") {

	const SearchParams param;

	REQUIRE(param.tm_range.first == Approx(60.0f));
	REQUIRE(param.tm_range.second == Approx(65.0f));
	REQUIRE(param.spurious_tm_clip == Approx(40.0f));
	REQUIRE(param.min_size() == 18);
	REQUIRE(param.max_size() == 30);
	REQUIRE(param.min_num_mismatches == 1);
	REQUIRE_FALSE(param.lenient_mode);

	REQUIRE(param.mismatch_weights.size() == 7);
	REQUIRE(param.mismatch_weight(0) == Approx(5.0f));
	REQUIRE(param.mismatch_weight(5) == Approx(2.0f));
	REQUIRE(param.mismatch_weight(6) == Approx(1.0f));

	REQUIRE(param.thermo.salt == Approx(0.05f));
	REQUIRE(param.thermo.primer_strand == Approx(9.0e-7f));

	REQUIRE_NOTHROW( param.validate() );
}

TEST_CASE("Invalid search parameters", "[search_params]") {

	SearchParams param;

	SECTION("Size range") {

		param.size_range = make_pair(0, 30);
		REQUIRE_THROWS_AS(param.validate(), ValidationError);

		param.size_range = make_pair(31, 30);
		REQUIRE_THROWS_AS(param.validate(), ValidationError);

		// A single primer length is allowed
		param.size_range = make_pair(20, 20);
		REQUIRE_NOTHROW( param.validate() );
	}

	SECTION("Tm range") {

		// The score divides by the width of the Tm range
		param.tm_range = make_pair(62.0f, 62.0f);
		REQUIRE_THROWS_AS(param.validate(), ValidationError);
	}

	SECTION("Clip") {

		param.spurious_tm_clip = 0.0f;
		REQUIRE_THROWS_AS(param.validate(), ValidationError);
	}

	SECTION("Mismatch requirements") {

		param.min_num_mismatches = -1;
		REQUIRE_THROWS_AS(param.validate(), ValidationError);

		param.min_num_mismatches = 1;
		param.mismatch_weights.clear();
		REQUIRE_THROWS_AS(param.validate(), ValidationError);
	}

	SECTION("Concentrations") {

		param.thermo.salt = 0.0f;
		REQUIRE_THROWS_AS(param.validate(), ValidationError);

		param.thermo.salt = DEFAULT_SALT;
		param.thermo.primer_strand = -1.0f;
		REQUIRE_THROWS_AS(param.validate(), ValidationError);
	}
}

TEST_CASE("Search outcome names", "[search_params]") {

	REQUIRE(string( outcome_name(PRIMER_FOUND) ) == "found");
	REQUIRE(string( outcome_name(GC_CLAMP) ) == "3' GC clamp");
	REQUIRE(string( outcome_name(NO_ADMISSIBLE_WINDOW) ) == "no admissible window");
}

TEST_CASE("Lower casing option values", "[search_params][options]") {

	REQUIRE(tolower("PLUS") == "plus");
	REQUIRE(tolower("Discriminatory") == "discriminatory");

	// Bytes outside of ASCII are left alone
	REQUIRE(tolower("A" "\xC9" "B") == "a" "\xC9" "b");
}

// getopt_long keeps global state, so reset it before every parse
static void load_options(Options &m_opt, vector<string> m_args)
{
	vector<char*> argv;

	for(vector<string>::iterator i = m_args.begin();i != m_args.end();++i){
		argv.push_back( &(*i)[0] );
	}

	argv.push_back(NULL);

	optind = 0;

	m_opt.load(int(m_args.size()), &argv[0]);
}

TEST_CASE("Command line options", "[search_params][options]") {

	vector<string> args;

	args.push_back("mascpcr");
	args.push_back("--mut");
	args.push_back("mut.fna");
	args.push_back("--ref");
	args.push_back("ref.fna.gz");
	args.push_back("--idx-lut");
	args.push_back("idx.txt");
	args.push_back("-o");
	args.push_back("out.txt");

	SECTION("Defaults") {

		Options opt;

		load_options(opt, args);

		REQUIRE_FALSE(opt.quit);
		REQUIRE(opt.mut_filename == "mut.fna");
		REQUIRE(opt.ref_filename == "ref.fna.gz");
		REQUIRE(opt.idx_lut_filename == "idx.txt");
		REQUIRE(opt.edge_filename.empty());
		REQUIRE(opt.output_filename == "out.txt");
		REQUIRE(opt.search_mode == Options::BOTH_SEARCH);
		REQUIRE(opt.strand_selection == Options::STRAND_BOTH);
		REQUIRE(opt.output_format == Options::TEXT_OUTPUT);
		REQUIRE(opt.anchor_start == 0);
		REQUIRE(opt.anchor_stop == -1);
		REQUIRE(opt.anchor_step == 1);
	}

	SECTION("Search selection and parameters") {

		args.push_back("--mode");
		args.push_back("common");
		args.push_back("--strand");
		args.push_back("minus");
		args.push_back("--start");
		args.push_back("100");
		args.push_back("--stop");
		args.push_back("200");
		args.push_back("--step");
		args.push_back("5");
		args.push_back("--primer.size.min");
		args.push_back("20");
		args.push_back("--primer.tm.max");
		args.push_back("68");
		args.push_back("--mismatch.weights");
		args.push_back("6,5,4");
		args.push_back("--lenient");
		args.push_back("--o.json");

		Options opt;

		load_options(opt, args);

		REQUIRE_FALSE(opt.quit);
		REQUIRE(opt.search_mode == Options::COMMON_SEARCH);
		REQUIRE(opt.strand_selection == Options::STRAND_MINUS);
		REQUIRE(opt.anchor_start == 100);
		REQUIRE(opt.anchor_stop == 200);
		REQUIRE(opt.anchor_step == 5);
		REQUIRE(opt.param.min_size() == 20);
		REQUIRE(opt.param.tm_range.second == Approx(68.0f));
		REQUIRE(opt.param.mismatch_weights.size() == 3);
		REQUIRE(opt.param.mismatch_weight(10) == Approx(4.0f));
		REQUIRE(opt.param.lenient_mode);
		REQUIRE(opt.output_format == Options::JSON_OUTPUT);
	}

	SECTION("Invalid values") {

		Options opt;

		// A minimum primer size above the default maximum
		args.push_back("--primer.size.min");
		args.push_back("40");

		REQUIRE_THROWS_AS(load_options(opt, args), ValidationError);
	}

	SECTION("Unknown option values") {

		Options opt;

		args.push_back("--strand");
		args.push_back("sideways");

		REQUIRE_THROWS_AS(load_options(opt, args), ValidationError);
	}

	SECTION("An inverted anchor range") {

		Options opt;

		args.push_back("--start");
		args.push_back("200");
		args.push_back("--stop");
		args.push_back("100");

		REQUIRE_THROWS_AS(load_options(opt, args), ValidationError);
	}

	SECTION("Missing inputs") {

		Options opt;

		args.erase( args.begin() + 1, args.begin() + 3 ); // Drop --mut

		REQUIRE_THROWS_AS(load_options(opt, args), ValidationError);
	}

	SECTION("Asking for help is not an error") {

		Options opt;

		args.push_back("-h");

		REQUIRE_NOTHROW( load_options(opt, args) );
		REQUIRE(opt.quit);
	}
}
