/// \file valid_primer.cpp
///
/// unit tests for the melting temperature and secondary structure filter
///
#include <string>

#include "primer.h"
#include "mock_oracle.h"
#include <catch2/catch.hpp>

using namespace std;

TEST_CASE("Melting temperature decides whether to keep growing a primer", "[valid_primer]") {

	const SearchParams param; // 60 <= Tm <= 65

	REQUIRE(check_tm(59.9f, param) == CONTINUE_SEARCH);
	REQUIRE(check_tm(60.0f, param) == ACCEPT_WINDOW);
	REQUIRE(check_tm(65.0f, param) == ACCEPT_WINDOW);
	REQUIRE(check_tm(65.1f, param) == STOP_SEARCH);
}

TEST_CASE("Stable secondary structure stops the search", "[valid_primer]") {

	const SearchParams param; // clip = 40

	PrimerThermo thermo;

	thermo.hairpin_tm = 40.0f;
	thermo.homodimer_tm = 40.0f;

	REQUIRE(check_structure(thermo, param) == ACCEPT_WINDOW);

	thermo.hairpin_tm = 40.5f;

	REQUIRE(check_structure(thermo, param) == STOP_SEARCH);

	thermo.hairpin_tm = 0.0f;
	thermo.homodimer_tm = 41.0f;

	REQUIRE(check_structure(thermo, param) == STOP_SEARCH);
}

TEST_CASE("Screening a single primer", "[valid_primer]") {

	const SearchParams param;
	MockOracle oracle;
	PrimerThermo thermo;

	SECTION("Cold primers skip the structure calculation") {

		REQUIRE(screen_primer(string(18, 'A'), oracle, param, thermo) == CONTINUE_SEARCH);
		REQUIRE(thermo.tm == Approx(56.0f));
		REQUIRE(oracle.num_hairpin == 0);
		REQUIRE(oracle.num_homodimer == 0);
	}

	SECTION("Primers in the Tm range are checked for structure") {

		REQUIRE(screen_primer(string(21, 'A'), oracle, param, thermo) == ACCEPT_WINDOW);
		REQUIRE(oracle.num_hairpin == 1);
		REQUIRE(oracle.num_homodimer == 1);

		oracle.hairpin_by_len[21] = 45.0f;

		REQUIRE(screen_primer(string(21, 'A'), oracle, param, thermo) == STOP_SEARCH);
		REQUIRE(thermo.hairpin_tm == Approx(45.0f));
	}

	SECTION("Oracle failures propagate") {
		REQUIRE_THROWS_AS(screen_primer("ACGNACGTACGTACGTACGT", oracle, param, thermo), ThermoError);
	}
}

TEST_CASE("Both members of a discriminatory pair must pass", "[valid_primer]") {

	SearchParams param;
	MockOracle oracle;

	const string mut = "ACGTACGTACGTACGTACGT";
	const string wt = "TTGTACGTACGTACGTACGT";

	PrimerThermo mut_thermo;
	PrimerThermo wt_thermo;

	SECTION("Both in range") {

		oracle.tm_by_seq[mut] = 62.0f;
		oracle.tm_by_seq[wt] = 63.0f;

		REQUIRE(screen_primer_pair(mut, wt, oracle, param, mut_thermo, wt_thermo) == ACCEPT_WINDOW);
		REQUIRE(mut_thermo.tm == Approx(62.0f));
		REQUIRE(wt_thermo.tm == Approx(63.0f));
	}

	SECTION("A cold wildtype primer keeps the search going") {

		oracle.tm_by_seq[mut] = 62.0f;
		oracle.tm_by_seq[wt] = 58.0f;

		REQUIRE(screen_primer_pair(mut, wt, oracle, param, mut_thermo, wt_thermo) == CONTINUE_SEARCH);
	}

	SECTION("Cold takes precedence over hot") {

		oracle.tm_by_seq[mut] = 66.0f;
		oracle.tm_by_seq[wt] = 58.0f;

		REQUIRE(screen_primer_pair(mut, wt, oracle, param, mut_thermo, wt_thermo) == CONTINUE_SEARCH);
	}

	SECTION("A hot wildtype primer stops the search") {

		oracle.tm_by_seq[mut] = 62.0f;
		oracle.tm_by_seq[wt] = 66.0f;

		REQUIRE(screen_primer_pair(mut, wt, oracle, param, mut_thermo, wt_thermo) == STOP_SEARCH);
		REQUIRE(oracle.num_hairpin == 0);
	}

	SECTION("Wildtype secondary structure stops the search") {

		oracle.tm_by_seq[mut] = 62.0f;
		oracle.tm_by_seq[wt] = 62.0f;
		oracle.hairpin_by_seq[wt] = 50.0f;

		REQUIRE(screen_primer_pair(mut, wt, oracle, param, mut_thermo, wt_thermo) == STOP_SEARCH);
	}

	SECTION("Lenient mode accepts every window") {

		param.lenient_mode = true;

		oracle.tm_by_seq[mut] = 80.0f;
		oracle.tm_by_seq[wt] = 20.0f;
		oracle.hairpin_by_seq[mut] = 70.0f;

		REQUIRE(screen_primer_pair(mut, wt, oracle, param, mut_thermo, wt_thermo) == ACCEPT_WINDOW);

		// The structure melting temperatures are still computed for the records
		REQUIRE(mut_thermo.hairpin_tm == Approx(70.0f));
		REQUIRE(oracle.num_hairpin == 2);
		REQUIRE(oracle.num_homodimer == 2);
	}
}
