/// \file score_primer.cpp
///
/// unit tests for the composite primer score
///
#include <string>

#include "primer.h"
#include "mock_oracle.h"
#include <catch2/catch.hpp>

using namespace std;

TEST_CASE("Thermodynamic score penalties", "[score_primer]") {

	const SearchParams param; // 60 <= Tm <= 65, clip = 40

	// A primer at the middle of the Tm range with no secondary structure is ideal
	REQUIRE(score_thermo(62.5f, 0.0f, 0.0f, param) == Approx(0.0f));

	REQUIRE(score_thermo(60.0f, 0.0f, 0.0f, param) == Approx(-0.25f));
	REQUIRE(score_thermo(65.0f, 0.0f, 0.0f, param) == Approx(-0.25f));
	REQUIRE(score_thermo(62.5f, 20.0f, 0.0f, param) == Approx(-0.25f));
	REQUIRE(score_thermo(62.5f, 0.0f, 40.0f, param) == Approx(-1.0f));
	REQUIRE(score_thermo(60.0f, 20.0f, 40.0f, param) == Approx(-1.5f));
}

TEST_CASE("Scoring a primer sequence", "[score_primer]") {

	const SearchParams param;
	MockOracle oracle;

	const string seq(21, 'A'); // Tm = 62

	oracle.hairpin_by_len[21] = 10.0f;
	oracle.homodimer_by_len[21] = 20.0f;

	const float expected = -0.01f - 0.0625f - 0.25f;

	SECTION("Missing temperatures come from the oracle") {

		REQUIRE(score_primer(seq, oracle, param) == Approx(expected));
		REQUIRE(oracle.num_tm == 1);
		REQUIRE(oracle.num_hairpin == 1);
		REQUIRE(oracle.num_homodimer == 1);
	}

	SECTION("Supplied temperatures are used as is") {

		const float tm = 62.0f;
		const float hairpin_tm = 10.0f;
		const float homodimer_tm = 20.0f;

		REQUIRE(score_primer(seq, oracle, param, &tm, &hairpin_tm, &homodimer_tm) == Approx(expected));
		REQUIRE(oracle.num_tm == 0);
		REQUIRE(oracle.num_hairpin == 0);
		REQUIRE(oracle.num_homodimer == 0);

		// Only the missing hairpin value is computed
		REQUIRE(score_primer(seq, oracle, param, &tm, NULL, &homodimer_tm) == Approx(expected));
		REQUIRE(oracle.num_tm == 0);
		REQUIRE(oracle.num_hairpin == 1);
	}

	SECTION("Identical inputs give identical scores") {

		const float first = score_primer(seq, oracle, param);
		const float second = score_primer(seq, oracle, param);

		REQUIRE(first == second);
	}
}
