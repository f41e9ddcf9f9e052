/// \file mismatch_weight.cpp
///
/// unit tests for designed mismatch weighting
///
#include <string>
#include <vector>

#include "primer.h"
#include "mock_oracle.h"
#include "test_genome.h"
#include <catch2/catch.hpp>

using namespace std;

TEST_CASE("Mismatches are weighted from the 3' end", "[mismatch_weight]") {

	const string mut = make_genome(1000);
	const GenomeTables tables = make_tables( mut, positions(495, 500) );
	MockOracle oracle;
	const SearchParams param;

	SECTION("Plus strand") {

		const CandidateWindow window(tables, oracle, 500, PLUS_STRAND, param.size_range,
			DISCRIMINATORY_MARGIN, true);

		const MismatchTally tally = weigh_mismatches(window, 21, tables, param);

		REQUIRE(tally.count == 2);
		REQUIRE(tally.flags.size() == 21);
		REQUIRE(tally.flags[0]);
		REQUIRE(tally.flags[5]);
		REQUIRE(tally.flags.count() == 2);
		REQUIRE(tally.score == Approx(5.0f + 2.0f));
		REQUIRE(tally.edge_offset == -1);
	}

	SECTION("Minus strand") {

		// The minus strand walk moves toward larger coordinates
		const CandidateWindow window(tables, oracle, 495, MINUS_STRAND, param.size_range,
			DISCRIMINATORY_MARGIN, true);

		const MismatchTally tally = weigh_mismatches(window, 21, tables, param);

		REQUIRE(tally.count == 2);
		REQUIRE(tally.flags[0]);
		REQUIRE(tally.flags[5]);
		REQUIRE(tally.score == Approx(5.0f + 2.0f));
	}
}

TEST_CASE("Offsets past the weight table reuse the last weight", "[mismatch_weight]") {

	const GenomeTables tables = make_tables( make_genome(1000), positions(490, 480) );
	MockOracle oracle;

	SearchParams param;

	SECTION("Default weights") {

		const CandidateWindow window(tables, oracle, 500, PLUS_STRAND, param.size_range,
			DISCRIMINATORY_MARGIN, true);

		// Offsets 10 and 20
		const MismatchTally tally = weigh_mismatches(window, 25, tables, param);

		REQUIRE(tally.count == 2);
		REQUIRE(tally.score == Approx(1.0f + 1.0f));
	}

	SECTION("Short weight table") {

		param.mismatch_weights.clear();
		param.mismatch_weights.push_back(10.0f);
		param.mismatch_weights.push_back(7.0f);

		const CandidateWindow window(tables, oracle, 500, PLUS_STRAND, param.size_range,
			DISCRIMINATORY_MARGIN, true);

		const MismatchTally tally = weigh_mismatches(window, 25, tables, param);

		REQUIRE(tally.score == Approx(7.0f + 7.0f));
		REQUIRE(param.mismatch_weight(0) == Approx(10.0f));
		REQUIRE(param.mismatch_weight(100) == Approx(7.0f));
	}
}

TEST_CASE("Only bases inside the primer are counted", "[mismatch_weight]") {

	// Offset 20 is outside a 20 base primer
	const GenomeTables tables = make_tables( make_genome(1000), positions(480) );
	MockOracle oracle;
	const SearchParams param;

	const CandidateWindow window(tables, oracle, 500, PLUS_STRAND, param.size_range,
		DISCRIMINATORY_MARGIN, true);

	REQUIRE(weigh_mismatches(window, 20, tables, param).count == 0);
	REQUIRE(weigh_mismatches(window, 21, tables, param).count == 1);
}

// The walk stops at an edge, but the mismatches found before the edge are kept and
// the primer is still scored. Invalidating the whole window instead would be a
// behavior change, and this test is expected to change with it.
TEST_CASE("An edge truncates the mismatch walk", "[mismatch_weight][edge-truncation]") {

	MockOracle oracle;
	const SearchParams param;

	SECTION("Mismatches beyond the edge are ignored") {

		// Edge at offset 3, mismatch at offset 5
		const GenomeTables tables = make_tables( make_genome(1000), positions(495), positions(497) );

		const CandidateWindow window(tables, oracle, 500, PLUS_STRAND, param.size_range,
			DISCRIMINATORY_MARGIN, true);

		const MismatchTally tally = weigh_mismatches(window, 21, tables, param);

		REQUIRE(tally.edge_offset == 3);
		REQUIRE(tally.count == 0);
		REQUIRE(tally.score == 0.0f);
	}

	SECTION("Mismatches before the edge still count") {

		// Mismatch at offset 2, edge at offset 3
		const GenomeTables tables = make_tables( make_genome(1000), positions(498), positions(497) );

		const CandidateWindow window(tables, oracle, 500, PLUS_STRAND, param.size_range,
			DISCRIMINATORY_MARGIN, true);

		const MismatchTally tally = weigh_mismatches(window, 21, tables, param);

		REQUIRE(tally.edge_offset == 3);
		REQUIRE(tally.count == 1);
		REQUIRE(tally.flags[2]);
		REQUIRE(tally.score == Approx(4.0f));

		// ... and the discriminatory search still returns a primer
		const PrimerPair primers = find_discriminatory_primer(500, PLUS_STRAND, tables, oracle, param);

		REQUIRE( primers.found() );
		REQUIRE(primers.mutant.num_mismatch() == 1);
	}
}
