/// \file common_primer.cpp
///
/// unit tests for the common primer search
///
#include <string>
#include <vector>

#include "primer.h"
#include "mock_oracle.h"
#include "test_genome.h"
#include <catch2/catch.hpp>

using namespace std;

TEST_CASE("A common primer in a mismatch-free region", "[common_primer]") {

	const string mut = make_genome(1000);
	const GenomeTables tables = make_tables(mut);
	MockOracle oracle;
	const SearchParams param;

	SearchOutcome outcome = NO_ADMISSIBLE_WINDOW;

	const PrimerRecord best = find_common_primer(500, PLUS_STRAND, tables, oracle, param, &outcome);

	REQUIRE(outcome == PRIMER_FOUND);
	REQUIRE( best.found() );
	REQUIRE(best.length() >= param.min_size());
	REQUIRE(best.length() <= param.max_size());

	// Tm = 2*length + 20, so the 21 base primer (Tm = 62) is closest to the middle of the range
	REQUIRE(best.length() == 21);
	REQUIRE(best.index() == 500 - best.length() + 1);
	REQUIRE(best.strand() == PLUS_STRAND);
	REQUIRE(best.seq() == mut.substr(480, 21));
	REQUIRE(best.num_mismatch() == 0);
	REQUIRE(best.mismatches().size() == 21);
	REQUIRE(best.score() == Approx(-0.01f));

	SECTION("The scan stops at the first hot primer") {

		REQUIRE(oracle.num_tm == 6);
		REQUIRE(oracle.num_hairpin == 3);
		REQUIRE(oracle.num_homodimer == 3);
	}

	SECTION("The same search on the minus strand") {

		const PrimerRecord minus = find_common_primer(500, MINUS_STRAND, tables, oracle, param);

		REQUIRE( minus.found() );
		REQUIRE(minus.index() == 500);
		REQUIRE(minus.seq() == reverse_complement( mut.substr(500, 21) ));
	}
}

TEST_CASE("Common primers never cover a designed mismatch", "[common_primer]") {

	MockOracle oracle;
	const SearchParams param;
	SearchOutcome outcome = PRIMER_FOUND;

	SECTION("A mismatch at the 3' end") {

		const GenomeTables tables = make_tables( make_genome(1000), positions(500) );

		REQUIRE_FALSE( find_common_primer(500, PLUS_STRAND, tables, oracle, param, &outcome).found() );
		REQUIRE(outcome == DESIGNED_MISMATCH);
		REQUIRE(oracle.num_tm == 0);
	}

	SECTION("A mismatch inside the shortest primer") {

		// Offset 17 is the 5'-most base of an 18 base primer
		const GenomeTables tables = make_tables( make_genome(1000), positions(483) );

		REQUIRE_FALSE( find_common_primer(500, PLUS_STRAND, tables, oracle, param, &outcome).found() );
		REQUIRE(outcome == DESIGNED_MISMATCH);
	}

	SECTION("A mismatch that only a longer primer would reach") {

		// Offset 20 is the 5'-most base of a 21 base primer
		const GenomeTables tables = make_tables( make_genome(1000), positions(480) );

		const PrimerRecord best = find_common_primer(500, PLUS_STRAND, tables, oracle, param, &outcome);

		REQUIRE( best.found() );
		REQUIRE(outcome == PRIMER_FOUND);
		REQUIRE(best.length() == 20);
		REQUIRE(best.index() == 481);
		REQUIRE(best.score() == Approx(-0.25f));

		// The scan ends at the mismatch, before the 21 base primer is evaluated
		REQUIRE(oracle.num_tm == 3);
	}

	SECTION("A mismatch reached before any primer is in range") {

		// Offset 19 is reached by the 20 base primer, the first one that is warm enough
		const GenomeTables tables = make_tables( make_genome(1000), positions(481) );

		REQUIRE_FALSE( find_common_primer(500, PLUS_STRAND, tables, oracle, param, &outcome).found() );
		REQUIRE(outcome == DESIGNED_MISMATCH);
	}

	SECTION("Minus strand") {

		const GenomeTables tables = make_tables( make_genome(1000), positions(520) );

		const PrimerRecord best = find_common_primer(500, MINUS_STRAND, tables, oracle, param, &outcome);

		REQUIRE( best.found() );
		REQUIRE(best.length() == 20);
	}
}

TEST_CASE("Common search outcomes", "[common_primer]") {

	string mut = make_genome(1000);
	MockOracle oracle;
	SearchParams param;
	SearchOutcome outcome = PRIMER_FOUND;

	SECTION("Common primers need an extra base of 3' flank") {

		const GenomeTables tables = make_tables(mut);

		REQUIRE( find_common_primer(968, MINUS_STRAND, tables, oracle, param, &outcome).found() );
		REQUIRE_FALSE( find_common_primer(969, MINUS_STRAND, tables, oracle, param, &outcome).found() );
		REQUIRE(outcome == INSUFFICIENT_SEQUENCE);
	}

	SECTION("The GC clamp always applies") {

		mut.replace(496, 5, "GCGCG");

		const GenomeTables tables = make_tables(mut);

		param.lenient_mode = true;

		REQUIRE_FALSE( find_common_primer(500, PLUS_STRAND, tables, oracle, param, &outcome).found() );
		REQUIRE(outcome == GC_CLAMP);
	}

	SECTION("No primer in the Tm range") {

		const GenomeTables tables = make_tables(mut);

		// Every primer is too cold
		oracle.tm_per_base = 1.0f;
		oracle.tm_offset = 0.0f;

		REQUIRE_FALSE( find_common_primer(500, PLUS_STRAND, tables, oracle, param, &outcome).found() );
		REQUIRE(outcome == NO_ADMISSIBLE_WINDOW);
		REQUIRE(oracle.num_tm == 13);
	}

	SECTION("Edges do not affect common primers") {

		const GenomeTables tables = make_tables( mut, vector<size_t>(), positions(495) );

		REQUIRE( find_common_primer(500, PLUS_STRAND, tables, oracle, param).found() );
	}
}

TEST_CASE("Invalid common searches are rejected", "[common_primer]") {

	const GenomeTables tables = make_tables( make_genome(1000) );
	MockOracle oracle;
	SearchParams param;

	REQUIRE_THROWS_AS(find_common_primer(500, 0, tables, oracle, param), ValidationError);

	param.tm_range = make_pair(65.0f, 60.0f);

	REQUIRE_THROWS_AS(find_common_primer(500, PLUS_STRAND, tables, oracle, param), ValidationError);

	param = SearchParams();
	oracle.fail_on_tm_call = 1;

	REQUIRE_THROWS_AS(find_common_primer(500, PLUS_STRAND, tables, oracle, param), ThermoError);
}
