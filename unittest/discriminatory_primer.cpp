/// \file discriminatory_primer.cpp
///
/// unit tests for the discriminatory primer search
///
#include <string>
#include <vector>

#include "primer.h"
#include "mock_oracle.h"
#include "test_genome.h"
#include <catch2/catch.hpp>

using namespace std;

// With the default mock oracle (Tm = 2*length + 20) primers of length 20, 21 and
// 22 are in the 60-65 Tm range and the 21 base primer (Tm = 62) scores best.

TEST_CASE("A primer needs at least one designed mismatch", "[discriminatory_primer]") {

	const GenomeTables tables = make_tables( make_genome(1000) );
	MockOracle oracle;
	const SearchParams param;

	SearchOutcome outcome = PRIMER_FOUND;

	const PrimerPair best = find_discriminatory_primer(500, PLUS_STRAND, tables, oracle, param, &outcome);

	REQUIRE_FALSE( best.found() );
	REQUIRE_FALSE( best.wildtype.found() );
	REQUIRE(outcome == NO_ADMISSIBLE_WINDOW);

	SECTION("Unless zero mismatches are allowed") {

		SearchParams no_mismatch;

		no_mismatch.min_num_mismatches = 0;

		REQUIRE( find_discriminatory_primer(500, PLUS_STRAND, tables, oracle, no_mismatch).found() );
	}
}

TEST_CASE("A designed mismatch 5 bases from the 3' end", "[discriminatory_primer]") {

	const string mut = make_genome(1000);
	const GenomeTables tables = make_tables( mut, positions(495) );
	MockOracle oracle;
	const SearchParams param;

	SearchOutcome outcome = NO_ADMISSIBLE_WINDOW;

	const PrimerPair best = find_discriminatory_primer(500, PLUS_STRAND, tables, oracle, param, &outcome);

	REQUIRE(outcome == PRIMER_FOUND);
	REQUIRE( best.found() );

	const PrimerRecord &primer = best.mutant;

	REQUIRE(primer.length() == 21);
	REQUIRE(primer.index() == 480);
	REQUIRE(primer.strand() == PLUS_STRAND);
	REQUIRE(primer.seq() == mut.substr(480, 21));
	REQUIRE(primer.mismatches().size() == 21);
	REQUIRE(primer.mismatches()[5]);
	REQUIRE(primer.num_mismatch() == 1);
	REQUIRE(primer.tm() == Approx(62.0f));

	// Thermodynamic score plus the weight of the mismatch at offset 5
	REQUIRE(primer.score() == Approx(-0.01f + 2.0f));

	SECTION("The wildtype partner has the same shape and no score") {

		const PrimerRecord &wt = best.wildtype;

		REQUIRE( wt.found() );
		REQUIRE(wt.length() == primer.length());
		REQUIRE(wt.strand() == primer.strand());
		REQUIRE(wt.index() == 480);
		REQUIRE(wt.mismatches().size() == 21);
		REQUIRE(wt.num_mismatch() == 0);
		REQUIRE(wt.score() == 0.0f);
	}
}

TEST_CASE("Minus strand discriminatory primers", "[discriminatory_primer]") {

	const string mut = make_genome(1000);

	// Offset 3 from the 3' end of a minus strand primer anchored at 500
	const GenomeTables tables = make_tables( mut, positions(503) );
	MockOracle oracle;
	const SearchParams param;

	const PrimerPair best = find_discriminatory_primer(500, MINUS_STRAND, tables, oracle, param);

	REQUIRE( best.found() );
	REQUIRE(best.mutant.index() == 500);
	REQUIRE(best.mutant.strand() == MINUS_STRAND);
	REQUIRE(best.mutant.seq() == reverse_complement( mut.substr(500, 21) ));
	REQUIRE(best.mutant.mismatches()[3]);
	REQUIRE(best.mutant.score() == Approx(-0.01f + 3.0f));
	REQUIRE(best.wildtype.index() == 500);
}

TEST_CASE("Discriminatory search outcomes", "[discriminatory_primer]") {

	string mut = make_genome(1000);
	MockOracle oracle;
	SearchParams param;

	SearchOutcome outcome = PRIMER_FOUND;

	SECTION("Not enough sequence") {

		const GenomeTables tables = make_tables( mut, positions(10) );

		REQUIRE_FALSE( find_discriminatory_primer(10, PLUS_STRAND, tables, oracle, param, &outcome).found() );
		REQUIRE(outcome == INSUFFICIENT_SEQUENCE);
		REQUIRE(oracle.num_tm == 0);
	}

	SECTION("3' GC clamp") {

		mut.replace(496, 5, "GCGCG");

		const GenomeTables tables = make_tables( mut, positions(495) );

		REQUIRE_FALSE( find_discriminatory_primer(500, PLUS_STRAND, tables, oracle, param, &outcome).found() );
		REQUIRE(outcome == GC_CLAMP);
		REQUIRE(oracle.num_tm == 0);

		SECTION("Lenient mode skips the GC clamp") {

			param.lenient_mode = true;

			REQUIRE( find_discriminatory_primer(500, PLUS_STRAND, tables, oracle, param, &outcome).found() );
			REQUIRE(outcome == PRIMER_FOUND);
		}
	}

	SECTION("Three 3' G/C bases are allowed") {

		mut.replace(496, 5, "AGCGA");

		const GenomeTables tables = make_tables( mut, positions(495) );

		REQUIRE( find_discriminatory_primer(500, PLUS_STRAND, tables, oracle, param, &outcome).found() );
	}

	SECTION("Four 3' G/C bases are not") {

		mut.replace(496, 5, "AGCGC");

		const GenomeTables tables = make_tables( mut, positions(495) );

		REQUIRE_FALSE( find_discriminatory_primer(500, PLUS_STRAND, tables, oracle, param, &outcome).found() );
		REQUIRE(outcome == GC_CLAMP);
	}
}

TEST_CASE("The length scan stops early", "[discriminatory_primer]") {

	const GenomeTables tables = make_tables( make_genome(1000), positions(495) );
	MockOracle oracle;
	const SearchParams param;

	SECTION("Too hot") {

		// Lengths 18 to 23 are evaluated; 23 (Tm = 66) ends the scan
		REQUIRE( find_discriminatory_primer(500, PLUS_STRAND, tables, oracle, param).found() );
		REQUIRE(oracle.num_tm == 2*6);
		REQUIRE(oracle.num_hairpin == 2*3);
		REQUIRE(oracle.num_homodimer == 2*3);
	}

	SECTION("Too much secondary structure") {

		oracle.hairpin_by_len[21] = 50.0f;

		const PrimerPair best = find_discriminatory_primer(500, PLUS_STRAND, tables, oracle, param);

		// Only the 20 base primer was accepted before the scan stopped
		REQUIRE( best.found() );
		REQUIRE(best.mutant.length() == 20);
		REQUIRE(best.mutant.score() == Approx(-0.25f + 2.0f));
		REQUIRE(oracle.num_tm == 2*4);
	}

	SECTION("Lenient mode scans every length") {

		SearchParams lenient;

		lenient.lenient_mode = true;

		oracle.hairpin_by_len[21] = 50.0f;

		const PrimerPair best = find_discriminatory_primer(500, PLUS_STRAND, tables, oracle, lenient);

		REQUIRE( best.found() );
		REQUIRE(oracle.num_tm == 2*13);

		// The hairpin penalty makes the 22 base primer the best
		REQUIRE(best.mutant.length() == 22);
	}
}

TEST_CASE("Ties keep the shortest primer", "[discriminatory_primer]") {

	const string mut = make_genome(1000);
	const GenomeTables tables = make_tables( mut, positions(495) );
	MockOracle oracle;
	const SearchParams param;

	// Every primer shorter than 23 bases has Tm = 62.5
	oracle.tm_per_base = 0.0f;
	oracle.tm_offset = 62.5f;

	oracle.tm_by_seq[ mut.substr(478, 23) ] = 70.0f;

	const PrimerPair best = find_discriminatory_primer(500, PLUS_STRAND, tables, oracle, param);

	REQUIRE( best.found() );
	REQUIRE(best.mutant.length() == 18);
}

TEST_CASE("Invalid discriminatory searches are rejected", "[discriminatory_primer]") {

	const GenomeTables tables = make_tables( make_genome(1000), positions(495) );
	MockOracle oracle;
	SearchParams param;

	SECTION("Strand") {

		REQUIRE_THROWS_AS(find_discriminatory_primer(500, 0, tables, oracle, param), ValidationError);
		REQUIRE_THROWS_AS(find_discriminatory_primer(500, 2, tables, oracle, param), ValidationError);
	}

	SECTION("Size range") {

		param.size_range = make_pair(25, 20);

		REQUIRE_THROWS_AS(find_discriminatory_primer(500, PLUS_STRAND, tables, oracle, param), ValidationError);
	}

	SECTION("Oracle failures are not reported as not found") {

		oracle.fail_on_tm_call = 3;

		REQUIRE_THROWS_AS(find_discriminatory_primer(500, PLUS_STRAND, tables, oracle, param), ThermoError);
	}
}
