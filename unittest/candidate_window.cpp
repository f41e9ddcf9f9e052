/// \file candidate_window.cpp
///
/// unit tests for primer window bounds and strand coordinate arithmetic
///
#include <string>
#include <vector>

#include "primer.h"
#include "mock_oracle.h"
#include "test_genome.h"
#include <catch2/catch.hpp>

using namespace std;

TEST_CASE("A plus strand window ends at the anchor", "[candidate_window]") {

	const string mut = make_genome(1000);
	const GenomeTables tables = make_tables(mut);
	MockOracle oracle;

	const CandidateWindow window(tables, oracle, 500, PLUS_STRAND, make_pair(18, 30),
		DISCRIMINATORY_MARGIN, true);

	REQUIRE( window.valid() );

	SECTION("Primers are the 3'-most bases of the window") {

		REQUIRE(window.primer(21) == mut.substr(480, 21));
		REQUIRE(window.primer(30) == mut.substr(471, 30));
		REQUIRE(window.index(21) == 480);
	}

	SECTION("Offsets are measured from the 3' end") {

		REQUIRE(window.coordinate(0) == 500);
		REQUIRE(window.coordinate(5) == 495);
	}

	SECTION("The wildtype primer matches the reference") {

		REQUIRE(window.wildtype_primer(21) == mut.substr(480, 21));
		REQUIRE(window.wildtype_index(21) == 480);
	}

	SECTION("Out of range primer lengths are rejected") {

		REQUIRE_THROWS_AS(window.primer(31), const char*);
		REQUIRE_THROWS_AS(window.primer(0), const char*);
	}
}

TEST_CASE("A minus strand window starts at the anchor", "[candidate_window]") {

	const string mut = make_genome(1000);
	const GenomeTables tables = make_tables(mut);
	MockOracle oracle;

	const CandidateWindow window(tables, oracle, 500, MINUS_STRAND, make_pair(18, 30),
		DISCRIMINATORY_MARGIN, true);

	REQUIRE( window.valid() );

	REQUIRE(window.primer(21) == reverse_complement( mut.substr(500, 21) ));
	REQUIRE(window.wildtype_primer(21) == reverse_complement( mut.substr(500, 21) ));

	// The 5' index of a minus strand primer is the anchor for every length
	REQUIRE(window.index(18) == 500);
	REQUIRE(window.index(30) == 500);

	REQUIRE(window.coordinate(5) == 505);

	// The 3'-most base of the primer is the complement of the anchor base
	REQUIRE(window.primer(18)[17] == complement(mut[500]));
}

TEST_CASE("Windows need flanking sequence for the longest primer", "[candidate_window]") {

	const GenomeTables tables = make_tables( make_genome(1000) );
	MockOracle oracle;

	const pair<int, int> size_range(18, 30);

	REQUIRE_FALSE( CandidateWindow(tables, oracle, 29, PLUS_STRAND, size_range, DISCRIMINATORY_MARGIN, false).valid() );
	REQUIRE( CandidateWindow(tables, oracle, 30, PLUS_STRAND, size_range, DISCRIMINATORY_MARGIN, false).valid() );

	SECTION("The 3' margin depends on the primer class") {

		REQUIRE( CandidateWindow(tables, oracle, 969, MINUS_STRAND, size_range, DISCRIMINATORY_MARGIN, false).valid() );
		REQUIRE_FALSE( CandidateWindow(tables, oracle, 970, MINUS_STRAND, size_range, DISCRIMINATORY_MARGIN, false).valid() );

		REQUIRE( CandidateWindow(tables, oracle, 968, MINUS_STRAND, size_range, COMMON_MARGIN, false).valid() );
		REQUIRE_FALSE( CandidateWindow(tables, oracle, 969, MINUS_STRAND, size_range, COMMON_MARGIN, false).valid() );
	}

	SECTION("The bounds apply to both strands") {

		REQUIRE_FALSE( CandidateWindow(tables, oracle, 29, MINUS_STRAND, size_range, COMMON_MARGIN, false).valid() );
		REQUIRE_FALSE( CandidateWindow(tables, oracle, 970, PLUS_STRAND, size_range, DISCRIMINATORY_MARGIN, false).valid() );
	}
}

TEST_CASE("The wildtype window follows the index table", "[candidate_window]") {

	// The reference carries three extra bases after mutant coordinate 99
	const string mut = make_genome(1000);
	const string ref = mut.substr(0, 100) + "TTT" + mut.substr(100);

	vector<unsigned int> idx_lut( mut.size() );

	for(size_t i = 0;i < mut.size();++i){
		idx_lut[i] = (i < 100) ? i : i + 3;
	}

	const GenomeTables tables(mut, ref, idx_lut, BitSet(mut.size(), false), BitSet(mut.size(), false));
	MockOracle oracle;

	const CandidateWindow plus(tables, oracle, 500, PLUS_STRAND, make_pair(18, 30),
		DISCRIMINATORY_MARGIN, true);

	REQUIRE(plus.wildtype_primer(21) == mut.substr(480, 21));
	REQUIRE(plus.wildtype_index(21) == 483);

	const CandidateWindow minus(tables, oracle, 500, MINUS_STRAND, make_pair(18, 30),
		DISCRIMINATORY_MARGIN, true);

	REQUIRE(minus.wildtype_primer(21) == reverse_complement( mut.substr(500, 21) ));
	REQUIRE(minus.wildtype_index(21) == 503);
}

TEST_CASE("3' GC content of a window", "[candidate_window]") {

	string mut = make_genome(1000);

	const GenomeTables plain = make_tables(mut);
	MockOracle oracle;

	REQUIRE(CandidateWindow(plain, oracle, 500, PLUS_STRAND, make_pair(18, 30),
		DISCRIMINATORY_MARGIN, false).gc_3() == 2);

	mut.replace(496, 5, "GCGCG");

	const GenomeTables gc_rich = make_tables(mut);

	REQUIRE(CandidateWindow(gc_rich, oracle, 500, PLUS_STRAND, make_pair(18, 30),
		DISCRIMINATORY_MARGIN, false).gc_3() == 5);

	// A minus strand primer anchored at 496 has its 3' end over coordinates 496 to 500
	REQUIRE(CandidateWindow(gc_rich, oracle, 496, MINUS_STRAND, make_pair(18, 30),
		DISCRIMINATORY_MARGIN, false).gc_3() == 5);
}
