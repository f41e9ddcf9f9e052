/// \file genome_tables.cpp
///
/// unit tests for genome and lookup table validation
///
#include <string>
#include <vector>

#include "genome_tables.h"
#include "errors.h"
#include "test_genome.h"
#include <catch2/catch.hpp>

using namespace std;

TEST_CASE("Consistent genome tables", "[genome_tables]") {

	const string mut = make_genome(100);
	const GenomeTables tables = make_tables( mut, positions(10, 20), positions(30) );

	REQUIRE(tables.size() == 100);
	REQUIRE(tables.mutant() == mut);
	REQUIRE(tables.reference() == mut);
	REQUIRE(tables.ref_index(42) == 42);
	REQUIRE(tables.mismatch(10));
	REQUIRE_FALSE(tables.mismatch(11));
	REQUIRE(tables.edge(30));
	REQUIRE(tables.num_mismatch() == 2);
	REQUIRE(tables.num_edge() == 1);
}

TEST_CASE("Inconsistent genome tables are rejected", "[genome_tables]") {

	const string mut = make_genome(100);
	const string ref = make_genome(90);

	vector<unsigned int> idx_lut(100);

	for(size_t i = 0;i < idx_lut.size();++i){
		idx_lut[i] = i*90/100;
	}

	const BitSet flags(100, false);

	// The valid starting point for every failure below
	REQUIRE_NOTHROW( GenomeTables(mut, ref, idx_lut, flags, flags) );

	SECTION("Empty genomes") {

		REQUIRE_THROWS_AS( GenomeTables("", ref, vector<unsigned int>(), BitSet(), BitSet()), ValidationError );
		REQUIRE_THROWS_AS( GenomeTables(mut, "", idx_lut, flags, flags), ValidationError );
	}

	SECTION("Table lengths must match the mutant genome") {

		REQUIRE_THROWS_AS( GenomeTables(mut, ref, vector<unsigned int>(99, 0), flags, flags), ValidationError );
		REQUIRE_THROWS_AS( GenomeTables(mut, ref, idx_lut, BitSet(101, false), flags), ValidationError );
		REQUIRE_THROWS_AS( GenomeTables(mut, ref, idx_lut, flags, BitSet(99, false)), ValidationError );
	}

	SECTION("Degenerate bases") {

		string bad_mut = mut;

		bad_mut[50] = 'N';

		REQUIRE_THROWS_AS( GenomeTables(bad_mut, ref, idx_lut, flags, flags), ValidationError );

		string bad_ref = ref;

		bad_ref[0] = 'a';

		REQUIRE_THROWS_AS( GenomeTables(mut, bad_ref, idx_lut, flags, flags), ValidationError );
	}

	SECTION("The index table must stay inside the reference") {

		vector<unsigned int> bad_lut(idx_lut);

		// One past the end is allowed
		bad_lut.back() = 90;

		REQUIRE_NOTHROW( GenomeTables(mut, ref, bad_lut, flags, flags) );

		bad_lut.back() = 91;

		REQUIRE_THROWS_AS( GenomeTables(mut, ref, bad_lut, flags, flags), ValidationError );
	}

	SECTION("The index table can not decrease") {

		vector<unsigned int> bad_lut(idx_lut);

		bad_lut[60] = bad_lut[59] - 1;

		REQUIRE_THROWS_AS( GenomeTables(mut, ref, bad_lut, flags, flags), ValidationError );
	}
}
