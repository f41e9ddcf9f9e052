/// \file base_table.cpp
///
/// unit tests for the nucleotide helpers
///
#include <string>

#include "base_table.h"
#include <catch2/catch.hpp>

using namespace std;

TEST_CASE("Reverse complement of a primer", "[base_table]") {

	REQUIRE(reverse_complement("AACGT") == "ACGTT");
	REQUIRE(reverse_complement("GATTACA") == "TGTAATC");
	REQUIRE(reverse_complement("") == "");

	SECTION("Illegal bases are rejected") {
		REQUIRE_THROWS( reverse_complement("ACXT") );
	}
}

TEST_CASE("Locate degenerate bases", "[base_table]") {

	REQUIRE(find_non_acgt("ACGTACGT") == 8);
	REQUIRE(find_non_acgt("ACGNACGT") == 3);
	REQUIRE(find_non_acgt("acgt") == 0);
}

TEST_CASE("Count 3' G/C bases", "[base_table]") {

	REQUIRE(count_gc_3("AAAAAGCGCG", 5) == 5);
	REQUIRE(count_gc_3("GCGCGAAAAA", 5) == 0);
	REQUIRE(count_gc_3("AAAAAACGTA", 5) == 2);

	// Shorter than the requested 3' window
	REQUIRE(count_gc_3("GC", 5) == 2);
}
