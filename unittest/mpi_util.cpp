/// \file mpi_util.cpp
///
/// unit tests for the MPI byte packing of primers, parameters and genome tables
///
#include <string>
#include <vector>
#include <deque>

#include "mascpcr.h"
#include "test_genome.h"
#include <catch2/catch.hpp>

using namespace std;

// Pack an object into a buffer and unpack it into a new object, checking that
// exactly mpi_size bytes were used in both directions
template<class T>
T repack(const T &m_obj)
{
	const size_t len = mpi_size(m_obj);

	vector<unsigned char> buffer(len);

	REQUIRE(mpi_pack(&buffer[0], m_obj) == &buffer[0] + len);

	T ret;

	REQUIRE(mpi_unpack(&buffer[0], ret) == &buffer[0] + len);

	return ret;
}

TEST_CASE("BitSets are packed eight bits to a byte", "[mpi_util]") {

	BitSet bits(13, false);

	bits[0] = true;
	bits[7] = true;
	bits[8] = true;
	bits[12] = true;

	REQUIRE(mpi_size(bits) == sizeof(size_t) + 2);

	const BitSet copy = repack(bits);

	REQUIRE(copy.size() == 13);
	REQUIRE(copy == bits);

	REQUIRE(mpi_size( BitSet() ) == sizeof(size_t));
	REQUIRE(repack( BitSet() ).empty());
}

TEST_CASE("Primer records survive packing", "[mpi_util]") {

	BitSet flags(21, false);

	flags[5] = true;

	const PrimerRecord primer(480, "AACGTAACGTAACGTAACGTA", PLUS_STRAND, flags,
		62.0f, 12.5f, 8.25f, 1.99f);

	const PrimerRecord copy = repack(primer);

	REQUIRE( copy.found() );
	REQUIRE(copy.index() == 480);
	REQUIRE(copy.seq() == primer.seq());
	REQUIRE(copy.strand() == PLUS_STRAND);
	REQUIRE(copy.mismatches() == flags);
	REQUIRE(copy.tm() == 62.0f);
	REQUIRE(copy.tm_homodimer() == 12.5f);
	REQUIRE(copy.tm_hairpin() == 8.25f);
	REQUIRE(copy.score() == 1.99f);

	SECTION("A list of hits") {

		PrimerPair primers;

		primers.mutant = primer;
		primers.wildtype = PrimerRecord(483, primer.seq(), PLUS_STRAND, BitSet(21, false),
			61.0f, 0.0f, 0.0f, 0.0f);

		deque<PrimerHit> hits;

		hits.push_back( PrimerHit(500, primers) );
		hits.push_back( PrimerHit(700, primer) );

		const deque<PrimerHit> hits_copy = repack(hits);

		REQUIRE(hits_copy.size() == 2);
		REQUIRE(hits_copy[0].anchor == 500);
		REQUIRE(hits_copy[0].kind == DISCRIMINATORY_PRIMER);
		REQUIRE(hits_copy[0].wildtype.index() == 483);
		REQUIRE(hits_copy[1].anchor == 700);
		REQUIRE(hits_copy[1].kind == COMMON_PRIMER);
		REQUIRE_FALSE( hits_copy[1].wildtype.found() );
	}
}

TEST_CASE("Search parameters survive packing", "[mpi_util]") {

	SearchParams param;

	param.tm_range = make_pair(58.0f, 63.0f);
	param.size_range = make_pair(20, 28);
	param.thermo.salt = 0.1f;
	param.lenient_mode = true;
	param.mismatch_weights.push_back(0.5f);

	const SearchParams copy = repack(param);

	REQUIRE(copy.tm_range == param.tm_range);
	REQUIRE(copy.size_range == param.size_range);
	REQUIRE(copy.thermo.salt == param.thermo.salt);
	REQUIRE(copy.thermo.primer_strand == param.thermo.primer_strand);
	REQUIRE(copy.lenient_mode);
	REQUIRE(copy.mismatch_weights == param.mismatch_weights);
}

TEST_CASE("Genome tables survive packing", "[mpi_util]") {

	const GenomeTables tables = make_tables( make_genome(200), positions(10, 150), positions(20) );

	const GenomeTables copy = repack(tables);

	REQUIRE_NOTHROW( copy.validate() );
	REQUIRE(copy.mutant() == tables.mutant());
	REQUIRE(copy.reference() == tables.reference());
	REQUIRE(copy.ref_index(199) == 199);
	REQUIRE(copy.mismatch(150));
	REQUIRE(copy.edge(20));
	REQUIRE(copy.num_mismatch() == 2);
	REQUIRE(copy.num_edge() == 1);
}
