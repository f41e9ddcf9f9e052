/// \file write_primer.cpp
///
/// unit tests for primer ordering and the text and JSON writers
///
#include <string>
#include <deque>
#include <vector>
#include <sstream>
#include <algorithm>
#include <limits>

#include "mascpcr.h"
#include <catch2/catch.hpp>

using namespace std;

static PrimerRecord make_record(const int &m_index, const string &m_seq, const int &m_strand,
	const float &m_tm, const float &m_score)
{
	BitSet flags(m_seq.size(), false);

	if( !flags.empty() ){
		flags[0] = true;
	}

	return PrimerRecord(m_index, m_seq, m_strand, flags, m_tm, 12.5f, 8.25f, m_score);
}

static vector<string> split_lines(const string &m_text)
{
	vector<string> ret;
	stringstream ssin(m_text);
	string line;

	while( getline(ssin, line) ){
		ret.push_back(line);
	}

	return ret;
}

TEST_CASE("Primer hits are sorted by anchor, strand and kind", "[write_primer]") {

	PrimerPair primers;

	primers.mutant = make_record(481, "ACGTACGTACGTACGTACGT", PLUS_STRAND, 62.0f, 1.5f);
	primers.wildtype = make_record(484, "ACGTACGTACGTACGTACGA", PLUS_STRAND, 61.0f, 0.0f);

	deque<PrimerHit> hits;

	hits.push_back( PrimerHit(600, make_record(600, "AAAACCCCGGGGTTTTAAAA", MINUS_STRAND, 62.0f, -0.5f) ) );
	hits.push_back( PrimerHit(500, make_record(500, "AAAACCCCGGGGTTTTAAAA", MINUS_STRAND, 62.0f, -0.5f) ) );
	hits.push_back( PrimerHit(500, make_record(481, "AAAACCCCGGGGTTTTAAAA", PLUS_STRAND, 62.0f, -0.5f) ) );
	hits.push_back( PrimerHit(500, primers) );

	SORT( hits.begin(), hits.end() );

	REQUIRE(hits[0].anchor == 500);
	REQUIRE(hits[0].kind == DISCRIMINATORY_PRIMER);
	REQUIRE(hits[1].anchor == 500);
	REQUIRE(hits[1].kind == COMMON_PRIMER);
	REQUIRE(hits[1].primer.strand() == PLUS_STRAND);
	REQUIRE(hits[2].anchor == 500);
	REQUIRE(hits[2].primer.strand() == MINUS_STRAND);
	REQUIRE(hits[3].anchor == 600);
}

TEST_CASE("Text output", "[write_primer]") {

	PrimerPair primers;

	primers.mutant = make_record(481, "ACGTACGTACGTACGTACGT", PLUS_STRAND, 62.0f, 1.5f);
	primers.wildtype = make_record(484, "ACGTACGTACGTACGTACGA", PLUS_STRAND, 61.0f, 0.0f);

	deque<PrimerHit> hits;

	hits.push_back( PrimerHit(500, primers) );
	hits.push_back( PrimerHit(700, make_record(700, "AAAACCCCGGGGTTTTAAAA", MINUS_STRAND, 62.0f, -0.5f) ) );

	stringstream ssout;

	write_text(ssout, hits);

	const vector<string> lines = split_lines( ssout.str() );

	// Discriminatory hits take two rows, one for each genome
	REQUIRE(lines.size() == 4);
	REQUIRE(lines[0] == "#kind\tanchor\tstrand\tindex\tlength\tsequence\ttm\thairpin_tm\thomodimer_tm\tscore\tmismatches");
	REQUIRE(lines[1] == "disc\t500\t+\t481\t20\tACGTACGTACGTACGTACGT\t62\t8.25\t12.5\t1.5\t10000000000000000000");
	REQUIRE(lines[2] == "wt\t500\t+\t484\t20\tACGTACGTACGTACGTACGA\t61\t8.25\t12.5\t0\t10000000000000000000");
	REQUIRE(lines[3] == "common\t700\t-\t700\t20\tAAAACCCCGGGGTTTTAAAA\t62\t8.25\t12.5\t-0.5\t10000000000000000000");

	SECTION("The header records the command line") {

		char prog[] = "mascpcr";
		char flag[] = "--lenient";
		char* argv[] = {prog, flag};

		stringstream header;

		write_text_header(header, 2, argv);

		const vector<string> header_lines = split_lines( header.str() );

		REQUIRE(header_lines.size() == 2);
		REQUIRE(header_lines[0] == "mascpcr version " MASCPCR_MAJOR_VERSION "." MASCPCR_MINOR_VERSION);
		REQUIRE(header_lines[1] == "Command line: mascpcr --lenient");
	}
}

TEST_CASE("JSON output", "[write_primer]") {

	char prog[] = "mascpcr";
	char name[] = "--mut=\"odd\".fna";
	char* argv[] = {prog, name};

	SECTION("No primers") {

		stringstream ssout;

		write_json(ssout, deque<PrimerHit>(), 2, argv);

		const string json = ssout.str();

		REQUIRE(json.find("\"program\":\"mascpcr\"") != string::npos);
		REQUIRE(json.find("\"command line\":\"mascpcr --mut=\\\"odd\\\".fna\"") != string::npos);
		REQUIRE(json.find("\"primers\":[]") != string::npos);
	}

	SECTION("Discriminatory and common primers") {

		PrimerPair primers;

		primers.mutant = make_record(481, "ACGTACGTACGTACGTACGT", PLUS_STRAND, 62.0f, 1.5f);
		primers.wildtype = make_record(484, "ACGTACGTACGTACGTACGA", PLUS_STRAND, 61.0f, 0.0f);

		deque<PrimerHit> hits;

		hits.push_back( PrimerHit(500, primers) );
		hits.push_back( PrimerHit(700, make_record(700, "AAAACCCCGGGGTTTTAAAA", MINUS_STRAND, 62.0f, -0.5f) ) );

		stringstream ssout;

		write_json(ssout, hits, 2, argv);

		const string json = ssout.str();

		REQUIRE(json.find("\"kind\":\"discriminatory\"") != string::npos);
		REQUIRE(json.find("\"kind\":\"common\"") != string::npos);
		REQUIRE(json.find("\"anchor\":500") != string::npos);
		REQUIRE(json.find("\"wildtype\":{") != string::npos);
		REQUIRE(json.find("\"index\":484") != string::npos);
		REQUIRE(json.find("\"strand\":\"-\"") != string::npos);
		REQUIRE(json.find("\"hairpin tm\":8.25") != string::npos);

		// The wildtype primer is nested inside its discriminatory primer
		REQUIRE(json.find("\"wildtype\"") < json.find("\"kind\":\"common\""));

		// Balanced braces and brackets
		REQUIRE( count(json.begin(), json.end(), '{') == count(json.begin(), json.end(), '}') );
		REQUIRE( count(json.begin(), json.end(), '[') == count(json.begin(), json.end(), ']') );
	}
}

TEST_CASE("JSON output is valid for unusual values", "[write_primer]") {

	SECTION("Control characters in the command line are escaped") {

		char prog[] = "mascpcr";
		char name[] = "a\tb\nc\x01";
		char* argv[] = {prog, name};

		stringstream ssout;

		write_json(ssout, deque<PrimerHit>(), 2, argv);

		const string json = ssout.str();

		REQUIRE(json.find("\"command line\":\"mascpcr a\\tb\\nc\\u0001\"") != string::npos);

		// The only raw control characters are the newlines and tabs used for layout,
		// which never appear inside a string value
		const size_t begin = json.find("\"command line\"");
		const size_t end = json.find('\n', begin);

		REQUIRE(json.substr(begin, end - begin).find('\t') == string::npos);
	}

	SECTION("Non-finite values are written as null") {

		char prog[] = "mascpcr";
		char* argv[] = {prog};

		deque<PrimerHit> hits;

		hits.push_back( PrimerHit(700, make_record(700, "AAAACCCCGGGGTTTTAAAA", MINUS_STRAND,
			std::numeric_limits<float>::quiet_NaN(), -std::numeric_limits<float>::infinity() ) ) );

		stringstream ssout;

		write_json(ssout, hits, 1, argv);

		const string json = ssout.str();

		REQUIRE(json.find("\"tm\":null") != string::npos);
		REQUIRE(json.find("\"score\":null") != string::npos);
		REQUIRE(json.find("\"hairpin tm\":8.25") != string::npos);
		REQUIRE(json.find("nan") == string::npos);
		REQUIRE(json.find("inf") == string::npos);
	}
}

TEST_CASE("Strand symbols", "[write_primer]") {

	REQUIRE(strand_symbol(PLUS_STRAND) == "+");
	REQUIRE(strand_symbol(MINUS_STRAND) == "-");
}
