/// \file parse_input.cpp
///
/// unit tests for the fasta and lookup table readers
///
#include <string>
#include <vector>
#include <fstream>

#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>
#include <zlib.h>

#include "mascpcr.h"
#include "errors.h"
#include <catch2/catch.hpp>

using namespace std;

// A uniquely named file that is removed when it goes out of scope
class TempFile
{
	private:
		string filename;
	public:
		TempFile()
		{
			char buffer[] = "/tmp/mascpcr_test_XXXXXX";

			const int fd = mkstemp(buffer);

			if(fd < 0){
				throw __FILE__ ":TempFile: Unable to create a temporary file";
			}

			close(fd);

			filename = buffer;
		};

		~TempFile()
		{
			remove( filename.c_str() );
		};

		const string& name() const
		{
			return filename;
		};

		void write(const string &m_text) const
		{
			ofstream fout( filename.c_str() );

			fout << m_text;
		};

		void write_gz(const string &m_text) const
		{
			gzFile fout = gzopen(filename.c_str(), "wb");

			REQUIRE(fout != NULL);

			gzwrite( fout, m_text.c_str(), (unsigned int)( m_text.size() ) );
			gzclose(fout);
		};
};

TEST_CASE("Reading a genome from a fasta file", "[parse_input]") {

	TempFile file;
	string defline;

	SECTION("Bases are upper cased and white space is removed") {

		file.write(">chr1 recoded\nACGTac\ngtnn \r\nACGT\n");

		REQUIRE(read_genome(file.name(), defline) == "ACGTACGTNNACGT");
		REQUIRE(defline == "chr1 recoded");
	}

	SECTION("Only the first record is read") {

		file.write(">first\nAAAA\nCCCC\n>second\nGGGG\n");

		REQUIRE(read_genome(file.name(), defline) == "AAAACCCC");
		REQUIRE(defline == "first");
	}

	SECTION("Long deflines") {

		const string long_name(5000, 'x');

		file.write(">" + long_name + "\nACGT\n");

		REQUIRE(read_genome(file.name(), defline) == "ACGT");
		REQUIRE(defline == long_name);
	}

	SECTION("Bytes outside of ASCII are kept as is") {

		file.write(">high\nAC" "\xE9" "gt\n");

		REQUIRE(read_genome(file.name(), defline) == "AC" "\xE9" "GT");
	}

	SECTION("Compressed files") {

		file.write_gz(">gz\nACGTACGT\n");

		REQUIRE(read_genome(file.name(), defline) == "ACGTACGT");
	}

	SECTION("Files without sequence") {

		file.write(">empty\n");

		REQUIRE_THROWS_AS(read_genome(file.name(), defline), const char*);
	}

	SECTION("Missing files") {
		REQUIRE_THROWS_AS(read_genome(file.name() + ".missing", defline), const char*);
	}
}

TEST_CASE("Reading the index table", "[parse_input]") {

	TempFile file;

	file.write("# mutant -> reference\n0\n1\n\n  2  \n5 # after an insertion\n6");

	const vector<unsigned int> idx_lut = read_index_table( file.name() );

	REQUIRE(idx_lut.size() == 5);
	REQUIRE(idx_lut[0] == 0);
	REQUIRE(idx_lut[2] == 2);
	REQUIRE(idx_lut[3] == 5);
	REQUIRE(idx_lut[4] == 6);

	SECTION("Malformed entries") {

		file.write("0\n1\nfoo\n");

		REQUIRE_THROWS_AS(read_index_table( file.name() ), ValidationError);

		file.write("0\n-1\n");

		REQUIRE_THROWS_AS(read_index_table( file.name() ), ValidationError);

		file.write("0\n" "\xA0" "1\n");

		REQUIRE_THROWS_AS(read_index_table( file.name() ), ValidationError);
	}
}

TEST_CASE("Reading flagged positions", "[parse_input]") {

	SECTION("No file means no flags") {

		const BitSet flags = read_position_table("", 50);

		REQUIRE(flags.size() == 50);
		REQUIRE(flags.count() == 0);
	}

	SECTION("One coordinate per line") {

		TempFile file;

		file.write_gz("# designed mismatches\n3\n10\n10\n49\n");

		const BitSet flags = read_position_table(file.name(), 50);

		REQUIRE(flags.count() == 3);
		REQUIRE(flags[3]);
		REQUIRE(flags[10]);
		REQUIRE(flags[49]);
	}

	SECTION("Coordinates must be inside the genome") {

		TempFile file;

		file.write("3\n50\n");

		REQUIRE_THROWS_AS(read_position_table(file.name(), 50), ValidationError);
	}
}
