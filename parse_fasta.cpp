#include "mascpcr.h"

#include <string.h>
#include <ctype.h>

#include <iostream>

#include <zlib.h>

using namespace std;

// Read the first record of a (possibly gzip compressed) fasta file. Bases are
// converted to upper case and any following records are ignored.
string read_genome(const string &m_filename, string &m_defline)
{
	// Use zlib to read both compressed and uncompressed fasta files.
	gzFile fin = gzopen(m_filename.c_str(), "r");

	if(fin == NULL){

		cerr << "Error opening: " << m_filename << endl;
		throw __FILE__ ":read_genome: Unable to open fasta file";
	}

	const int buffer_len = 2048;
	char buffer[buffer_len];

	string seq;
	int num_record = 0;

	// Deflines may be longer than the buffer, so track whether the current
	// buffer continues a defline
	bool in_defline = false;
	bool line_start = true;

	m_defline.clear();

	while( gzgets(fin, buffer, buffer_len) ){

		const bool line_end = (strchr(buffer, '\n') != NULL);

		if(line_start && (buffer[0] == '>') ){

			++num_record;

			if(num_record > 1){
				break;
			}

			in_defline = true;
		}

		if(in_defline){

			for(char* p = buffer;*p != '\0';++p){

				if( (*p != '\n') && (*p != '\r') ){
					m_defline.push_back(*p);
				}
			}
		}
		else{
			for(char* p = buffer;*p != '\0';++p){

				// Bytes >= 0x80 must not reach the ctype functions as negative values
				const unsigned char c = (unsigned char)(*p);

				if( !isspace(c) ){
					seq.push_back( toupper(c) );
				}
			}
		}

		if(line_end){
			in_defline = false;
		}

		line_start = line_end;
	}

	gzclose(fin);

	if( seq.empty() ){

		cerr << "No sequence found in: " << m_filename << endl;
		throw __FILE__ ":read_genome: Empty fasta file";
	}

	// Strip the leading '>'
	if( !m_defline.empty() ){
		m_defline.erase(0, 1);
	}

	return seq;
}
