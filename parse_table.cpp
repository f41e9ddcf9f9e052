#include "mascpcr.h"
#include "errors.h"

#include <stdlib.h>
#include <string.h>
#include <ctype.h>

#include <iostream>
#include <sstream>

#include <zlib.h>

using namespace std;

// Lookup tables are plain (or gzip compressed) text with one integer per line.
// Anything after a '#' is a comment and blank lines are skipped.
static void read_integers(const string &m_filename, deque< pair<size_t, long int> > &m_values)
{
	// Use zlib to read both compressed and uncompressed table files.
	gzFile fin = gzopen(m_filename.c_str(), "r");

	if(fin == NULL){

		cerr << "Error opening: " << m_filename << endl;
		throw __FILE__ ":read_integers: Unable to open table file";
	}

	const int buffer_len = 2048;
	char buffer[buffer_len];

	string line;
	size_t line_number = 0;
	bool more = true;

	while(more){

		more = (gzgets(fin, buffer, buffer_len) != NULL);

		if(more){

			line += buffer;

			// Keep reading until we have a complete line
			if( (strchr(buffer, '\n') == NULL) && !gzeof(fin) ){
				continue;
			}
		}

		if( line.empty() ){
			continue;
		}

		++line_number;

		const size_t comment = line.find('#');

		if(comment != string::npos){
			line.erase(comment);
		}

		const char* p = line.c_str();

		while( isspace( (unsigned char)(*p) ) ){
			++p;
		}

		if(*p != '\0'){

			char* end = NULL;
			const long int value = strtol(p, &end, 10);

			while( (end != NULL) && isspace( (unsigned char)(*end) ) ){
				++end;
			}

			if( (end == p) || (end == NULL) || (*end != '\0') ){

				gzclose(fin);

				stringstream ssout;

				ssout << m_filename << ": Unable to parse line " << line_number
					<< " (\"" << p << "\")";

				throw ValidationError( ssout.str() );
			}

			m_values.push_back( make_pair(line_number, value) );
		}

		line.clear();
	}

	gzclose(fin);
}

vector<unsigned int> read_index_table(const string &m_filename)
{
	deque< pair<size_t, long int> > values;

	read_integers(m_filename, values);

	vector<unsigned int> ret;

	ret.reserve( values.size() );

	for(deque< pair<size_t, long int> >::const_iterator i = values.begin();i != values.end();++i){

		if(i->second < 0){

			stringstream ssout;

			ssout << m_filename << ": Negative reference coordinate on line " << i->first;

			throw ValidationError( ssout.str() );
		}

		ret.push_back( (unsigned int)(i->second) );
	}

	return ret;
}

// An empty filename produces a table with no flagged positions
BitSet read_position_table(const string &m_filename, const size_t &m_genome_len)
{
	BitSet ret(m_genome_len, false);

	if( m_filename.empty() ){
		return ret;
	}

	deque< pair<size_t, long int> > values;

	read_integers(m_filename, values);

	for(deque< pair<size_t, long int> >::const_iterator i = values.begin();i != values.end();++i){

		if( (i->second < 0) || ( (size_t)(i->second) >= m_genome_len) ){

			stringstream ssout;

			ssout << m_filename << ": Coordinate " << i->second << " on line " << i->first
				<< " is outside the mutant genome (" << m_genome_len << " bp)";

			throw ValidationError( ssout.str() );
		}

		ret[i->second] = true;
	}

	return ret;
}
