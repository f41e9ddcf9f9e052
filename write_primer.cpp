#include "mascpcr.h"

#include <iostream>
#include <sstream>
#include <cmath>
#include <stdio.h>

using namespace std;

static string mismatch_flags_str(const BitSet &m_flags);
static string json_escape(const string &m_str);
static string json_number(const float &m_value);
static void write_text_record(ostream &m_out, const char* m_kind, const int &m_anchor,
	const PrimerRecord &m_primer);
static void write_json_record(ostream &m_out, const PrimerRecord &m_primer, const string &m_indent);

string strand_symbol(const int &m_strand)
{
	return (m_strand == PLUS_STRAND) ? "+" : "-";
}

void write_text_header(ostream &m_out, int argc, char *argv[])
{
	m_out << "mascpcr version "
		<< MASCPCR_MAJOR_VERSION << '.'
		<< MASCPCR_MINOR_VERSION << endl;

	// Write the command line arguments to disk
	m_out << "Command line:";

	for(int i = 0;i < argc;++i){
		m_out << ' ' << argv[i];
	}

	m_out << endl;
}

void write_text(ostream &m_out, const deque<PrimerHit> &m_hits)
{
	m_out << "#kind\tanchor\tstrand\tindex\tlength\tsequence\ttm\thairpin_tm\thomodimer_tm\tscore\tmismatches" << endl;

	for(deque<PrimerHit>::const_iterator i = m_hits.begin();i != m_hits.end();++i){

		switch(i->kind){
			case DISCRIMINATORY_PRIMER:

				write_text_record(m_out, "disc", i->anchor, i->primer);
				write_text_record(m_out, "wt", i->anchor, i->wildtype);
				break;
			case COMMON_PRIMER:

				write_text_record(m_out, "common", i->anchor, i->primer);
				break;
			default:
				throw __FILE__ ":write_text: Unknown primer kind";
		};
	}
}

void write_json(ostream &m_out, const deque<PrimerHit> &m_hits, int argc, char *argv[])
{
	m_out << "{\n\t\"program\":\"mascpcr\",\n"
		<< "\t\"version\":\"" << MASCPCR_MAJOR_VERSION << '.'
		<< MASCPCR_MINOR_VERSION << "\",\n\t"
		<< "\"command line\":\"";

	for(int i = 0;i < argc;++i){

		if(i > 0){
			m_out << ' ';
		}

		m_out << json_escape(argv[i]);
	}

	m_out << "\",\n\t\"primers\":[";

	for(deque<PrimerHit>::const_iterator i = m_hits.begin();i != m_hits.end();++i){

		if( i != m_hits.begin() ){
			m_out << ',';
		}

		m_out << "\n\t\t{\n";

		switch(i->kind){
			case DISCRIMINATORY_PRIMER:
				m_out << "\t\t\t\"kind\":\"discriminatory\",\n";
				break;
			case COMMON_PRIMER:
				m_out << "\t\t\t\"kind\":\"common\",\n";
				break;
			default:
				throw __FILE__ ":write_json: Unknown primer kind";
		};

		m_out << "\t\t\t\"anchor\":" << i->anchor << ",\n";

		write_json_record(m_out, i->primer, "\t\t\t");

		if(i->kind == DISCRIMINATORY_PRIMER){

			m_out << ",\n\t\t\t\"wildtype\":{\n";

			write_json_record(m_out, i->wildtype, "\t\t\t\t");

			m_out << "\n\t\t\t}";
		}

		m_out << "\n\t\t}";
	}

	if( !m_hits.empty() ){
		m_out << "\n\t";
	}

	m_out << "]\n}" << endl;
}

void write_text_record(ostream &m_out, const char* m_kind, const int &m_anchor,
	const PrimerRecord &m_primer)
{
	m_out << m_kind << '\t'
		<< m_anchor << '\t'
		<< strand_symbol( m_primer.strand() ) << '\t'
		<< m_primer.index() << '\t'
		<< m_primer.length() << '\t'
		<< m_primer.seq() << '\t'
		<< m_primer.tm() << '\t'
		<< m_primer.tm_hairpin() << '\t'
		<< m_primer.tm_homodimer() << '\t'
		<< m_primer.score() << '\t'
		<< mismatch_flags_str( m_primer.mismatches() ) << endl;
}

void write_json_record(ostream &m_out, const PrimerRecord &m_primer, const string &m_indent)
{
	m_out << m_indent << "\"strand\":\"" << strand_symbol( m_primer.strand() ) << "\",\n"
		<< m_indent << "\"index\":" << m_primer.index() << ",\n"
		<< m_indent << "\"length\":" << m_primer.length() << ",\n"
		<< m_indent << "\"sequence\":\"" << m_primer.seq() << "\",\n"
		<< m_indent << "\"tm\":" << json_number( m_primer.tm() ) << ",\n"
		<< m_indent << "\"hairpin tm\":" << json_number( m_primer.tm_hairpin() ) << ",\n"
		<< m_indent << "\"homodimer tm\":" << json_number( m_primer.tm_homodimer() ) << ",\n"
		<< m_indent << "\"score\":" << json_number( m_primer.score() ) << ",\n"
		<< m_indent << "\"mismatches\":\"" << mismatch_flags_str( m_primer.mismatches() ) << "\"";
}

// One character per primer base, starting at the 3' end
string mismatch_flags_str(const BitSet &m_flags)
{
	string ret( m_flags.size(), '0' );

	for(size_t i = 0;i < m_flags.size();++i){

		if(m_flags[i]){
			ret[i] = '1';
		}
	}

	return ret;
}

string json_escape(const string &m_str)
{
	string ret;

	for(string::const_iterator i = m_str.begin();i != m_str.end();++i){

		switch(*i){
			case '"':
				ret += "\\\"";
				break;
			case '\\':
				ret += "\\\\";
				break;
			case '\n':
				ret += "\\n";
				break;
			case '\r':
				ret += "\\r";
				break;
			case '\t':
				ret += "\\t";
				break;
			default:

				// The remaining control characters use the four digit hex escape
				if( (unsigned char)(*i) < 0x20 ){

					char buffer[7];

					snprintf(buffer, sizeof(buffer), "\\u%04x", (unsigned int)( (unsigned char)(*i) ) );

					ret += buffer;
				}
				else{
					ret.push_back(*i);
				}

				break;
		};
	}

	return ret;
}

// JSON has no representation for NaN or infinity
string json_number(const float &m_value)
{
	if( !std::isfinite(m_value) ){
		return "null";
	}

	stringstream ssout;

	ssout << m_value;

	return ssout.str();
}
