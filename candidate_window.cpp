#include "primer.h"
#include "base_table.h"

using namespace std;

// Primer coordinates on the plus strand of the genome:
//
// Plus strand primer index    |
// Plus strand primer          >>>>>>>>>>>>>>>>>>
// Genome               ATTACCGATACCAATTGACCAGTTGGGACCCAGTTGACCAGTTGGACCCAGTTAGC
// Minus strand primer                                   <<<<<<<<<<<<<<<<<<<
// Minus strand primer index                             |
//
// The anchor is the 3'-most base of the primer footprint: the right-most base of a
// plus strand primer and the left-most base of a minus strand primer.
CandidateWindow::CandidateWindow(const GenomeTables &m_tables, ThermoOracle &m_oracle,
	const int &m_anchor, const int &m_strand, const pair<int, int> &m_size_range,
	const int &m_margin, const bool &m_with_wildtype) :
	tables(m_tables), anchor(m_anchor), strand(m_strand), max_len(m_size_range.second),
	is_valid(false)
{
	const int genome_len = int( tables.size() );

	if( (anchor - max_len < 0) || (anchor + max_len > genome_len - m_margin) ){
		return;
	}

	if(strand == PLUS_STRAND){
		mut_region = tables.mutant().substr(anchor - max_len + 1, max_len);
	}
	else{
		mut_region = m_oracle.reverse_complement( tables.mutant().substr(anchor, max_len) );
	}

	if(m_with_wildtype){

		const int ref_len = int( tables.reference().size() );

		if(strand == PLUS_STRAND){

			// The reference coordinate of the base that follows the anchor is an
			// exclusive upper bound for the wildtype primer
			const int wt_end = int( tables.ref_index(anchor + 1) );

			if(wt_end - max_len < 0){
				return;
			}

			wt_region = tables.reference().substr(wt_end - max_len, max_len);
		}
		else{

			const int wt_begin = int( tables.ref_index(anchor) );

			if(wt_begin + max_len > ref_len){
				return;
			}

			wt_region = m_oracle.reverse_complement( tables.reference().substr(wt_begin, max_len) );
		}
	}

	is_valid = true;
}

int CandidateWindow::index(const int &m_len) const
{
	return (strand == PLUS_STRAND) ? anchor - m_len + 1 : anchor;
}

int CandidateWindow::wildtype_index(const int &m_len) const
{
	return int( tables.ref_index( index(m_len) ) );
}

string CandidateWindow::primer(const int &m_len) const
{
	if( !is_valid || (m_len < 1) || (m_len > max_len) ){
		throw __FILE__ ":CandidateWindow::primer: Primer length out of bounds";
	}

	return mut_region.substr(max_len - m_len, m_len);
}

string CandidateWindow::wildtype_primer(const int &m_len) const
{
	if( !is_valid || (m_len < 1) || (m_len > max_len) ){
		throw __FILE__ ":CandidateWindow::wildtype_primer: Primer length out of bounds";
	}

	if( wt_region.empty() ){
		throw __FILE__ ":CandidateWindow::wildtype_primer: Wildtype sequence was not requested";
	}

	return wt_region.substr(max_len - m_len, m_len);
}

unsigned int CandidateWindow::gc_3() const
{
	return count_gc_3(mut_region, GC_CLAMP_LEN);
}
