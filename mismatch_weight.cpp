#include "primer.h"

using namespace std;

// Walk the primer from its 3' end toward its 5' end, flagging and weighting the
// designed mismatches. The walk stops at the first edge base; mismatches found
// before the edge are kept and the primer is still scored.
MismatchTally weigh_mismatches(const CandidateWindow &m_window, const int &m_len,
	const GenomeTables &m_tables, const SearchParams &m_param)
{
	MismatchTally ret(m_len);

	for(int offset = 0;offset < m_len;++offset){

		const int loc = m_window.coordinate(offset);

		if( m_tables.edge(loc) ){

			ret.edge_offset = offset;
			break;
		}

		if( m_tables.mismatch(loc) ){

			ret.flags[offset] = true;
			++ret.count;
			ret.score += m_param.mismatch_weight(offset);
		}
	}

	return ret;
}
