#include "primer.h"

using namespace std;

// Find the best scoring common primer (one that binds the mutant and reference
// genomes identically) whose 3' end sits at m_anchor. The primer footprint may
// not contain a designed mismatch. Since the 3' end is fixed, the first
// mismatch encountered while growing the primer ends the search.
PrimerRecord find_common_primer(const int &m_anchor, const int &m_strand,
	const GenomeTables &m_tables, ThermoOracle &m_oracle, const SearchParams &m_param,
	SearchOutcome *m_outcome /*= NULL*/)
{
	check_strand(m_strand);
	m_param.validate();

	PrimerRecord best;

	const CandidateWindow window(m_tables, m_oracle, m_anchor, m_strand,
		m_param.size_range, COMMON_MARGIN, false /*without wildtype*/);

	if( !window.valid() ){

		if(m_outcome != NULL){
			*m_outcome = INSUFFICIENT_SEQUENCE;
		}

		return best;
	}

	// Check the 3' end for high end stability (lenient mode does not apply)
	if(window.gc_3() > GC_CLAMP_MAX){

		if(m_outcome != NULL){
			*m_outcome = GC_CLAMP;
		}

		return best;
	}

	// The shortest primer must already be free of designed mismatches
	for(int offset = 0;offset < m_param.min_size() - 1;++offset){

		if( m_tables.mismatch( window.coordinate(offset) ) ){

			if(m_outcome != NULL){
				*m_outcome = DESIGNED_MISMATCH;
			}

			return best;
		}
	}

	SearchOutcome outcome = NO_ADMISSIBLE_WINDOW;

	for(int len = m_param.min_size();len <= m_param.max_size();++len){

		// The 5'-most base is the only new base in this primer
		if( m_tables.mismatch( window.coordinate(len - 1) ) ){

			outcome = DESIGNED_MISMATCH;
			break;
		}

		const string seq = window.primer(len);

		PrimerThermo thermo;

		const ThermoDecision decision = screen_primer(seq, m_oracle, m_param, thermo);

		if(decision == CONTINUE_SEARCH){
			continue;
		}

		if(decision == STOP_SEARCH){
			break;
		}

		const float score = score_thermo(thermo.tm, thermo.hairpin_tm, thermo.homodimer_tm, m_param);

		if( best.found() && !(score > best.score() ) ){
			continue;
		}

		best = PrimerRecord(window.index(len), seq, m_strand, BitSet(len, false),
			thermo.tm, thermo.homodimer_tm, thermo.hairpin_tm, score);
	}

	if(m_outcome != NULL){
		*m_outcome = best.found() ? PRIMER_FOUND : outcome;
	}

	return best;
}
