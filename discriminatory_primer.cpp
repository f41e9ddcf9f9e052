#include "primer.h"

using namespace std;

// Find the best scoring discriminatory primer whose 3' end sits at m_anchor,
// along with the matching primer on the reference genome. Primers are examined
// in order of increasing length. A primer is scored when both it and its wildtype
// partner pass the melting temperature and secondary structure cutoffs (or
// unconditionally in lenient mode) and it covers at least
// m_param.min_num_mismatches designed mismatches.
PrimerPair find_discriminatory_primer(const int &m_anchor, const int &m_strand,
	const GenomeTables &m_tables, ThermoOracle &m_oracle, const SearchParams &m_param,
	SearchOutcome *m_outcome /*= NULL*/)
{
	check_strand(m_strand);
	m_param.validate();

	PrimerPair best;

	const CandidateWindow window(m_tables, m_oracle, m_anchor, m_strand,
		m_param.size_range, DISCRIMINATORY_MARGIN, true /*with wildtype*/);

	if( !window.valid() ){

		if(m_outcome != NULL){
			*m_outcome = INSUFFICIENT_SEQUENCE;
		}

		return best;
	}

	// Check the 3' end for high end stability
	if( !m_param.lenient_mode && (window.gc_3() > GC_CLAMP_MAX) ){

		if(m_outcome != NULL){
			*m_outcome = GC_CLAMP;
		}

		return best;
	}

	for(int len = m_param.min_size();len <= m_param.max_size();++len){

		const string mut = window.primer(len);
		const string wt = window.wildtype_primer(len);

		PrimerThermo mut_thermo;
		PrimerThermo wt_thermo;

		const ThermoDecision decision = screen_primer_pair(mut, wt, m_oracle, m_param,
			mut_thermo, wt_thermo);

		if(decision == CONTINUE_SEARCH){
			continue;
		}

		if(decision == STOP_SEARCH){
			break;
		}

		const MismatchTally tally = weigh_mismatches(window, len, m_tables, m_param);

		if(tally.count < m_param.min_num_mismatches){
			continue;
		}

		const float score = score_thermo(mut_thermo.tm, mut_thermo.hairpin_tm,
			mut_thermo.homodimer_tm, m_param) + tally.score;

		// Only a strictly better score replaces the current best primer
		if( best.found() && !(score > best.mutant.score() ) ){
			continue;
		}

		best.mutant = PrimerRecord(window.index(len), mut, m_strand, tally.flags,
			mut_thermo.tm, mut_thermo.homodimer_tm, mut_thermo.hairpin_tm, score);

		// The wildtype primer is not scored
		best.wildtype = PrimerRecord(window.wildtype_index(len), wt, m_strand, BitSet(len, false),
			wt_thermo.tm, wt_thermo.homodimer_tm, wt_thermo.hairpin_tm, 0.0f);
	}

	if(m_outcome != NULL){
		*m_outcome = best.found() ? PRIMER_FOUND : NO_ADMISSIBLE_WINDOW;
	}

	return best;
}
