#include "primer.h"

using namespace std;

// Penalties grow as the square of the error. The best possible score is zero:
// a primer Tm at the center of the allowed range and no secondary structure.
float score_thermo(const float &m_tm, const float &m_hairpin_tm, const float &m_homodimer_tm,
	const SearchParams &m_param)
{
	const float target_tm = 0.5f*(m_param.tm_range.first + m_param.tm_range.second);
	const float tm_width = m_param.tm_range.second - m_param.tm_range.first;

	const float hetero = (m_tm - target_tm)/tm_width;
	const float hairpin = m_hairpin_tm/m_param.spurious_tm_clip;
	const float homodimer = m_homodimer_tm/m_param.spurious_tm_clip;

	return -hetero*hetero - hairpin*hairpin - homodimer*homodimer;
}

// Score a primer sequence, computing any melting temperature that is not supplied
float score_primer(const string &m_seq, ThermoOracle &m_oracle, const SearchParams &m_param,
	const float *m_tm /*= NULL*/, const float *m_hairpin_tm /*= NULL*/,
	const float *m_homodimer_tm /*= NULL*/)
{
	const float tm = (m_tm != NULL) ? *m_tm :
		m_oracle.melting_temperature(m_seq, m_param.thermo);

	const float hairpin_tm = (m_hairpin_tm != NULL) ? *m_hairpin_tm :
		m_oracle.hairpin(m_seq, m_param.thermo).tm;

	const float homodimer_tm = (m_homodimer_tm != NULL) ? *m_homodimer_tm :
		m_oracle.homodimer(m_seq, m_param.thermo).tm;

	return score_thermo(tm, hairpin_tm, homodimer_tm, m_param);
}
