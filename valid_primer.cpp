#include "primer.h"

using namespace std;

// Melting temperature increases with primer length. A primer that is too cold
// may be rescued by a longer primer, while a primer that is too hot can not.
ThermoDecision check_tm(const float &m_tm, const SearchParams &m_param)
{
	if(m_tm < m_param.tm_range.first){
		return CONTINUE_SEARCH;
	}

	if(m_tm > m_param.tm_range.second){
		return STOP_SEARCH;
	}

	return ACCEPT_WINDOW;
}

// Hairpin and homodimer stability only get worse as the primer grows
ThermoDecision check_structure(const PrimerThermo &m_thermo, const SearchParams &m_param)
{
	if( (m_thermo.hairpin_tm > m_param.spurious_tm_clip) ||
	    (m_thermo.homodimer_tm > m_param.spurious_tm_clip) ){
		return STOP_SEARCH;
	}

	return ACCEPT_WINDOW;
}

static void structure_tm(const string &m_seq, ThermoOracle &m_oracle,
	const SearchParams &m_param, PrimerThermo &m_thermo)
{
	m_thermo.hairpin_tm = m_oracle.hairpin(m_seq, m_param.thermo).tm;
	m_thermo.homodimer_tm = m_oracle.homodimer(m_seq, m_param.thermo).tm;
}

ThermoDecision screen_primer(const string &m_seq, ThermoOracle &m_oracle,
	const SearchParams &m_param, PrimerThermo &m_thermo)
{
	m_thermo.tm = m_oracle.melting_temperature(m_seq, m_param.thermo);

	const ThermoDecision ret = check_tm(m_thermo.tm, m_param);

	if(ret != ACCEPT_WINDOW){
		return ret;
	}

	structure_tm(m_seq, m_oracle, m_param, m_thermo);

	return check_structure(m_thermo, m_param);
}

// The discriminatory primer and its wildtype partner must both pass. A cold
// primer in either pair member takes precedence over a hot one.
ThermoDecision screen_primer_pair(const string &m_mut, const string &m_wt,
	ThermoOracle &m_oracle, const SearchParams &m_param,
	PrimerThermo &m_mut_thermo, PrimerThermo &m_wt_thermo)
{
	m_mut_thermo.tm = m_oracle.melting_temperature(m_mut, m_param.thermo);
	m_wt_thermo.tm = m_oracle.melting_temperature(m_wt, m_param.thermo);

	if(m_param.lenient_mode){

		// Every window is scored, but the primer records still need the
		// secondary structure melting temperatures
		structure_tm(m_mut, m_oracle, m_param, m_mut_thermo);
		structure_tm(m_wt, m_oracle, m_param, m_wt_thermo);

		return ACCEPT_WINDOW;
	}

	const ThermoDecision mut_tm = check_tm(m_mut_thermo.tm, m_param);
	const ThermoDecision wt_tm = check_tm(m_wt_thermo.tm, m_param);

	if( (mut_tm == CONTINUE_SEARCH) || (wt_tm == CONTINUE_SEARCH) ){
		return CONTINUE_SEARCH;
	}

	if( (mut_tm == STOP_SEARCH) || (wt_tm == STOP_SEARCH) ){
		return STOP_SEARCH;
	}

	structure_tm(m_mut, m_oracle, m_param, m_mut_thermo);
	structure_tm(m_wt, m_oracle, m_param, m_wt_thermo);

	if( (check_structure(m_mut_thermo, m_param) == STOP_SEARCH) ||
	    (check_structure(m_wt_thermo, m_param) == STOP_SEARCH) ){
		return STOP_SEARCH;
	}

	return ACCEPT_WINDOW;
}
