#include "nuc_cruc_oracle.h"
#include "base_table.h"
#include "errors.h"

using namespace std;

// NucCruc would silently treat degenerate bases as mismatches, so refuse anything
// that is not A, C, G or T before it reaches the engine.
static void check_sequence(const string &m_seq, const char *m_caller)
{
	if( m_seq.empty() ){
		throw ThermoError( string(m_caller) + ": Empty sequence" );
	}

	const size_t loc = find_non_acgt(m_seq);

	if( loc != m_seq.size() ){
		throw ThermoError( string(m_caller) + ": Illegal base '" + m_seq[loc] + "' in " + m_seq );
	}
}

void NucCrucOracle::set_conditions(const ThermoParams &m_param)
{
	melt.salt(m_param.salt);
	melt.strand(m_param.primer_strand);
}

void NucCrucOracle::set_query(const string &m_seq, const ThermoParams &m_param)
{
	set_conditions(m_param);
	melt.set_query(m_seq);
}

float NucCrucOracle::melting_temperature(const string &m_seq, const ThermoParams &m_param)
{
	check_sequence(m_seq, "NucCrucOracle::melting_temperature");

	try{
		set_conditions(m_param);

		return melt.tm_pm_duplex(m_seq);
	}
	catch(const char *error){
		throw ThermoError( string("NucCrucOracle::melting_temperature: ") + error );
	}
}

ThermoResult NucCrucOracle::hairpin(const string &m_seq, const ThermoParams &m_param)
{
	check_sequence(m_seq, "NucCrucOracle::hairpin");

	try{
		set_query(m_seq, m_param);

		return ThermoResult( melt.approximate_tm_hairpin() );
	}
	catch(const char *error){
		throw ThermoError( string("NucCrucOracle::hairpin: ") + error );
	}
}

ThermoResult NucCrucOracle::homodimer(const string &m_seq, const ThermoParams &m_param)
{
	check_sequence(m_seq, "NucCrucOracle::homodimer");

	try{
		set_query(m_seq, m_param);

		return ThermoResult( melt.approximate_tm_homodimer() );
	}
	catch(const char *error){
		throw ThermoError( string("NucCrucOracle::homodimer: ") + error );
	}
}

string NucCrucOracle::reverse_complement(const string &m_seq) const
{
	check_sequence(m_seq, "NucCrucOracle::reverse_complement");

	return ::reverse_complement(m_seq);
}
