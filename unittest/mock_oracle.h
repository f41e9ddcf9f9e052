#ifndef __MOCK_ORACLE
#define __MOCK_ORACLE

#include <string>
#include <map>

#include "thermo.h"
#include "base_table.h"
#include "errors.h"

// A deterministic ThermoOracle for testing. By default the melting temperature is
// a linear function of the primer length (tm_per_base*length + tm_offset) and the
// hairpin and homodimer melting temperatures are zero. Individual sequences or
// lengths can be given scripted values. Every call is counted.
class MockOracle : public ThermoOracle
{
	public:
		float tm_per_base;
		float tm_offset;

		std::map<std::string, float> tm_by_seq;
		std::map<size_t, float> hairpin_by_len;
		std::map<std::string, float> hairpin_by_seq;
		std::map<size_t, float> homodimer_by_len;

		// Throw a ThermoError on this melting temperature call (counting from 1), or never if 0
		size_t fail_on_tm_call;

		size_t num_tm;
		size_t num_hairpin;
		size_t num_homodimer;

		MockOracle() :
			tm_per_base(2.0f), tm_offset(20.0f), fail_on_tm_call(0),
			num_tm(0), num_hairpin(0), num_homodimer(0)
		{
		};

		float melting_temperature(const std::string &m_seq, const ThermoParams &m_param)
		{
			check(m_seq);

			++num_tm;

			if( (fail_on_tm_call > 0) && (num_tm == fail_on_tm_call) ){
				throw ThermoError("MockOracle: scripted failure");
			}

			std::map<std::string, float>::const_iterator iter = tm_by_seq.find(m_seq);

			if( iter != tm_by_seq.end() ){
				return iter->second;
			}

			return tm_per_base*m_seq.size() + tm_offset;
		};

		ThermoResult hairpin(const std::string &m_seq, const ThermoParams &m_param)
		{
			check(m_seq);

			++num_hairpin;

			std::map<std::string, float>::const_iterator iter = hairpin_by_seq.find(m_seq);

			if( iter != hairpin_by_seq.end() ){
				return ThermoResult(iter->second);
			}

			return ThermoResult( lookup(hairpin_by_len, m_seq.size()) );
		};

		ThermoResult homodimer(const std::string &m_seq, const ThermoParams &m_param)
		{
			check(m_seq);

			++num_homodimer;

			return ThermoResult( lookup(homodimer_by_len, m_seq.size()) );
		};

		std::string reverse_complement(const std::string &m_seq) const
		{
			return ::reverse_complement(m_seq);
		};

		void reset_counts()
		{
			num_tm = num_hairpin = num_homodimer = 0;
		};

	private:

		static void check(const std::string &m_seq)
		{
			if( m_seq.empty() || ( find_non_acgt(m_seq) != m_seq.size() ) ){
				throw ThermoError("MockOracle: Illegal sequence \"" + m_seq + "\"");
			}
		};

		static float lookup(const std::map<size_t, float> &m_table, const size_t &m_len)
		{
			std::map<size_t, float>::const_iterator iter = m_table.find(m_len);

			return ( iter == m_table.end() ) ? 0.0f : iter->second;
		};
};

#endif // __MOCK_ORACLE
