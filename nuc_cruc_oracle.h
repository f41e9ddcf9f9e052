#ifndef __NUC_CRUC_ORACLE
#define __NUC_CRUC_ORACLE

#include "thermo.h"
#include "nuc_cruc.h"

// ThermoOracle backed by the NucCruc nearest-neighbor engine. NucCruc
// caches the current query, so every thread needs its own NucCrucOracle.
class NucCrucOracle : public ThermoOracle
{
	private:
		NucCruc melt;

		void set_conditions(const ThermoParams &m_param);
		void set_query(const std::string &m_seq, const ThermoParams &m_param);
	public:

		NucCrucOracle()
		{
		};

		float melting_temperature(const std::string &m_seq, const ThermoParams &m_param);
		ThermoResult hairpin(const std::string &m_seq, const ThermoParams &m_param);
		ThermoResult homodimer(const std::string &m_seq, const ThermoParams &m_param);
		std::string reverse_complement(const std::string &m_seq) const;
};

#endif // __NUC_CRUC_ORACLE
