#ifndef __THERMO
#define __THERMO

#include <string>

#define	DEFAULT_SALT		0.05f
#define	DEFAULT_PRIMER_STRAND	900.0e-9f

// Solution conditions that are forwarded, unchanged, to the melting temperature engine
struct ThermoParams
{
	// Use X Macros (https://en.wikipedia.org/wiki/X_Macro) to
	// ensure that structure variable are correctly serialized.
	#define THERMO_PARAMS_MEMBERS \
		VARIABLE(float, salt) \
		VARIABLE(float, primer_strand)

	#define VARIABLE(A, B) A B;
		THERMO_PARAMS_MEMBERS
	#undef VARIABLE

	ThermoParams() :
		salt(DEFAULT_SALT), primer_strand(DEFAULT_PRIMER_STRAND)
	{
	};
};

struct ThermoResult
{
	float tm; // Melting temperature in degrees C

	ThermoResult() :
		tm(0.0f)
	{
	};

	explicit ThermoResult(const float &m_tm) :
		tm(m_tm)
	{
	};
};

// The thermodynamic calculations needed by the primer searches. Implementations
// may keep internal state between calls, so a single oracle must not be shared
// between threads. All sequences are 5'-3'. Failures are reported by throwing
// ThermoError.
class ThermoOracle
{
	public:
		virtual ~ThermoOracle()
		{
		};

		// Perfect match duplex melting temperature (degrees C)
		virtual float melting_temperature(const std::string &m_seq, const ThermoParams &m_param) = 0;

		virtual ThermoResult hairpin(const std::string &m_seq, const ThermoParams &m_param) = 0;
		virtual ThermoResult homodimer(const std::string &m_seq, const ThermoParams &m_param) = 0;

		virtual std::string reverse_complement(const std::string &m_seq) const = 0;
};

#endif // __THERMO
