#ifndef __MASCPCR_ERRORS
#define __MASCPCR_ERRORS

#include <stdexcept>
#include <string>

// Malformed inputs to a primer search: inconsistent lookup tables, an
// illegal strand or an invalid parameter set. These are caller bugs and are
// never reported as "primer not found".
class ValidationError : public std::runtime_error
{
	public:
		explicit ValidationError(const std::string &m_msg) :
			std::runtime_error(m_msg)
		{
		};
};

// A failure inside the thermodynamic oracle (i.e. a sequence that the
// melting temperature engine can not evaluate).
class ThermoError : public std::runtime_error
{
	public:
		explicit ThermoError(const std::string &m_msg) :
			std::runtime_error(m_msg)
		{
		};
};

#endif // __MASCPCR_ERRORS
