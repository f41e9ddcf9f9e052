#ifndef __UPDATE
#define __UPDATE

#include <string>
#include <iostream>

// An in-place progress indicator. The line is rewritten (using backspaces) only
// when the integer percentage changes.
class UpdateInfo
{
	private:
		std::ostream &out;
		std::string prefix;
		size_t buffer_size;
		int last_percent;
		bool is_open;

		void rewrite(const std::string &m_str);
	public:

		UpdateInfo(const std::string &m_prefix, std::ostream &m_out = std::cerr) :
			out(m_out), prefix(m_prefix), buffer_size(0), last_percent(-1), is_open(false)
		{
		};

		~UpdateInfo()
		{
			close();
		};

		void progress(const size_t &m_done, const size_t &m_total);
		void close();
};

#endif // __UPDATE
