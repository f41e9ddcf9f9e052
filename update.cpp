#include "update.h"

#include <sstream>

using namespace std;

void UpdateInfo::rewrite(const string &m_str)
{
	// Erase the previous message
	out << string(buffer_size, '\b')
		<< string(buffer_size, ' ')
		<< string(buffer_size, '\b');

	buffer_size = m_str.size();

	out << m_str;
	out.flush();
}

void UpdateInfo::progress(const size_t &m_done, const size_t &m_total)
{
	const int percent = (m_total == 0) ? 100 : int( (100*m_done)/m_total );

	if(percent == last_percent){
		return;
	}

	if(!is_open){

		out << prefix;
		is_open = true;
	}

	last_percent = percent;

	stringstream ssout;

	ssout << percent << '%';

	rewrite( ssout.str() );
}

void UpdateInfo::close()
{
	if(!is_open){
		return;
	}

	out << endl;

	is_open = false;
	buffer_size = 0;
	last_percent = -1;
}
