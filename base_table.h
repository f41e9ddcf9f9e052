#ifndef __BASE_TABLE
#define  __BASE_TABLE

#include <string>

// Primers and genomes are plain, upper-case nucleotide strings. Degenerate
// bases are not allowed anywhere in a primer search.

inline bool is_acgt(char m_base)
{
	switch(m_base){
		case 'A':
		case 'C':
		case 'G':
		case 'T':
			return true;
		default:
			return false;
	};

	return false;
};

inline bool is_gc(char m_base)
{
	return (m_base == 'G') || (m_base == 'C');
};

inline char complement(char m_base)
{
	switch(m_base){
		case 'A':
			return 'T';
		case 'T':
			return 'A';
		case 'G':
			return 'C';
		case 'C':
			return 'G';
		case 'N':
			return 'N';
		default:
			throw __FILE__ ":complement: Illegal base";
			break;
	};

	// We should never get here
	return '?';
};

inline std::string reverse_complement(const std::string &m_seq)
{
	std::string ret(m_seq.size(), 'N');

	std::string::const_iterator i = m_seq.begin();
	std::string::reverse_iterator r = ret.rbegin();

	for(;i != m_seq.end();++i, ++r){
		*r = complement(*i);
	}

	return ret;
};

// Return the index of the first non-ACGT base, or m_seq.size() if there is none
inline size_t find_non_acgt(const std::string &m_seq)
{
	const size_t len = m_seq.size();

	for(size_t i = 0;i < len;++i){

		if( !is_acgt(m_seq[i]) ){
			return i;
		}
	}

	return len;
};

// Count the G and C bases in the last m_len bases of m_seq
inline unsigned int count_gc_3(const std::string &m_seq, size_t m_len)
{
	if(m_len > m_seq.size()){
		m_len = m_seq.size();
	}

	unsigned int ret = 0;

	for(std::string::const_reverse_iterator i = m_seq.rbegin();m_len > 0;++i, --m_len){

		if( is_gc(*i) ){
			++ret;
		}
	}

	return ret;
};

#endif // __BASE_TABLE
