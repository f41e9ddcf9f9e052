#ifndef __TEST_GENOME
#define __TEST_GENOME

#include <string>
#include <vector>

#include "genome_tables.h"

// Every window of five bases in this repeat holds exactly two G/C, so the
// 3' GC clamp never rejects an anchor unless a test edits the genome.
inline std::string make_genome(const size_t &m_len)
{
	const char* repeat = "AACGT";

	std::string ret(m_len, 'A');

	for(size_t i = 0;i < m_len;++i){
		ret[i] = repeat[i%5];
	}

	return ret;
}

// Tables for a mutant genome that is identical to its reference genome, apart
// from the flagged positions
inline GenomeTables make_tables(const std::string &m_mut,
	const std::vector<size_t> &m_mismatch = std::vector<size_t>(),
	const std::vector<size_t> &m_edge = std::vector<size_t>())
{
	std::vector<unsigned int> idx_lut( m_mut.size() );

	for(size_t i = 0;i < m_mut.size();++i){
		idx_lut[i] = i;
	}

	BitSet edge(m_mut.size(), false);
	BitSet mismatch(m_mut.size(), false);

	for(std::vector<size_t>::const_iterator i = m_edge.begin();i != m_edge.end();++i){
		edge[*i] = true;
	}

	for(std::vector<size_t>::const_iterator i = m_mismatch.begin();i != m_mismatch.end();++i){
		mismatch[*i] = true;
	}

	return GenomeTables(m_mut, m_mut, idx_lut, edge, mismatch);
}

inline std::vector<size_t> positions(const size_t &m_a)
{
	return std::vector<size_t>(1, m_a);
}

inline std::vector<size_t> positions(const size_t &m_a, const size_t &m_b)
{
	std::vector<size_t> ret;

	ret.push_back(m_a);
	ret.push_back(m_b);

	return ret;
}

#endif // __TEST_GENOME
