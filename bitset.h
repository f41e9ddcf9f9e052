#ifndef __BITSET
#define __BITSET

#include <vector>
#include "mpi_util.h"

// Per-coordinate flags (edge and mismatch tables, primer mismatch flags)
// with MPI serialization
class BitSet : public std::vector<bool>
{
	public:
		
		BitSet()
		{
		};
		
		BitSet(const size_t &m_len, const bool &m_value)
		{
			resize(m_len, m_value);
		};
		
		inline size_t count() const
		{
			size_t ret = 0;
			
			for(const_iterator i = begin();i != end();++i){
				
				if(*i){
					++ret;
				}
			}
			
			return ret;
		};
};

template<> size_t mpi_size(const BitSet &m_obj);
template<> unsigned char* mpi_pack(unsigned char* m_ptr, const BitSet &m_obj);
template<> unsigned char* mpi_unpack(unsigned char* m_ptr, BitSet &m_obj);

#endif // __BITSET
