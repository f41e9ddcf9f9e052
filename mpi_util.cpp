#include "mpi_util.h"
#include "mascpcr.h"
#include "bitset.h"
#include "primer.h"
#include "genome_tables.h"

#include <string.h>

using namespace std;

/////////////////////////////////////////////////////////////////////////////////////////
// Specialization for std::string
/////////////////////////////////////////////////////////////////////////////////////////
template<>
size_t mpi_size(const string &m_str)
{
	return sizeof(size_t) + m_str.size();
}

template<>
unsigned char* mpi_pack(unsigned char* m_ptr, const string &m_str)
{
	const size_t len = m_str.size();

	memcpy( m_ptr, &len, sizeof(size_t) );
	m_ptr += sizeof(size_t);

	memcpy(m_ptr, m_str.data(), len);
	m_ptr += len;

	return m_ptr;
}

template<>
unsigned char* mpi_unpack(unsigned char* m_ptr, string &m_str)
{
	size_t len;

	memcpy( &len, m_ptr, sizeof(size_t) );
	m_ptr += sizeof(size_t);

	m_str.assign( (char*)m_ptr, len );
	m_ptr += len;

	return m_ptr;
}

/////////////////////////////////////////////////////////////////////////////////////////
// Specialization for BitSet. Bits are packed eight to a byte, most significant
// bit first, and the packed bits always occupy a whole number of bytes.
/////////////////////////////////////////////////////////////////////////////////////////
template<>
size_t mpi_size(const BitSet &m_obj)
{
	return sizeof(size_t) + (m_obj.size() + 7)/8;
}

template<>
unsigned char* mpi_pack(unsigned char* m_ptr, const BitSet &m_obj)
{
	const size_t num_bits = m_obj.size();
	const size_t num_bytes = (num_bits + 7)/8;

	memcpy( m_ptr, &num_bits, sizeof(size_t) );
	m_ptr += sizeof(size_t);

	memset(m_ptr, 0, num_bytes);

	for(size_t i = 0;i < num_bits;++i){

		if(m_obj[i]){
			m_ptr[i/8] |= (1 << (7 - i%8) );
		}
	}

	return m_ptr + num_bytes;
}

template<>
unsigned char* mpi_unpack(unsigned char* m_ptr, BitSet &m_obj)
{
	size_t num_bits;

	memcpy( &num_bits, m_ptr, sizeof(size_t) );
	m_ptr += sizeof(size_t);

	m_obj.assign(num_bits, false);

	for(size_t i = 0;i < num_bits;++i){
		m_obj[i] = (m_ptr[i/8] >> (7 - i%8) ) & 1;
	}

	return m_ptr + (num_bits + 7)/8;
}

/////////////////////////////////////////////////////////////////////////////////////////
// Specialization for SearchParams
/////////////////////////////////////////////////////////////////////////////////////////
template<>
size_t mpi_size(const SearchParams &m_obj)
{
	size_t ret = 0;

	#define VARIABLE(A, B) ret += mpi_size(m_obj.B);
		SEARCH_PARAMS_MEMBERS
	#undef VARIABLE

	return ret;
}

template<>
unsigned char* mpi_pack(unsigned char* m_ptr, const SearchParams &m_obj)
{
	#define VARIABLE(A, B) m_ptr = mpi_pack(m_ptr, m_obj.B);
		SEARCH_PARAMS_MEMBERS
	#undef VARIABLE

	return m_ptr;
}

template<>
unsigned char* mpi_unpack(unsigned char* m_ptr, SearchParams &m_obj)
{
	#define VARIABLE(A, B) m_ptr = mpi_unpack(m_ptr, m_obj.B);
		SEARCH_PARAMS_MEMBERS
	#undef VARIABLE

	return m_ptr;
}

/////////////////////////////////////////////////////////////////////////////////////////
// Specialization for PrimerRecord
/////////////////////////////////////////////////////////////////////////////////////////
template<>
size_t mpi_size(const PrimerRecord &m_obj)
{
	size_t ret = 0;

	#define VARIABLE(A, B) ret += mpi_size(m_obj.B);
		PRIMER_RECORD_MEMBERS
	#undef VARIABLE

	return ret;
}

template<>
unsigned char* mpi_pack(unsigned char* m_ptr, const PrimerRecord &m_obj)
{
	#define VARIABLE(A, B) m_ptr = mpi_pack(m_ptr, m_obj.B);
		PRIMER_RECORD_MEMBERS
	#undef VARIABLE

	return m_ptr;
}

template<>
unsigned char* mpi_unpack(unsigned char* m_ptr, PrimerRecord &m_obj)
{
	#define VARIABLE(A, B) m_ptr = mpi_unpack(m_ptr, m_obj.B);
		PRIMER_RECORD_MEMBERS
	#undef VARIABLE

	return m_ptr;
}

/////////////////////////////////////////////////////////////////////////////////////////
// Specialization for GenomeTables
/////////////////////////////////////////////////////////////////////////////////////////
template<>
size_t mpi_size(const GenomeTables &m_obj)
{
	size_t ret = 0;

	#define VARIABLE(A, B) ret += mpi_size(m_obj.B);
		GENOME_TABLES_MEMBERS
	#undef VARIABLE

	return ret;
}

template<>
unsigned char* mpi_pack(unsigned char* m_ptr, const GenomeTables &m_obj)
{
	#define VARIABLE(A, B) m_ptr = mpi_pack(m_ptr, m_obj.B);
		GENOME_TABLES_MEMBERS
	#undef VARIABLE

	return m_ptr;
}

template<>
unsigned char* mpi_unpack(unsigned char* m_ptr, GenomeTables &m_obj)
{
	#define VARIABLE(A, B) m_ptr = mpi_unpack(m_ptr, m_obj.B);
		GENOME_TABLES_MEMBERS
	#undef VARIABLE

	return m_ptr;
}

/////////////////////////////////////////////////////////////////////////////////////////
// Specialization for Options
/////////////////////////////////////////////////////////////////////////////////////////
template<>
size_t mpi_size(const Options &m_obj)
{
	size_t ret = 0;

	#define VARIABLE(A, B) ret += mpi_size(m_obj.B);
		OPTIONS_MEMBERS
	#undef VARIABLE

	return ret;
}

template<>
unsigned char* mpi_pack(unsigned char* m_ptr, const Options &m_obj)
{
	#define VARIABLE(A, B) m_ptr = mpi_pack(m_ptr, m_obj.B);
		OPTIONS_MEMBERS
	#undef VARIABLE

	return m_ptr;
}

template<>
unsigned char* mpi_unpack(unsigned char* m_ptr, Options &m_obj)
{
	#define VARIABLE(A, B) m_ptr = mpi_unpack(m_ptr, m_obj.B);
		OPTIONS_MEMBERS
	#undef VARIABLE

	return m_ptr;
}

/////////////////////////////////////////////////////////////////////////////////////////
// Specialization for PrimerHit
/////////////////////////////////////////////////////////////////////////////////////////
template<>
size_t mpi_size(const PrimerHit &m_obj)
{
	size_t ret = 0;

	#define VARIABLE(A, B) ret += mpi_size(m_obj.B);
		PRIMER_HIT_MEMBERS
	#undef VARIABLE

	return ret;
}

template<>
unsigned char* mpi_pack(unsigned char* m_ptr, const PrimerHit &m_obj)
{
	#define VARIABLE(A, B) m_ptr = mpi_pack(m_ptr, m_obj.B);
		PRIMER_HIT_MEMBERS
	#undef VARIABLE

	return m_ptr;
}

template<>
unsigned char* mpi_unpack(unsigned char* m_ptr, PrimerHit &m_obj)
{
	#define VARIABLE(A, B) m_ptr = mpi_unpack(m_ptr, m_obj.B);
		PRIMER_HIT_MEMBERS
	#undef VARIABLE

	return m_ptr;
}
