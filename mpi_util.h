#ifndef __MPI_UTIL
#define __MPI_UTIL

#include <mpi.h>
#include <string.h>

#include <string>
#include <vector>
#include <deque>
#include <utility>
#include <algorithm>

// Byte-level serialization for sending objects between MPI ranks. Every
// serializable type provides mpi_size (the number of packed bytes), mpi_pack
// and mpi_unpack (which return a pointer to the next free/unread byte).
// The generic templates handle plain-old-data types; everything else needs a
// specialization or an overload.

// Protect any commas that appear in template variables
// when combined with X Macros
#define SINGLE_ARG(...) __VA_ARGS__

template<class T> size_t mpi_size(const T &m_obj);
template<class T> unsigned char* mpi_pack(unsigned char* m_ptr, const T &m_obj);
template<class T> unsigned char* mpi_unpack(unsigned char* m_ptr, T &m_obj);

template<> size_t mpi_size(const std::string &m_str);
template<> unsigned char* mpi_pack(unsigned char* m_ptr, const std::string &m_str);
template<> unsigned char* mpi_unpack(unsigned char* m_ptr, std::string &m_str);

template<class A, class B> size_t mpi_size(const std::pair<A, B> &m_obj);
template<class A, class B> unsigned char* mpi_pack(unsigned char* m_ptr, const std::pair<A, B> &m_obj);
template<class A, class B> unsigned char* mpi_unpack(unsigned char* m_ptr, std::pair<A, B> &m_obj);

template<class T> size_t mpi_size(const std::vector<T> &m_obj);
template<class T> unsigned char* mpi_pack(unsigned char* m_ptr, const std::vector<T> &m_obj);
template<class T> unsigned char* mpi_unpack(unsigned char* m_ptr, std::vector<T> &m_obj);

template<class T> size_t mpi_size(const std::deque<T> &m_obj);
template<class T> unsigned char* mpi_pack(unsigned char* m_ptr, const std::deque<T> &m_obj);
template<class T> unsigned char* mpi_unpack(unsigned char* m_ptr, std::deque<T> &m_obj);

/////////////////////////////////////////////////////////////////////////////////////////
// Plain-old-data
/////////////////////////////////////////////////////////////////////////////////////////
template<class T>
size_t mpi_size(const T &m_obj)
{
	return sizeof(m_obj);
}

template<class T>
unsigned char* mpi_pack(unsigned char* m_ptr, const T &m_obj)
{
	memcpy( m_ptr, &m_obj, sizeof(m_obj) );
	m_ptr += sizeof(m_obj);

	return m_ptr;
}

template<class T>
unsigned char* mpi_unpack(unsigned char* m_ptr, T &m_obj)
{
	memcpy( &m_obj, m_ptr, sizeof(m_obj) );
	m_ptr += sizeof(m_obj);

	return m_ptr;
}

/////////////////////////////////////////////////////////////////////////////////////////
// std::pair
/////////////////////////////////////////////////////////////////////////////////////////
template<class A, class B>
size_t mpi_size(const std::pair<A, B> &m_obj)
{
	return mpi_size(m_obj.first) + mpi_size(m_obj.second);
}

template<class A, class B>
unsigned char* mpi_pack(unsigned char* m_ptr, const std::pair<A, B> &m_obj)
{
	m_ptr = mpi_pack(m_ptr, m_obj.first);
	m_ptr = mpi_pack(m_ptr, m_obj.second);

	return m_ptr;
}

template<class A, class B>
unsigned char* mpi_unpack(unsigned char* m_ptr, std::pair<A, B> &m_obj)
{
	m_ptr = mpi_unpack(m_ptr, m_obj.first);
	m_ptr = mpi_unpack(m_ptr, m_obj.second);

	return m_ptr;
}

/////////////////////////////////////////////////////////////////////////////////////////
// std::vector
/////////////////////////////////////////////////////////////////////////////////////////
template<class T>
size_t mpi_size(const std::vector<T> &m_obj)
{
	size_t ret = sizeof(size_t);

	for(typename std::vector<T>::const_iterator i = m_obj.begin();i != m_obj.end();++i){
		ret += mpi_size(*i);
	}

	return ret;
}

template<class T>
unsigned char* mpi_pack(unsigned char* m_ptr, const std::vector<T> &m_obj)
{
	const size_t len = m_obj.size();

	memcpy( m_ptr, &len, sizeof(size_t) );
	m_ptr += sizeof(size_t);

	for(typename std::vector<T>::const_iterator i = m_obj.begin();i != m_obj.end();++i){
		m_ptr = mpi_pack(m_ptr, *i);
	}

	return m_ptr;
}

template<class T>
unsigned char* mpi_unpack(unsigned char* m_ptr, std::vector<T> &m_obj)
{
	size_t len;

	memcpy( &len, m_ptr, sizeof(size_t) );
	m_ptr += sizeof(size_t);

	m_obj.clear();
	m_obj.resize(len);

	for(typename std::vector<T>::iterator i = m_obj.begin();i != m_obj.end();++i){
		m_ptr = mpi_unpack(m_ptr, *i);
	}

	return m_ptr;
}

/////////////////////////////////////////////////////////////////////////////////////////
// std::deque
/////////////////////////////////////////////////////////////////////////////////////////
template<class T>
size_t mpi_size(const std::deque<T> &m_obj)
{
	size_t ret = sizeof(size_t);

	for(typename std::deque<T>::const_iterator i = m_obj.begin();i != m_obj.end();++i){
		ret += mpi_size(*i);
	}

	return ret;
}

template<class T>
unsigned char* mpi_pack(unsigned char* m_ptr, const std::deque<T> &m_obj)
{
	const size_t len = m_obj.size();

	memcpy( m_ptr, &len, sizeof(size_t) );
	m_ptr += sizeof(size_t);

	for(typename std::deque<T>::const_iterator i = m_obj.begin();i != m_obj.end();++i){
		m_ptr = mpi_pack(m_ptr, *i);
	}

	return m_ptr;
}

template<class T>
unsigned char* mpi_unpack(unsigned char* m_ptr, std::deque<T> &m_obj)
{
	size_t len;

	memcpy( &len, m_ptr, sizeof(size_t) );
	m_ptr += sizeof(size_t);

	m_obj.clear();
	m_obj.resize(len);

	for(typename std::deque<T>::iterator i = m_obj.begin();i != m_obj.end();++i){
		m_ptr = mpi_unpack(m_ptr, *i);
	}

	return m_ptr;
}

/////////////////////////////////////////////////////////////////////////////////////////
// Share an object held by rank m_root with every other rank
/////////////////////////////////////////////////////////////////////////////////////////
template<class T>
void broadcast(T &m_obj, const int &m_rank, const int &m_root)
{
	unsigned long len = (m_rank == m_root) ? mpi_size(m_obj) : 0;

	if(MPI_Bcast( (void*)&len, 1, MPI_UNSIGNED_LONG, m_root, MPI_COMM_WORLD ) != MPI_SUCCESS){
		throw __FILE__ ":broadcast: Error broadcasting buffer size";
	}

	std::vector<unsigned char> buffer(len);

	if(m_rank == m_root){
		mpi_pack(&buffer[0], m_obj);
	}

	// Large genomes can exceed the int count that MPI_Bcast accepts, so send in blocks
	const unsigned long block = 1ul << 30;

	for(unsigned long i = 0;i < len;i += block){

		const int count = int( std::min(block, len - i) );

		if(MPI_Bcast( (void*)&buffer[i], count, MPI_BYTE, m_root, MPI_COMM_WORLD ) != MPI_SUCCESS){
			throw __FILE__ ":broadcast: Error broadcasting buffer";
		}
	}

	if(m_rank != m_root){
		mpi_unpack(&buffer[0], m_obj);
	}
}

#endif // __MPI_UTIL
