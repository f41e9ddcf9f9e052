#ifndef __GENOME_TABLES
#define __GENOME_TABLES

#include <string>
#include <vector>

#include "bitset.h"
#include "mpi_util.h"

// The recoded (mutant) genome, its reference (wildtype) genome and the
// per-coordinate lookup tables that relate them. All tables are indexed by
// mutant genome coordinate. A GenomeTables object is validated when it is
// built and is read-only afterwards.
class GenomeTables
{
	private:
		// Use X Macros (https://en.wikipedia.org/wiki/X_Macro) to
		// ensure that structure variable are correctly serialized.
		#define GENOME_TABLES_MEMBERS \
			VARIABLE(std::string, mut_seq) \
			VARIABLE(std::string, ref_seq) \
			VARIABLE(std::vector<unsigned int>, idx_lut) \
			VARIABLE(BitSet, edge_lut) \
			VARIABLE(BitSet, mismatch_lut)

		#define VARIABLE(A, B) A B;
			GENOME_TABLES_MEMBERS
		#undef VARIABLE

	public:

		GenomeTables()
		{
		};

		// Throws ValidationError if the tables are inconsistent
		GenomeTables(const std::string &m_mut, const std::string &m_ref,
			const std::vector<unsigned int> &m_idx_lut,
			const BitSet &m_edge, const BitSet &m_mismatch);

		void validate() const;

		inline size_t size() const
		{
			return mut_seq.size();
		};

		inline const std::string& mutant() const
		{
			return mut_seq;
		};

		inline const std::string& reference() const
		{
			return ref_seq;
		};

		// Map a mutant coordinate to the reference genome
		inline unsigned int ref_index(const size_t &m_index) const
		{
			return idx_lut[m_index];
		};

		inline bool edge(const size_t &m_index) const
		{
			return edge_lut[m_index];
		};

		inline bool mismatch(const size_t &m_index) const
		{
			return mismatch_lut[m_index];
		};

		inline size_t num_edge() const
		{
			return edge_lut.count();
		};

		inline size_t num_mismatch() const
		{
			return mismatch_lut.count();
		};

		template<class T> friend size_t mpi_size(const T &m_obj);
		template<class T> friend unsigned char* mpi_pack(unsigned char* m_ptr,
			const T &m_obj);
		template<class T> friend unsigned char* mpi_unpack(unsigned char* m_ptr,
			T &m_obj);
};

template<> size_t mpi_size(const GenomeTables &m_obj);
template<> unsigned char* mpi_pack(unsigned char* m_ptr, const GenomeTables &m_obj);
template<> unsigned char* mpi_unpack(unsigned char* m_ptr, GenomeTables &m_obj);

#endif // __GENOME_TABLES
