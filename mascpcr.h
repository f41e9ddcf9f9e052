#ifndef __MASCPCR
#define __MASCPCR

#include <string>
#include <deque>
#include <vector>
#include <ostream>

#include "primer.h"
#include "genome_tables.h"
#include "mpi_util.h"

#define	MASCPCR_MAJOR_VERSION	"0"
#define	MASCPCR_MINOR_VERSION	"2"

// Scan every anchor by default
#define	DEFAULT_ANCHOR_STEP	1

// Note that on OS X, the clang compiler defines __GNUC__
#if defined(_OPENMP) && !defined(__clang__)
	#include <parallel/algorithm>

	// Enable OpenMP-based parallel sorting
	#define	SORT	__gnu_parallel::sort
#else
	#include <algorithm>

	// Use standard serial-based sorting
	#define	SORT	std::sort
#endif // _OPENMP

struct Options
{
	typedef enum {
		SILENT,
		VERBOSE,
		EVERYTHING,
		UNKNOWN_VERBOSITY
	} Verbosity;

	typedef enum {
		TEXT_OUTPUT,
		JSON_OUTPUT,
		UNKNOWN_OUTPUT
	} OutputFormat;

	typedef enum {
		DISCRIMINATORY_SEARCH = (1 << 0),
		COMMON_SEARCH = (1 << 1),
		BOTH_SEARCH = DISCRIMINATORY_SEARCH | COMMON_SEARCH,
		UNKNOWN_SEARCH = 0
	} SearchMode;

	typedef enum {
		STRAND_PLUS = (1 << 0),
		STRAND_MINUS = (1 << 1),
		STRAND_BOTH = STRAND_PLUS | STRAND_MINUS,
		STRAND_UNKNOWN = 0
	} StrandSelection;

	// Use X Macros (https://en.wikipedia.org/wiki/X_Macro) to
	// ensure that structure variable are correctly serialized.
	#define OPTIONS_MEMBERS \
		VARIABLE(Verbosity, output_filter) \
		VARIABLE(OutputFormat, output_format) \
		VARIABLE(SearchMode, search_mode) \
		VARIABLE(StrandSelection, strand_selection) \
		VARIABLE(std::string, mut_filename) \
		VARIABLE(std::string, ref_filename) \
		VARIABLE(std::string, idx_lut_filename) \
		VARIABLE(std::string, edge_filename) \
		VARIABLE(std::string, mismatch_filename) \
		VARIABLE(std::string, output_filename) \
		VARIABLE(int, anchor_start) \
		VARIABLE(int, anchor_stop) \
		VARIABLE(unsigned int, anchor_step) \
		VARIABLE(SearchParams, param) \
		VARIABLE(unsigned int, max_thread) \
		VARIABLE(bool, quit)

	#define VARIABLE(A, B) A B;
		OPTIONS_MEMBERS
	#undef VARIABLE

	Options();

	void load(int argc, char *argv[]);
};

template<> size_t mpi_size(const Options &m_obj);
template<> unsigned char* mpi_pack(unsigned char* m_ptr, const Options &m_obj);
template<> unsigned char* mpi_unpack(unsigned char* m_ptr, Options &m_obj);

typedef enum {
	DISCRIMINATORY_PRIMER,
	COMMON_PRIMER
} PrimerKind;

// A primer found by scanning the genome, along with the anchor that produced it
struct PrimerHit
{
	// Use X Macros (https://en.wikipedia.org/wiki/X_Macro) to
	// ensure that structure variable are correctly serialized.
	#define PRIMER_HIT_MEMBERS \
		VARIABLE(int, anchor) \
		VARIABLE(PrimerKind, kind) \
		VARIABLE(PrimerRecord, primer) \
		VARIABLE(PrimerRecord, wildtype)

	#define VARIABLE(A, B) A B;
		PRIMER_HIT_MEMBERS
	#undef VARIABLE

	PrimerHit() :
		anchor(-1), kind(COMMON_PRIMER)
	{
	};

	PrimerHit(const int &m_anchor, const PrimerRecord &m_primer) :
		anchor(m_anchor), kind(COMMON_PRIMER), primer(m_primer)
	{
	};

	PrimerHit(const int &m_anchor, const PrimerPair &m_pair) :
		anchor(m_anchor), kind(DISCRIMINATORY_PRIMER), primer(m_pair.mutant),
		wildtype(m_pair.wildtype)
	{
	};

	// Order by anchor, then plus strand before minus strand, then discriminatory
	// before common
	inline bool operator<(const PrimerHit &m_rhs) const
	{
		if(anchor != m_rhs.anchor){
			return anchor < m_rhs.anchor;
		}

		if( primer.strand() != m_rhs.primer.strand() ){
			return primer.strand() > m_rhs.primer.strand();
		}

		return kind < m_rhs.kind;
	};
};

template<> size_t mpi_size(const PrimerHit &m_obj);
template<> unsigned char* mpi_pack(unsigned char* m_ptr, const PrimerHit &m_obj);
template<> unsigned char* mpi_unpack(unsigned char* m_ptr, PrimerHit &m_obj);

// The number of anchors that ended with each SearchOutcome
#define	NUM_SEARCH_OUTCOME	(NO_ADMISSIBLE_WINDOW + 1)

struct OutcomeCount
{
	unsigned long count[NUM_SEARCH_OUTCOME];

	OutcomeCount()
	{
		for(int i = 0;i < NUM_SEARCH_OUTCOME;++i){
			count[i] = 0;
		}
	};

	inline void add(const SearchOutcome &m_outcome)
	{
		++count[m_outcome];
	};

	inline OutcomeCount& operator+=(const OutcomeCount &m_rhs)
	{
		for(int i = 0;i < NUM_SEARCH_OUTCOME;++i){
			count[i] += m_rhs.count[i];
		}

		return *this;
	};
};

// In parse_fasta.cpp
std::string read_genome(const std::string &m_filename, std::string &m_defline);

// In parse_table.cpp
std::vector<unsigned int> read_index_table(const std::string &m_filename);
BitSet read_position_table(const std::string &m_filename, const size_t &m_genome_len);

// In write_primer.cpp
void write_text_header(std::ostream &m_out, int argc, char *argv[]);
void write_text(std::ostream &m_out, const std::deque<PrimerHit> &m_hits);
void write_json(std::ostream &m_out, const std::deque<PrimerHit> &m_hits, int argc, char *argv[]);
std::string strand_symbol(const int &m_strand);

// In options.cpp
std::string tolower(const std::string &m_str);

#endif // __MASCPCR
