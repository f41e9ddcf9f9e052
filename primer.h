#ifndef __PRIMER
#define __PRIMER

#include <string>
#include <vector>
#include <utility>

#include "bitset.h"
#include "thermo.h"
#include "genome_tables.h"
#include "mpi_util.h"

#define	DEFAULT_MIN_PRIMER_TM		60.0f
#define	DEFAULT_MAX_PRIMER_TM		65.0f
#define	DEFAULT_SPURIOUS_TM_CLIP	40.0f

#define	DEFAULT_MIN_PRIMER		18
#define	DEFAULT_MAX_PRIMER		30

#define	DEFAULT_MIN_NUM_MISMATCHES	1

// The 3' end GC clamp: reject an anchor when more than GC_CLAMP_MAX of the
// GC_CLAMP_LEN 3'-most bases are G or C
#define	GC_CLAMP_LEN			5
#define	GC_CLAMP_MAX			3

// The number of bases that must remain between the 3'-most possible
// reverse primer base and the end of the genome
#define	DISCRIMINATORY_MARGIN		1
#define	COMMON_MARGIN			2

#define	PLUS_STRAND			1
#define	MINUS_STRAND			-1

typedef enum {
	PRIMER_FOUND,
	INSUFFICIENT_SEQUENCE,	// Not enough genome on either side of the anchor
	GC_CLAMP,		// Too many G/C at the 3' end
	DESIGNED_MISMATCH,	// A common primer can not avoid a designed mismatch
	NO_ADMISSIBLE_WINDOW	// No primer length satisfied the cutoffs
} SearchOutcome;

// The admissibility filter tells the length scan what to do with the current
// window. Melting temperature grows with primer length, so a window that is
// too hot (or has too stable a hairpin or homodimer) ends the scan.
typedef enum {
	CONTINUE_SEARCH,	// Too cold; try a longer window
	STOP_SEARCH,		// Too hot or too structured; no longer window can pass
	ACCEPT_WINDOW
} ThermoDecision;

const char* outcome_name(const SearchOutcome &m_outcome);

struct SearchParams
{
	// Use X Macros (https://en.wikipedia.org/wiki/X_Macro) to
	// ensure that structure variable are correctly serialized.
	#define SEARCH_PARAMS_MEMBERS \
		VARIABLE(SINGLE_ARG(std::pair<float, float>), tm_range) \
		VARIABLE(float, spurious_tm_clip) \
		VARIABLE(SINGLE_ARG(std::pair<int, int>), size_range) \
		VARIABLE(ThermoParams, thermo) \
		VARIABLE(int, min_num_mismatches) \
		VARIABLE(bool, lenient_mode) \
		VARIABLE(std::vector<float>, mismatch_weights)

	#define VARIABLE(A, B) A B;
		SEARCH_PARAMS_MEMBERS
	#undef VARIABLE

	SearchParams();

	// Throws ValidationError
	void validate() const;

	inline int min_size() const
	{
		return size_range.first;
	};

	inline int max_size() const
	{
		return size_range.second;
	};

	// Mismatch weights are indexed from the 3' end of the primer. Offsets past the
	// end of the weight table reuse the last weight.
	inline float mismatch_weight(const size_t &m_offset) const
	{
		return (m_offset < mismatch_weights.size()) ?
			mismatch_weights[m_offset] : mismatch_weights.back();
	};
};

template<> size_t mpi_size(const SearchParams &m_obj);
template<> unsigned char* mpi_pack(unsigned char* m_ptr, const SearchParams &m_obj);
template<> unsigned char* mpi_unpack(unsigned char* m_ptr, SearchParams &m_obj);

// A single primer candidate. A default constructed PrimerRecord (with an empty
// sequence) means "no primer found".
class PrimerRecord
{
	private:
		// Use X Macros (https://en.wikipedia.org/wiki/X_Macro) to
		// ensure that structure variable are correctly serialized.
		#define PRIMER_RECORD_MEMBERS \
			VARIABLE(int, loc5) \
			VARIABLE(std::string, primer_seq) \
			VARIABLE(int, primer_strand) \
			VARIABLE(BitSet, mismatch_flags) \
			VARIABLE(float, primer_tm) \
			VARIABLE(float, homodimer_tm) \
			VARIABLE(float, hairpin_tm) \
			VARIABLE(float, primer_score)

		#define VARIABLE(A, B) A B;
			PRIMER_RECORD_MEMBERS
		#undef VARIABLE

	public:

		PrimerRecord() :
			loc5(-1), primer_strand(0), primer_tm(0.0f), homodimer_tm(0.0f),
			hairpin_tm(0.0f), primer_score(0.0f)
		{
		};

		PrimerRecord(const int &m_loc5, const std::string &m_seq, const int &m_strand,
			const BitSet &m_mismatch, const float &m_tm, const float &m_homodimer_tm,
			const float &m_hairpin_tm, const float &m_score) :
			loc5(m_loc5), primer_seq(m_seq), primer_strand(m_strand), mismatch_flags(m_mismatch),
			primer_tm(m_tm), homodimer_tm(m_homodimer_tm), hairpin_tm(m_hairpin_tm),
			primer_score(m_score)
		{
		};

		inline bool found() const
		{
			return !primer_seq.empty();
		};

		// The 5'-most coordinate of the primer footprint on the plus strand of its genome
		inline int index() const
		{
			return loc5;
		};

		// 5'-3'
		inline const std::string& seq() const
		{
			return primer_seq;
		};

		inline int strand() const
		{
			return primer_strand;
		};

		inline int length() const
		{
			return int( primer_seq.size() );
		};

		// Designed mismatch flags, indexed from the 3' end of the primer
		inline const BitSet& mismatches() const
		{
			return mismatch_flags;
		};

		inline size_t num_mismatch() const
		{
			return mismatch_flags.count();
		};

		inline float tm() const
		{
			return primer_tm;
		};

		inline float tm_homodimer() const
		{
			return homodimer_tm;
		};

		inline float tm_hairpin() const
		{
			return hairpin_tm;
		};

		inline float score() const
		{
			return primer_score;
		};

		template<class T> friend size_t mpi_size(const T &m_obj);
		template<class T> friend unsigned char* mpi_pack(unsigned char* m_ptr,
			const T &m_obj);
		template<class T> friend unsigned char* mpi_unpack(unsigned char* m_ptr,
			T &m_obj);
};

template<> size_t mpi_size(const PrimerRecord &m_obj);
template<> unsigned char* mpi_pack(unsigned char* m_ptr, const PrimerRecord &m_obj);
template<> unsigned char* mpi_unpack(unsigned char* m_ptr, PrimerRecord &m_obj);

// A discriminatory primer and the matching primer on the reference genome
struct PrimerPair
{
	PrimerRecord mutant;
	PrimerRecord wildtype;

	inline bool found() const
	{
		return mutant.found();
	};
};

struct PrimerThermo
{
	float tm;
	float hairpin_tm;
	float homodimer_tm;

	PrimerThermo() :
		tm(0.0f), hairpin_tm(0.0f), homodimer_tm(0.0f)
	{
	};
};

struct MismatchTally
{
	BitSet flags; // Indexed from the 3' end
	int count;
	float score;

	// The 3' offset of the first edge base, or -1 if the primer does not cross an edge
	int edge_offset;

	MismatchTally(const int &m_len) :
		flags(m_len, false), count(0), score(0.0f), edge_offset(-1)
	{
	};
};

// The candidate primer region with a fixed 3' end. Primers of length L are
// the 3'-most L bases of the region. All strand-dependent coordinate arithmetic
// lives here: the base m_offset positions from the 3' end of a primer sits at
// mutant coordinate anchor - m_offset*strand.
class CandidateWindow
{
	private:

		const GenomeTables &tables;
		int anchor;
		int strand;
		int max_len;
		bool is_valid;

		std::string mut_region; // 5'-3'
		std::string wt_region; // 5'-3', empty when not requested

	public:

		CandidateWindow(const GenomeTables &m_tables, ThermoOracle &m_oracle,
			const int &m_anchor, const int &m_strand, const std::pair<int, int> &m_size_range,
			const int &m_margin, const bool &m_with_wildtype);

		// Is there enough flanking sequence for the longest primer?
		inline bool valid() const
		{
			return is_valid;
		};

		inline int coordinate(const int &m_offset) const
		{
			return anchor - m_offset*strand;
		};

		int index(const int &m_len) const;
		int wildtype_index(const int &m_len) const;

		std::string primer(const int &m_len) const;
		std::string wildtype_primer(const int &m_len) const;

		// The number of G/C bases in the GC_CLAMP_LEN 3'-most bases
		unsigned int gc_3() const;
};

// In valid_primer.cpp
ThermoDecision check_tm(const float &m_tm, const SearchParams &m_param);
ThermoDecision check_structure(const PrimerThermo &m_thermo, const SearchParams &m_param);
ThermoDecision screen_primer(const std::string &m_seq, ThermoOracle &m_oracle,
	const SearchParams &m_param, PrimerThermo &m_thermo);
ThermoDecision screen_primer_pair(const std::string &m_mut, const std::string &m_wt,
	ThermoOracle &m_oracle, const SearchParams &m_param,
	PrimerThermo &m_mut_thermo, PrimerThermo &m_wt_thermo);

// In mismatch_weight.cpp
MismatchTally weigh_mismatches(const CandidateWindow &m_window, const int &m_len,
	const GenomeTables &m_tables, const SearchParams &m_param);

// In score_primer.cpp
float score_thermo(const float &m_tm, const float &m_hairpin_tm, const float &m_homodimer_tm,
	const SearchParams &m_param);
float score_primer(const std::string &m_seq, ThermoOracle &m_oracle, const SearchParams &m_param,
	const float *m_tm = NULL, const float *m_hairpin_tm = NULL, const float *m_homodimer_tm = NULL);

// In discriminatory_primer.cpp
PrimerPair find_discriminatory_primer(const int &m_anchor, const int &m_strand,
	const GenomeTables &m_tables, ThermoOracle &m_oracle, const SearchParams &m_param,
	SearchOutcome *m_outcome = NULL);

// In common_primer.cpp
PrimerRecord find_common_primer(const int &m_anchor, const int &m_strand,
	const GenomeTables &m_tables, ThermoOracle &m_oracle, const SearchParams &m_param,
	SearchOutcome *m_outcome = NULL);

// In search_params.cpp
void check_strand(const int &m_strand);

#endif // __PRIMER
