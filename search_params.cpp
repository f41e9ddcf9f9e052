#include "primer.h"
#include "errors.h"

#include <sstream>

using namespace std;

// Mismatch weights from the 3' end of the primer
const float default_mismatch_weights[] = {5.0f, 4.0f, 4.0f, 3.0f, 3.0f, 2.0f, 1.0f};

SearchParams::SearchParams()
{
	tm_range = make_pair(DEFAULT_MIN_PRIMER_TM, DEFAULT_MAX_PRIMER_TM);
	spurious_tm_clip = DEFAULT_SPURIOUS_TM_CLIP;
	size_range = make_pair(DEFAULT_MIN_PRIMER, DEFAULT_MAX_PRIMER);
	min_num_mismatches = DEFAULT_MIN_NUM_MISMATCHES;
	lenient_mode = false;

	mismatch_weights = vector<float>(default_mismatch_weights,
		default_mismatch_weights + sizeof(default_mismatch_weights)/sizeof(float) );
}

void SearchParams::validate() const
{
	if(size_range.first < 1){
		throw ValidationError("SearchParams: The minimum primer size must be >= 1");
	}

	if(size_range.first > size_range.second){

		stringstream ssout;

		ssout << "SearchParams: Invalid primer size range [" << size_range.first
			<< ", " << size_range.second << "]";

		throw ValidationError( ssout.str() );
	}

	// The scoring function divides by the width of the Tm range
	if( !(tm_range.first < tm_range.second) ){

		stringstream ssout;

		ssout << "SearchParams: Invalid primer Tm range [" << tm_range.first
			<< ", " << tm_range.second << "]";

		throw ValidationError( ssout.str() );
	}

	if( !(spurious_tm_clip > 0.0f) ){
		throw ValidationError("SearchParams: The spurious Tm clip must be > 0");
	}

	if(min_num_mismatches < 0){
		throw ValidationError("SearchParams: The minimum number of mismatches must be >= 0");
	}

	if( mismatch_weights.empty() ){
		throw ValidationError("SearchParams: Empty mismatch weight table");
	}

	if( !(thermo.salt > 0.0f) ){
		throw ValidationError("SearchParams: The salt concentration must be > 0");
	}

	if( !(thermo.primer_strand > 0.0f) ){
		throw ValidationError("SearchParams: The primer concentration must be > 0");
	}
}

void check_strand(const int &m_strand)
{
	if( (m_strand != PLUS_STRAND) && (m_strand != MINUS_STRAND) ){

		stringstream ssout;

		ssout << "Invalid strand (" << m_strand << "); expected 1 or -1";

		throw ValidationError( ssout.str() );
	}
}

const char* outcome_name(const SearchOutcome &m_outcome)
{
	switch(m_outcome){
		case PRIMER_FOUND:
			return "found";
		case INSUFFICIENT_SEQUENCE:
			return "insufficient sequence";
		case GC_CLAMP:
			return "3' GC clamp";
		case DESIGNED_MISMATCH:
			return "designed mismatch";
		case NO_ADMISSIBLE_WINDOW:
			return "no admissible window";
	};

	throw __FILE__ ":outcome_name: Unknown outcome";
	return "?"; // Keep the compiler happy
}
