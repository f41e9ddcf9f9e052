#include "genome_tables.h"
#include "base_table.h"
#include "errors.h"

#include <sstream>

using namespace std;

GenomeTables::GenomeTables(const string &m_mut, const string &m_ref,
	const vector<unsigned int> &m_idx_lut,
	const BitSet &m_edge, const BitSet &m_mismatch) :
	mut_seq(m_mut), ref_seq(m_ref), idx_lut(m_idx_lut),
	edge_lut(m_edge), mismatch_lut(m_mismatch)
{
	validate();
}

void GenomeTables::validate() const
{
	if( mut_seq.empty() ){
		throw ValidationError("GenomeTables: Empty mutant genome");
	}

	if( ref_seq.empty() ){
		throw ValidationError("GenomeTables: Empty reference genome");
	}

	const size_t len = mut_seq.size();

	if(idx_lut.size() != len){

		stringstream ssout;

		ssout << "GenomeTables: The index table has " << idx_lut.size()
			<< " entries for a mutant genome of " << len << " bp";

		throw ValidationError( ssout.str() );
	}

	if(edge_lut.size() != len){

		stringstream ssout;

		ssout << "GenomeTables: The edge table has " << edge_lut.size()
			<< " entries for a mutant genome of " << len << " bp";

		throw ValidationError( ssout.str() );
	}

	if(mismatch_lut.size() != len){

		stringstream ssout;

		ssout << "GenomeTables: The mismatch table has " << mismatch_lut.size()
			<< " entries for a mutant genome of " << len << " bp";

		throw ValidationError( ssout.str() );
	}

	size_t loc = find_non_acgt(mut_seq);

	if( loc != len ){

		stringstream ssout;

		ssout << "GenomeTables: Illegal base '" << mut_seq[loc]
			<< "' in the mutant genome at " << loc;

		throw ValidationError( ssout.str() );
	}

	loc = find_non_acgt(ref_seq);

	if( loc != ref_seq.size() ){

		stringstream ssout;

		ssout << "GenomeTables: Illegal base '" << ref_seq[loc]
			<< "' in the reference genome at " << loc;

		throw ValidationError( ssout.str() );
	}

	for(size_t i = 0;i < len;++i){

		// The index table may point one past the end of the reference, which is
		// used as an exclusive upper bound
		if( idx_lut[i] > ref_seq.size() ){

			stringstream ssout;

			ssout << "GenomeTables: Index table entry " << i << " (" << idx_lut[i]
				<< ") is past the end of the reference genome";

			throw ValidationError( ssout.str() );
		}

		if( (i > 0) && (idx_lut[i] < idx_lut[i - 1]) ){

			stringstream ssout;

			ssout << "GenomeTables: The index table decreases at entry " << i;

			throw ValidationError( ssout.str() );
		}
	}
}
