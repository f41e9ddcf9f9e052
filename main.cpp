// mascpcr: MASC-PCR primer selection for recoded genomes
//
// Scans anchor coordinates of an engineered (mutant) genome and, for each anchor
// and strand, selects the best discriminatory primer (paired with its wildtype
// counterpart) and the best common primer.

#include <iostream>
#include <fstream>
#include <sstream>
#include <vector>
#include <deque>
#include <limits.h>
#include <stdlib.h>
#include <math.h>
#include <time.h>

#include <mpi.h>

// Still no openmp support on the clang compiler that ships with OSX
#ifdef _OPENMP
#include <omp.h>
#endif // _OPENMP

#include "mascpcr.h"
#include "errors.h"
#include "update.h"
#include "nuc_cruc_oracle.h"

using namespace std;

// Global variables for MPI
int mpi_numtasks;
int mpi_rank;

// MPI messages
#define	PRIMER_HITS		1000
#define	PRIMER_HITS_DATA	1001

// Errors thrown inside an OpenMP parallel region are caught and rethrown after the region
typedef enum {
	NO_SEARCH_ERROR,
	VALIDATION_SEARCH_ERROR,
	THERMO_SEARCH_ERROR,
	OTHER_SEARCH_ERROR
} SearchError;

string time_to_str(const time_t &m_elapsed);
void search_anchor(const int &m_anchor, const vector<int> &m_strands, const Options &m_opt,
	const GenomeTables &m_tables, ThermoOracle &m_oracle, deque<PrimerHit> &m_hits,
	OutcomeCount &m_disc_count, OutcomeCount &m_common_count);
void gather_hits(deque<PrimerHit> &m_hits);
void reduce_outcomes(OutcomeCount &m_count);
void write_outcomes(ostream &m_out, const string &m_prefix, const OutcomeCount &m_count);
string search_mode_str(const Options::SearchMode &m_mode);
string strand_selection_str(const Options::StrandSelection &m_strand);

int main(int argc, char *argv[])
{
	try{
		MPI_Init(&argc, &argv);
		MPI_Comm_size(MPI_COMM_WORLD, &mpi_numtasks);
		MPI_Comm_rank(MPI_COMM_WORLD, &mpi_rank);

		time_t profile = time(NULL);

		const bool is_root = (mpi_rank == 0);

		Options opt;

		if(is_root){
			opt.load(argc, argv);
		}

		// Share the options with all workers
		broadcast(opt, mpi_rank, 0);

		// Invalid options throw a ValidationError, so quit is only set after the
		// usage has been printed
		if(opt.quit){

			MPI_Finalize();
			return EXIT_SUCCESS;
		}

		if(opt.max_thread > 0){

			#ifdef _OPENMP
			omp_set_num_threads(opt.max_thread);
			#endif // _OPENMP
		}

		ofstream fnull("/dev/null");

		if(!fnull){
			throw "Unable to open /dev/null";
		}

		ostream &vout = ( (opt.output_filter == Options::SILENT) || !is_root ) ? fnull : cerr;

		ofstream fout(is_root ? opt.output_filename.c_str() : "/dev/null");

		if(!fout){
			throw __FILE__ ": Unable to open output file for writing";
		}

		vout << "mascpcr version "
			<< MASCPCR_MAJOR_VERSION << "."
			<< MASCPCR_MINOR_VERSION << endl;

		if(mpi_numtasks > 1){
			vout << "Running in MPI mode with " << mpi_numtasks << " workers" << endl;
		}

		#ifdef _OPENMP
		vout << "Using up to " << omp_get_max_threads() << " OpenMP threads per worker" << endl;
		#endif // _OPENMP

		vout << "Search mode = " << search_mode_str(opt.search_mode) << endl;
		vout << "Strand = " << strand_selection_str(opt.strand_selection) << endl;
		vout << '\t' << opt.param.min_size() << " <= primer length <= "
			<< opt.param.max_size() << endl;
		vout << '\t' << opt.param.tm_range.first << " <= primer Tm <= "
			<< opt.param.tm_range.second << endl;
		vout << "Max hairpin and homodimer Tm = " << opt.param.spurious_tm_clip << endl;
		vout << "[Na+] = " << opt.param.thermo.salt << endl;
		vout << "[primer strand] = " << opt.param.thermo.primer_strand << endl;

		if(opt.search_mode & Options::DISCRIMINATORY_SEARCH){

			vout << "Minimum number of designed mismatches = " << opt.param.min_num_mismatches << endl;
			vout << "Mismatch weights (from 3') =";

			for(vector<float>::const_iterator i = opt.param.mismatch_weights.begin();
				i != opt.param.mismatch_weights.end();++i){
				vout << ' ' << *i;
			}

			vout << endl;

			if(opt.param.lenient_mode){
				vout << "** Lenient discriminatory search: GC clamp and structure checks are disabled **" << endl;
			}
		}

		GenomeTables tables;

		if(is_root){

			string mut_defline;
			string ref_defline;

			const string mut = read_genome(opt.mut_filename, mut_defline);

			vout << "Mutant genome: " << mut_defline << " (" << mut.size() << " bp)" << endl;

			const string ref = read_genome(opt.ref_filename, ref_defline);

			vout << "Reference genome: " << ref_defline << " (" << ref.size() << " bp)" << endl;

			tables = GenomeTables(mut, ref,
				read_index_table(opt.idx_lut_filename),
				read_position_table(opt.edge_filename, mut.size() ),
				read_position_table(opt.mismatch_filename, mut.size() ) );

			vout << "Flagged edge positions = " << tables.num_edge() << endl;
			vout << "Flagged mismatch positions = " << tables.num_mismatch() << endl;
		}

		// Share the genomes and lookup tables with all workers
		broadcast(tables, mpi_rank, 0);

		const int genome_len = int( tables.size() );

		if(opt.anchor_start >= genome_len){

			stringstream ssout;

			ssout << "The start coordinate (" << opt.anchor_start
				<< ") is past the end of the mutant genome (" << genome_len << " bp)";

			throw ValidationError( ssout.str() );
		}

		const int anchor_stop = ( (opt.anchor_stop < 0) || (opt.anchor_stop >= genome_len) ) ?
			genome_len - 1 : opt.anchor_stop;

		// Deal the anchors to the workers in round-robin order
		vector<int> local_anchor;

		const long int stride = (long int)(opt.anchor_step)*mpi_numtasks;

		for(long int a = opt.anchor_start + (long int)(opt.anchor_step)*mpi_rank;a <= anchor_stop;a += stride){
			local_anchor.push_back( int(a) );
		}

		vector<int> strands;

		if(opt.strand_selection & Options::STRAND_PLUS){
			strands.push_back(PLUS_STRAND);
		}

		if(opt.strand_selection & Options::STRAND_MINUS){
			strands.push_back(MINUS_STRAND);
		}

		vout << "Searching anchors " << opt.anchor_start << " to " << anchor_stop
			<< " in steps of " << opt.anchor_step << endl;

		deque<PrimerHit> hits;
		OutcomeCount disc_count;
		OutcomeCount common_count;

		SearchError search_error = NO_SEARCH_ERROR;
		string search_error_msg;

		const int num_local = int( local_anchor.size() );
		int num_done = 0;

		UpdateInfo progress("Searching: ", vout);

		#pragma omp parallel
		{
			// NucCruc is not thread safe, so every thread gets its own oracle
			NucCrucOracle oracle;

			deque<PrimerHit> local_hits;
			OutcomeCount local_disc_count;
			OutcomeCount local_common_count;

			#pragma omp for schedule(dynamic)
			for(int i = 0;i < num_local;++i){

				bool skip;

				#pragma omp critical (search_state)
				skip = (search_error != NO_SEARCH_ERROR);

				if(skip){
					continue;
				}

				SearchError local_error = NO_SEARCH_ERROR;
				string local_error_msg;

				try{
					search_anchor(local_anchor[i], strands, opt, tables, oracle,
						local_hits, local_disc_count, local_common_count);
				}
				catch(ValidationError &error){

					local_error = VALIDATION_SEARCH_ERROR;
					local_error_msg = error.what();
				}
				catch(ThermoError &error){

					local_error = THERMO_SEARCH_ERROR;
					local_error_msg = error.what();
				}
				catch(const char *error){

					local_error = OTHER_SEARCH_ERROR;
					local_error_msg = error;
				}

				#pragma omp critical (search_state)
				{
					if( (local_error != NO_SEARCH_ERROR) && (search_error == NO_SEARCH_ERROR) ){

						search_error = local_error;
						search_error_msg = local_error_msg;
					}

					++num_done;

					progress.progress(num_done, num_local);
				}
			}

			#pragma omp critical (search_merge)
			{
				hits.insert( hits.end(), local_hits.begin(), local_hits.end() );

				disc_count += local_disc_count;
				common_count += local_common_count;
			}
		}

		progress.close();

		switch(search_error){
			case NO_SEARCH_ERROR:
				break;
			case VALIDATION_SEARCH_ERROR:
				throw ValidationError(search_error_msg);
			case THERMO_SEARCH_ERROR:
				throw ThermoError(search_error_msg);
			case OTHER_SEARCH_ERROR:
				throw search_error_msg;
		};

		// Collect the results from all workers
		gather_hits(hits);

		reduce_outcomes(disc_count);
		reduce_outcomes(common_count);

		if(is_root){

			// The output order does not depend on the number of workers or threads
			SORT( hits.begin(), hits.end() );

			size_t num_disc = 0;
			size_t num_common = 0;

			for(deque<PrimerHit>::const_iterator i = hits.begin();i != hits.end();++i){

				if(i->kind == DISCRIMINATORY_PRIMER){
					++num_disc;
				}
				else{
					++num_common;
				}
			}

			switch(opt.output_format){
				case Options::TEXT_OUTPUT:

					write_text_header(fout, argc, argv);
					write_text(fout, hits);
					break;
				case Options::JSON_OUTPUT:

					write_json(fout, hits, argc, argv);
					break;
				default:
					throw __FILE__ ":main: Unknown output format";
			};

			if(opt.search_mode & Options::DISCRIMINATORY_SEARCH){
				vout << "Found " << num_disc << " discriminatory primers" << endl;
			}

			if(opt.search_mode & Options::COMMON_SEARCH){
				vout << "Found " << num_common << " common primers" << endl;
			}

			if(opt.output_filter == Options::EVERYTHING){

				if(opt.search_mode & Options::DISCRIMINATORY_SEARCH){
					write_outcomes(vout, "Discriminatory", disc_count);
				}

				if(opt.search_mode & Options::COMMON_SEARCH){
					write_outcomes(vout, "Common", common_count);
				}
			}
		}

		profile = time(NULL) - profile;

		vout << time_to_str(profile) << endl;
	}
	catch(ValidationError &error){

		cerr << "Invalid input: " << error.what() << endl;

		if(mpi_numtasks > 1){
			MPI_Abort(MPI_COMM_WORLD, EXIT_FAILURE);
		}

		MPI_Finalize();

		return EXIT_FAILURE;
	}
	catch(ThermoError &error){

		cerr << "Thermodynamics error: " << error.what() << endl;

		if(mpi_numtasks > 1){
			MPI_Abort(MPI_COMM_WORLD, EXIT_FAILURE);
		}

		MPI_Finalize();

		return EXIT_FAILURE;
	}
	catch(const char *error){

		cerr << "Caught the error " << error << endl;

		if(mpi_numtasks > 1){
			MPI_Abort(MPI_COMM_WORLD, EXIT_FAILURE);
		}

		MPI_Finalize();

		return EXIT_FAILURE;
	}
	catch(const string error){

		cerr << "Caught the error " << error << endl;

		if(mpi_numtasks > 1){
			MPI_Abort(MPI_COMM_WORLD, EXIT_FAILURE);
		}

		MPI_Finalize();

		return EXIT_FAILURE;
	}

	MPI_Finalize();

	return EXIT_SUCCESS;
}

void search_anchor(const int &m_anchor, const vector<int> &m_strands, const Options &m_opt,
	const GenomeTables &m_tables, ThermoOracle &m_oracle, deque<PrimerHit> &m_hits,
	OutcomeCount &m_disc_count, OutcomeCount &m_common_count)
{
	for(vector<int>::const_iterator s = m_strands.begin();s != m_strands.end();++s){

		if(m_opt.search_mode & Options::DISCRIMINATORY_SEARCH){

			SearchOutcome outcome;

			const PrimerPair disc = find_discriminatory_primer(m_anchor, *s, m_tables, m_oracle,
				m_opt.param, &outcome);

			m_disc_count.add(outcome);

			if( disc.found() ){
				m_hits.push_back( PrimerHit(m_anchor, disc) );
			}
		}

		if(m_opt.search_mode & Options::COMMON_SEARCH){

			SearchOutcome outcome;

			const PrimerRecord common = find_common_primer(m_anchor, *s, m_tables, m_oracle,
				m_opt.param, &outcome);

			m_common_count.add(outcome);

			if( common.found() ){
				m_hits.push_back( PrimerHit(m_anchor, common) );
			}
		}
	}
}

// Every worker sends its primers to the rank 0 task
void gather_hits(deque<PrimerHit> &m_hits)
{
	if(mpi_numtasks <= 1){
		return;
	}

	if(mpi_rank == 0){

		MPI_Status status;

		for(int task = 1;task < mpi_numtasks;++task){

			unsigned long len = 0;

			if(MPI_Recv(&len, 1, MPI_UNSIGNED_LONG, MPI_ANY_SOURCE, PRIMER_HITS, MPI_COMM_WORLD, &status) != MPI_SUCCESS){
				throw __FILE__ ":gather_hits: Error receiving msg";
			}

			vector<unsigned char> buffer(len);

			if(MPI_Recv(&buffer[0], int(len), MPI_BYTE, status.MPI_SOURCE, PRIMER_HITS_DATA, MPI_COMM_WORLD, &status) != MPI_SUCCESS){
				throw __FILE__ ":gather_hits: Error receiving data";
			}

			deque<PrimerHit> remote_hits;

			mpi_unpack(&buffer[0], remote_hits);

			m_hits.insert( m_hits.end(), remote_hits.begin(), remote_hits.end() );
		}
	}
	else{

		unsigned long len = mpi_size(m_hits);

		if(len > (unsigned long)(INT_MAX) ){
			throw __FILE__ ":gather_hits: Too many primers to send in a single message";
		}

		vector<unsigned char> buffer(len);

		mpi_pack(&buffer[0], m_hits);

		if(MPI_Send( (void*)&len, 1, MPI_UNSIGNED_LONG, 0, PRIMER_HITS, MPI_COMM_WORLD ) != MPI_SUCCESS){
			throw __FILE__ ":gather_hits: Error sending msg";
		}

		if(MPI_Send( (void*)&buffer[0], int(len), MPI_BYTE, 0, PRIMER_HITS_DATA, MPI_COMM_WORLD ) != MPI_SUCCESS){
			throw __FILE__ ":gather_hits: Error sending data";
		}

		m_hits.clear();
	}
}

// Sum the per-outcome counts on the rank 0 task
void reduce_outcomes(OutcomeCount &m_count)
{
	if(mpi_numtasks <= 1){
		return;
	}

	OutcomeCount total;

	if(MPI_Reduce(m_count.count, total.count, NUM_SEARCH_OUTCOME, MPI_UNSIGNED_LONG,
		MPI_SUM, 0, MPI_COMM_WORLD) != MPI_SUCCESS){
		throw __FILE__ ":reduce_outcomes: Error reducing search outcomes";
	}

	if(mpi_rank == 0){
		m_count = total;
	}
}

void write_outcomes(ostream &m_out, const string &m_prefix, const OutcomeCount &m_count)
{
	m_out << m_prefix << " search outcomes (anchor and strand):" << endl;

	for(int i = 0;i < NUM_SEARCH_OUTCOME;++i){
		m_out << '\t' << outcome_name( SearchOutcome(i) ) << " = " << m_count.count[i] << endl;
	}
}

string search_mode_str(const Options::SearchMode &m_mode)
{
	switch(m_mode){
		case Options::DISCRIMINATORY_SEARCH:
			return "discriminatory";
		case Options::COMMON_SEARCH:
			return "common";
		case Options::BOTH_SEARCH:
			return "discriminatory and common";
		default:
			throw __FILE__ ":search_mode_str: Unknown search mode";
	};

	return "?"; // Keep the compiler happy
}

string strand_selection_str(const Options::StrandSelection &m_strand)
{
	switch(m_strand){
		case Options::STRAND_PLUS:
			return "plus";
		case Options::STRAND_MINUS:
			return "minus";
		case Options::STRAND_BOTH:
			return "plus and minus";
		default:
			throw __FILE__ ":strand_selection_str: Unknown strand";
	};

	return "?"; // Keep the compiler happy
}

string time_to_str(const time_t &m_elapsed)
{
	const float elapsed_sec = m_elapsed % 60;

	float elapsed_time = (m_elapsed - elapsed_sec)/60.0f; // In min

	const float elapsed_min = fmod(elapsed_time, 60.0f);
	elapsed_time = (elapsed_time - elapsed_min)/60.0f; // In hour

	const float elapsed_hour = fmod(elapsed_time, 24.0f);
	elapsed_time = (elapsed_time - elapsed_hour)/24.0f; // In day

	stringstream sout;

	sout << "Run time is "
		<< elapsed_time
		<< " days, "
		<< elapsed_hour
		<< ( (elapsed_hour == 1) ? " hour, " : " hours, ")
		<< elapsed_min
		<< " min and "
		<< elapsed_sec
		<< " sec";

	return sout.str();
}
