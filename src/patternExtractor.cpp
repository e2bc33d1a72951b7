/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Implementation of extracting occurrencies of selected categories from text
/// \file "patternExtractor.cpp"
#include "patternExtractor.hpp"
#include "patternExpression.hpp"
#include "pextract/patternExtractorInstanceInterface.hpp"
#include "pextract/patternExtractorContextInterface.hpp"
#include "pextract/patternRegistryInterface.hpp"
#include "pextract/match.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/debugTraceInterface.hpp"
#include "strus/reference.hpp"
#include "strus/base/stdint.h"
#include "strus/base/string_conv.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include "hyperscanErrorCode.hpp"
#include "hs_compile.h"
#include "hs.h"
#include <vector>
#include <string>
#include <set>
#include <cstring>
#include <cstdlib>
#include <stdexcept>
#include <limits>
#include <queue>
#include <istream>
#undef TRE_USE_SYSTEM_REGEX_H
#include <tre/tre.h>

using namespace pextract;

typedef unsigned long long unsigned_long_long;

static const char* g_customCategoryName = "custom";

/// \brief Regular expression with the index of the sub expression that selects the match
struct SubExpressionDef
{
	regex_t regex;
	std::size_t index;
	enum {MaxSubexpressionIndex=99};

	SubExpressionDef( const std::string& expression, std::size_t index_, int cflags)
		:index(index_)
	{
		if (index > MaxSubexpressionIndex)
		{
			throw pextract::runtime_error( _TXT("error in sub expression selection index out of range"));
		}
		int errcode = tre_regcomp( &regex, expression.c_str(), cflags);
		if (errcode)
		{
			char errbuf[ 1024];
			(void)tre_regerror( errcode, &regex, errbuf, sizeof(errbuf));
			throw ErrorCodeException( strus::ErrorCodeSyntax, std::string(_TXT("error compiling regular expression: ")) + errbuf);
		}
	}
	~SubExpressionDef()
	{
		tre_regfree( &regex);
	}

	/// \brief Find the leftmost longest match in the span [from,to) of src and return the span of the selected sub expression
	/// \param[in] notbol true if 'from' is not the start of the input
	/// \param[in] noteol true if 'to' is not the end of the input
	bool match( const char* src, std::size_t from, std::size_t to, bool notbol, bool noteol, std::size_t& resstart, std::size_t& resend) const
	{
		regmatch_t pmatch[ MaxSubexpressionIndex+1];
		int eflags = 0;
		if (notbol) eflags |= REG_NOTBOL;
		if (noteol) eflags |= REG_NOTEOL;
		int errcode = tre_regnexec( &regex, src + from, to - from, index+1, pmatch, eflags);
		if (errcode)
		{
			if (errcode == REG_NOMATCH) return false;

			char errbuf[ 1024];
			(void)tre_regerror( errcode, &regex, errbuf, sizeof(errbuf));
			throw pextract::runtime_error(_TXT("error matching of a regular expression: %s"), errbuf);
		}
		const regmatch_t& mt = pmatch[ index];
		if (mt.rm_so < 0 || mt.rm_eo <= mt.rm_so || mt.rm_eo > (regoff_t)(to - from)) return false;
		resstart = from + mt.rm_so;
		resend = from + mt.rm_eo;
		return true;
	}

private:
	SubExpressionDef( const SubExpressionDef&);	//... non copyable
	void operator=( const SubExpressionDef&);	//... non copyable
};

/// \brief One expression of the automaton
struct AutomatonExpression
{
	std::string expression;
	uint32_t categoryidx;		///< index of the category in ExtractorData::categories
	uint32_t subexpref;		///< index of the sub expression selector in ExtractorData::subexprar starting with 1
	bool leftContext;		///< true if the match is preceded by one character of context
	Pattern::Validation validation;

	AutomatonExpression( const std::string& expression_, uint32_t categoryidx_, uint32_t subexpref_, bool leftContext_, Pattern::Validation validation_)
		:expression(expression_),categoryidx(categoryidx_),subexpref(subexpref_),leftContext(leftContext_),validation(validation_){}
	AutomatonExpression( const AutomatonExpression& o)
		:expression(o.expression),categoryidx(o.categoryidx),subexpref(o.subexpref),leftContext(o.leftContext),validation(o.validation){}
};

class HsPatternTable
{
public:
	std::size_t arsize;
	const char** patternar;
	unsigned int* idar;
	unsigned int* flagar;

	HsPatternTable()
		:arsize(0),patternar(0),idar(0),flagar(0)
	{}

	void init( std::size_t arsize_)
	{
		clear();
		arsize = arsize_;
		patternar = (const char**)std::calloc( arsize+1, sizeof(*patternar));
		idar = (unsigned int*)std::calloc( arsize+1, sizeof(*idar));
		flagar = (unsigned int*)std::calloc( arsize+1, sizeof(*flagar));
		if (!patternar | !idar | !flagar)
		{
			clear();
			throw std::bad_alloc();
		}
	}

	~HsPatternTable()
	{
		clear();
	}

	void clear()
	{
		if (patternar) {std::free(patternar); patternar = 0;}
		if (idar) {std::free(idar); idar = 0;}
		if (flagar) {std::free(flagar); flagar = 0;}
	}
};

enum {
	DefaultBlockSize=(1<<20),	///< default size of the blocks of input scanned at once
	MinBlockSize=256,		///< smallest block size accepted
	MaxBlockSize=(1<<30),		///< biggest block size accepted
	ReadChunkSize=4096		///< size of the chunks read from the input stream
};

/// \brief Compiled data shared by all contexts of an instance
struct ExtractorData
{
	std::vector<std::string> categories;			///< selected categories in the order of their priority
	std::vector<AutomatonExpression> exprar;			///< expressions of the automaton, index is the hyperscan id
	std::vector<strus::Reference<SubExpressionDef> > subexprar;	///< sub expression selectors referenced by AutomatonExpression::subexpref
	hs_database_t* patterndb;
	bool luhn;
	std::size_t blocksize;					///< size of the blocks of input scanned at once
	std::size_t maxMatchSize;				///< longest match guaranteed to be found, a quarter of the block size

	ExtractorData()
		:categories(),exprar(),subexprar(),patterndb(0),luhn(false),blocksize(DefaultBlockSize),maxMatchSize(DefaultBlockSize/4){}
	~ExtractorData()
	{
		if (patterndb) hs_free_database( patterndb);
	}

	void addExpression( const std::string& expression, uint32_t categoryidx, unsigned int resultIndex, bool leftContext, Pattern::Validation validation, int regcompflags)
	{
		subexprar.push_back( new SubExpressionDef( expression, resultIndex, regcompflags));
		exprar.push_back( AutomatonExpression( expression, categoryidx, subexprar.size(), leftContext, validation));
		if (exprar.size() >= (std::size_t)std::numeric_limits<uint32_t>::max())
		{
			throw pextract::runtime_error(_TXT("too many expressions defined, maximum %u allowed"), (unsigned int)std::numeric_limits<uint32_t>::max());
		}
	}

	void complete( HsPatternTable& hspt, unsigned int flags) const
	{
		hspt.init( exprar.size());
		std::vector<AutomatonExpression>::const_iterator ei = exprar.begin(), ee = exprar.end();
		for (std::size_t eidx=0; ei != ee; ++ei,++eidx)
		{
			hspt.patternar[ eidx] = ei->expression.c_str();
			hspt.idar[ eidx] = eidx;
			hspt.flagar[ eidx] = flags | HS_FLAG_SOM_LEFTMOST;
		}
	}
};

/// \brief Luhn checksum test of the digits of a string, blanks and dashes are skipped
static bool checkLuhn( const char* src, std::size_t srcsize)
{
	unsigned int sum = 0;
	unsigned int nofDigits = 0;
	bool doubled = false;
	std::size_t si = srcsize;
	while (si > 0)
	{
		char ch = src[ --si];
		if (ch == ' ' || ch == '-') continue;
		if (ch < '0' || ch > '9') return false;
		unsigned int digit = ch - '0';
		if (doubled)
		{
			digit *= 2;
			if (digit > 9) digit -= 9;
		}
		sum += digit;
		doubled = !doubled;
		++nofDigits;
	}
	return nofDigits > 1 && sum % 10 == 0;
}

/// \brief Candidate for the next match, positions are absolute offsets in the input
struct MatchCandidate
{
	uint32_t exprid;
	uint32_t categoryidx;
	std::size_t start;
	std::size_t end;
	std::size_t origend;		///< end of the occurrence reported by the automaton, including context

	MatchCandidate()
		:exprid(0),categoryidx(0),start(0),end(0),origend(0){}
	MatchCandidate( uint32_t exprid_, uint32_t categoryidx_, std::size_t start_, std::size_t end_, std::size_t origend_)
		:exprid(exprid_),categoryidx(categoryidx_),start(start_),end(end_),origend(origend_){}
	MatchCandidate( const MatchCandidate& o)
		:exprid(o.exprid),categoryidx(o.categoryidx),start(o.start),end(o.end),origend(o.origend){}

	// Order of preference: leftmost, longest, earliest defined category
	bool operator < (const MatchCandidate& o) const
	{
		if (start != o.start) return start < o.start;
		if (end != o.end) return end > o.end;
		return categoryidx < o.categoryidx;
	}
};

struct MatchCandidateOrder
{
	bool operator()( const MatchCandidate& a, const MatchCandidate& b) const
	{
		return b < a;
	}
};

/// \brief Context scanning one input stream block by block
/// \note The buffer always starts one character before the cursor, so that the left context of a match at the cursor is visible.
///	The automaton reports the leftmost start of an occurrence only. An occurrence that starts before the cursor may hide a match
///	with the same end starting after the cursor. Such an occurrence is rematched from the cursor when it is reached.
class PatternExtractorContext
	:public PatternExtractorContextInterface
{
public:
	PatternExtractorContext( const ExtractorData* data_, std::istream& input_, strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_),m_debugtrace(0),m_data(data_),m_input(input_),m_hs_scratch(0)
		,m_buffer(),m_bufpos(0),m_eof(false),m_queue(),m_cursor(0),m_state(Init)
	{
		hs_error_t err = hs_alloc_scratch( m_data->patterndb, &m_hs_scratch);
		if (err != HS_SUCCESS)
		{
			throw ErrorCodeException( hyperscanErrorCode( err), std::string(_TXT("failed to allocate scratch space for the automaton: ")) + hyperscanErrorName( err));
		}
		strus::DebugTraceInterface* dbgi = m_errorhnd->debugTrace();
		if (dbgi) m_debugtrace = dbgi->createTraceContext( "pattern");
	}

	virtual ~PatternExtractorContext()
	{
		if (m_hs_scratch) hs_free_scratch( m_hs_scratch);
		if (m_debugtrace) delete m_debugtrace;
	}

	static int match_event_handler( unsigned int id, unsigned_long_long from, unsigned_long_long to, unsigned int, void *context)
	{
		PatternExtractorContext* THIS = (PatternExtractorContext*)context;
		try
		{
			bool notbol = (THIS->m_bufpos + from > 0);
			THIS->pushCandidate( id, from, to, notbol);
			return 0;
		}
		CATCH_ERROR_MAP_RETURN( _TXT("error calling hyperscan match event handler: %s"), *THIS->m_errorhnd, -1);
	}

	virtual bool nextMatch( Match& match)
	{
		try
		{
			if (m_state == Init)
			{
				m_state = Failed;
				fillBuffer();
				scanBuffer();
				m_state = Fetch;
			}
			if (m_state != Fetch) return false;

			for (;;)
			{
				while (!m_queue.empty() && m_queue.top().start < m_cursor)
				{
					MatchCandidate stale = m_queue.top();
					m_queue.pop();
					if (stale.origend > m_cursor)
					{
						rematchFromCursor( stale);
					}
				}
				if (!m_queue.empty() && (m_eof || m_queue.top().start < safeEnd()))
				{
					const MatchCandidate& top = m_queue.top();
					match = Match( m_data->categories[ top.categoryidx], top.start, top.end,
							std::string( m_buffer.c_str() + (top.start - m_bufpos), top.end - top.start));
					m_cursor = top.end;
					m_queue.pop();
					return true;
				}
				if (m_eof) break;

				// No match starts before the end of the safe part of the buffer, continue with the next block:
				std::size_t se = safeEnd();
				if (m_cursor < se) m_cursor = se;
				m_state = Failed;
				fillBuffer();
				scanBuffer();
				m_state = Fetch;
			}
			m_state = Done;
			releaseBuffers();
			return false;
		}
		CATCH_ERROR_MAP_RETURN( _TXT("failed to fetch next match: %s"), *m_errorhnd, false);
	}

private:
	/// \brief Evaluate the match of an expression in the buffer span [from,to) and push it as candidate
	void pushCandidate( uint32_t exprid, std::size_t from, std::size_t to, bool notbol)
	{
		const AutomatonExpression& def = m_data->exprar[ exprid];
		bool noteol = !(m_eof && to == m_buffer.size());
		std::size_t resstart;
		std::size_t resend;
		if (!m_data->subexprar[ def.subexpref-1]->match( m_buffer.c_str(), from, to, notbol, noteol, resstart, resend))
		{
			return;
		}
		if (m_data->luhn && def.validation == Pattern::LuhnChecksum)
		{
			if (!checkLuhn( m_buffer.c_str() + resstart, resend - resstart)) return;
		}
		m_queue.push( MatchCandidate( exprid, def.categoryidx, m_bufpos + resstart, m_bufpos + resend, m_bufpos + to));
	}

	/// \brief Search a match of the expression of a candidate starting before the cursor in the rest of its occurrence
	void rematchFromCursor( const MatchCandidate& stale)
	{
		const AutomatonExpression& def = m_data->exprar[ stale.exprid];
		std::size_t from = m_cursor - m_bufpos;
		if (def.leftContext) from -= 1;
		std::size_t to = stale.origend - m_bufpos;
		if (from >= to) return;
		pushCandidate( stale.exprid, from, to, true/*notbol*/);
		if (m_debugtrace) m_debugtrace->event( "rematch", "expr=%d cursor=%d end=%d", (int)stale.exprid, (int)m_cursor, (int)stale.origend);
	}

	/// \brief End of the part of the buffer where all matches starting there are known
	std::size_t safeEnd() const
	{
		std::size_t bufend = m_bufpos + m_buffer.size();
		if (m_eof) return bufend;
		return (m_buffer.size() > m_data->maxMatchSize) ? (bufend - m_data->maxMatchSize) : m_bufpos;
	}

	/// \brief Drop the input before the left context of the cursor and read the next block
	void fillBuffer()
	{
		std::size_t keep = m_cursor ? (m_cursor - 1) : 0;
		if (keep > m_bufpos)
		{
			m_buffer.erase( 0, keep - m_bufpos);
			m_bufpos = keep;
		}
		char buf[ ReadChunkSize];
		while (!m_eof && m_buffer.size() < m_data->blocksize)
		{
			m_input.read( buf, ReadChunkSize);
			std::streamsize nn = m_input.gcount();
			if (nn > 0) m_buffer.append( buf, nn);
			if (m_input.bad())
			{
				throw ErrorCodeException( strus::ErrorCodeIOError, _TXT("failed to read input stream"));
			}
			if (!m_input.good()) m_eof = true;
		}
	}

	void scanBuffer()
	{
		std::priority_queue<MatchCandidate, std::vector<MatchCandidate>, MatchCandidateOrder>().swap( m_queue);
		if (m_buffer.empty()) return;
		hs_error_t err = hs_scan( m_data->patterndb, m_buffer.c_str(), (unsigned int)m_buffer.size(), 0/*reserved*/, m_hs_scratch, match_event_handler, this);
		if (err != HS_SUCCESS)
		{
			throw ErrorCodeException( hyperscanErrorCode( err), std::string(_TXT("error scanning input (hyperscan error ")) + hyperscanErrorName( err) + ")");
		}
		if (m_debugtrace) m_debugtrace->event( "scan", "pos=%d size=%d candidates=%d eof=%d", (int)m_bufpos, (int)m_buffer.size(), (int)m_queue.size(), (int)m_eof);
	}

	void releaseBuffers()
	{
		std::priority_queue<MatchCandidate, std::vector<MatchCandidate>, MatchCandidateOrder>().swap( m_queue);
		std::string().swap( m_buffer);
	}

private:
	strus::ErrorBufferInterface* m_errorhnd;
	strus::DebugTraceContextInterface* m_debugtrace;
	const ExtractorData* m_data;
	std::istream& m_input;
	hs_scratch_t* m_hs_scratch;
	std::string m_buffer;			///< block of input scanned
	std::size_t m_bufpos;			///< offset of the start of m_buffer in the input
	bool m_eof;				///< true if the end of the input is in m_buffer
	std::priority_queue<MatchCandidate, std::vector<MatchCandidate>, MatchCandidateOrder> m_queue;
	std::size_t m_cursor;			///< offset in the input where the next match may start
	enum State {Init,Fetch,Done,Failed};
	State m_state;
};

class PatternExtractorInstance
	:public PatternExtractorInstanceInterface
{
public:
	PatternExtractorInstance( const PatternRegistryInterface* registry_, strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_),m_debugtrace(0),m_registry(registry_),m_data()
		,m_selection(),m_customExpression(),m_flags(0),m_luhn(false),m_blocksize(DefaultBlockSize),m_invalid(false),m_state(DefinitionPhase)
	{
		strus::DebugTraceInterface* dbgi = m_errorhnd->debugTrace();
		if (dbgi) m_debugtrace = dbgi->createTraceContext( "pattern");
	}

	virtual ~PatternExtractorInstance()
	{
		if (m_debugtrace) delete m_debugtrace;
	}

	virtual void selectCategory( const std::string& name)
	{
		try
		{
			if (m_state != DefinitionPhase)
			{
				throw ErrorCodeException( strus::ErrorCodeOperationOrder, _TXT("called select category after calling 'compile'"));
			}
			unsigned int idx = m_registry->definitionIndex( name);
			if (!idx)
			{
				m_invalid = true;
				throw UnknownPatternError( std::string(_TXT("unknown category")) + " '" + name + "'");
			}
			m_selection.insert( idx);
		}
		CATCH_ERROR_MAP( _TXT("failed to select category: %s"), *m_errorhnd);
	}

	virtual void defineCustomPattern( const std::string& expression)
	{
		try
		{
			if (m_state != DefinitionPhase)
			{
				throw ErrorCodeException( strus::ErrorCodeOperationOrder, _TXT("called define custom pattern after calling 'compile'"));
			}
			if (!m_customExpression.empty())
			{
				m_invalid = true;
				throw pextract::runtime_error( _TXT("custom pattern defined twice"));
			}
			try
			{
				checkExpression( expression, HS_FLAG_SOM_LEFTMOST);
				// the expression is also rematched with TRE, so it has to be accepted there too
				SubExpressionDef posixcheck( expression, 0, REG_EXTENDED);
			}
			catch (const std::runtime_error& err)
			{
				m_invalid = true;
				throw UnknownPatternError( err.what());
			}
			m_customExpression = expression;
		}
		CATCH_ERROR_MAP( _TXT("failed to define custom pattern: %s"), *m_errorhnd);
	}

	virtual void defineOption( const std::string& name, double value)
	{
		try
		{
			if (m_state != DefinitionPhase)
			{
				throw ErrorCodeException( strus::ErrorCodeOperationOrder, _TXT("called define option after calling 'compile'"));
			}
			bool enable = (value != 0.0);
			unsigned int flag = 0;
			if (strus::caseInsensitiveEquals( name, "CASELESS"))
			{
				flag = HS_FLAG_CASELESS;
			}
			else if (strus::caseInsensitiveEquals( name, "DOTALL"))
			{
				flag = HS_FLAG_DOTALL;
			}
			else if (strus::caseInsensitiveEquals( name, "MULTILINE"))
			{
				flag = HS_FLAG_MULTILINE;
			}
			else if (strus::caseInsensitiveEquals( name, "LUHN"))
			{
				m_luhn = enable;
				return;
			}
			else if (strus::caseInsensitiveEquals( name, "BLOCKSIZE"))
			{
				if (value < (double)MinBlockSize || value > (double)MaxBlockSize || value != (double)(std::size_t)value)
				{
					m_invalid = true;
					throw pextract::runtime_error(_TXT("option '%s' expects an integer between %u and %u"), "BLOCKSIZE", (unsigned int)MinBlockSize, (unsigned int)MaxBlockSize);
				}
				m_blocksize = (std::size_t)value;
				return;
			}
			else
			{
				m_invalid = true;
				throw pextract::runtime_error(_TXT("unknown option '%s'"), name.c_str());
			}
			if (enable)
			{
				m_flags |= flag;
			}
			else
			{
				m_flags &= ~flag;
			}
		}
		CATCH_ERROR_MAP( _TXT("define option failed for hyperscan pattern extractor: %s"), *m_errorhnd);
	}

	virtual bool compile()
	{
		try
		{
			if (m_state != DefinitionPhase)
			{
				throw ErrorCodeException( strus::ErrorCodeOperationOrder, _TXT("called 'compile' twice"));
			}
			if (m_invalid)
			{
				throw UnknownPatternError( _TXT("invalid selection of categories or options"));
			}
			// POSIX flags of the rematch mirroring the hyperscan flags
			int regcompflags = REG_EXTENDED;
			if (m_flags & HS_FLAG_CASELESS) regcompflags |= REG_ICASE;
			if (m_flags & HS_FLAG_MULTILINE) regcompflags |= REG_NEWLINE;
			std::vector<std::string> names = m_registry->listCategories();
			std::vector<std::string>::const_iterator ni = names.begin(), ne = names.end();
			for (unsigned int nidx=1; ni != ne; ++ni,++nidx)
			{
				if (!m_selection.empty() && m_selection.find( nidx) == m_selection.end()) continue;

				Pattern pattern = m_registry->resolve( *ni);
				std::vector<ExpressionDef> exprs = getPatternExpressions( pattern);
				uint32_t categoryidx = m_data.categories.size();
				m_data.categories.push_back( *ni);
				std::vector<ExpressionDef>::const_iterator ei = exprs.begin(), ee = exprs.end();
				for (; ei != ee; ++ei)
				{
					// result index 2 means that the result sub expression is preceded by the left context
					m_data.addExpression( ei->expression, categoryidx, ei->resultIndex, ei->resultIndex > 1, ei->validation, regcompflags);
					if (m_debugtrace) m_debugtrace->event( "expression", "category='%s' expr='%s'", ni->c_str(), ei->expression.c_str());
				}
			}
			if (!m_customExpression.empty())
			{
				uint32_t categoryidx = m_data.categories.size();
				m_data.categories.push_back( g_customCategoryName);
				m_data.addExpression( m_customExpression, categoryidx, 0, false, Pattern::NoValidation, regcompflags);
				if (m_debugtrace) m_debugtrace->event( "expression", "category='%s' expr='%s'", g_customCategoryName, m_customExpression.c_str());
			}
			if (m_data.exprar.empty())
			{
				throw pextract::runtime_error(_TXT("no categories to compile"));
			}
			m_data.luhn = m_luhn;
			m_data.blocksize = m_blocksize;
			m_data.maxMatchSize = m_blocksize / 4;

			HsPatternTable hspt;
			m_data.complete( hspt, m_flags);

			hs_platform_info_t platform;
			std::memset( &platform, 0, sizeof(platform));
			platform.cpu_features = HS_TUNE_FAMILY_GENERIC;
			hs_compile_error_t* compile_err = 0;

			hs_error_t err =
				hs_compile_multi(
					hspt.patternar, hspt.flagar, hspt.idar, hspt.arsize, HS_MODE_BLOCK, &platform,
					&m_data.patterndb, &compile_err);
			if (err != HS_SUCCESS)
			{
				if (compile_err)
				{
					const char* error_pattern = compile_err->expression < 0 ?0:hspt.patternar[ compile_err->expression];
					if (error_pattern)
					{
						m_errorhnd->report(
							hyperscanErrorCode( err),
							_TXT( "failed to compile pattern \"%s\": %s"), error_pattern, compile_err->message);
					}
					else
					{
						m_errorhnd->report(
							hyperscanErrorCode( err),
							_TXT( "failed to build automaton from expressions: %s"), compile_err->message);
					}
					hs_free_compile_error( compile_err);
				}
				else
				{
					m_errorhnd->report(
						hyperscanErrorCode( err),
						_TXT( "unknown error building automaton from expressions"));
				}
				m_data.patterndb = 0;
				return false;
			}
			if (m_debugtrace) m_debugtrace->event( "compile", "categories=%d expressions=%d", (int)m_data.categories.size(), (int)m_data.exprar.size());
			m_state = MatchPhase;
			return true;
		}
		CATCH_ERROR_MAP_RETURN( _TXT("failed to compile selected categories: %s"), *m_errorhnd, false);
	}

	virtual std::vector<std::string> selectedCategories() const
	{
		return m_data.categories;
	}

	virtual PatternExtractorContextInterface* createContext( std::istream& input) const
	{
		try
		{
			if (m_state != MatchPhase)
			{
				throw ErrorCodeException( strus::ErrorCodeOperationOrder, _TXT("called create context without calling 'compile'"));
			}
			return new PatternExtractorContext( &m_data, input, m_errorhnd);
		}
		CATCH_ERROR_MAP_RETURN( _TXT("failed to create pattern extractor context: %s"), *m_errorhnd, 0);
	}

private:
	strus::ErrorBufferInterface* m_errorhnd;
	strus::DebugTraceContextInterface* m_debugtrace;
	const PatternRegistryInterface* m_registry;
	ExtractorData m_data;
	std::set<unsigned int> m_selection;	///< definition indices of the selected categories
	std::string m_customExpression;
	unsigned int m_flags;
	bool m_luhn;
	std::size_t m_blocksize;
	bool m_invalid;				///< true if a definition failed, compile fails then
	enum State {DefinitionPhase,MatchPhase};
	State m_state;
};


std::vector<std::string> PatternExtractor::getCompileOptionNames() const
{
	std::vector<std::string> rt;
	static const char* ar[] = {"CASELESS", "DOTALL", "MULTILINE", "LUHN", "BLOCKSIZE", 0};
	for (std::size_t ai=0; ar[ai]; ++ai)
	{
		rt.push_back( ar[ ai]);
	}
	return rt;
}

PatternExtractorInstanceInterface* PatternExtractor::createInstance( const PatternRegistryInterface* registry) const
{
	try
	{
		if (!registry)
		{
			throw pextract::runtime_error( _TXT("no registry passed to pattern extractor"));
		}
		return new PatternExtractorInstance( registry, m_errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to create pattern extractor instance: %s"), *m_errorhnd, 0);
}

const char* PatternExtractor::getDescription() const
{
	return _TXT( "pattern extractor based on the Intel hyperscan library");
}

