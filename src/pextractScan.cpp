/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Program printing the occurrencies of selected categories found in input files
#include "pextract/lib/extract.hpp"
#include "pextract/patternRegistryInterface.hpp"
#include "pextract/patternExtractorInterface.hpp"
#include "pextract/patternExtractorInstanceInterface.hpp"
#include "pextract/patternExtractorContextInterface.hpp"
#include "pextract/match.hpp"
#include "pextract/versionExtract.hpp"
#include "strus/lib/error.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/versionBase.hpp"
#include "internationalization.hpp"
#include <stdexcept>
#include <string>
#include <vector>
#include <utility>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <fstream>
#include <sstream>
#include <memory>
#include "hs.h"
#include <boost/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/bind.hpp>

struct CategoryFlag
{
	const char* shortopt;
	const char* category;
};

// Short options for the most frequently used categories, all categories have a long option '--<name>':
static const CategoryFlag g_categoryFlags[] =
{
	{"-N", "number"},
	{"-X", "hex-number"},
	{"-V", "version-number"},
	{"-w", "word"},
	{"-M", "mac-address"},
	{"-4", "ipv4-address"},
	{"-6", "ipv6-address"},
	{"-I", "ip-address"},
	{"-H", "host-name"},
	{"-D", "domain-name"},
	{"-E", "email-address"},
	{"-U", "url"},
	{"-u", "uri"},
	{"-P", "phone-number"},
	{"-S", "ssn"},
	{"-C", "credit-card"},
	{"-p", "path"},
	{"-F", "file-name"},
	{"-s", "string"},
	{"-K", "api-key"},
	{0, 0}
};

static void printIntelBsdLicense()
{
	std::cout << " Copyright (c) 2015, Intel Corporation" << std::endl;
	std::cout << std::endl;
	std::cout << " Redistribution and use in source and binary forms, with or without" << std::endl;
	std::cout << " modification, are permitted provided that the following conditions are met:" << std::endl;
	std::cout << std::endl;
	std::cout << "  * Redistributions of source code must retain the above copyright notice," << std::endl;
	std::cout << "    this list of conditions and the following disclaimer." << std::endl;
	std::cout << "  * Redistributions in binary form must reproduce the above copyright" << std::endl;
	std::cout << "    notice, this list of conditions and the following disclaimer in the" << std::endl;
	std::cout << "    documentation and/or other materials provided with the distribution." << std::endl;
	std::cout << "  * Neither the name of Intel Corporation nor the names of its contributors" << std::endl;
	std::cout << "    may be used to endorse or promote products derived from this software" << std::endl;
	std::cout << "    without specific prior written permission." << std::endl;
	std::cout << std::endl;
	std::cout << " THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS \"AS IS\"" << std::endl;
	std::cout << " AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE" << std::endl;
	std::cout << " IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE" << std::endl;
	std::cout << " ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE" << std::endl;
	std::cout << " LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR" << std::endl;
	std::cout << " CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF" << std::endl;
	std::cout << " SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS" << std::endl;
	std::cout << " INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN" << std::endl;
	std::cout << " CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)" << std::endl;
	std::cout << " ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE" << std::endl;
	std::cout << " POSSIBILITY OF SUCH DAMAGE." << std::endl;
}

static void printUsage()
{
	std::cout << "pextractScan [options] [<inputfile>...]" << std::endl;
	std::cout << "options:" << std::endl;
	std::cout << "-h|--help" << std::endl;
	std::cout << "    " << _TXT("Print this usage and do nothing else") << std::endl;
	std::cout << "-v|--version" << std::endl;
	std::cout << "    " << _TXT("Print the program version and do nothing else") << std::endl;
	std::cout << "--intel-bsd-license" << std::endl;
	std::cout << "    " << _TXT("Print the BSD license text of the Intel hyperscan library") << std::endl;
	std::cout << "-l|--list" << std::endl;
	std::cout << "    " << _TXT("Print the names of all categories and do nothing else") << std::endl;
	std::cout << "-c|--category <NAME>" << std::endl;
	std::cout << "    " << _TXT("Select the category <NAME> to search for") << std::endl;
	std::cout << "--<NAME>" << std::endl;
	std::cout << "    " << _TXT("Select the category <NAME> to search for (see --list)") << std::endl;
	for (std::size_t fi=0; g_categoryFlags[fi].shortopt; ++fi)
	{
		std::cout << g_categoryFlags[fi].shortopt << "|--" << g_categoryFlags[fi].category << std::endl;
	}
	std::cout << "    " << _TXT("Select the category named by the long option") << std::endl;
	std::cout << "    " << _TXT("  (if no category is selected all categories are searched for)") << std::endl;
	std::cout << "-e|--regexp <EXPR>" << std::endl;
	std::cout << "    " << _TXT("Search for the regular expression <EXPR> too (category \"custom\")") << std::endl;
	std::cout << "-O|--option <NAME>[=<VALUE>]" << std::endl;
	std::cout << "    " << _TXT("Enable the compile option <NAME> (CASELESS, DOTALL, MULTILINE, LUHN)") << std::endl;
	std::cout << "    " << _TXT("or set it to <VALUE> (BLOCKSIZE, size of the blocks of input scanned at once)") << std::endl;
	std::cout << "-n|--offsets" << std::endl;
	std::cout << "    " << _TXT("Print the byte offsets and the category of every match too") << std::endl;
	std::cout << "-t|--threads <N>" << std::endl;
	std::cout << "    " << _TXT("Set <N> as number of threads processing the input files") << std::endl;
	std::cout << "-L|--logfile <FILE>" << std::endl;
	std::cout << "    " << _TXT("Write the error log to <FILE>") << std::endl;
	std::cout << "<inputfile>  : " << _TXT("input file to process, standard input if not specified or '-'") << std::endl;
}

static strus::ErrorBufferInterface* g_errorBuffer = 0;	// error buffer

static unsigned int getUintValue( const char* arg)
{
	unsigned int rt = 0, prev = 0;
	char const* cc = arg;
	for (; *cc; ++cc)
	{
		if (*cc < '0' || *cc > '9') throw std::runtime_error( std::string( "parameter is not a non negative integer number: ") + arg);
		rt = (rt * 10) + (*cc - '0');
		if (rt < prev) throw std::runtime_error( std::string( "parameter out of range: ") + arg);
		prev = rt;
	}
	return rt;
}

static const char* shortOptionCategory( const char* arg)
{
	for (std::size_t fi=0; g_categoryFlags[fi].shortopt; ++fi)
	{
		if (0==std::strcmp( arg, g_categoryFlags[fi].shortopt)) return g_categoryFlags[fi].category;
	}
	return 0;
}

class ThreadContext;

class GlobalContext
{
public:
	GlobalContext(
			const pextract::PatternExtractorInstanceInterface* instance_,
			const std::vector<std::string>& files_,
			bool printOffsets_)
		:m_instance(instance_)
		,m_files(files_)
		,m_printOffsets(printOffsets_)
		,m_printFileNames(files_.size() > 1)
	{
		m_fileitr = m_files.begin();
	}

	const pextract::PatternExtractorInstanceInterface* instance() const	{return m_instance;}
	bool printOffsets() const						{return m_printOffsets;}
	bool printFileNames() const						{return m_printFileNames;}

	void fetchError()
	{
		if (g_errorBuffer->hasError())
		{
			boost::mutex::scoped_lock lock( m_mutex);
			m_errors.push_back( g_errorBuffer->fetchError());
		}
	}

	void reportError( const std::string& msg)
	{
		boost::mutex::scoped_lock lock( m_mutex);
		m_errors.push_back( msg);
	}

	bool fetchFile( std::string& filename)
	{
		boost::mutex::scoped_lock lock( m_mutex);
		if (m_fileitr != m_files.end())
		{
			filename = *m_fileitr++;
			return true;
		}
		return false;
	}

	void writeOutput( const std::string& content)
	{
		boost::mutex::scoped_lock lock( m_mutex);
		std::cout << content << std::flush;
	}

	const std::vector<std::string>& errors() const
	{
		return m_errors;
	}

private:
	boost::mutex m_mutex;
	const pextract::PatternExtractorInstanceInterface* m_instance;
	std::vector<std::string> m_errors;
	std::vector<std::string> m_files;
	std::vector<std::string>::const_iterator m_fileitr;
	bool m_printOffsets;
	bool m_printFileNames;
};

class ThreadContext
{
public:
	~ThreadContext(){}

	ThreadContext( const ThreadContext& o)
		:m_globalContext(o.m_globalContext),m_threadid(o.m_threadid)
	{}

	ThreadContext( GlobalContext* globalContext_, unsigned int threadid_)
		:m_globalContext(globalContext_),m_threadid(threadid_)
	{}

	void processDocument( const std::string& filename)
	{
		std::ifstream filestream;
		std::istream* input = &std::cin;
		if (filename != "-")
		{
			filestream.open( filename.c_str(), std::ios::in | std::ios::binary);
			if (!filestream.is_open())
			{
				throw pextract::runtime_error(_TXT("failed to open input file '%s'"), filename.c_str());
			}
			input = &filestream;
		}
		std::auto_ptr<pextract::PatternExtractorContextInterface> ctx( m_globalContext->instance()->createContext( *input));
		if (!ctx.get())
		{
			throw pextract::runtime_error(_TXT("failed to create extractor context for '%s'"), filename.c_str());
		}
		std::ostringstream out;
		pextract::Match match;
		while (ctx->nextMatch( match))
		{
			if (m_globalContext->printFileNames())
			{
				out << filename << ":";
			}
			if (m_globalContext->printOffsets())
			{
				out << match.start() << ":" << match.end() << " " << match.category() << " ";
			}
			out << match.text() << "\n";
		}
		if (g_errorBuffer->hasError())
		{
			throw pextract::runtime_error(_TXT("error scanning '%s'"), filename.c_str());
		}
		m_globalContext->writeOutput( out.str());
	}

	void run()
	{
		try
		{
			std::string filename;
			while (m_globalContext->fetchFile( filename))
			{
				processDocument( filename);
			}
		}
		catch (const std::runtime_error& err)
		{
			const char* errormsg = g_errorBuffer->fetchError();
			if (errormsg)
			{
				m_globalContext->reportError( std::string( err.what()) + ": " + errormsg);
			}
			else
			{
				m_globalContext->reportError( err.what());
			}
		}
		catch (const std::bad_alloc&)
		{
			m_globalContext->reportError( _TXT("out of memory processing documents"));
		}
		m_globalContext->fetchError();
	}

private:
	GlobalContext* m_globalContext;
	unsigned int m_threadid;
};


int main( int argc, const char* argv[])
{
	std::auto_ptr<strus::ErrorBufferInterface> errorBuffer;
	FILE* logfile = 0;
	int rt = -1;
	try
	{
		bool doExit = false;
		bool doList = false;
		bool printOffsets = false;
		int argi = 1;
		std::vector<std::string> categories;
		std::vector<std::pair<std::string,double> > options;
		std::string customExpression;
		std::string logfilename;
		unsigned int nofThreads = 0;

		// Parsing arguments:
		for (; argi < argc; ++argi)
		{
			const char* category = 0;
			if (0==std::strcmp( argv[argi], "-h") || 0==std::strcmp( argv[argi], "--help"))
			{
				printUsage();
				doExit = true;
			}
			else if (0==std::strcmp( argv[argi], "-v") || 0==std::strcmp( argv[argi], "--version"))
			{
				std::cerr << _TXT("pextract version ") << PEXTRACT_VERSION_STRING << std::endl;
				std::cerr << _TXT("strus base version ") << STRUS_BASE_VERSION_STRING << std::endl;
				std::cerr << std::endl;
				std::cerr << _TXT("hyperscan version ") << hs_version() << std::endl;
				std::cerr << "\tCopyright (c) 2015, Intel Corporation" << std::endl;
				std::cerr << "\tCall this program with --intel-bsd-license" << std::endl;
				std::cerr << "\tto print the the Intel hyperscan library license text." << std::endl;
				doExit = true;
			}
			else if (0==std::strcmp( argv[argi], "--intel-bsd-license"))
			{
				std::cerr << _TXT("Intel hyperscan library license:") << std::endl;
				printIntelBsdLicense();
				std::cerr << std::endl;
				doExit = true;
			}
			else if (0==std::strcmp( argv[argi], "-l") || 0==std::strcmp( argv[argi], "--list"))
			{
				doList = true;
			}
			else if (0==std::strcmp( argv[argi], "-n") || 0==std::strcmp( argv[argi], "--offsets"))
			{
				printOffsets = true;
			}
			else if (0==std::strcmp( argv[argi], "-c") || 0==std::strcmp( argv[argi], "--category"))
			{
				if (argi+1 == argc || argv[argi+1][0] == '-')
				{
					throw pextract::runtime_error( _TXT("no argument given to option --category"));
				}
				++argi;
				categories.push_back( argv[argi]);
			}
			else if (0==std::strcmp( argv[argi], "-e") || 0==std::strcmp( argv[argi], "--regexp"))
			{
				if (argi+1 == argc)
				{
					throw pextract::runtime_error( _TXT("no argument given to option --regexp"));
				}
				++argi;
				if (!customExpression.empty())
				{
					throw pextract::runtime_error( _TXT("option --regexp specified twice"));
				}
				customExpression = argv[argi];
				if (customExpression.empty())
				{
					throw pextract::runtime_error( _TXT("option --regexp argument is empty"));
				}
			}
			else if (0==std::strcmp( argv[argi], "-O") || 0==std::strcmp( argv[argi], "--option"))
			{
				if (argi+1 == argc || argv[argi+1][0] == '-')
				{
					throw pextract::runtime_error( _TXT("no argument given to option --option"));
				}
				++argi;
				const char* assign = std::strchr( argv[argi], '=');
				if (assign)
				{
					options.push_back( std::pair<std::string,double>( std::string( argv[argi], assign - argv[argi]), (double)getUintValue( assign+1)));
				}
				else
				{
					options.push_back( std::pair<std::string,double>( argv[argi], 1.0));
				}
			}
			else if (0==std::strcmp( argv[argi], "-t") || 0==std::strcmp( argv[argi], "--threads"))
			{
				if (argi+1 == argc || argv[argi+1][0] == '-')
				{
					throw pextract::runtime_error( _TXT("no argument given to option --threads"));
				}
				++argi;
				if (nofThreads)
				{
					throw pextract::runtime_error( _TXT("number of threads option --threads specified twice"));
				}
				nofThreads = getUintValue( argv[argi]);
				if (!nofThreads)
				{
					throw pextract::runtime_error( _TXT("number of threads option --threads is 0"));
				}
			}
			else if (0==std::strcmp( argv[argi], "-L") || 0==std::strcmp( argv[argi], "--logfile"))
			{
				if (argi+1 == argc || argv[argi+1][0] == '-')
				{
					throw pextract::runtime_error( _TXT("no argument given to option --logfile"));
				}
				++argi;
				if (!logfilename.empty())
				{
					throw pextract::runtime_error( _TXT("option --logfile specified twice"));
				}
				logfilename = argv[argi];
			}
			else if (0!=(category = shortOptionCategory( argv[argi])))
			{
				categories.push_back( category);
			}
			else if (argv[argi][0] == '-' && argv[argi][1] == '-' && !argv[argi][2])
			{
				++argi;
				break;
			}
			else if (argv[argi][0] == '-' && argv[argi][1] == '-')
			{
				// ... long option of a category, checked against the registry later
				categories.push_back( argv[argi]+2);
			}
			else if (argv[argi][0] == '-' && !argv[argi][1])
			{
				break;
			}
			else if (argv[argi][0] == '-')
			{
				throw pextract::runtime_error(_TXT("unknown option %s"), argv[ argi]);
			}
			else
			{
				break;
			}
		}
		if (doExit) return 0;

		if (!logfilename.empty())
		{
			logfile = std::fopen( logfilename.c_str(), "a");
			if (!logfile)
			{
				throw pextract::runtime_error( _TXT("failed to open log file '%s'"), logfilename.c_str());
			}
		}
		errorBuffer.reset( strus::createErrorBuffer_standard( logfile, nofThreads+1));
		if (!errorBuffer.get())
		{
			throw pextract::runtime_error( _TXT("failed to create error buffer"));
		}
		g_errorBuffer = errorBuffer.get();

		std::auto_ptr<pextract::PatternRegistryInterface> registry( pextract::createStandardPatternRegistry( g_errorBuffer));
		if (!registry.get()) throw pextract::runtime_error( _TXT("failed to create the registry of standard categories"));
		if (doList)
		{
			std::vector<std::string> names = registry->listCategories();
			std::vector<std::string>::const_iterator ni = names.begin(), ne = names.end();
			for (; ni != ne; ++ni)
			{
				std::cout << *ni << std::endl;
			}
			errorBuffer.reset();
			if (logfile) std::fclose( logfile);
			return 0;
		}

		// Create objects:
		std::auto_ptr<pextract::PatternExtractorInterface> extractor( pextract::createPatternExtractor_hyperscan( g_errorBuffer));
		if (!extractor.get()) throw pextract::runtime_error( _TXT("failed to create pattern extractor"));
		std::auto_ptr<pextract::PatternExtractorInstanceInterface> instance( extractor->createInstance( registry.get()));
		if (!instance.get()) throw pextract::runtime_error( _TXT("failed to create pattern extractor instance"));

		std::vector<std::string>::const_iterator ci = categories.begin(), ce = categories.end();
		for (; ci != ce; ++ci)
		{
			instance->selectCategory( *ci);
		}
		if (!customExpression.empty())
		{
			instance->defineCustomPattern( customExpression);
		}
		std::vector<std::pair<std::string,double> >::const_iterator oi = options.begin(), oe = options.end();
		for (; oi != oe; ++oi)
		{
			instance->defineOption( oi->first, oi->second);
		}
		if (g_errorBuffer->hasError())
		{
			throw pextract::runtime_error( _TXT("error in selection of categories"));
		}
		if (!instance->compile())
		{
			throw pextract::runtime_error( _TXT("error compiling selected categories"));
		}

		std::vector<std::string> files;
		for (; argi < argc; ++argi)
		{
			files.push_back( argv[ argi]);
		}
		if (files.empty())
		{
			files.push_back( "-");
		}
		GlobalContext globalContext( instance.get(), files, printOffsets);
		if (nofThreads)
		{
			std::cerr << _TXT("starting threads for evaluation: ") << nofThreads << std::endl;

			std::vector<ThreadContext> ctxar;
			for (unsigned int ti=0; ti<nofThreads; ++ti)
			{
				ctxar.push_back( ThreadContext( &globalContext, ti+1));
			}
			{
				boost::thread_group tgroup;
				for (unsigned int ti=0; ti<nofThreads; ++ti)
				{
					tgroup.create_thread( boost::bind( &ThreadContext::run, &ctxar[ti]));
				}
				tgroup.join_all();
			}
		}
		else
		{
			ThreadContext ctx( &globalContext, 0);
			ctx.run();
		}
		if (!globalContext.errors().empty())
		{
			std::vector<std::string>::const_iterator
				ei = globalContext.errors().begin(), ee = globalContext.errors().end();
			for (; ei != ee; ++ei)
			{
				std::cerr << _TXT("error: ") << *ei << std::endl;
			}
			throw pextract::runtime_error( _TXT("error processing documents"));
		}
		// Check for reported error an terminate regularly:
		if (g_errorBuffer->hasError())
		{
			throw pextract::runtime_error( _TXT("error processing documents"));
		}
		rt = 0;
	}
	catch (const std::bad_alloc&)
	{
		std::cerr << _TXT("out of memory") << std::endl;
	}
	catch (const std::exception& e)
	{
		const char* errormsg = g_errorBuffer?g_errorBuffer->fetchError():0;
		if (errormsg)
		{
			std::cerr << e.what() << ": " << errormsg << std::endl;
		}
		else
		{
			std::cerr << e.what() << std::endl;
		}
	}
	errorBuffer.reset();
	if (logfile) std::fclose( logfile);
	return rt;
}

