/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Implementation of the table of named patterns
/// \file "patternRegistry.cpp"
#include "patternRegistry.hpp"
#include "patternExpression.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/debugTraceInterface.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include "hs_compile.h"
#include <stdexcept>
#include <limits>

using namespace pextract;

PatternRegistry::PatternRegistry( strus::ErrorBufferInterface* errorhnd_)
	:m_errorhnd(errorhnd_),m_debugtrace(0),m_patterns(),m_nameIndexMap(),m_done(false)
{
	strus::DebugTraceInterface* dbgi = m_errorhnd->debugTrace();
	if (dbgi) m_debugtrace = dbgi->createTraceContext( "pattern");
}

PatternRegistry::PatternRegistry( const PatternRegistry& o, strus::ErrorBufferInterface* errorhnd_)
	:m_errorhnd(errorhnd_),m_debugtrace(0),m_patterns(o.m_patterns),m_nameIndexMap(o.m_nameIndexMap),m_done(o.m_done)
{
	if (m_errorhnd && !m_done)
	{
		strus::DebugTraceInterface* dbgi = m_errorhnd->debugTrace();
		if (dbgi) m_debugtrace = dbgi->createTraceContext( "pattern");
	}
}

PatternRegistry::~PatternRegistry()
{
	if (m_debugtrace) delete m_debugtrace;
}

bool PatternRegistry::definePattern(
		const std::string& name,
		const Pattern& pattern)
{
	try
	{
		if (m_done)
		{
			throw ErrorCodeException( strus::ErrorCodeOperationOrder, _TXT("called define pattern after calling 'done'"));
		}
		if (name.empty())
		{
			throw pextract::runtime_error(_TXT("empty pattern name"));
		}
		if (m_nameIndexMap.find( name) != m_nameIndexMap.end())
		{
			throw DuplicateNameError( name);
		}
		if (!pattern.defined())
		{
			throw pextract::runtime_error(_TXT("undefined pattern passed for '%s'"), name.c_str());
		}
		checkExpression( pattern.regex(), HS_FLAG_SOM_LEFTMOST);
		std::vector<ExpressionDef> exprs = getPatternExpressions( pattern);
		std::vector<ExpressionDef>::const_iterator ei = exprs.begin(), ee = exprs.end();
		for (; ei != ee; ++ei)
		{
			checkExpression( ei->expression, HS_FLAG_SOM_LEFTMOST);
			if (m_debugtrace) m_debugtrace->event( "expression", "name='%s' expr='%s' result=%d", name.c_str(), ei->expression.c_str(), (int)ei->resultIndex);
		}
		if (m_patterns.size() >= (std::size_t)std::numeric_limits<unsigned int>::max())
		{
			throw pextract::runtime_error(_TXT("too many patterns defined"));
		}
		m_patterns.push_back( pattern.named( name));
		m_nameIndexMap[ name] = m_patterns.size();
		if (m_debugtrace) m_debugtrace->event( "define", "idx=%d name='%s' alternatives=%d", (int)m_patterns.size(), name.c_str(), (int)exprs.size());
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to define pattern: %s"), *m_errorhnd, false);
}

bool PatternRegistry::isDefined( const std::string& name) const
{
	return m_nameIndexMap.find( name) != m_nameIndexMap.end();
}

Pattern PatternRegistry::resolve( const std::string& name) const
{
	try
	{
		NameIndexMap::const_iterator ni = m_nameIndexMap.find( name);
		if (ni == m_nameIndexMap.end())
		{
			throw UnknownPatternError( std::string(_TXT("undefined pattern")) + " '" + name + "'");
		}
		return m_patterns[ ni->second-1];
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to resolve pattern: %s"), *m_errorhnd, Pattern());
}

unsigned int PatternRegistry::definitionIndex( const std::string& name) const
{
	NameIndexMap::const_iterator ni = m_nameIndexMap.find( name);
	if (ni == m_nameIndexMap.end()) return 0;
	return ni->second;
}

std::vector<std::string> PatternRegistry::listCategories() const
{
	std::vector<std::string> rt;
	rt.reserve( m_patterns.size());
	std::vector<Pattern>::const_iterator pi = m_patterns.begin(), pe = m_patterns.end();
	for (; pi != pe; ++pi)
	{
		rt.push_back( pi->name());
	}
	return rt;
}

void PatternRegistry::done()
{
	m_done = true;
	if (m_debugtrace)
	{
		m_debugtrace->event( "done", "patterns=%d", (int)m_patterns.size());
		delete m_debugtrace;
		m_debugtrace = 0;
	}
}

