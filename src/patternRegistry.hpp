/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Implementation of the table of named patterns
/// \file "patternRegistry.hpp"
#ifndef _PEXTRACT_PATTERN_REGISTRY_IMPLEMENTATION_HPP_INCLUDED
#define _PEXTRACT_PATTERN_REGISTRY_IMPLEMENTATION_HPP_INCLUDED
#include "pextract/patternRegistryInterface.hpp"
#include <boost/unordered_map.hpp>
#include <vector>
#include <string>

namespace strus {
///\brief Forward declaration
class ErrorBufferInterface;
///\brief Forward declaration
class DebugTraceContextInterface;
}

namespace pextract {

/// \brief Implementation of the table of named patterns
class PatternRegistry
	:public PatternRegistryInterface
{
public:
	explicit PatternRegistry( strus::ErrorBufferInterface* errorhnd_);
	/// \brief Constructor of a registry sharing the patterns of another, reporting errors to its own error buffer
	/// \param[in] errorhnd_ error buffer, NULL for a registry that is only copied and never queried
	PatternRegistry( const PatternRegistry& o, strus::ErrorBufferInterface* errorhnd_);
	virtual ~PatternRegistry();

	virtual bool definePattern(
			const std::string& name,
			const Pattern& pattern);

	virtual bool isDefined( const std::string& name) const;
	virtual Pattern resolve( const std::string& name) const;
	virtual unsigned int definitionIndex( const std::string& name) const;
	virtual std::vector<std::string> listCategories() const;
	virtual void done();

private:
	strus::ErrorBufferInterface* m_errorhnd;
	strus::DebugTraceContextInterface* m_debugtrace;
	std::vector<Pattern> m_patterns;			///< patterns in the order of definition
	typedef boost::unordered_map<std::string,std::size_t> NameIndexMap;
	NameIndexMap m_nameIndexMap;				///< map pattern name -> index in m_patterns starting with 1
	bool m_done;

private:
	PatternRegistry( const PatternRegistry&);	//... non copyable
	void operator=( const PatternRegistry&);	//... non copyable
};

}//namespace
#endif

