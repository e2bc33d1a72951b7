/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Implementation of extracting occurrencies of selected categories from text
/// \file "patternExtractor.hpp"
#ifndef _PEXTRACT_PATTERN_EXTRACTOR_IMPLEMENTATION_HPP_INCLUDED
#define _PEXTRACT_PATTERN_EXTRACTOR_IMPLEMENTATION_HPP_INCLUDED
#include "pextract/patternExtractorInterface.hpp"

namespace strus {
///\brief Forward declaration
class ErrorBufferInterface;
}

namespace pextract {

/// \brief Object for creating automata extracting the categories of a registry from text
/// \note Based on the Intel hyperscan library as backend, sub expressions are selected with TRE.
class PatternExtractor
	:public PatternExtractorInterface
{
public:
	explicit PatternExtractor( strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_){}

	virtual ~PatternExtractor(){}

	virtual std::vector<std::string> getCompileOptionNames() const;
	virtual PatternExtractorInstanceInterface* createInstance( const PatternRegistryInterface* registry) const;
	virtual const char* getDescription() const;

private:
	strus::ErrorBufferInterface* m_errorhnd;
};

}//namespace
#endif

