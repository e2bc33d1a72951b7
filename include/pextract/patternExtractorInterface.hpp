/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for creating automata for extracting occurrencies of selected categories from text
/// \file "patternExtractorInterface.hpp"
#ifndef _PEXTRACT_PATTERN_EXTRACTOR_INTERFACE_HPP_INCLUDED
#define _PEXTRACT_PATTERN_EXTRACTOR_INTERFACE_HPP_INCLUDED
#include <string>
#include <vector>

namespace pextract
{

/// \brief Forward declaration
class PatternExtractorInstanceInterface;
/// \brief Forward declaration
class PatternRegistryInterface;

/// \brief Interface for creating automata for extracting occurrencies of selected categories from text
class PatternExtractorInterface
{
public:
	/// \brief Destructor
	virtual ~PatternExtractorInterface(){}

	/// \brief Get the list of options that can be passed to PatternExtractorInstanceInterface::defineOption
	/// \return list of option names
	virtual std::vector<std::string> getCompileOptionNames() const=0;

	/// \brief Create an instance to select the categories to extract
	/// \param[in] registry table of categories to select from (reference, not owned, has to live as long as the instance)
	/// \return the instance (with ownership) or NULL on error (error reported in error buffer)
	virtual PatternExtractorInstanceInterface* createInstance( const PatternRegistryInterface* registry) const=0;

	/// \brief Get a one line description of this extractor
	virtual const char* getDescription() const=0;
};

} //namespace
#endif

